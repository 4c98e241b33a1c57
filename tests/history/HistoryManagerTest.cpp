#include <gtest/gtest.h>
#include <flowcanvas/history/HistoryManager.h>

using namespace flowcanvas;

namespace {

/// Snapshot holding nodeCount nodes, distinguishable by count
DiagramSnapshot snapshotWith(size_t nodeCount) {
    DiagramSnapshot snapshot;
    for (size_t i = 0; i < nodeCount; ++i) {
        NodeData node;
        node.id = static_cast<NodeId>(i);
        snapshot.nodes.push_back(node);
    }
    return snapshot;
}

}  // namespace

class HistoryManagerTest : public ::testing::Test {
protected:
    HistoryManager history;
};

TEST_F(HistoryManagerTest, StartsEmpty) {
    EXPECT_TRUE(history.empty());
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.current(), nullptr);
    EXPECT_EQ(history.capacity(), HistoryManager::DEFAULT_CAPACITY);
}

TEST_F(HistoryManagerTest, SingleEntryCannotUndo) {
    history.commit(snapshotWith(1));

    EXPECT_EQ(history.size(), 1);
    EXPECT_EQ(history.index(), 0);
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.undo().has_value());
}

TEST_F(HistoryManagerTest, UndoRedoRoundTrip) {
    history.commit(snapshotWith(1));
    history.commit(snapshotWith(2));
    history.commit(snapshotWith(3));

    auto undone = history.undo();
    ASSERT_TRUE(undone.has_value());
    EXPECT_EQ(undone->nodes.size(), 2);
    EXPECT_TRUE(history.canRedo());

    auto redone = history.redo();
    ASSERT_TRUE(redone.has_value());
    EXPECT_EQ(redone->nodes.size(), 3);
    EXPECT_FALSE(history.canRedo());
}

TEST_F(HistoryManagerTest, UndoStopsAtOldestEntry) {
    history.commit(snapshotWith(1));
    history.commit(snapshotWith(2));

    EXPECT_TRUE(history.undo().has_value());
    EXPECT_FALSE(history.undo().has_value());
    EXPECT_EQ(history.index(), 0);
    EXPECT_EQ(history.current()->nodes.size(), 1);
}

TEST_F(HistoryManagerTest, RedoAtNewestEntryIsNoOp) {
    history.commit(snapshotWith(1));
    EXPECT_FALSE(history.redo().has_value());
    EXPECT_EQ(history.index(), 0);
}

TEST_F(HistoryManagerTest, CommitAfterUndoTruncatesRedo) {
    history.commit(snapshotWith(1));
    history.commit(snapshotWith(2));
    history.commit(snapshotWith(3));

    history.undo();
    history.undo();
    history.commit(snapshotWith(5));

    EXPECT_EQ(history.size(), 2);
    EXPECT_EQ(history.index(), 1);
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.current()->nodes.size(), 5);
}

TEST_F(HistoryManagerTest, EvictsOldestBeyondCapacity) {
    HistoryManager bounded(3);
    for (size_t i = 1; i <= 5; ++i) {
        bounded.commit(snapshotWith(i));
    }

    EXPECT_EQ(bounded.size(), 3);
    EXPECT_EQ(bounded.index(), 2);

    bounded.undo();
    auto oldest = bounded.undo();
    ASSERT_TRUE(oldest.has_value());
    EXPECT_EQ(oldest->nodes.size(), 3);
    EXPECT_FALSE(bounded.canUndo());
}

TEST_F(HistoryManagerTest, DefaultCapacityIsFifty) {
    for (size_t i = 0; i < 60; ++i) {
        history.commit(snapshotWith(i));
    }
    EXPECT_EQ(history.size(), 50);
    EXPECT_EQ(history.index(), 49);
}

TEST_F(HistoryManagerTest, ZeroCapacityKeepsOneEntry) {
    HistoryManager tiny(0);
    EXPECT_EQ(tiny.capacity(), 1);

    tiny.commit(snapshotWith(1));
    tiny.commit(snapshotWith(2));
    EXPECT_EQ(tiny.size(), 1);
    EXPECT_EQ(tiny.current()->nodes.size(), 2);
}

TEST_F(HistoryManagerTest, EntriesAreIndependentCopies) {
    DiagramSnapshot live = snapshotWith(1);
    history.commit(live);
    history.commit(snapshotWith(2));

    live.nodes[0].text = "changed later";

    auto restored = history.undo();
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->nodes[0].text.empty());

    // Mutating a returned entry does not reach the stored one
    restored->nodes[0].text = "edited";
    EXPECT_TRUE(history.current()->nodes[0].text.empty());
}

TEST_F(HistoryManagerTest, KeepsViewport) {
    DiagramSnapshot snapshot;
    snapshot.viewport = {10.0f, 20.0f, 1.5f};
    history.commit(snapshot);
    history.commit(DiagramSnapshot{});

    auto restored = history.undo();
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->viewport, (Viewport{10.0f, 20.0f, 1.5f}));
}

TEST_F(HistoryManagerTest, Clear) {
    history.commit(snapshotWith(1));
    history.commit(snapshotWith(2));
    history.clear();

    EXPECT_TRUE(history.empty());
    EXPECT_FALSE(history.canUndo());
    EXPECT_EQ(history.current(), nullptr);
}
