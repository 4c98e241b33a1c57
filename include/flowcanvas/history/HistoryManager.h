#pragma once

#include "flowcanvas/core/Diagram.h"
#include "flowcanvas/view/ViewportTransform.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace flowcanvas {

/// Immutable copy of diagram content at one point in history.
/// Selection is deliberately absent.
struct DiagramSnapshot {
    std::vector<NodeData> nodes;
    std::vector<EdgeData> edges;
    Viewport viewport;

    bool operator==(const DiagramSnapshot&) const = default;
};

/// Bounded linear undo/redo stack over snapshots.
///
/// commit() after undo() drops every entry past the current index, so the
/// history never branches. When capacity is exceeded the oldest entry is
/// evicted and all indices shift down by one.
///
/// Snapshots are stored and handed out by value: later changes to live
/// state cannot reach a stored entry, and a returned entry can be moved
/// into live state freely.
class HistoryManager {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;

    explicit HistoryManager(size_t capacity = DEFAULT_CAPACITY);

    void commit(DiagramSnapshot snapshot);

    /// Step back one entry
    /// @return The entry now current, or std::nullopt at the oldest entry
    std::optional<DiagramSnapshot> undo();

    /// Step forward one entry
    /// @return The entry now current, or std::nullopt at the newest entry
    std::optional<DiagramSnapshot> redo();

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    size_t capacity() const noexcept { return capacity_; }

    /// Index of the current entry. Meaningless when empty().
    size_t index() const noexcept { return index_; }

    /// Current entry, if any
    const DiagramSnapshot* current() const;

    void clear();

private:
    std::vector<DiagramSnapshot> entries_;
    size_t index_ = 0;
    size_t capacity_;
};

}  // namespace flowcanvas
