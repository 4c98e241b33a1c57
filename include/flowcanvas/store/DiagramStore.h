#pragma once

#include "ToolState.h"
#include "flowcanvas/config/EditorConfig.h"
#include "flowcanvas/core/Diagram.h"
#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/history/HistoryManager.h"
#include "flowcanvas/view/ViewportTransform.h"

#include <optional>
#include <string>
#include <vector>

namespace flowcanvas {

/// Partial node edit; unset fields are left untouched
struct NodeUpdate {
    std::optional<NodeType> type;
    std::optional<Point> position;
    std::optional<Size> size;
    std::optional<std::string> text;
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<float> strokeWidth;
};

/// Partial viewport edit; scale is clamped
struct ViewportUpdate {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> scale;
};

/// Drag-to-select rectangle in world coordinates
struct SelectionBox {
    Point start;
    Point end;
    bool active = true;

    Rect rect() const { return Rect::fromCorners(start, end); }
};

/// Single source of truth for an open diagram.
///
/// Owns nodes, edges, selection, viewport, tool state, the selection box
/// and the undo history. Every operation runs to completion synchronously;
/// the caller (presentation layer or InputController) re-reads state
/// afterwards.
///
/// History policy:
/// - Discrete edits (add, delete, connect, clear, duplicate, load) commit
///   one snapshot each.
/// - Continuous edits (updateNode, moveSelected, updateEdgeAnchors) never
///   commit; the gesture end does (endDrag() or commitHistory()).
/// - Selection, tool and viewport navigation are never committed.
///
/// Invalid-but-foreseeable input (unknown ids, rejected edges, undo at the
/// boundary) is a silent no-op, logged at debug level.
class DiagramStore {
public:
    explicit DiagramStore(EditorConfig config = EditorConfig::defaults());

    // =========================================================================
    // State Access
    // =========================================================================

    const EditorConfig& config() const { return config_; }
    const Diagram& diagram() const { return diagram_; }
    const std::vector<NodeData>& nodes() const { return diagram_.nodes(); }
    const std::vector<EdgeData>& edges() const { return diagram_.edges(); }

    /// @throws std::out_of_range for unknown ids
    const NodeData& getNode(NodeId id) const { return diagram_.getNode(id); }
    const EdgeData& getEdge(EdgeId id) const { return diagram_.getEdge(id); }

    const NodeData* findNode(NodeId id) const { return diagram_.findNode(id); }
    const EdgeData* findEdge(EdgeId id) const { return diagram_.findEdge(id); }

    const std::vector<NodeId>& selectedNodes() const { return selectedNodes_; }
    const std::vector<EdgeId>& selectedEdges() const { return selectedEdges_; }
    bool isNodeSelected(NodeId id) const;
    bool isEdgeSelected(EdgeId id) const;

    const Viewport& viewport() const { return viewport_; }

    const ToolState& toolState() const { return tool_; }
    Tool tool() const { return toolOf(tool_); }
    bool isConnecting() const;
    std::optional<NodeId> connectionSource() const;

    const std::optional<SelectionBox>& selectionBox() const { return selectionBox_; }

    bool isDragging() const { return dragging_; }
    bool isResizing() const { return resize_.has_value(); }
    bool isPanning() const { return panning_; }

    const HistoryManager& history() const { return history_; }

    /// Current content as a history snapshot
    DiagramSnapshot snapshot() const;

    // =========================================================================
    // Node Operations
    // =========================================================================

    /// Create a node with default size and style, select it, commit.
    /// NodeType::Text is forwarded to addTextNode().
    NodeId addNode(NodeType type, const Point& position);

    /// Create a text node (transparent fill and stroke, zero stroke width), commit
    NodeId addTextNode(const Point& position);

    /// Merge fields into a node. Size is floored at the configured minimum
    /// and stroke width at 0. Does not commit and does not touch edge
    /// anchors: callers changing position/size follow up with
    /// refreshEdgeAnchors() and commit when the gesture ends.
    void updateNode(NodeId id, const NodeUpdate& update);

    /// Remove a node and its incident edges, prune selection, commit
    void deleteNode(NodeId id);

    /// Copy the selected nodes and the edges among them, offset by
    /// config().duplicateOffset; the copies become the selection. Commits.
    /// @return Ids of the new nodes, in selection order
    std::vector<NodeId> duplicateSelected();

    // =========================================================================
    // Selection
    // =========================================================================

    /// multiSelect toggles membership. Otherwise selects only id, or clears
    /// when id was the sole selected node. Edge selection is always cleared.
    void selectNode(NodeId id, bool multiSelect = false);

    /// Replace node selection (unknown ids are skipped), clear edge selection
    void selectNodes(const std::vector<NodeId>& ids);

    /// Edge counterpart of selectNode(); clears node selection
    void selectEdge(EdgeId id, bool multiSelect = false);

    void selectAll();
    void clearSelection();

    /// Remove selected nodes, selected edges and edges touching removed
    /// nodes in one commit. No-op when nothing is selected.
    void deleteSelected();

    // =========================================================================
    // Edge Operations
    // =========================================================================

    /// Connect two nodes. Rejected (std::nullopt) when either node is
    /// missing, source == target, or the pair is already connected in
    /// either direction. On success the tool returns to Select and the
    /// change is committed.
    std::optional<EdgeId> addEdge(NodeId sourceId, NodeId targetId);

    /// Remove one edge, prune selection, commit
    void deleteEdge(EdgeId id);

    /// Overwrite cached anchors. Does not commit.
    void updateEdgeAnchors(EdgeId id, const Point& sourceAnchor, const Point& targetAnchor);

    /// Recompute both anchors of every edge touching nodeId. Does not commit.
    void refreshEdgeAnchors(NodeId nodeId);

    // =========================================================================
    // Drag Gesture
    // =========================================================================

    void beginDrag();

    /// Translate every selected node by a world-space delta and refresh
    /// affected anchors. Does not commit.
    void moveSelected(const Point& delta);

    /// Finish the gesture; commits once if anything moved since beginDrag()
    void endDrag();

    // =========================================================================
    // Resize Gesture
    // =========================================================================

    /// Start resizing nodeId from one of its grips. Unknown ids are ignored.
    void beginResize(NodeId nodeId, ResizeHandle handle);

    /// Move the active grip to a world point. The opposite edges stay where
    /// they were at beginResize(), size is floored at the configured minimum
    /// and incident anchors are refreshed. Does not commit.
    void resizeTo(const Point& worldPoint);

    /// Finish the gesture; commits once if the bounds changed
    void endResize();

    // =========================================================================
    // Viewport (never committed)
    // =========================================================================

    void setViewport(const ViewportUpdate& update);
    void zoom(float delta, const Point& pivot);
    void pan(const Point& delta);

    // =========================================================================
    // Tool and Connection State
    // =========================================================================

    /// Switch tool; any in-progress connection is discarded
    void setTool(Tool tool);

    /// Record nodeId as connection source and enter the connecting state
    void startConnection(NodeId nodeId);

    /// Conclude a connection: a distinct node attempts addEdge(). The
    /// connecting state is cleared and the tool returns to Select in every
    /// case.
    void endConnection(NodeId nodeId);

    /// Abandon the connection (Escape); tool returns to Select
    void cancelConnection();

    /// Pointer click on a node, interpreted by the current tool:
    /// - line tool, idle: start connecting from the node
    /// - line tool, connecting: another node concludes the connection,
    ///   the source node itself is ignored
    /// - any other tool: selectNode(nodeId, multiSelect)
    void handleNodeInteraction(NodeId nodeId, bool multiSelect = false);

    // =========================================================================
    // Selection Box (never committed)
    // =========================================================================

    void startSelectionBox(const Point& point);
    void updateSelectionBox(const Point& point);

    /// Select every node whose bounds overlap the box (inclusive) and drop the box
    void endSelectionBox();

    void cancelSelectionBox();

    // =========================================================================
    // Interaction Flags
    // =========================================================================

    void setDragging(bool dragging) { dragging_ = dragging; }
    void setPanning(bool panning) { panning_ = panning; }

    // =========================================================================
    // History
    // =========================================================================

    /// Push the current content as a new history entry
    void commitHistory();

    void undo();
    void redo();

    // =========================================================================
    // Whole-Diagram Operations
    // =========================================================================

    /// Remove all content, reset the viewport, commit
    void clear();

    /// Replace content with validated copies and commit. Sizes are floored,
    /// edges that dangle, self-loop or duplicate a pair are dropped, and
    /// anchors are recomputed. Viewport and selection are reset.
    void loadDiagram(const std::vector<NodeData>& nodes, const std::vector<EdgeData>& edges);

private:
    NodeId insertNode(NodeData node);
    void clampNode(NodeData& node) const;
    void restore(const DiagramSnapshot& snapshot);
    void resetConnectionIfSourceGone();

    /// Next unused id; skips the INVALID_* sentinel and ids already present
    NodeId takeNodeId();
    EdgeId takeEdgeId();

    struct ResizeState {
        NodeId nodeId = INVALID_NODE;
        ResizeHandle handle = ResizeHandle::BottomRight;
        Rect startBounds;
        bool changed = false;
    };

    EditorConfig config_;
    Diagram diagram_;
    HistoryManager history_;

    std::vector<NodeId> selectedNodes_;
    std::vector<EdgeId> selectedEdges_;

    Viewport viewport_ = viewport::DEFAULT_VIEWPORT;
    ToolState tool_ = SelectTool{};
    std::optional<SelectionBox> selectionBox_;

    bool dragging_ = false;
    bool dragMoved_ = false;
    bool panning_ = false;
    std::optional<ResizeState> resize_;

    // Never restored from history, so ids stay unique across undo/redo
    // until the 32-bit space is exhausted
    NodeId nextNodeId_ = 0;
    EdgeId nextEdgeId_ = 0;
};

}  // namespace flowcanvas
