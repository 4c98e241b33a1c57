#include "flowcanvas/store/DiagramStore.h"
#include "flowcanvas/common/Logger.h"
#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/core/Shape.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace flowcanvas {

namespace {

template <typename Id>
bool containsId(const std::vector<Id>& ids, Id id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

template <typename Id>
void eraseId(std::vector<Id>& ids, Id id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

EditorConfig validated(EditorConfig config) {
    if (config.isValid()) {
        return config;
    }
    LOG_WARN("Invalid editor config, falling back to defaults");
    return EditorConfig::defaults();
}

}  // namespace

DiagramStore::DiagramStore(EditorConfig config)
    : config_(validated(std::move(config))),
      history_(config_.historyCapacity) {}

bool DiagramStore::isNodeSelected(NodeId id) const {
    return containsId(selectedNodes_, id);
}

bool DiagramStore::isEdgeSelected(EdgeId id) const {
    return containsId(selectedEdges_, id);
}

bool DiagramStore::isConnecting() const {
    return connectionSource().has_value();
}

std::optional<NodeId> DiagramStore::connectionSource() const {
    if (const auto* connect = std::get_if<ConnectTool>(&tool_)) {
        return connect->source;
    }
    return std::nullopt;
}

DiagramSnapshot DiagramStore::snapshot() const {
    return {diagram_.nodes(), diagram_.edges(), viewport_};
}

// =============================================================================
// Node Operations
// =============================================================================

NodeId DiagramStore::addNode(NodeType type, const Point& position) {
    if (type == NodeType::Text) {
        return addTextNode(position);
    }

    NodeData node;
    node.type = type;
    node.position = position;
    node.size = std::visit([&](const auto& shape) { return shape.defaultSize(config_); },
                           shapeFor(type));
    node.text = config_.shapeStyle.text;
    node.fill = config_.shapeStyle.fill;
    node.stroke = config_.shapeStyle.stroke;
    node.strokeWidth = config_.shapeStyle.strokeWidth;

    return insertNode(std::move(node));
}

NodeId DiagramStore::addTextNode(const Point& position) {
    NodeData node;
    node.type = NodeType::Text;
    node.position = position;
    node.size = TextShape{}.defaultSize(config_);
    node.text = config_.textStyle.text;
    node.fill = config_.textStyle.fill;
    node.stroke = config_.textStyle.stroke;
    node.strokeWidth = config_.textStyle.strokeWidth;

    return insertNode(std::move(node));
}

NodeId DiagramStore::takeNodeId() {
    for (;;) {
        if (nextNodeId_ == INVALID_NODE) {
            LOG_WARN("Node id space exhausted, reusing free ids");
            nextNodeId_ = 0;
        }
        if (!diagram_.hasNode(nextNodeId_)) {
            return nextNodeId_++;
        }
        ++nextNodeId_;
    }
}

EdgeId DiagramStore::takeEdgeId() {
    for (;;) {
        if (nextEdgeId_ == INVALID_EDGE) {
            LOG_WARN("Edge id space exhausted, reusing free ids");
            nextEdgeId_ = 0;
        }
        if (!diagram_.hasEdge(nextEdgeId_)) {
            return nextEdgeId_++;
        }
        ++nextEdgeId_;
    }
}

NodeId DiagramStore::insertNode(NodeData node) {
    node.id = takeNodeId();
    clampNode(node);
    NodeId id = node.id;

    diagram_.addNode(std::move(node));
    selectedNodes_ = {id};
    selectedEdges_.clear();

    LOG_DEBUG("Added node {}", id);
    commitHistory();
    return id;
}

void DiagramStore::clampNode(NodeData& node) const {
    node.size.width = std::max(node.size.width, config_.minNodeSize);
    node.size.height = std::max(node.size.height, config_.minNodeSize);
    node.strokeWidth = std::max(node.strokeWidth, 0.0f);
}

void DiagramStore::updateNode(NodeId id, const NodeUpdate& update) {
    NodeData* node = diagram_.findNode(id);
    if (!node) {
        LOG_DEBUG("Ignoring update of unknown node {}", id);
        return;
    }

    if (update.type) node->type = *update.type;
    if (update.position) node->position = *update.position;
    if (update.size) node->size = *update.size;
    if (update.text) node->text = *update.text;
    if (update.fill) node->fill = *update.fill;
    if (update.stroke) node->stroke = *update.stroke;
    if (update.strokeWidth) node->strokeWidth = *update.strokeWidth;

    clampNode(*node);
}

void DiagramStore::deleteNode(NodeId id) {
    if (!diagram_.hasNode(id)) {
        LOG_DEBUG("Ignoring delete of unknown node {}", id);
        return;
    }

    auto removedEdges = diagram_.removeNode(id);
    eraseId(selectedNodes_, id);
    for (EdgeId edgeId : removedEdges) {
        eraseId(selectedEdges_, edgeId);
    }
    resetConnectionIfSourceGone();

    LOG_DEBUG("Deleted node {} with {} incident edges", id, removedEdges.size());
    commitHistory();
}

std::vector<NodeId> DiagramStore::duplicateSelected() {
    std::vector<NodeId> copies;
    if (selectedNodes_.empty()) return copies;

    std::unordered_map<NodeId, NodeId> copyOf;
    for (NodeId id : selectedNodes_) {
        const NodeData* original = diagram_.findNode(id);
        if (!original) continue;

        NodeData copy = *original;
        copy.id = takeNodeId();
        copy.position = original->position + config_.duplicateOffset;
        copyOf[id] = copy.id;
        copies.push_back(copy.id);
        diagram_.addNode(std::move(copy));
    }

    // Edges whose both ends were duplicated follow their nodes
    std::vector<std::pair<NodeId, NodeId>> copiedPairs;
    for (const auto& edge : diagram_.edges()) {
        auto src = copyOf.find(edge.sourceNodeId);
        auto dst = copyOf.find(edge.targetNodeId);
        if (src == copyOf.end() || dst == copyOf.end()) continue;
        copiedPairs.emplace_back(src->second, dst->second);
    }
    for (const auto& [sourceId, targetId] : copiedPairs) {
        EdgeData copy;
        copy.id = takeEdgeId();
        copy.sourceNodeId = sourceId;
        copy.targetNodeId = targetId;
        auto anchors = geometry::connectionPoints(diagram_.getNode(sourceId),
                                                  diagram_.getNode(targetId));
        copy.sourceAnchor = anchors.source;
        copy.targetAnchor = anchors.target;
        diagram_.addEdge(std::move(copy));
    }

    selectedNodes_ = copies;
    selectedEdges_.clear();

    LOG_DEBUG("Duplicated {} nodes and {} edges", copies.size(), copiedPairs.size());
    commitHistory();
    return copies;
}

// =============================================================================
// Selection
// =============================================================================

void DiagramStore::selectNode(NodeId id, bool multiSelect) {
    if (!diagram_.hasNode(id)) return;

    bool wasSelected = isNodeSelected(id);

    if (multiSelect) {
        if (wasSelected) {
            eraseId(selectedNodes_, id);
        } else {
            selectedNodes_.push_back(id);
        }
    } else if (wasSelected && selectedNodes_.size() == 1) {
        // Click on the only selected node deselects it
        selectedNodes_.clear();
    } else {
        selectedNodes_ = {id};
    }

    selectedEdges_.clear();
}

void DiagramStore::selectNodes(const std::vector<NodeId>& ids) {
    selectedNodes_.clear();
    for (NodeId id : ids) {
        if (diagram_.hasNode(id) && !isNodeSelected(id)) {
            selectedNodes_.push_back(id);
        }
    }
    selectedEdges_.clear();
}

void DiagramStore::selectEdge(EdgeId id, bool multiSelect) {
    if (!diagram_.hasEdge(id)) return;

    bool wasSelected = isEdgeSelected(id);

    if (multiSelect) {
        if (wasSelected) {
            eraseId(selectedEdges_, id);
        } else {
            selectedEdges_.push_back(id);
        }
    } else if (wasSelected && selectedEdges_.size() == 1) {
        selectedEdges_.clear();
    } else {
        selectedEdges_ = {id};
    }

    selectedNodes_.clear();
}

void DiagramStore::selectAll() {
    selectedNodes_.clear();
    for (const auto& node : diagram_.nodes()) {
        selectedNodes_.push_back(node.id);
    }
    selectedEdges_.clear();
}

void DiagramStore::clearSelection() {
    selectedNodes_.clear();
    selectedEdges_.clear();
}

void DiagramStore::deleteSelected() {
    if (selectedNodes_.empty() && selectedEdges_.empty()) return;

    size_t nodeCount = 0;
    size_t edgeCount = 0;

    for (EdgeId id : selectedEdges_) {
        if (diagram_.removeEdge(id)) ++edgeCount;
    }
    for (NodeId id : selectedNodes_) {
        if (!diagram_.hasNode(id)) continue;
        edgeCount += diagram_.removeNode(id).size();
        ++nodeCount;
    }

    clearSelection();
    resetConnectionIfSourceGone();

    LOG_DEBUG("Deleted {} nodes and {} edges", nodeCount, edgeCount);
    commitHistory();
}

// =============================================================================
// Edge Operations
// =============================================================================

std::optional<EdgeId> DiagramStore::addEdge(NodeId sourceId, NodeId targetId) {
    const NodeData* source = diagram_.findNode(sourceId);
    const NodeData* target = diagram_.findNode(targetId);

    if (!source || !target) {
        LOG_DEBUG("Edge {} -> {} rejected: missing node", sourceId, targetId);
        return std::nullopt;
    }
    if (sourceId == targetId) {
        LOG_DEBUG("Edge {} -> {} rejected: self-loop", sourceId, targetId);
        return std::nullopt;
    }
    if (diagram_.findEdgeBetween(sourceId, targetId)) {
        LOG_DEBUG("Edge {} -> {} rejected: nodes already connected", sourceId, targetId);
        return std::nullopt;
    }

    auto anchors = geometry::connectionPoints(*source, *target);

    EdgeData edge;
    edge.id = takeEdgeId();
    edge.sourceNodeId = sourceId;
    edge.targetNodeId = targetId;
    edge.sourceAnchor = anchors.source;
    edge.targetAnchor = anchors.target;

    EdgeId id = edge.id;
    diagram_.addEdge(std::move(edge));
    tool_ = SelectTool{};

    LOG_DEBUG("Added edge {} ({} -> {})", id, sourceId, targetId);
    commitHistory();
    return id;
}

void DiagramStore::deleteEdge(EdgeId id) {
    if (!diagram_.removeEdge(id)) {
        LOG_DEBUG("Ignoring delete of unknown edge {}", id);
        return;
    }
    eraseId(selectedEdges_, id);
    commitHistory();
}

void DiagramStore::updateEdgeAnchors(EdgeId id, const Point& sourceAnchor, const Point& targetAnchor) {
    EdgeData* edge = diagram_.findEdge(id);
    if (!edge) return;
    edge->sourceAnchor = sourceAnchor;
    edge->targetAnchor = targetAnchor;
}

void DiagramStore::refreshEdgeAnchors(NodeId nodeId) {
    for (EdgeId edgeId : diagram_.connectedEdges(nodeId)) {
        EdgeData& edge = diagram_.getEdge(edgeId);
        auto anchors = geometry::connectionPoints(diagram_.getNode(edge.sourceNodeId),
                                                  diagram_.getNode(edge.targetNodeId));
        edge.sourceAnchor = anchors.source;
        edge.targetAnchor = anchors.target;
    }
}

// =============================================================================
// Drag Gesture
// =============================================================================

void DiagramStore::beginDrag() {
    dragging_ = true;
    dragMoved_ = false;
}

void DiagramStore::moveSelected(const Point& delta) {
    if (selectedNodes_.empty() || (delta.x == 0.0f && delta.y == 0.0f)) return;

    for (NodeId id : selectedNodes_) {
        NodeData* node = diagram_.findNode(id);
        if (!node) continue;
        node->position = node->position + delta;
    }

    // After all moves, so edges between two moved nodes see both new centers
    for (NodeId id : selectedNodes_) {
        refreshEdgeAnchors(id);
    }
    dragMoved_ = true;
}

void DiagramStore::endDrag() {
    bool moved = dragging_ && dragMoved_;
    dragging_ = false;
    dragMoved_ = false;

    if (moved) {
        commitHistory();
    }
}

// =============================================================================
// Resize Gesture
// =============================================================================

void DiagramStore::beginResize(NodeId nodeId, ResizeHandle handle) {
    const NodeData* node = diagram_.findNode(nodeId);
    if (!node) {
        LOG_DEBUG("Ignoring resize of unknown node {}", nodeId);
        return;
    }
    resize_ = ResizeState{nodeId, handle, node->bounds(), false};
}

void DiagramStore::resizeTo(const Point& worldPoint) {
    if (!resize_) return;

    NodeData* node = diagram_.findNode(resize_->nodeId);
    if (!node) {
        resize_.reset();
        return;
    }

    Rect bounds = geometry::resizedBounds(resize_->startBounds, resize_->handle,
                                          worldPoint, config_.minNodeSize);
    if (bounds == node->bounds()) return;

    node->position = bounds.position();
    node->size = bounds.size();
    clampNode(*node);
    refreshEdgeAnchors(resize_->nodeId);
    resize_->changed = true;
}

void DiagramStore::endResize() {
    if (!resize_) return;

    bool changed = resize_->changed && diagram_.hasNode(resize_->nodeId) &&
                   diagram_.getNode(resize_->nodeId).bounds() != resize_->startBounds;
    resize_.reset();

    if (changed) {
        commitHistory();
    }
}

// =============================================================================
// Viewport
// =============================================================================

void DiagramStore::setViewport(const ViewportUpdate& update) {
    if (update.x) viewport_.x = *update.x;
    if (update.y) viewport_.y = *update.y;
    if (update.scale) viewport_.scale = viewport::clampScale(*update.scale);
}

void DiagramStore::zoom(float delta, const Point& pivot) {
    viewport_ = viewport::zoom(delta, pivot, viewport_);
}

void DiagramStore::pan(const Point& delta) {
    viewport_ = viewport::pan(delta, viewport_);
}

// =============================================================================
// Tool and Connection State
// =============================================================================

void DiagramStore::setTool(Tool tool) {
    tool_ = toolStateFor(tool);
}

void DiagramStore::startConnection(NodeId nodeId) {
    if (!diagram_.hasNode(nodeId)) {
        LOG_DEBUG("Ignoring connection from unknown node {}", nodeId);
        return;
    }
    tool_ = ConnectTool{nodeId};
}

void DiagramStore::endConnection(NodeId nodeId) {
    auto source = connectionSource();
    if (!source) return;

    if (*source != nodeId) {
        addEdge(*source, nodeId);
    }
    tool_ = SelectTool{};
}

void DiagramStore::cancelConnection() {
    tool_ = SelectTool{};
}

void DiagramStore::handleNodeInteraction(NodeId nodeId, bool multiSelect) {
    if (!diagram_.hasNode(nodeId)) return;

    auto* connect = std::get_if<ConnectTool>(&tool_);
    if (!connect) {
        selectNode(nodeId, multiSelect);
        return;
    }

    if (!connect->source) {
        startConnection(nodeId);
    } else if (*connect->source != nodeId) {
        endConnection(nodeId);
    }
}

void DiagramStore::resetConnectionIfSourceGone() {
    auto source = connectionSource();
    if (source && !diagram_.hasNode(*source)) {
        tool_ = ConnectTool{};
    }
}

// =============================================================================
// Selection Box
// =============================================================================

void DiagramStore::startSelectionBox(const Point& point) {
    selectionBox_ = SelectionBox{point, point, true};
}

void DiagramStore::updateSelectionBox(const Point& point) {
    if (!selectionBox_) return;
    selectionBox_->end = point;
}

void DiagramStore::endSelectionBox() {
    if (!selectionBox_) return;

    Rect box = selectionBox_->rect();
    selectedNodes_.clear();
    for (const auto& node : diagram_.nodes()) {
        if (node.bounds().overlaps(box)) {
            selectedNodes_.push_back(node.id);
        }
    }
    selectedEdges_.clear();
    selectionBox_.reset();
}

void DiagramStore::cancelSelectionBox() {
    selectionBox_.reset();
}

// =============================================================================
// History
// =============================================================================

void DiagramStore::commitHistory() {
    history_.commit(snapshot());
}

void DiagramStore::undo() {
    auto entry = history_.undo();
    if (!entry) {
        LOG_DEBUG("Nothing to undo");
        return;
    }
    restore(*entry);
}

void DiagramStore::redo() {
    auto entry = history_.redo();
    if (!entry) {
        LOG_DEBUG("Nothing to redo");
        return;
    }
    restore(*entry);
}

void DiagramStore::restore(const DiagramSnapshot& snapshot) {
    diagram_.assign(snapshot.nodes, snapshot.edges);
    viewport_ = snapshot.viewport;
    clearSelection();
    selectionBox_.reset();
    resize_.reset();
    resetConnectionIfSourceGone();
}

// =============================================================================
// Whole-Diagram Operations
// =============================================================================

void DiagramStore::clear() {
    diagram_.clear();
    clearSelection();
    selectionBox_.reset();
    viewport_ = viewport::DEFAULT_VIEWPORT;
    resetConnectionIfSourceGone();

    LOG_INFO("Diagram cleared");
    commitHistory();
}

void DiagramStore::loadDiagram(const std::vector<NodeData>& nodes, const std::vector<EdgeData>& edges) {
    Diagram loaded;

    for (const auto& source : nodes) {
        if (source.id == INVALID_NODE || loaded.hasNode(source.id)) {
            LOG_WARN("Skipping node with invalid or duplicate id {}", source.id);
            continue;
        }
        NodeData node = source;
        clampNode(node);
        nextNodeId_ = std::max(nextNodeId_, node.id + 1);
        loaded.addNode(std::move(node));
    }

    size_t dropped = 0;
    std::unordered_set<EdgeId> seenEdges;
    for (const auto& source : edges) {
        bool valid = source.id != INVALID_EDGE &&
                     seenEdges.insert(source.id).second &&
                     source.sourceNodeId != source.targetNodeId &&
                     loaded.hasNode(source.sourceNodeId) &&
                     loaded.hasNode(source.targetNodeId) &&
                     !loaded.findEdgeBetween(source.sourceNodeId, source.targetNodeId);
        if (!valid) {
            ++dropped;
            continue;
        }

        EdgeData edge = source;
        auto anchors = geometry::connectionPoints(loaded.getNode(edge.sourceNodeId),
                                                  loaded.getNode(edge.targetNodeId));
        edge.sourceAnchor = anchors.source;
        edge.targetAnchor = anchors.target;
        nextEdgeId_ = std::max(nextEdgeId_, edge.id + 1);
        loaded.addEdge(std::move(edge));
    }
    if (dropped > 0) {
        LOG_WARN("Dropped {} invalid edges while loading", dropped);
    }

    diagram_ = std::move(loaded);
    clearSelection();
    selectionBox_.reset();
    viewport_ = viewport::DEFAULT_VIEWPORT;
    resetConnectionIfSourceGone();

    LOG_INFO("Loaded diagram with {} nodes and {} edges", diagram_.nodeCount(), diagram_.edgeCount());
    commitHistory();
}

}  // namespace flowcanvas
