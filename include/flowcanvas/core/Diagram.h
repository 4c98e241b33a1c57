#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace flowcanvas {

/// Shape discriminator of a node
enum class NodeType {
    Rectangle,
    Ellipse,
    Diamond,
    Text
};

struct NodeData {
    NodeId id = INVALID_NODE;
    NodeType type = NodeType::Rectangle;
    Point position;                      ///< World-space top-left corner
    Size size = {120.0f, 80.0f};
    std::string text;
    std::string fill;
    std::string stroke;
    float strokeWidth = 0.0f;

    Rect bounds() const { return {position, size}; }
    Point center() const { return bounds().center(); }

    bool operator==(const NodeData&) const = default;
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId sourceNodeId = INVALID_NODE;
    NodeId targetNodeId = INVALID_NODE;
    Point sourceAnchor;                  ///< Cached, derived from both endpoint nodes
    Point targetAnchor;                  ///< Cached, derived from both endpoint nodes

    /// True if this edge joins a and b in either direction
    bool connects(NodeId a, NodeId b) const {
        return (sourceNodeId == a && targetNodeId == b) ||
               (sourceNodeId == b && targetNodeId == a);
    }

    bool isIncidentTo(NodeId id) const {
        return sourceNodeId == id || targetNodeId == id;
    }

    bool operator==(const EdgeData&) const = default;
};

/// Diagram content: nodes in draw order plus the edges between them.
///
/// Ids are assigned by the owner (DiagramStore); the container only keeps
/// referential integrity: an edge can only be added between existing
/// nodes and removing a node removes its incident edges.
class Diagram {
public:
    Diagram() = default;

    // Node operations
    void addNode(NodeData node);

    /// Remove a node and every incident edge
    /// @return Ids of the edges removed along with the node
    std::vector<EdgeId> removeNode(NodeId id);
    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): Reference return for ids known to exist. Throws std::out_of_range otherwise.
    //   WARNING: Returned reference is invalidated by any add/remove!
    // - findNode(): Pointer return, nullptr for unknown ids.
    const NodeData& getNode(NodeId id) const;
    NodeData& getNode(NodeId id);
    const NodeData* findNode(NodeId id) const;
    NodeData* findNode(NodeId id);

    // Edge operations

    /// @throws std::invalid_argument if an endpoint node does not exist
    void addEdge(EdgeData edge);
    bool removeEdge(EdgeId id);
    bool hasEdge(EdgeId id) const;

    const EdgeData& getEdge(EdgeId id) const;
    EdgeData& getEdge(EdgeId id);
    const EdgeData* findEdge(EdgeId id) const;
    EdgeData* findEdge(EdgeId id);

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty() && edges_.empty(); }

    const std::vector<NodeData>& nodes() const { return nodes_; }
    const std::vector<EdgeData>& edges() const { return edges_; }

    /// Edges where id is source or target
    std::vector<EdgeId> connectedEdges(NodeId id) const;

    /// Find the edge joining a and b, ignoring direction
    std::optional<EdgeId> findEdgeBetween(NodeId a, NodeId b) const;

    /// Replace all content. Edges must reference nodes in the given set.
    void assign(std::vector<NodeData> nodes, std::vector<EdgeData> edges);

    void clear();

    bool operator==(const Diagram&) const = default;

private:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
};

}  // namespace flowcanvas
