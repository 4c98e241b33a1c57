#include "flowcanvas/core/Diagram.h"

#include <algorithm>

namespace flowcanvas {

void Diagram::addNode(NodeData node) {
    if (hasNode(node.id)) {
        throw std::invalid_argument("Duplicate node ID: " + std::to_string(node.id));
    }
    nodes_.push_back(std::move(node));
}

std::vector<EdgeId> Diagram::removeNode(NodeId id) {
    std::vector<EdgeId> removedEdges;

    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [id](const NodeData& n) { return n.id == id; });
    if (it == nodes_.end()) return removedEdges;

    // Remove all edges connected to this node
    for (const auto& edge : edges_) {
        if (edge.isIncidentTo(id)) {
            removedEdges.push_back(edge.id);
        }
    }
    edges_.erase(std::remove_if(edges_.begin(), edges_.end(),
                                [id](const EdgeData& e) { return e.isIncidentTo(id); }),
                 edges_.end());

    nodes_.erase(it);
    return removedEdges;
}

bool Diagram::hasNode(NodeId id) const {
    return findNode(id) != nullptr;
}

const NodeData& Diagram::getNode(NodeId id) const {
    const NodeData* node = findNode(id);
    if (!node) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return *node;
}

NodeData& Diagram::getNode(NodeId id) {
    NodeData* node = findNode(id);
    if (!node) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return *node;
}

const NodeData* Diagram::findNode(NodeId id) const {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [id](const NodeData& n) { return n.id == id; });
    return it != nodes_.end() ? &*it : nullptr;
}

NodeData* Diagram::findNode(NodeId id) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [id](const NodeData& n) { return n.id == id; });
    return it != nodes_.end() ? &*it : nullptr;
}

void Diagram::addEdge(EdgeData edge) {
    if (!hasNode(edge.sourceNodeId) || !hasNode(edge.targetNodeId)) {
        throw std::invalid_argument("Invalid node ID in edge");
    }
    if (hasEdge(edge.id)) {
        throw std::invalid_argument("Duplicate edge ID: " + std::to_string(edge.id));
    }
    edges_.push_back(std::move(edge));
}

bool Diagram::removeEdge(EdgeId id) {
    auto it = std::find_if(edges_.begin(), edges_.end(),
                           [id](const EdgeData& e) { return e.id == id; });
    if (it == edges_.end()) return false;
    edges_.erase(it);
    return true;
}

bool Diagram::hasEdge(EdgeId id) const {
    return findEdge(id) != nullptr;
}

const EdgeData& Diagram::getEdge(EdgeId id) const {
    const EdgeData* edge = findEdge(id);
    if (!edge) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return *edge;
}

EdgeData& Diagram::getEdge(EdgeId id) {
    EdgeData* edge = findEdge(id);
    if (!edge) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return *edge;
}

const EdgeData* Diagram::findEdge(EdgeId id) const {
    auto it = std::find_if(edges_.begin(), edges_.end(),
                           [id](const EdgeData& e) { return e.id == id; });
    return it != edges_.end() ? &*it : nullptr;
}

EdgeData* Diagram::findEdge(EdgeId id) {
    auto it = std::find_if(edges_.begin(), edges_.end(),
                           [id](const EdgeData& e) { return e.id == id; });
    return it != edges_.end() ? &*it : nullptr;
}

std::vector<EdgeId> Diagram::connectedEdges(NodeId id) const {
    std::vector<EdgeId> result;
    for (const auto& edge : edges_) {
        if (edge.isIncidentTo(id)) {
            result.push_back(edge.id);
        }
    }
    return result;
}

std::optional<EdgeId> Diagram::findEdgeBetween(NodeId a, NodeId b) const {
    for (const auto& edge : edges_) {
        if (edge.connects(a, b)) {
            return edge.id;
        }
    }
    return std::nullopt;
}

void Diagram::assign(std::vector<NodeData> nodes, std::vector<EdgeData> edges) {
    nodes_ = std::move(nodes);
    edges_ = std::move(edges);
}

void Diagram::clear() {
    nodes_.clear();
    edges_.clear();
}

}  // namespace flowcanvas
