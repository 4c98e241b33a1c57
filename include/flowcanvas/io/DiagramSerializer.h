#pragma once

#include "flowcanvas/config/EditorConfig.h"
#include "flowcanvas/core/Diagram.h"

#include <optional>
#include <string>
#include <vector>

namespace flowcanvas {

// Forward declarations
class DiagramStore;

/// Interchange form of a diagram: exactly its nodes and edges
struct DiagramDocument {
    std::vector<NodeData> nodes;
    std::vector<EdgeData> edges;
};

/// JSON encoding of diagrams for external stores, plus editor config loading.
///
/// Format (version 1):
/// @code
/// {
///   "version": 1,
///   "nodes": [{"id": "0", "type": "rectangle", "position": {"x": 0, "y": 0},
///              "size": {"width": 120, "height": 80}, "text": "New Node",
///              "fill": "#ffffff", "stroke": "#666666", "strokeWidth": 2}],
///   "edges": [{"id": "0", "sourceNodeId": "0", "targetNodeId": "1",
///              "sourceAnchor": {"x": 120, "y": 40}, "targetAnchor": {"x": 200, "y": 40}}]
/// }
/// @endcode
/// Edges reference nodes by id string only.
class DiagramSerializer {
public:
    // === Diagram serialization ===

    static std::string toJson(const DiagramDocument& document);

    /// Serialize the store's current nodes and edges
    static std::string toJson(const DiagramStore& store);

    /// Parse a document
    /// @return std::nullopt if the text is not valid JSON or a field has the wrong type
    static std::optional<DiagramDocument> documentFromJson(const std::string& json);

    /// Parse and load into the store (DiagramStore::loadDiagram)
    /// @return true if parsing succeeded
    static bool load(DiagramStore& store, const std::string& json);

    static bool saveToFile(const DiagramStore& store, const std::string& path);
    static bool loadFromFile(DiagramStore& store, const std::string& path);

    // === Config ===

    /// Read an EditorConfig. Missing keys keep their EditorConfig::defaults() value.
    /// @return std::nullopt if the text is not valid JSON or a field has the wrong type
    static std::optional<EditorConfig> configFromJson(const std::string& json);

    // === Node type names ===

    static std::string nodeTypeToString(NodeType type);

    /// Unknown names map to NodeType::Rectangle
    static NodeType stringToNodeType(const std::string& str);
};

}  // namespace flowcanvas
