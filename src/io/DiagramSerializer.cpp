#include "flowcanvas/io/DiagramSerializer.h"
#include "flowcanvas/common/Logger.h"
#include "flowcanvas/store/DiagramStore.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace flowcanvas {

namespace {

constexpr int FORMAT_VERSION = 1;

json pointToJson(const Point& p) {
    return {{"x", p.x}, {"y", p.y}};
}

Point pointFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>()};
}

json sizeToJson(const Size& s) {
    return {{"width", s.width}, {"height", s.height}};
}

Size sizeFromJson(const json& j) {
    return {j.at("width").get<float>(), j.at("height").get<float>()};
}

// Ids travel as decimal strings; bare numbers are accepted too
uint32_t idFromJson(const json& j) {
    if (j.is_string()) {
        unsigned long value = std::stoul(j.get<std::string>());
        if (value >= UINT32_MAX) {
            throw std::out_of_range("id out of range");
        }
        return static_cast<uint32_t>(value);
    }
    return j.get<uint32_t>();
}

}  // namespace

std::string DiagramSerializer::nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::Rectangle: return "rectangle";
        case NodeType::Ellipse: return "ellipse";
        case NodeType::Diamond: return "diamond";
        case NodeType::Text: return "text";
    }
    return "rectangle";
}

NodeType DiagramSerializer::stringToNodeType(const std::string& str) {
    if (str == "rectangle") return NodeType::Rectangle;
    if (str == "ellipse") return NodeType::Ellipse;
    if (str == "diamond") return NodeType::Diamond;
    if (str == "text") return NodeType::Text;
    return NodeType::Rectangle;
}

std::string DiagramSerializer::toJson(const DiagramDocument& document) {
    json j;
    j["version"] = FORMAT_VERSION;

    json nodes = json::array();
    for (const auto& node : document.nodes) {
        nodes.push_back({
            {"id", std::to_string(node.id)},
            {"type", nodeTypeToString(node.type)},
            {"position", pointToJson(node.position)},
            {"size", sizeToJson(node.size)},
            {"text", node.text},
            {"fill", node.fill},
            {"stroke", node.stroke},
            {"strokeWidth", node.strokeWidth}
        });
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : document.edges) {
        edges.push_back({
            {"id", std::to_string(edge.id)},
            {"sourceNodeId", std::to_string(edge.sourceNodeId)},
            {"targetNodeId", std::to_string(edge.targetNodeId)},
            {"sourceAnchor", pointToJson(edge.sourceAnchor)},
            {"targetAnchor", pointToJson(edge.targetAnchor)}
        });
    }
    j["edges"] = edges;

    return j.dump(2);
}

std::string DiagramSerializer::toJson(const DiagramStore& store) {
    return toJson(DiagramDocument{store.nodes(), store.edges()});
}

std::optional<DiagramDocument> DiagramSerializer::documentFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("Diagram JSON must be an object, got {}", j.type_name());
            return std::nullopt;
        }
        for (const char* key : {"nodes", "edges"}) {
            if (j.contains(key) && !j[key].is_array()) {
                LOG_WARN("Diagram JSON field '{}' must be an array", key);
                return std::nullopt;
            }
        }

        DiagramDocument document;

        if (j.contains("nodes")) {
            for (const auto& value : j.at("nodes")) {
                NodeData node;
                node.id = idFromJson(value.at("id"));
                node.type = stringToNodeType(value.value("type", "rectangle"));
                node.position = pointFromJson(value.at("position"));
                node.size = sizeFromJson(value.at("size"));
                node.text = value.value("text", "");
                node.fill = value.value("fill", "");
                node.stroke = value.value("stroke", "");
                node.strokeWidth = value.value("strokeWidth", 0.0f);
                document.nodes.push_back(std::move(node));
            }
        }

        if (j.contains("edges")) {
            for (const auto& value : j.at("edges")) {
                EdgeData edge;
                edge.id = idFromJson(value.at("id"));
                edge.sourceNodeId = idFromJson(value.at("sourceNodeId"));
                edge.targetNodeId = idFromJson(value.at("targetNodeId"));
                if (value.contains("sourceAnchor")) {
                    edge.sourceAnchor = pointFromJson(value.at("sourceAnchor"));
                }
                if (value.contains("targetAnchor")) {
                    edge.targetAnchor = pointFromJson(value.at("targetAnchor"));
                }
                document.edges.push_back(edge);
            }
        }

        return document;
    } catch (const json::exception& e) {
        LOG_WARN("Invalid diagram JSON: {}", e.what());
        return std::nullopt;
    } catch (const std::logic_error& e) {
        // std::stoul on a malformed id string
        LOG_WARN("Invalid id in diagram JSON: {}", e.what());
        return std::nullopt;
    }
}

bool DiagramSerializer::load(DiagramStore& store, const std::string& json) {
    auto document = documentFromJson(json);
    if (!document) return false;
    store.loadDiagram(document->nodes, document->edges);
    return true;
}

bool DiagramSerializer::saveToFile(const DiagramStore& store, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(store);
    return file.good();
}

bool DiagramSerializer::loadFromFile(DiagramStore& store, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load(store, buffer.str());
}

std::optional<EditorConfig> DiagramSerializer::configFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("Editor config JSON must be an object, got {}", j.type_name());
            return std::nullopt;
        }
        EditorConfig config = EditorConfig::defaults();

        // Read signed so a negative capacity is rejected instead of wrapping
        if (j.contains("historyCapacity")) {
            if (!j["historyCapacity"].is_number_integer() ||
                j["historyCapacity"].get<long long>() < 1) {
                LOG_WARN("historyCapacity must be a positive integer");
                return std::nullopt;
            }
            config.historyCapacity = j["historyCapacity"].get<size_t>();
        }
        config.minNodeSize = j.value("minNodeSize", config.minNodeSize);
        config.zoomStep = j.value("zoomStep", config.zoomStep);

        if (j.contains("defaultNodeSize")) {
            config.defaultNodeSize = sizeFromJson(j.at("defaultNodeSize"));
        }
        if (j.contains("defaultTextSize")) {
            config.defaultTextSize = sizeFromJson(j.at("defaultTextSize"));
        }
        if (j.contains("duplicateOffset")) {
            config.duplicateOffset = pointFromJson(j.at("duplicateOffset"));
        }

        auto readStyle = [&j](const char* key, NodeStyle& style) {
            if (!j.contains(key)) return;
            const json& s = j.at(key);
            style.text = s.value("text", style.text);
            style.fill = s.value("fill", style.fill);
            style.stroke = s.value("stroke", style.stroke);
            style.strokeWidth = s.value("strokeWidth", style.strokeWidth);
        };
        readStyle("shapeStyle", config.shapeStyle);
        readStyle("textStyle", config.textStyle);

        if (!config.isValid()) {
            LOG_WARN("Editor config out of range, sizes and zoomStep must be positive");
            return std::nullopt;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_WARN("Invalid editor config JSON: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace flowcanvas
