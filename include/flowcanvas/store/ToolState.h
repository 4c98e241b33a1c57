#pragma once

#include "flowcanvas/core/Diagram.h"

#include <optional>
#include <variant>

namespace flowcanvas {

/// Toolbar tool, as picked by the user or a hotkey
enum class Tool {
    Select,
    Rectangle,
    Ellipse,
    Diamond,
    Text,
    Line
};

/// Pointer input selects, moves and box-selects
struct SelectTool {
    bool operator==(const SelectTool&) const = default;
};

/// Pointer input places a shape of the given kind
struct ShapeTool {
    NodeType kind = NodeType::Rectangle;
    bool operator==(const ShapeTool&) const = default;
};

/// Pointer input places a text node
struct TextTool {
    bool operator==(const TextTool&) const = default;
};

/// Line tool. Idle while source is empty, connecting once a first node
/// was picked. A connection can never exist without its source.
struct ConnectTool {
    std::optional<NodeId> source;
    bool operator==(const ConnectTool&) const = default;
};

using ToolState = std::variant<SelectTool, ShapeTool, TextTool, ConnectTool>;

/// Initial state for a toolbar tool (line tool starts idle)
ToolState toolStateFor(Tool tool);

/// Toolbar tool that a state belongs to
Tool toolOf(const ToolState& state);

}  // namespace flowcanvas
