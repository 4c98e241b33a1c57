#include "flowcanvas/store/ToolState.h"

namespace flowcanvas {

ToolState toolStateFor(Tool tool) {
    switch (tool) {
        case Tool::Select: return SelectTool{};
        case Tool::Rectangle: return ShapeTool{NodeType::Rectangle};
        case Tool::Ellipse: return ShapeTool{NodeType::Ellipse};
        case Tool::Diamond: return ShapeTool{NodeType::Diamond};
        case Tool::Text: return TextTool{};
        case Tool::Line: return ConnectTool{};
    }
    return SelectTool{};
}

Tool toolOf(const ToolState& state) {
    if (std::holds_alternative<TextTool>(state)) return Tool::Text;
    if (std::holds_alternative<ConnectTool>(state)) return Tool::Line;
    if (const auto* shape = std::get_if<ShapeTool>(&state)) {
        switch (shape->kind) {
            case NodeType::Rectangle: return Tool::Rectangle;
            case NodeType::Ellipse: return Tool::Ellipse;
            case NodeType::Diamond: return Tool::Diamond;
            case NodeType::Text: return Tool::Text;
        }
    }
    return Tool::Select;
}

}  // namespace flowcanvas
