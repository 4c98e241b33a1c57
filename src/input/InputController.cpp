#include "flowcanvas/input/InputController.h"
#include "flowcanvas/common/Logger.h"
#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/store/DiagramStore.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <type_traits>

namespace flowcanvas {

namespace {

enum class ShortcutAction {
    SelectTool,
    RectangleTool,
    EllipseTool,
    DiamondTool,
    TextTool,
    LineTool,
    Delete,
    Undo,
    Redo,
    SelectAll,
    Duplicate,
    ZoomIn,
    ZoomOut,
    ResetView,
    Escape
};

/// command is Ctrl on Linux/Windows and Cmd (meta) on macOS
struct Shortcut {
    const char* key;
    bool command;
    bool shift;
    ShortcutAction action;
};

constexpr Shortcut SHORTCUTS[] = {
    {"v", false, false, ShortcutAction::SelectTool},
    {"r", false, false, ShortcutAction::RectangleTool},
    {"e", false, false, ShortcutAction::EllipseTool},
    {"d", false, false, ShortcutAction::DiamondTool},
    {"t", false, false, ShortcutAction::TextTool},
    {"l", false, false, ShortcutAction::LineTool},
    {"delete", false, false, ShortcutAction::Delete},
    {"backspace", false, false, ShortcutAction::Delete},
    {"z", true, false, ShortcutAction::Undo},
    {"z", true, true, ShortcutAction::Redo},
    {"a", true, false, ShortcutAction::SelectAll},
    {"d", true, false, ShortcutAction::Duplicate},
    {"=", true, false, ShortcutAction::ZoomIn},
    {"-", true, false, ShortcutAction::ZoomOut},
    {"0", true, false, ShortcutAction::ResetView},
    {"escape", false, false, ShortcutAction::Escape},
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool matches(const KeyEvent& event, const std::string& key, const Shortcut& shortcut) {
    bool command = event.ctrl || event.meta;
    return key == shortcut.key &&
           command == shortcut.command &&
           event.shift == shortcut.shift &&
           !event.alt;
}

}  // namespace

InputController::InputController(DiagramStore& store)
    : store_(store) {
}

bool InputController::onKey(const KeyEvent& event) {
    std::string key = toLower(event.key);
    auto it = std::find_if(std::begin(SHORTCUTS), std::end(SHORTCUTS),
                           [&](const Shortcut& s) { return matches(event, key, s); });
    if (it == std::end(SHORTCUTS)) {
        return false;
    }

    float step = store_.config().zoomStep;
    switch (it->action) {
        case ShortcutAction::SelectTool: store_.setTool(Tool::Select); break;
        case ShortcutAction::RectangleTool: store_.setTool(Tool::Rectangle); break;
        case ShortcutAction::EllipseTool: store_.setTool(Tool::Ellipse); break;
        case ShortcutAction::DiamondTool: store_.setTool(Tool::Diamond); break;
        case ShortcutAction::TextTool: store_.setTool(Tool::Text); break;
        case ShortcutAction::LineTool: store_.setTool(Tool::Line); break;
        case ShortcutAction::Delete: store_.deleteSelected(); break;
        case ShortcutAction::Undo: store_.undo(); break;
        case ShortcutAction::Redo: store_.redo(); break;
        case ShortcutAction::SelectAll: store_.selectAll(); break;
        case ShortcutAction::Duplicate: store_.duplicateSelected(); break;
        case ShortcutAction::ZoomIn: store_.zoom(step, Point{0.0f, 0.0f}); break;
        case ShortcutAction::ZoomOut: store_.zoom(-step, Point{0.0f, 0.0f}); break;
        case ShortcutAction::ResetView:
            store_.setViewport({viewport::DEFAULT_VIEWPORT.x,
                                viewport::DEFAULT_VIEWPORT.y,
                                viewport::DEFAULT_VIEWPORT.scale});
            break;
        case ShortcutAction::Escape:
            store_.cancelConnection();
            store_.cancelSelectionBox();
            if (gesture_ == PointerGesture::SelectionBox) {
                gesture_ = PointerGesture::None;
            }
            break;
    }
    return true;
}

std::optional<NodeId> InputController::hitTest(const Point& worldPoint) const {
    const auto& nodes = store_.nodes();
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        if (geometry::isPointInNode(worldPoint, *it)) {
            return it->id;
        }
    }
    return std::nullopt;
}

std::optional<HandleHit> InputController::hitTestHandle(const Point& screenPoint) const {
    static constexpr ResizeHandle HANDLES[] = {
        ResizeHandle::TopLeft, ResizeHandle::TopRight,
        ResizeHandle::BottomRight, ResizeHandle::BottomLeft,
        ResizeHandle::Top, ResizeHandle::Right,
        ResizeHandle::Bottom, ResizeHandle::Left,
    };

    const auto& nodes = store_.nodes();
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        if (!store_.isNodeSelected(it->id)) continue;
        for (ResizeHandle handle : HANDLES) {
            Point grip = viewport::toScreen(geometry::resizeHandlePoint(it->bounds(), handle),
                                            store_.viewport());
            if (geometry::distance(grip, screenPoint) <= HANDLE_HIT_RADIUS) {
                return HandleHit{it->id, handle};
            }
        }
    }
    return std::nullopt;
}

void InputController::onPointerDown(const PointerEvent& event) {
    if (gesture_ != PointerGesture::None) {
        LOG_TRACE("Ignoring press during active gesture");
        return;
    }

    lastScreen_ = event.position;
    gestureButton_ = event.button;

    if (event.button != PointerButton::Primary) {
        beginPan();
        return;
    }

    Point world = viewport::toWorld(event.position, store_.viewport());
    if (std::holds_alternative<SelectTool>(store_.toolState()) && !event.panModifier) {
        if (auto grip = hitTestHandle(event.position)) {
            beginResize(*grip, world);
            return;
        }
    }

    if (auto hit = hitTest(world)) {
        pressOnNode(*hit, event, world);
    } else {
        pressOnCanvas(event, world);
    }
}

void InputController::pressOnNode(NodeId nodeId, const PointerEvent& event, const Point& world) {
    bool multi = event.shift || event.ctrl || event.meta;

    std::visit([&](const auto& state) {
        using T = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<T, ConnectTool>) {
            store_.handleNodeInteraction(nodeId, multi);
        } else if constexpr (std::is_same_v<T, ShapeTool>) {
            store_.addNode(state.kind, world);
        } else if constexpr (std::is_same_v<T, TextTool>) {
            store_.addTextNode(world);
        } else {
            // Pressing an already selected node keeps the group for dragging
            if (multi || !store_.isNodeSelected(nodeId)) {
                store_.selectNode(nodeId, multi);
            }
            if (store_.isNodeSelected(nodeId)) {
                store_.beginDrag();
                gesture_ = PointerGesture::DragNodes;
            }
        }
    }, store_.toolState());
}

void InputController::pressOnCanvas(const PointerEvent& event, const Point& world) {
    std::visit([&](const auto& state) {
        using T = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<T, ConnectTool>) {
            store_.cancelConnection();
        } else if constexpr (std::is_same_v<T, ShapeTool>) {
            store_.addNode(state.kind, world);
        } else if constexpr (std::is_same_v<T, TextTool>) {
            store_.addTextNode(world);
        } else {
            if (event.panModifier || event.alt || event.ctrl || event.meta) {
                beginPan();
                return;
            }
            store_.clearSelection();
            store_.startSelectionBox(world);
            gesture_ = PointerGesture::SelectionBox;
        }
    }, store_.toolState());
}

void InputController::beginPan() {
    store_.setPanning(true);
    gesture_ = PointerGesture::Pan;
}

void InputController::beginResize(const HandleHit& hit, const Point& world) {
    const NodeData& node = store_.getNode(hit.nodeId);
    gripOffset_ = geometry::resizeHandlePoint(node.bounds(), hit.handle) - world;
    store_.beginResize(hit.nodeId, hit.handle);
    gesture_ = PointerGesture::ResizeNode;
}

void InputController::onPointerMove(const PointerEvent& event) {
    Point screenDelta = event.position - lastScreen_;
    lastScreen_ = event.position;

    switch (gesture_) {
        case PointerGesture::DragNodes:
            store_.moveSelected(screenDelta / store_.viewport().scale);
            break;
        case PointerGesture::ResizeNode:
            store_.resizeTo(viewport::toWorld(event.position, store_.viewport()) + gripOffset_);
            break;
        case PointerGesture::SelectionBox:
            store_.updateSelectionBox(viewport::toWorld(event.position, store_.viewport()));
            break;
        case PointerGesture::Pan:
            store_.pan(screenDelta);
            break;
        case PointerGesture::None:
            break;
    }
}

void InputController::onPointerUp(const PointerEvent& event) {
    if (gesture_ != PointerGesture::None && event.button != gestureButton_) {
        return;
    }

    onPointerMove(event);

    switch (gesture_) {
        case PointerGesture::DragNodes:
            store_.endDrag();
            break;
        case PointerGesture::ResizeNode:
            store_.endResize();
            break;
        case PointerGesture::SelectionBox:
            store_.endSelectionBox();
            break;
        case PointerGesture::Pan:
            store_.setPanning(false);
            break;
        case PointerGesture::None:
            break;
    }
    gesture_ = PointerGesture::None;
}

void InputController::onWheel(float wheelDelta, const Point& screenPosition) {
    if (wheelDelta == 0.0f) return;
    float step = store_.config().zoomStep;
    store_.zoom(wheelDelta > 0.0f ? -step : step, screenPosition);
    LOG_TRACE("Wheel zoom to scale {}", store_.viewport().scale);
}

}  // namespace flowcanvas
