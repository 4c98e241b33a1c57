#pragma once

#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/core/Types.h"

#include <optional>
#include <string>

namespace flowcanvas {

class DiagramStore;

/// Keyboard event as delivered by the host window.
/// key is the produced character ("z", "=") or a named key ("Delete", "Escape").
struct KeyEvent {
    std::string key;
    bool ctrl = false;
    bool shift = false;
    bool alt = false;
    bool meta = false;
};

enum class PointerButton {
    Primary,
    Secondary,
    Middle
};

/// Pointer event in screen coordinates
struct PointerEvent {
    Point position;
    PointerButton button = PointerButton::Primary;
    bool ctrl = false;
    bool shift = false;
    bool alt = false;
    bool meta = false;
    bool panModifier = false;  ///< Host-specific pan key (e.g. space held)
};

/// Gesture started by the last pointer press
enum class PointerGesture {
    None,
    DragNodes,
    ResizeNode,
    SelectionBox,
    Pan
};

/// Grip under the pointer of a selected node
struct HandleHit {
    NodeId nodeId = INVALID_NODE;
    ResizeHandle handle = ResizeHandle::BottomRight;
};

/// Translates raw keyboard and pointer input into DiagramStore operations.
///
/// Holds only the in-flight gesture and the last pointer position; all
/// diagram state lives in the store. One gesture runs at a time: presses
/// arriving while it is active are ignored and only the release of the
/// button that started it ends it.
class InputController {
public:
    /// Grip pick radius in screen pixels, independent of zoom
    static constexpr float HANDLE_HIT_RADIUS = 6.0f;

    explicit InputController(DiagramStore& store);

    /// @return true if the key matched a shortcut
    bool onKey(const KeyEvent& event);

    void onPointerDown(const PointerEvent& event);
    void onPointerMove(const PointerEvent& event);
    void onPointerUp(const PointerEvent& event);

    /// One zoom step per event. Only the sign of wheelDelta counts:
    /// positive zooms out, negative zooms in.
    void onWheel(float wheelDelta, const Point& screenPosition);

    /// Topmost node (last in draw order) containing the world point
    std::optional<NodeId> hitTest(const Point& worldPoint) const;

    /// Resize grip of a selected node within HANDLE_HIT_RADIUS of a screen
    /// point. Topmost node wins.
    std::optional<HandleHit> hitTestHandle(const Point& screenPoint) const;

    PointerGesture gesture() const { return gesture_; }

private:
    void pressOnNode(NodeId nodeId, const PointerEvent& event, const Point& world);
    void pressOnCanvas(const PointerEvent& event, const Point& world);
    void beginPan();
    void beginResize(const HandleHit& hit, const Point& world);

    DiagramStore& store_;
    PointerGesture gesture_ = PointerGesture::None;
    PointerButton gestureButton_ = PointerButton::Primary;
    Point lastScreen_;
    Point gripOffset_;  ///< Grip minus press point, world units
};

}  // namespace flowcanvas
