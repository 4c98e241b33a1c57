#include "flowcanvas/view/ViewportTransform.h"

#include <algorithm>

namespace flowcanvas::viewport {

float clampScale(float scale) {
    return std::clamp(scale, MIN_SCALE, MAX_SCALE);
}

Point toWorld(const Point& screen, const Viewport& vp) {
    return (screen - vp.offset()) / vp.scale;
}

Point toScreen(const Point& world, const Viewport& vp) {
    return world * vp.scale + vp.offset();
}

Viewport zoom(float delta, const Point& pivot, const Viewport& vp) {
    float newScale = clampScale(vp.scale + delta);
    if (newScale == vp.scale) {
        return vp;
    }

    // Keep the world point under the pivot at the same screen position.
    // From the default viewport this equals offset - pivot * (newScale - scale).
    Point worldAtPivot = toWorld(pivot, vp);
    Point newOffset = pivot - worldAtPivot * newScale;

    return {newOffset.x, newOffset.y, newScale};
}

Viewport pan(const Point& delta, const Viewport& vp) {
    return {vp.x + delta.x, vp.y + delta.y, vp.scale};
}

}  // namespace flowcanvas::viewport
