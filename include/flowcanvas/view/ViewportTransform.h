#pragma once

#include "flowcanvas/core/Types.h"

namespace flowcanvas {

/// Pan offset and zoom scale mapping world coordinates to screen coordinates.
/// screen = world * scale + (x, y)
struct Viewport {
    float x = 0.0f;       ///< World origin offset in screen units
    float y = 0.0f;
    float scale = 1.0f;   ///< Zoom factor, kept within [MIN_SCALE, MAX_SCALE]

    constexpr Point offset() const { return {x, y}; }

    constexpr bool operator==(const Viewport& o) const {
        return x == o.x && y == o.y && scale == o.scale;
    }
    constexpr bool operator!=(const Viewport& o) const { return !(*this == o); }
};

/// Pure screen <-> world transforms and navigation steps
namespace viewport {

constexpr float MIN_SCALE = 0.1f;
constexpr float MAX_SCALE = 3.0f;

constexpr Viewport DEFAULT_VIEWPORT = {0.0f, 0.0f, 1.0f};

float clampScale(float scale);

/// (screen - offset) / scale
Point toWorld(const Point& screen, const Viewport& vp);

/// world * scale + offset
Point toScreen(const Point& world, const Viewport& vp);

/// Change scale by delta (clamped) keeping the world point under pivot fixed on screen
/// @param delta Additive scale change
/// @param pivot Screen point that must not move
Viewport zoom(float delta, const Point& pivot, const Viewport& vp);

/// Shift the offset by a screen-space delta (independent of scale)
Viewport pan(const Point& delta, const Viewport& vp);

}  // namespace viewport

}  // namespace flowcanvas
