#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace flowcanvas {

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    /// Rectangle spanned by two arbitrary corners
    static Rect fromCorners(const Point& a, const Point& b) {
        float minX = std::min(a.x, b.x);
        float minY = std::min(a.y, b.y);
        return {minX, minY, std::max(a.x, b.x) - minX, std::max(a.y, b.y) - minY};
    }

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    /// Overlap test with inclusive bounds (touching edges count)
    constexpr bool overlaps(const Rect& o) const {
        return right() >= o.x && x <= o.right() &&
               bottom() >= o.y && y <= o.bottom();
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace flowcanvas
