#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/core/Shape.h"

#include <algorithm>
#include <cmath>

namespace flowcanvas::geometry {

bool isPointInNode(const Point& point, const NodeData& node) {
    return node.bounds().contains(point);
}

float distance(const Point& a, const Point& b) {
    return a.distanceTo(b);
}

std::optional<Point> lineIntersection(
    const Point& p1, const Point& p2,
    const Point& p3, const Point& p4) {

    float denominator = (p1.x - p2.x) * (p3.y - p4.y) - (p1.y - p2.y) * (p3.x - p4.x);
    if (std::abs(denominator) < PARALLEL_EPSILON) {
        return std::nullopt;
    }

    float t = ((p1.x - p3.x) * (p3.y - p4.y) - (p1.y - p3.y) * (p3.x - p4.x)) / denominator;

    return Point{p1.x + t * (p2.x - p1.x), p1.y + t * (p2.y - p1.y)};
}

Point anchorPoint(const NodeData& node, const Point& externalPoint) {
    Rect bounds = node.bounds();
    Point center = bounds.center();

    if (externalPoint == center) {
        return center;
    }

    return std::visit(
        [&](const auto& shape) { return shape.boundaryIntersection(bounds, externalPoint); },
        shapeFor(node.type));
}

ConnectionPoints connectionPoints(const NodeData& source, const NodeData& target) {
    return {
        anchorPoint(source, target.center()),
        anchorPoint(target, source.center())
    };
}

Point resizeHandlePoint(const Rect& bounds, ResizeHandle handle) {
    Point center = bounds.center();
    switch (handle) {
        case ResizeHandle::TopLeft: return {bounds.left(), bounds.top()};
        case ResizeHandle::Top: return {center.x, bounds.top()};
        case ResizeHandle::TopRight: return {bounds.right(), bounds.top()};
        case ResizeHandle::Right: return {bounds.right(), center.y};
        case ResizeHandle::BottomRight: return {bounds.right(), bounds.bottom()};
        case ResizeHandle::Bottom: return {center.x, bounds.bottom()};
        case ResizeHandle::BottomLeft: return {bounds.left(), bounds.bottom()};
        case ResizeHandle::Left: return {bounds.left(), center.y};
    }
    return center;
}

Rect resizedBounds(const Rect& bounds, ResizeHandle handle, const Point& point, float minSize) {
    float left = bounds.left();
    float top = bounds.top();
    float right = bounds.right();
    float bottom = bounds.bottom();

    bool movesLeft = handle == ResizeHandle::TopLeft || handle == ResizeHandle::Left ||
                     handle == ResizeHandle::BottomLeft;
    bool movesRight = handle == ResizeHandle::TopRight || handle == ResizeHandle::Right ||
                      handle == ResizeHandle::BottomRight;
    bool movesTop = handle == ResizeHandle::TopLeft || handle == ResizeHandle::Top ||
                    handle == ResizeHandle::TopRight;
    bool movesBottom = handle == ResizeHandle::BottomLeft || handle == ResizeHandle::Bottom ||
                       handle == ResizeHandle::BottomRight;

    if (movesLeft) left = std::min(point.x, right - minSize);
    if (movesRight) right = std::max(point.x, left + minSize);
    if (movesTop) top = std::min(point.y, bottom - minSize);
    if (movesBottom) bottom = std::max(point.y, top + minSize);

    return {left, top, right - left, bottom - top};
}

}  // namespace flowcanvas::geometry
