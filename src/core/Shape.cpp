#include "flowcanvas/core/Shape.h"
#include "flowcanvas/core/GeometryUtils.h"

#include <cmath>

namespace flowcanvas {

Shape shapeFor(NodeType type) {
    switch (type) {
        case NodeType::Rectangle: return RectangleShape{};
        case NodeType::Ellipse: return EllipseShape{};
        case NodeType::Diamond: return DiamondShape{};
        case NodeType::Text: return TextShape{};
    }
    return RectangleShape{};
}

Point RectangleShape::boundaryIntersection(const Rect& bounds, const Point& externalPoint) const {
    Point center = bounds.center();
    float dx = externalPoint.x - center.x;
    float dy = externalPoint.y - center.y;

    float halfWidth = bounds.width / 2;
    float halfHeight = bounds.height / 2;

    // Ray leaves through left/right when its slope is not steeper than the diagonal
    bool hitsSide = dx != 0.0f && std::abs(dy) * halfWidth <= halfHeight * std::abs(dx);

    if (hitsSide) {
        float x = dx > 0 ? bounds.right() : bounds.left();
        float y = center.y + (dy * halfWidth) / std::abs(dx);
        return {x, y};
    }

    float x = center.x + (dx * halfHeight) / std::abs(dy);
    float y = dy > 0 ? bounds.bottom() : bounds.top();
    return {x, y};
}

Point EllipseShape::boundaryIntersection(const Rect& bounds, const Point& externalPoint) const {
    Point center = bounds.center();
    float a = bounds.width / 2;
    float b = bounds.height / 2;

    float angle = std::atan2(externalPoint.y - center.y, externalPoint.x - center.x);

    return {center.x + a * std::cos(angle), center.y + b * std::sin(angle)};
}

Point DiamondShape::boundaryIntersection(const Rect& bounds, const Point& externalPoint) const {
    Point center = bounds.center();
    float halfWidth = bounds.width / 2;
    float halfHeight = bounds.height / 2;

    float dx = externalPoint.x - center.x;
    float dy = externalPoint.y - center.y;

    // Vertices
    Point top = {center.x, center.y - halfHeight};
    Point right = {center.x + halfWidth, center.y};
    Point bottom = {center.x, center.y + halfHeight};
    Point left = {center.x - halfWidth, center.y};

    // The ray crosses the side joining the horizontal vertex on its x side
    // with the vertical vertex on its y side
    const Point& sideVertex = dx >= 0 ? right : left;
    const Point& capVertex = dy >= 0 ? bottom : top;

    auto hit = geometry::lineIntersection(center, externalPoint, sideVertex, capVertex);
    return hit.value_or(center);
}

}  // namespace flowcanvas
