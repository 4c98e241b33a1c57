#pragma once

#include "Diagram.h"

#include <optional>

namespace flowcanvas {

/// Pair of anchors for one edge
struct ConnectionPoints {
    Point source;
    Point target;
};

/// Eight resize grips on a node's bounding box
enum class ResizeHandle {
    TopLeft,
    Top,
    TopRight,
    Right,
    BottomRight,
    Bottom,
    BottomLeft,
    Left
};

/// Geometry functions for edge attachment and spatial queries
namespace geometry {

/// Floating-point tolerance for parallel-line detection
constexpr float PARALLEL_EPSILON = 1e-10f;

/// Center of a node's bounding box
inline Point nodeCenter(const NodeData& node) { return node.center(); }

/// Axis-aligned bounding box of a node
inline Rect nodeBounds(const NodeData& node) { return node.bounds(); }

/// Check if a world point lies inside a node's bounding box (inclusive)
bool isPointInNode(const Point& point, const NodeData& node);

/// Euclidean distance between two points
float distance(const Point& a, const Point& b);

/// Intersection of the infinite lines p1-p2 and p3-p4
/// @return Point on line p1-p2, or std::nullopt if the lines are parallel
std::optional<Point> lineIntersection(
    const Point& p1, const Point& p2,
    const Point& p3, const Point& p4);

/// Point on the node's outline lying on the ray from its center toward
/// externalPoint. Returns the center when externalPoint is the center.
Point anchorPoint(const NodeData& node, const Point& externalPoint);

/// Anchors for an edge from source to target.
/// Both ends depend on both nodes, so they are always computed together:
/// source = anchorPoint(source, center(target)),
/// target = anchorPoint(target, center(source)).
ConnectionPoints connectionPoints(const NodeData& source, const NodeData& target);

/// World position of a resize grip (corners and edge midpoints)
Point resizeHandlePoint(const Rect& bounds, ResizeHandle handle);

/// Bounds after dragging a grip to point. Edges the grip does not touch
/// stay fixed; each moved edge stops minSize short of its opposite edge.
Rect resizedBounds(const Rect& bounds, ResizeHandle handle, const Point& point, float minSize);

}  // namespace geometry

}  // namespace flowcanvas
