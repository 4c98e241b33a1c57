#pragma once

#include "Diagram.h"
#include "flowcanvas/config/EditorConfig.h"

#include <variant>

namespace flowcanvas {

/// Capability set shared by every shape alternative:
/// - boundaryIntersection(bounds, externalPoint): point on the outline on the
///   ray from the bounds center toward externalPoint
/// - defaultSize(config): size used when the node is created
///
/// All alternatives may assume externalPoint differs from the center;
/// geometry::anchorPoint handles that case before dispatch.

struct RectangleShape {
    Point boundaryIntersection(const Rect& bounds, const Point& externalPoint) const;
    Size defaultSize(const EditorConfig& config) const { return config.defaultNodeSize; }
};

struct EllipseShape {
    /// Angle-parametrized approximation, not the exact ray/ellipse hit
    Point boundaryIntersection(const Rect& bounds, const Point& externalPoint) const;
    Size defaultSize(const EditorConfig& config) const { return config.defaultNodeSize; }
};

struct DiamondShape {
    Point boundaryIntersection(const Rect& bounds, const Point& externalPoint) const;
    Size defaultSize(const EditorConfig& config) const { return config.defaultNodeSize; }
};

/// Text nodes attach like their rectangular frame
struct TextShape {
    Point boundaryIntersection(const Rect& bounds, const Point& externalPoint) const {
        return RectangleShape{}.boundaryIntersection(bounds, externalPoint);
    }
    Size defaultSize(const EditorConfig& config) const { return config.defaultTextSize; }
};

using Shape = std::variant<RectangleShape, EllipseShape, DiamondShape, TextShape>;

/// Map a node type tag to its shape alternative
Shape shapeFor(NodeType type);

}  // namespace flowcanvas
