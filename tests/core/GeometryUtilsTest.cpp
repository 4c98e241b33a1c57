#include <gtest/gtest.h>
#include <flowcanvas/core/GeometryUtils.h>
#include <flowcanvas/core/Shape.h>

#include <cmath>

using namespace flowcanvas;

namespace {

NodeData makeNode(NodeId id, NodeType type, Point position, Size size = {120.0f, 80.0f}) {
    NodeData node;
    node.id = id;
    node.type = type;
    node.position = position;
    node.size = size;
    return node;
}

}  // namespace

class GeometryUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Shared 120x80 box at the origin, center (60, 40)
        rect = makeNode(1, NodeType::Rectangle, {0.0f, 0.0f});
        ellipse = makeNode(2, NodeType::Ellipse, {0.0f, 0.0f});
        diamond = makeNode(3, NodeType::Diamond, {0.0f, 0.0f});
    }

    NodeData rect;
    NodeData ellipse;
    NodeData diamond;
};

// =============================================================================
// Basic helpers
// =============================================================================

TEST_F(GeometryUtilsTest, NodeCenterAndBounds) {
    NodeData node = makeNode(7, NodeType::Rectangle, {10.0f, 20.0f}, {100.0f, 50.0f});

    Point center = geometry::nodeCenter(node);
    EXPECT_FLOAT_EQ(center.x, 60.0f);
    EXPECT_FLOAT_EQ(center.y, 45.0f);

    Rect bounds = geometry::nodeBounds(node);
    EXPECT_FLOAT_EQ(bounds.right(), 110.0f);
    EXPECT_FLOAT_EQ(bounds.bottom(), 70.0f);
}

TEST_F(GeometryUtilsTest, PointInNodeIsInclusive) {
    EXPECT_TRUE(geometry::isPointInNode({0.0f, 0.0f}, rect));
    EXPECT_TRUE(geometry::isPointInNode({120.0f, 80.0f}, rect));
    EXPECT_TRUE(geometry::isPointInNode({60.0f, 40.0f}, rect));
    EXPECT_FALSE(geometry::isPointInNode({120.1f, 40.0f}, rect));
    EXPECT_FALSE(geometry::isPointInNode({-1.0f, -1.0f}, rect));
}

TEST_F(GeometryUtilsTest, Distance) {
    EXPECT_FLOAT_EQ(geometry::distance({0.0f, 0.0f}, {3.0f, 4.0f}), 5.0f);
    EXPECT_FLOAT_EQ(geometry::distance({2.0f, 2.0f}, {2.0f, 2.0f}), 0.0f);
}

TEST_F(GeometryUtilsTest, LineIntersection) {
    auto hit = geometry::lineIntersection({0, 0}, {10, 10}, {0, 10}, {10, 0});
    ASSERT_TRUE(hit.has_value());
    EXPECT_FLOAT_EQ(hit->x, 5.0f);
    EXPECT_FLOAT_EQ(hit->y, 5.0f);

    // Infinite lines: the crossing may lie outside both segments
    auto outside = geometry::lineIntersection({0, 0}, {1, 0}, {5, -1}, {5, 1});
    ASSERT_TRUE(outside.has_value());
    EXPECT_FLOAT_EQ(outside->x, 5.0f);
    EXPECT_FLOAT_EQ(outside->y, 0.0f);
}

TEST_F(GeometryUtilsTest, LineIntersectionParallel) {
    EXPECT_FALSE(geometry::lineIntersection({0, 0}, {10, 0}, {0, 5}, {10, 5}).has_value());
    EXPECT_FALSE(geometry::lineIntersection({0, 0}, {10, 10}, {1, 1}, {5, 5}).has_value());
}

// =============================================================================
// Rectangle
// =============================================================================

TEST_F(GeometryUtilsTest, RectangleAnchorHorizontal) {
    Point right = geometry::anchorPoint(rect, {500.0f, 40.0f});
    EXPECT_FLOAT_EQ(right.x, 120.0f);
    EXPECT_FLOAT_EQ(right.y, 40.0f);

    Point left = geometry::anchorPoint(rect, {-500.0f, 40.0f});
    EXPECT_FLOAT_EQ(left.x, 0.0f);
    EXPECT_FLOAT_EQ(left.y, 40.0f);
}

TEST_F(GeometryUtilsTest, RectangleAnchorVertical) {
    Point bottom = geometry::anchorPoint(rect, {60.0f, 500.0f});
    EXPECT_FLOAT_EQ(bottom.x, 60.0f);
    EXPECT_FLOAT_EQ(bottom.y, 80.0f);

    Point top = geometry::anchorPoint(rect, {60.0f, -500.0f});
    EXPECT_FLOAT_EQ(top.x, 60.0f);
    EXPECT_FLOAT_EQ(top.y, 0.0f);
}

TEST_F(GeometryUtilsTest, RectangleAnchorSlopedRay) {
    // dx = 100, dy = 20: slope below diagonal, exits the right side
    Point p = geometry::anchorPoint(rect, {160.0f, 60.0f});
    EXPECT_FLOAT_EQ(p.x, 120.0f);
    EXPECT_FLOAT_EQ(p.y, 52.0f);

    // dx = 20, dy = 100: exits the bottom
    Point q = geometry::anchorPoint(rect, {80.0f, 140.0f});
    EXPECT_FLOAT_EQ(q.x, 68.0f);
    EXPECT_FLOAT_EQ(q.y, 80.0f);
}

TEST_F(GeometryUtilsTest, RectangleAnchorLiesOnOutline) {
    const Point targets[] = {{300, -200}, {-50, 90}, {61, 400}, {-300, -301}};
    for (const auto& target : targets) {
        Point p = geometry::anchorPoint(rect, target);
        bool onVertical = std::abs(p.x - 0.0f) < 1e-3f || std::abs(p.x - 120.0f) < 1e-3f;
        bool onHorizontal = std::abs(p.y - 0.0f) < 1e-3f || std::abs(p.y - 80.0f) < 1e-3f;
        EXPECT_TRUE(onVertical || onHorizontal) << "(" << p.x << ", " << p.y << ")";
        EXPECT_TRUE(geometry::isPointInNode(p, rect));
    }
}

TEST_F(GeometryUtilsTest, AnchorAtCenterReturnsCenter) {
    for (const NodeData* node : {&rect, &ellipse, &diamond}) {
        Point p = geometry::anchorPoint(*node, {60.0f, 40.0f});
        EXPECT_FLOAT_EQ(p.x, 60.0f);
        EXPECT_FLOAT_EQ(p.y, 40.0f);
    }
}

// =============================================================================
// Ellipse
// =============================================================================

TEST_F(GeometryUtilsTest, EllipseAnchorOnAxes) {
    Point right = geometry::anchorPoint(ellipse, {300.0f, 40.0f});
    EXPECT_NEAR(right.x, 120.0f, 1e-4f);
    EXPECT_NEAR(right.y, 40.0f, 1e-4f);

    Point top = geometry::anchorPoint(ellipse, {60.0f, -300.0f});
    EXPECT_NEAR(top.x, 60.0f, 1e-4f);
    EXPECT_NEAR(top.y, 0.0f, 1e-4f);
}

TEST_F(GeometryUtilsTest, EllipseAnchorSatisfiesEquation) {
    Point p = geometry::anchorPoint(ellipse, {200.0f, 150.0f});
    float nx = (p.x - 60.0f) / 60.0f;
    float ny = (p.y - 40.0f) / 40.0f;
    EXPECT_NEAR(nx * nx + ny * ny, 1.0f, 1e-4f);
}

// =============================================================================
// Diamond
// =============================================================================

TEST_F(GeometryUtilsTest, DiamondAnchorAtVertices) {
    Point right = geometry::anchorPoint(diamond, {400.0f, 40.0f});
    EXPECT_NEAR(right.x, 120.0f, 1e-4f);
    EXPECT_NEAR(right.y, 40.0f, 1e-4f);

    Point bottom = geometry::anchorPoint(diamond, {60.0f, 400.0f});
    EXPECT_NEAR(bottom.x, 60.0f, 1e-4f);
    EXPECT_NEAR(bottom.y, 80.0f, 1e-4f);

    Point left = geometry::anchorPoint(diamond, {-400.0f, 40.0f});
    EXPECT_NEAR(left.x, 0.0f, 1e-4f);
    EXPECT_NEAR(left.y, 40.0f, 1e-4f);
}

TEST_F(GeometryUtilsTest, DiamondAnchorOnSide) {
    // Every quadrant lands on |x - cx| / hw + |y - cy| / hh == 1
    const Point targets[] = {{200, 200}, {-100, 150}, {-80, -90}, {250, -30}};
    for (const auto& target : targets) {
        Point p = geometry::anchorPoint(diamond, target);
        float sum = std::abs(p.x - 60.0f) / 60.0f + std::abs(p.y - 40.0f) / 40.0f;
        EXPECT_NEAR(sum, 1.0f, 1e-4f) << "(" << target.x << ", " << target.y << ")";
    }
}

TEST_F(GeometryUtilsTest, DiamondAnchorFollowsRayDirection) {
    Point p = geometry::anchorPoint(diamond, {160.0f, 140.0f});
    EXPECT_GT(p.x, 60.0f);
    EXPECT_GT(p.y, 40.0f);

    Point q = geometry::anchorPoint(diamond, {-40.0f, -60.0f});
    EXPECT_LT(q.x, 60.0f);
    EXPECT_LT(q.y, 40.0f);
}

// =============================================================================
// Text and dispatch
// =============================================================================

TEST_F(GeometryUtilsTest, TextAnchorsLikeRectangle) {
    NodeData text = makeNode(4, NodeType::Text, {0.0f, 0.0f});
    Point target = {160.0f, 60.0f};

    Point a = geometry::anchorPoint(text, target);
    Point b = geometry::anchorPoint(rect, target);
    EXPECT_FLOAT_EQ(a.x, b.x);
    EXPECT_FLOAT_EQ(a.y, b.y);
}

TEST_F(GeometryUtilsTest, ShapeForSelectsAlternative) {
    EXPECT_TRUE(std::holds_alternative<RectangleShape>(shapeFor(NodeType::Rectangle)));
    EXPECT_TRUE(std::holds_alternative<EllipseShape>(shapeFor(NodeType::Ellipse)));
    EXPECT_TRUE(std::holds_alternative<DiamondShape>(shapeFor(NodeType::Diamond)));
    EXPECT_TRUE(std::holds_alternative<TextShape>(shapeFor(NodeType::Text)));
}

TEST_F(GeometryUtilsTest, DefaultSizeFollowsConfig) {
    EditorConfig config = EditorConfig::defaults();
    EXPECT_EQ(RectangleShape{}.defaultSize(config), config.defaultNodeSize);
    EXPECT_EQ(TextShape{}.defaultSize(config), config.defaultTextSize);
}

// =============================================================================
// Connection points
// =============================================================================

TEST_F(GeometryUtilsTest, ConnectionPointsFaceEachOther) {
    NodeData a = makeNode(1, NodeType::Rectangle, {0.0f, 0.0f});
    NodeData b = makeNode(2, NodeType::Rectangle, {300.0f, 0.0f});

    ConnectionPoints points = geometry::connectionPoints(a, b);
    EXPECT_FLOAT_EQ(points.source.x, 120.0f);
    EXPECT_FLOAT_EQ(points.source.y, 40.0f);
    EXPECT_FLOAT_EQ(points.target.x, 300.0f);
    EXPECT_FLOAT_EQ(points.target.y, 40.0f);
}

TEST_F(GeometryUtilsTest, ConnectionPointsMixedShapes) {
    NodeData a = makeNode(1, NodeType::Diamond, {0.0f, 0.0f});
    NodeData b = makeNode(2, NodeType::Ellipse, {0.0f, 300.0f});

    ConnectionPoints points = geometry::connectionPoints(a, b);
    EXPECT_NEAR(points.source.x, 60.0f, 1e-4f);
    EXPECT_NEAR(points.source.y, 80.0f, 1e-4f);
    EXPECT_NEAR(points.target.x, 60.0f, 1e-4f);
    EXPECT_NEAR(points.target.y, 300.0f, 1e-4f);
}

TEST_F(GeometryUtilsTest, ConnectionPointsCoincidentCenters) {
    NodeData a = makeNode(1, NodeType::Rectangle, {0.0f, 0.0f});
    NodeData b = makeNode(2, NodeType::Ellipse, {10.0f, 10.0f}, {100.0f, 60.0f});

    ConnectionPoints points = geometry::connectionPoints(a, b);
    EXPECT_EQ(points.source, a.center());
    EXPECT_EQ(points.target, b.center());
}

// =============================================================================
// Resize grips
// =============================================================================

TEST(ResizeGeometryTest, HandlePointsSitOnCornersAndMidpoints) {
    Rect box{10.0f, 20.0f, 120.0f, 80.0f};

    EXPECT_EQ(geometry::resizeHandlePoint(box, ResizeHandle::TopLeft), (Point{10.0f, 20.0f}));
    EXPECT_EQ(geometry::resizeHandlePoint(box, ResizeHandle::Top), (Point{70.0f, 20.0f}));
    EXPECT_EQ(geometry::resizeHandlePoint(box, ResizeHandle::Right), (Point{130.0f, 60.0f}));
    EXPECT_EQ(geometry::resizeHandlePoint(box, ResizeHandle::BottomRight), (Point{130.0f, 100.0f}));
    EXPECT_EQ(geometry::resizeHandlePoint(box, ResizeHandle::BottomLeft), (Point{10.0f, 100.0f}));
}

TEST(ResizeGeometryTest, TopLeftKeepsBottomRightFixed) {
    Rect box{0.0f, 0.0f, 120.0f, 80.0f};

    Rect grown = geometry::resizedBounds(box, ResizeHandle::TopLeft, {-30.0f, -20.0f}, 20.0f);
    EXPECT_EQ(grown, (Rect{-30.0f, -20.0f, 150.0f, 100.0f}));

    // Dragged past the opposite corner: stops at the minimum size
    Rect floored = geometry::resizedBounds(box, ResizeHandle::TopLeft, {500.0f, 500.0f}, 20.0f);
    EXPECT_EQ(floored, (Rect{100.0f, 60.0f, 20.0f, 20.0f}));
}

TEST(ResizeGeometryTest, EdgeHandleMovesOneAxis) {
    Rect box{0.0f, 0.0f, 120.0f, 80.0f};

    Rect wider = geometry::resizedBounds(box, ResizeHandle::Right, {200.0f, 999.0f}, 20.0f);
    EXPECT_EQ(wider, (Rect{0.0f, 0.0f, 200.0f, 80.0f}));

    Rect shorter = geometry::resizedBounds(box, ResizeHandle::Bottom, {-50.0f, -10.0f}, 20.0f);
    EXPECT_EQ(shorter, (Rect{0.0f, 0.0f, 120.0f, 20.0f}));
}
