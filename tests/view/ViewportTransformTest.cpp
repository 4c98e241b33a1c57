#include <gtest/gtest.h>
#include <flowcanvas/view/ViewportTransform.h>

using namespace flowcanvas;

TEST(ViewportTransformTest, DefaultViewportIsIdentity) {
    Point p = {37.0f, -12.0f};
    EXPECT_EQ(viewport::toWorld(p, viewport::DEFAULT_VIEWPORT), p);
    EXPECT_EQ(viewport::toScreen(p, viewport::DEFAULT_VIEWPORT), p);
}

TEST(ViewportTransformTest, ToWorldAndBack) {
    Viewport vp = {100.0f, -50.0f, 2.0f};

    Point world = viewport::toWorld({300.0f, 150.0f}, vp);
    EXPECT_FLOAT_EQ(world.x, 100.0f);
    EXPECT_FLOAT_EQ(world.y, 100.0f);

    Point screen = viewport::toScreen(world, vp);
    EXPECT_FLOAT_EQ(screen.x, 300.0f);
    EXPECT_FLOAT_EQ(screen.y, 150.0f);
}

TEST(ViewportTransformTest, ClampScale) {
    EXPECT_FLOAT_EQ(viewport::clampScale(0.01f), viewport::MIN_SCALE);
    EXPECT_FLOAT_EQ(viewport::clampScale(10.0f), viewport::MAX_SCALE);
    EXPECT_FLOAT_EQ(viewport::clampScale(1.5f), 1.5f);
}

TEST(ViewportTransformTest, ZoomFromDefaultViewport) {
    Point pivot = {200.0f, 100.0f};
    Viewport vp = viewport::zoom(0.5f, pivot, viewport::DEFAULT_VIEWPORT);

    EXPECT_FLOAT_EQ(vp.scale, 1.5f);
    // offset - pivot * (newScale - scale)
    EXPECT_FLOAT_EQ(vp.x, -100.0f);
    EXPECT_FLOAT_EQ(vp.y, -50.0f);
}

TEST(ViewportTransformTest, ZoomKeepsPivotFixed) {
    Viewport vp = {35.0f, -20.0f, 1.3f};
    const Point pivots[] = {{0, 0}, {400, 300}, {-50, 720}};
    const float deltas[] = {0.1f, -0.4f, 0.9f};

    for (const auto& pivot : pivots) {
        for (float delta : deltas) {
            Point before = viewport::toWorld(pivot, vp);
            Viewport zoomed = viewport::zoom(delta, pivot, vp);
            Point after = viewport::toWorld(pivot, zoomed);

            EXPECT_NEAR(before.x, after.x, 1e-3f);
            EXPECT_NEAR(before.y, after.y, 1e-3f);
        }
    }
}

TEST(ViewportTransformTest, ZoomClampsScale) {
    Viewport in = viewport::zoom(100.0f, {10, 10}, viewport::DEFAULT_VIEWPORT);
    EXPECT_FLOAT_EQ(in.scale, viewport::MAX_SCALE);

    Viewport out = viewport::zoom(-100.0f, {10, 10}, viewport::DEFAULT_VIEWPORT);
    EXPECT_FLOAT_EQ(out.scale, viewport::MIN_SCALE);
}

TEST(ViewportTransformTest, ZoomAtLimitLeavesViewportUnchanged) {
    Viewport vp = {12.0f, 34.0f, viewport::MAX_SCALE};
    EXPECT_EQ(viewport::zoom(0.5f, {300, 200}, vp), vp);
}

TEST(ViewportTransformTest, PanIsScaleIndependent) {
    Viewport vp = {10.0f, 20.0f, 2.5f};
    Viewport panned = viewport::pan({5.0f, -7.0f}, vp);

    EXPECT_FLOAT_EQ(panned.x, 15.0f);
    EXPECT_FLOAT_EQ(panned.y, 13.0f);
    EXPECT_FLOAT_EQ(panned.scale, 2.5f);
}
