#include <gtest/gtest.h>
#include <canvas/view_transform.hpp>
#include <cmath>
#include <limits>

using canvas::ViewTransform;
using graph_model::Rect;
using graph_model::Vec2;

namespace {

constexpr double kEps = 1e-9;

void expect_near(Vec2 a, Vec2 b, double eps = kEps) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
}

} // namespace

TEST(ViewTransformTest, DefaultsToIdentityMapping) {
    ViewTransform t;
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
    expect_near(t.world_to_screen(Vec2{12.5, -3.0}), Vec2{12.5, -3.0});
    expect_near(t.screen_to_world(Vec2{400.0, 300.0}), Vec2{400.0, 300.0});
}

TEST(ViewTransformTest, RoundTripHoldsForAnyViewport) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{35.0, 80.0}, Vec2{1024.0, 640.0});
    const graph_model::Viewport viewports[] = {
        {0.0, 0.0, 1.0}, {-250.5, 90.25, 0.1}, {1e4, -3e3, 10.0}, {17.0, 17.0, 2.345},
    };
    const Vec2 screens[] = {{0.0, 0.0}, {35.0, 80.0}, {512.3, 77.7}, {1059.0, 720.0}, {-40.0, 3000.0}};
    for (const auto& vp : viewports) {
        t.set_viewport(vp);
        for (const Vec2& s : screens) {
            expect_near(t.world_to_screen(t.screen_to_world(s)), s, 1e-7);
        }
    }
}

TEST(ViewTransformTest, WheelZoomAnchoredAtCursorKeepsWorldPoint) {
    ViewTransform t;
    const Vec2 anchor{400.0, 300.0};
    const Vec2 before = t.screen_to_world(anchor);

    t.zoom_at(anchor, 2.0);

    EXPECT_DOUBLE_EQ(t.zoom(), 2.0);
    expect_near(t.screen_to_world(anchor), before);
    expect_near(t.world_to_screen(before), anchor);
}

TEST(ViewTransformTest, AnchorPreservedWhenZoomIsClamped) {
    ViewTransform t;
    t.set_viewport(graph_model::Viewport{-120.0, 45.0, 9.0});
    const Vec2 anchor{130.0, 610.0};
    const Vec2 before = t.screen_to_world(anchor);

    t.zoom_at(anchor, 5.0);

    EXPECT_DOUBLE_EQ(t.zoom(), 10.0);
    expect_near(t.screen_to_world(anchor), before);
}

TEST(ViewTransformTest, ZoomIsClampedToConfiguredRange) {
    ViewTransform t;
    t.zoom_at(Vec2{0.0, 0.0}, 1000.0);
    EXPECT_DOUBLE_EQ(t.zoom(), 10.0);
    t.zoom_at(Vec2{0.0, 0.0}, 1e-6);
    EXPECT_DOUBLE_EQ(t.zoom(), 0.1);

    t.set_viewport(graph_model::Viewport{0.0, 0.0, 50.0});
    EXPECT_DOUBLE_EQ(t.zoom(), 10.0);
}

TEST(ViewTransformTest, InvalidZoomFactorsAreIgnored) {
    ViewTransform t;
    t.set_viewport(graph_model::Viewport{5.0, 6.0, 2.0});
    t.zoom_at(Vec2{10.0, 10.0}, 0.0);
    t.zoom_at(Vec2{10.0, 10.0}, -3.0);
    t.zoom_at(Vec2{10.0, 10.0}, std::numeric_limits<double>::quiet_NaN());
    t.zoom_at(Vec2{10.0, 10.0}, std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(t.zoom(), 2.0);
    EXPECT_DOUBLE_EQ(t.pan().x, 5.0);
    EXPECT_DOUBLE_EQ(t.pan().y, 6.0);

    t.set_viewport(graph_model::Viewport{std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0});
    EXPECT_DOUBLE_EQ(t.pan().x, 5.0);
}

TEST(ViewTransformTest, PanByDividesScreenDeltaByZoom) {
    ViewTransform t;
    t.set_viewport(graph_model::Viewport{100.0, 50.0, 2.0});
    t.pan_by(Vec2{40.0, -20.0});
    EXPECT_DOUBLE_EQ(t.pan().x, 80.0);
    EXPECT_DOUBLE_EQ(t.pan().y, 60.0);
}

TEST(ViewTransformTest, PanIsNotClamped) {
    ViewTransform t;
    t.pan_by(Vec2{-1e7, 1e7});
    EXPECT_DOUBLE_EQ(t.pan().x, 1e7);
    EXPECT_DOUBLE_EQ(t.pan().y, -1e7);
}

TEST(ViewTransformTest, CenterOnPreservesZoom) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});
    t.set_viewport(graph_model::Viewport{0.0, 0.0, 2.0});
    t.center_on(Vec2{1000.0, -500.0});
    EXPECT_DOUBLE_EQ(t.zoom(), 2.0);
    expect_near(t.screen_to_world(t.canvas_center()), Vec2{1000.0, -500.0});
}

TEST(ViewTransformTest, ResetIsDeterministicAndIdempotent) {
    ViewTransform t;
    t.set_viewport(graph_model::Viewport{-42.0, 99.0, 3.5});
    t.reset_viewport();
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(t.pan().x, 0.0);
    EXPECT_DOUBLE_EQ(t.pan().y, 0.0);
    t.reset_viewport();
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(t.pan().x, 0.0);
    EXPECT_DOUBLE_EQ(t.pan().y, 0.0);
}

TEST(ViewTransformTest, ButtonZoomUsesCanvasCenter) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});
    const Vec2 center_world = t.screen_to_world(t.canvas_center());
    t.zoom_in();
    EXPECT_NEAR(t.zoom(), 1.1, kEps);
    expect_near(t.screen_to_world(t.canvas_center()), center_world);
    t.zoom_out();
    EXPECT_NEAR(t.zoom(), 1.0, kEps);
}

TEST(ViewTransformTest, FitToContentKeepsBoundsInsideMargin) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});
    const Rect content{100.0, 100.0, 1440.0, 520.0};
    ASSERT_TRUE(t.fit_to_content(content));

    // Width is the limiting side: (800 - 80) / 1440.
    EXPECT_NEAR(t.zoom(), 0.5, kEps);
    const Vec2 top_left = t.world_to_screen(Vec2{content.x, content.y});
    const Vec2 bottom_right = t.world_to_screen(Vec2{content.right(), content.bottom()});
    EXPECT_NEAR(top_left.x, 40.0, 1e-7);
    EXPECT_NEAR(bottom_right.x, 760.0, 1e-7);
    EXPECT_GE(top_left.y, 40.0 - 1e-7);
    EXPECT_LE(bottom_right.y, 560.0 + 1e-7);
}

TEST(ViewTransformTest, FitToContentRejectsCanvasSmallerThanMargins) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{60.0, 60.0});
    EXPECT_FALSE(t.fit_to_content(Rect{0.0, 0.0, 10.0, 10.0}));
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
}

TEST(ViewTransformTest, VisibleWorldRectFollowsViewport) {
    ViewTransform t;
    t.set_canvas_rect(Vec2{10.0, 20.0}, Vec2{400.0, 200.0});
    t.set_viewport(graph_model::Viewport{50.0, -30.0, 2.0});
    const Rect r = t.visible_world_rect();
    EXPECT_DOUBLE_EQ(r.x, 50.0);
    EXPECT_DOUBLE_EQ(r.y, -30.0);
    EXPECT_DOUBLE_EQ(r.width, 200.0);
    EXPECT_DOUBLE_EQ(r.height, 100.0);
}
