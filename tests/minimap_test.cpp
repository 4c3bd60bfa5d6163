#include <gtest/gtest.h>
#include <canvas/minimap.hpp>

using canvas::MinimapSync;
using canvas::ViewTransform;
using graph_model::Rect;
using graph_model::Vec2;

namespace {

void expect_near(Vec2 a, Vec2 b, double eps = 1e-9) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
}

// Node bounds (0,0)-(420,220) grow to (-40,-40)-(460,260): extent 500, center (210,110).
const Rect kNodeBounds{0.0, 0.0, 420.0, 220.0};
constexpr double kScale = (150.0 - 8.0) / 500.0;

} // namespace

TEST(MinimapTest, EmptyViewShowsDefaultExtent) {
    MinimapSync minimap;
    EXPECT_DOUBLE_EQ(minimap.content_rect().width, 1000.0);
    EXPECT_NEAR(minimap.scale(), 0.142, 1e-12);
    expect_near(minimap.world_to_minimap(Vec2{0.0, 0.0}), Vec2{100.0, 75.0});
}

TEST(MinimapTest, ScaleFitsInflatedContentIntoShorterSide) {
    MinimapSync minimap;
    minimap.update_content(kNodeBounds);
    EXPECT_DOUBLE_EQ(minimap.content_rect().x, -40.0);
    EXPECT_DOUBLE_EQ(minimap.content_rect().bottom(), 260.0);
    EXPECT_NEAR(minimap.scale(), kScale, 1e-12);

    minimap.set_size(Vec2{300.0, 300.0});
    EXPECT_NEAR(minimap.scale(), (300.0 - 8.0) / 500.0, 1e-12);
}

TEST(MinimapTest, CoordinateMappingRoundTrips) {
    MinimapSync minimap;
    minimap.update_content(kNodeBounds);
    expect_near(minimap.world_to_minimap(Vec2{210.0, 110.0}), Vec2{100.0, 75.0});
    for (const Vec2 w : {Vec2{0.0, 0.0}, Vec2{-300.0, 45.5}, Vec2{1234.0, -987.0}}) {
        expect_near(minimap.minimap_to_world(minimap.world_to_minimap(w)), w, 1e-9);
    }
}

TEST(MinimapTest, ViewportRectTracksVisibleWorldRect) {
    MinimapSync minimap;
    minimap.update_content(kNodeBounds);
    ViewTransform transform;
    transform.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});

    Rect r = minimap.viewport_rect(transform);
    EXPECT_NEAR(r.x, 100.0 - 210.0 * kScale, 1e-9);
    EXPECT_NEAR(r.y, 75.0 - 110.0 * kScale, 1e-9);
    EXPECT_NEAR(r.width, 800.0 * kScale, 1e-9);
    EXPECT_NEAR(r.height, 600.0 * kScale, 1e-9);

    transform.zoom_at(Vec2{0.0, 0.0}, 2.0);
    r = minimap.viewport_rect(transform);
    EXPECT_NEAR(r.width, 400.0 * kScale, 1e-9);
}

TEST(MinimapTest, ClickOutsideViewportRectRecentersMainView) {
    MinimapSync minimap;
    minimap.update_content(kNodeBounds);
    ViewTransform transform;
    transform.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});
    transform.set_viewport(graph_model::Viewport{0.0, 0.0, 10.0});

    const Vec2 local{150.0, 100.0};
    ASSERT_FALSE(minimap.viewport_rect(transform).contains(local));
    const Vec2 target = minimap.minimap_to_world(local);

    EXPECT_TRUE(minimap.pointer_down(local, transform));
    EXPECT_TRUE(minimap.dragging());
    EXPECT_DOUBLE_EQ(transform.zoom(), 10.0);
    expect_near(transform.screen_to_world(transform.canvas_center()), target, 1e-7);
}

TEST(MinimapTest, DraggingViewportRectPansByScaledDelta) {
    MinimapSync minimap;
    minimap.update_content(kNodeBounds);
    ViewTransform transform;
    transform.set_canvas_rect(Vec2{0.0, 0.0}, Vec2{800.0, 600.0});
    transform.set_viewport(graph_model::Viewport{0.0, 0.0, 10.0});

    const Rect r = minimap.viewport_rect(transform);
    const Vec2 inside = r.center();
    EXPECT_FALSE(minimap.pointer_down(inside, transform));
    EXPECT_DOUBLE_EQ(transform.pan().x, 0.0);

    EXPECT_TRUE(minimap.pointer_move(inside + Vec2{10.0, 5.0}, transform));
    EXPECT_NEAR(transform.pan().x, 10.0 / kScale, 1e-9);
    EXPECT_NEAR(transform.pan().y, 5.0 / kScale, 1e-9);
    EXPECT_DOUBLE_EQ(transform.zoom(), 10.0);

    minimap.pointer_up();
    EXPECT_FALSE(minimap.dragging());
    EXPECT_FALSE(minimap.pointer_move(inside + Vec2{50.0, 50.0}, transform));
    EXPECT_NEAR(transform.pan().x, 10.0 / kScale, 1e-9);
}
