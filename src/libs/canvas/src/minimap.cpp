#include <canvas/minimap.hpp>
#include <canvas/logging.hpp>
#include <algorithm>
#include <cmath>

namespace canvas {

using graph_model::Rect;
using graph_model::Vec2;

MinimapSync::MinimapSync(const MinimapConfig& config)
    : config_(config)
{
    update_content(std::nullopt);
}

void MinimapSync::set_config(const MinimapConfig& config) {
    config_ = config;
    recompute_scale();
}

void MinimapSync::set_size(Vec2 size) {
    if (!graph_model::is_finite(size)) return;
    config_.width = std::max(0.0, size.x);
    config_.height = std::max(0.0, size.y);
    recompute_scale();
}

void MinimapSync::update_content(const std::optional<Rect>& node_bounds) {
    if (node_bounds) {
        content_ = graph_model::inflate(*node_bounds, config_.content_margin);
    } else {
        const double half = config_.empty_extent * 0.5;
        content_ = Rect{-half, -half, config_.empty_extent, config_.empty_extent};
    }
    recompute_scale();
}

void MinimapSync::recompute_scale() {
    const double usable = std::min(config_.width, config_.height) - 2.0 * config_.padding;
    double extent = std::max(content_.width, content_.height);
    if (!(extent > 0.0)) extent = config_.empty_extent > 0.0 ? config_.empty_extent : 1.0;
    const double s = usable / extent;
    if (std::isfinite(s) && s > 0.0) {
        scale_ = s;
    } else {
        canvas_logger()->debug("minimap_scale_ignored usable={} extent={}", usable, extent);
    }
}

Vec2 MinimapSync::world_to_minimap(Vec2 world) const {
    const Vec2 center{config_.width * 0.5, config_.height * 0.5};
    return center + (world - content_.center()) * scale_;
}

Vec2 MinimapSync::minimap_to_world(Vec2 local) const {
    const Vec2 center{config_.width * 0.5, config_.height * 0.5};
    return content_.center() + (local - center) / scale_;
}

Rect MinimapSync::viewport_rect(const ViewTransform& transform) const {
    const Rect visible = transform.visible_world_rect();
    const Vec2 a = world_to_minimap(Vec2{visible.x, visible.y});
    const Vec2 b = world_to_minimap(Vec2{visible.right(), visible.bottom()});
    return graph_model::rect_from_corners(a, b);
}

bool MinimapSync::pointer_down(Vec2 local, ViewTransform& transform) {
    if (!graph_model::is_finite(local)) return false;
    dragging_ = true;
    last_local_ = local;
    if (viewport_rect(transform).contains(local)) return false;

    transform.center_on(minimap_to_world(local));
    return true;
}

bool MinimapSync::pointer_move(Vec2 local, ViewTransform& transform) {
    if (!dragging_ || !graph_model::is_finite(local)) return false;
    const Vec2 delta = local - last_local_;
    last_local_ = local;
    if (delta.x == 0.0 && delta.y == 0.0) return false;
    transform.pan_by_world(delta / scale_);
    return true;
}

void MinimapSync::pointer_up() {
    dragging_ = false;
}

} // namespace canvas
