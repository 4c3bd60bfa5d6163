#include <canvas/view_transform.hpp>
#include <canvas/logging.hpp>
#include <algorithm>
#include <cmath>

namespace canvas {

using graph_model::Rect;
using graph_model::Vec2;

ViewTransform::ViewTransform(const TransformConfig& config)
    : config_(config)
{
    if (!(config_.zoom_min > 0.0)) config_.zoom_min = 0.1;
    if (!(config_.zoom_max >= config_.zoom_min)) config_.zoom_max = config_.zoom_min;
}

void ViewTransform::set_config(const TransformConfig& config) {
    config_ = config;
    if (!(config_.zoom_min > 0.0)) config_.zoom_min = 0.1;
    if (!(config_.zoom_max >= config_.zoom_min)) config_.zoom_max = config_.zoom_min;
    viewport_.zoom = clamp_zoom(viewport_.zoom);
}

double ViewTransform::clamp_zoom(double zoom) const {
    return std::clamp(zoom, config_.zoom_min, config_.zoom_max);
}

void ViewTransform::set_viewport(const graph_model::Viewport& viewport) {
    if (!std::isfinite(viewport.pan_x) || !std::isfinite(viewport.pan_y) || !std::isfinite(viewport.zoom)) {
        canvas_logger()->debug("viewport_ignored reason=non_finite");
        return;
    }
    viewport_.pan_x = viewport.pan_x;
    viewport_.pan_y = viewport.pan_y;
    viewport_.zoom = clamp_zoom(viewport.zoom);
}

void ViewTransform::set_canvas_rect(Vec2 origin, Vec2 size) {
    if (!graph_model::is_finite(origin) || !graph_model::is_finite(size)) return;
    canvas_origin_ = origin;
    canvas_size_ = Vec2{std::max(0.0, size.x), std::max(0.0, size.y)};
}

Vec2 ViewTransform::canvas_center() const {
    return canvas_origin_ + canvas_size_ * 0.5;
}

Vec2 ViewTransform::world_to_screen(Vec2 world) const {
    return (world - pan()) * viewport_.zoom + canvas_origin_;
}

Vec2 ViewTransform::screen_to_world(Vec2 screen) const {
    return (screen - canvas_origin_) / viewport_.zoom + pan();
}

void ViewTransform::zoom_at(Vec2 screen_anchor, double factor) {
    if (!std::isfinite(factor) || factor <= 0.0 || !graph_model::is_finite(screen_anchor)) {
        canvas_logger()->debug("zoom_ignored factor={}", factor);
        return;
    }
    const Vec2 anchor_world = screen_to_world(screen_anchor);
    viewport_.zoom = clamp_zoom(viewport_.zoom * factor);
    const Vec2 new_pan = anchor_world - (screen_anchor - canvas_origin_) / viewport_.zoom;
    viewport_.pan_x = new_pan.x;
    viewport_.pan_y = new_pan.y;
}

void ViewTransform::zoom_at_center(double factor) {
    zoom_at(canvas_center(), factor);
}

void ViewTransform::zoom_in() {
    zoom_at_center(config_.button_zoom_step);
}

void ViewTransform::zoom_out() {
    if (config_.button_zoom_step > 0.0) zoom_at_center(1.0 / config_.button_zoom_step);
}

void ViewTransform::pan_by(Vec2 delta_screen) {
    if (!graph_model::is_finite(delta_screen)) return;
    viewport_.pan_x -= delta_screen.x / viewport_.zoom;
    viewport_.pan_y -= delta_screen.y / viewport_.zoom;
}

void ViewTransform::pan_by_world(Vec2 delta_world) {
    if (!graph_model::is_finite(delta_world)) return;
    viewport_.pan_x += delta_world.x;
    viewport_.pan_y += delta_world.y;
}

void ViewTransform::center_on(Vec2 world) {
    if (!graph_model::is_finite(world)) return;
    const Vec2 new_pan = world - (canvas_size_ * 0.5) / viewport_.zoom;
    viewport_.pan_x = new_pan.x;
    viewport_.pan_y = new_pan.y;
}

void ViewTransform::reset_viewport() {
    viewport_ = graph_model::Viewport{0.0, 0.0, clamp_zoom(1.0)};
}

bool ViewTransform::fit_to_content(const Rect& content_bounds) {
    const double avail_w = canvas_size_.x - 2.0 * config_.fit_margin;
    const double avail_h = canvas_size_.y - 2.0 * config_.fit_margin;
    if (avail_w <= 0.0 || avail_h <= 0.0) return false;
    if (!std::isfinite(content_bounds.width) || !std::isfinite(content_bounds.height)) return false;

    double zoom = config_.zoom_max;
    if (content_bounds.width > 0.0) zoom = std::min(zoom, avail_w / content_bounds.width);
    if (content_bounds.height > 0.0) zoom = std::min(zoom, avail_h / content_bounds.height);
    viewport_.zoom = clamp_zoom(zoom);
    center_on(content_bounds.center());
    return true;
}

Rect ViewTransform::visible_world_rect() const {
    const Vec2 top_left = screen_to_world(canvas_origin_);
    return Rect{top_left.x, top_left.y, canvas_size_.x / viewport_.zoom, canvas_size_.y / viewport_.zoom};
}

} // namespace canvas
