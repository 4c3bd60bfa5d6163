#pragma once

#include <canvas/config.hpp>
#include <graph_model/types.hpp>

namespace canvas {

// World <-> screen mapping for one canvas:
//   screen = (world - pan) * zoom + canvas_origin
// Inputs outside the valid range are clamped or ignored, never rejected with an error.
class ViewTransform {
public:
    explicit ViewTransform(const TransformConfig& config = {});

    const TransformConfig& config() const { return config_; }
    void set_config(const TransformConfig& config);

    const graph_model::Viewport& viewport() const { return viewport_; }
    void set_viewport(const graph_model::Viewport& viewport);
    double zoom() const { return viewport_.zoom; }
    graph_model::Vec2 pan() const { return graph_model::Vec2{viewport_.pan_x, viewport_.pan_y}; }

    void set_canvas_rect(graph_model::Vec2 origin, graph_model::Vec2 size);
    graph_model::Vec2 canvas_origin() const { return canvas_origin_; }
    graph_model::Vec2 canvas_size() const { return canvas_size_; }
    graph_model::Vec2 canvas_center() const;

    graph_model::Vec2 world_to_screen(graph_model::Vec2 world) const;
    graph_model::Vec2 screen_to_world(graph_model::Vec2 screen) const;

    // Rescale around a screen anchor; the world point under the anchor stays put.
    void zoom_at(graph_model::Vec2 screen_anchor, double factor);
    void zoom_at_center(double factor);
    void zoom_in();
    void zoom_out();

    void pan_by(graph_model::Vec2 delta_screen);
    void pan_by_world(graph_model::Vec2 delta_world);
    // Put a world point at the canvas center, preserving zoom.
    void center_on(graph_model::Vec2 world);

    // zoom = 1, pan = world origin.
    void reset_viewport();
    // Fit the bounds inside the canvas with config().fit_margin px on every side.
    bool fit_to_content(const graph_model::Rect& content_bounds);

    graph_model::Rect visible_world_rect() const;

private:
    double clamp_zoom(double zoom) const;

    TransformConfig config_;
    graph_model::Viewport viewport_;
    graph_model::Vec2 canvas_origin_;
    graph_model::Vec2 canvas_size_{800.0, 600.0};
};

} // namespace canvas
