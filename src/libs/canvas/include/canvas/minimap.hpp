#pragma once

#include <canvas/config.hpp>
#include <canvas/view_transform.hpp>
#include <graph_model/types.hpp>
#include <optional>

namespace canvas {

// Scaled overview of the view. Minimap coordinates are local pixels with
// (0,0) at the minimap's top-left corner.
class MinimapSync {
public:
    explicit MinimapSync(const MinimapConfig& config = {});

    const MinimapConfig& config() const { return config_; }
    void set_config(const MinimapConfig& config);

    void set_size(graph_model::Vec2 size);
    graph_model::Vec2 size() const { return graph_model::Vec2{config_.width, config_.height}; }

    // Call whenever nodes are added, removed or moved. nullopt means an empty view.
    void update_content(const std::optional<graph_model::Rect>& node_bounds);
    // World rect the minimap shows (node bounds grown by content_margin).
    const graph_model::Rect& content_rect() const { return content_; }
    double scale() const { return scale_; }

    graph_model::Vec2 world_to_minimap(graph_model::Vec2 world) const;
    graph_model::Vec2 minimap_to_world(graph_model::Vec2 local) const;
    // The main canvas' visible world rect in minimap coordinates.
    graph_model::Rect viewport_rect(const ViewTransform& transform) const;

    // Press inside the viewport rect grabs it; anywhere else recenters the
    // main view on that point and then grabs the rect as well.
    // Returns true when the transform changed.
    bool pointer_down(graph_model::Vec2 local, ViewTransform& transform);
    bool pointer_move(graph_model::Vec2 local, ViewTransform& transform);
    void pointer_up();
    bool dragging() const { return dragging_; }

private:
    void recompute_scale();

    MinimapConfig config_;
    graph_model::Rect content_;
    double scale_ = 1.0;
    bool dragging_ = false;
    graph_model::Vec2 last_local_;
};

} // namespace canvas
