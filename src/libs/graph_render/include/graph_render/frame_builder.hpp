#pragma once

#include <canvas/canvas.hpp>
#include <canvas/interaction.hpp>
#include <canvas/minimap.hpp>
#include <canvas/view_transform.hpp>
#include <graph_model/types.hpp>
#include <graph_render/frame.hpp>
#include <array>
#include <vector>

namespace graph_render {

struct ConnectionStyle {
    Color color = 0;
    float dash = 0.0f;
    float gap = 0.0f;
};

ConnectionStyle connection_style(graph_model::ConnectionKind kind);
// Strength 1..5 maps linearly onto 1..4 px; out-of-range strengths are clamped.
float connection_width(int strength);
Color note_color(graph_model::NoteColor color);

struct FrameOptions {
    // Indexed by ConnectionKind.
    std::array<bool, 4> visible_kinds{true, true, true, true};
    bool show_node_labels = true;
    bool show_connection_labels = false;
    bool show_grid = true;
    double grid_step = 40.0; // world units
    bool show_minimap = true;
    double minimap_margin = 12.0; // px from the canvas' bottom-right corner

    bool kind_visible(graph_model::ConnectionKind kind) const {
        return visible_kinds[static_cast<std::size_t>(kind)];
    }
    void set_kind_visible(graph_model::ConnectionKind kind, bool visible) {
        visible_kinds[static_cast<std::size_t>(kind)] = visible;
    }
};

// Top-left screen corner of the minimap inside the canvas.
graph_model::Vec2 minimap_screen_origin(const canvas::ViewTransform& transform,
    const canvas::MinimapSync& minimap, const FrameOptions& options);

// Pure: the same inputs always give the same frame. Nodes and connections
// entirely outside the visible world rect are culled.
Frame build_frame(const std::vector<graph_model::Node>& nodes,
    const std::vector<graph_model::Connection>& connections,
    const std::vector<graph_model::Note>& notes,
    const canvas::ViewTransform& transform,
    const canvas::InteractionState& interaction,
    const canvas::MinimapSync* minimap,
    const FrameOptions& options = {});

Frame build_frame(const canvas::CanvasEngine& engine, const FrameOptions& options = {});

} // namespace graph_render
