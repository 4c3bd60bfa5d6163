#pragma once

#include <graph_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace graph_render {

// Same packing as IM_COL32 (ABGR in memory order R,G,B,A).
using Color = std::uint32_t;

constexpr Color rgba(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255) {
    return (static_cast<Color>(a) << 24) | (static_cast<Color>(b) << 16) |
        (static_cast<Color>(g) << 8) | static_cast<Color>(r);
}

constexpr std::uint8_t alpha_of(Color c) { return static_cast<std::uint8_t>(c >> 24); }

constexpr Color with_alpha(Color c, std::uint8_t a) {
    return (c & 0x00FFFFFFu) | (static_cast<Color>(a) << 24);
}

// All primitive coordinates are screen pixels.

struct CirclePrim {
    graph_model::Vec2 center;
    float radius = 0.0f;
    Color fill = 0;
    Color outline = 0;
    float thickness = 1.0f;
};

struct PolylinePrim {
    std::vector<graph_model::Vec2> points;
    Color color = 0;
    float thickness = 1.0f;
    // Dash pattern in px; dash == 0 means solid.
    float dash = 0.0f;
    float gap = 0.0f;
};

struct TrianglePrim {
    graph_model::Vec2 a;
    graph_model::Vec2 b;
    graph_model::Vec2 c;
    Color color = 0;
};

struct RectPrim {
    graph_model::Rect rect;
    Color fill = 0;
    Color outline = 0;
    float thickness = 1.0f;
    float rounding = 0.0f;
};

struct TextPrim {
    graph_model::Vec2 pos;
    std::string text;
    Color color = 0;
    // Horizontally centered on pos instead of starting there.
    bool centered = false;
};

struct ClipPush {
    graph_model::Rect rect;
};

struct ClipPop {};

using Primitive = std::variant<CirclePrim, PolylinePrim, TrianglePrim, RectPrim, TextPrim, ClipPush, ClipPop>;

struct FrameStats {
    std::size_t nodes_drawn = 0;
    std::size_t nodes_culled = 0;
    std::size_t connections_drawn = 0;
    std::size_t connections_culled = 0;
    std::size_t connections_filtered = 0;
    std::size_t notes_drawn = 0;
};

// Paint order is the order of `items`.
struct Frame {
    graph_model::Rect canvas;
    graph_model::Rect minimap; // empty when the minimap is hidden
    std::vector<Primitive> items;
    FrameStats stats;
};

// Splits a polyline into dash segments, carrying the pattern phase across vertices.
std::vector<std::vector<graph_model::Vec2>> dash_polyline(
    const std::vector<graph_model::Vec2>& points, double dash, double gap);

} // namespace graph_render
