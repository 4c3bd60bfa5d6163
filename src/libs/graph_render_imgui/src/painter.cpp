#include <graph_render_imgui/painter.hpp>
#include "imgui.h"
#include <type_traits>
#include <vector>

namespace graph_render {

namespace {

ImVec2 to_im(graph_model::Vec2 p) {
    return ImVec2(static_cast<float>(p.x), static_cast<float>(p.y));
}

void paint_polyline(ImDrawList* draw_list, const PolylinePrim& p) {
    for (const auto& run : dash_polyline(p.points, p.dash, p.gap)) {
        std::vector<ImVec2> pts;
        pts.reserve(run.size());
        for (const auto& v : run) pts.push_back(to_im(v));
        draw_list->AddPolyline(pts.data(), static_cast<int>(pts.size()), p.color, ImDrawFlags_None, p.thickness);
    }
}

void paint_text(ImDrawList* draw_list, const TextPrim& t) {
    ImVec2 pos = to_im(t.pos);
    if (t.centered) {
        const ImVec2 text_size = ImGui::CalcTextSize(t.text.c_str());
        pos.x -= text_size.x * 0.5f;
    }
    draw_list->AddText(pos, t.color, t.text.c_str());
}

} // namespace

void paint_frame(ImDrawList* draw_list, const Frame& frame) {
    if (!draw_list) return;

    int clip_depth = 0;
    for (const Primitive& item : frame.items) {
        std::visit([&](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, CirclePrim>) {
                if (alpha_of(p.fill) > 0) draw_list->AddCircleFilled(to_im(p.center), p.radius, p.fill);
                if (alpha_of(p.outline) > 0 && p.thickness > 0.0f)
                    draw_list->AddCircle(to_im(p.center), p.radius, p.outline, 0, p.thickness);
            } else if constexpr (std::is_same_v<T, PolylinePrim>) {
                paint_polyline(draw_list, p);
            } else if constexpr (std::is_same_v<T, TrianglePrim>) {
                draw_list->AddTriangleFilled(to_im(p.a), to_im(p.b), to_im(p.c), p.color);
            } else if constexpr (std::is_same_v<T, RectPrim>) {
                const ImVec2 min_pt(static_cast<float>(p.rect.x), static_cast<float>(p.rect.y));
                const ImVec2 max_pt(static_cast<float>(p.rect.right()), static_cast<float>(p.rect.bottom()));
                if (alpha_of(p.fill) > 0) draw_list->AddRectFilled(min_pt, max_pt, p.fill, p.rounding);
                if (alpha_of(p.outline) > 0 && p.thickness > 0.0f)
                    draw_list->AddRect(min_pt, max_pt, p.outline, p.rounding, 0, p.thickness);
            } else if constexpr (std::is_same_v<T, TextPrim>) {
                paint_text(draw_list, p);
            } else if constexpr (std::is_same_v<T, ClipPush>) {
                draw_list->PushClipRect(ImVec2(static_cast<float>(p.rect.x), static_cast<float>(p.rect.y)),
                    ImVec2(static_cast<float>(p.rect.right()), static_cast<float>(p.rect.bottom())), true);
                ++clip_depth;
            } else if constexpr (std::is_same_v<T, ClipPop>) {
                if (clip_depth > 0) {
                    draw_list->PopClipRect();
                    --clip_depth;
                }
            }
        }, item);
    }
    while (clip_depth-- > 0) draw_list->PopClipRect();
}

} // namespace graph_render
