#pragma once

#include <graph_render/frame.hpp>

struct ImDrawList;

namespace graph_render {

// Replays a frame into an ImGui draw list. Call only while an ImGui frame is active.
void paint_frame(ImDrawList* draw_list, const Frame& frame);

} // namespace graph_render
