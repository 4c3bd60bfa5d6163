#include <graph_render/frame_builder.hpp>
#include <graph_placement/connection_lines.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace graph_render {

namespace {

using graph_model::Rect;
using graph_model::Vec2;

const Color canvas_bg = rgba(30, 30, 33);
const Color grid_color = rgba(48, 48, 52);
const Color node_fill = rgba(45, 45, 48);
const Color node_border = rgba(125, 125, 132);
const Color selected_border = rgba(255, 196, 64);
const Color text_color = rgba(220, 220, 220);
const Color label_muted = rgba(160, 160, 165);
const Color rubber_band = rgba(100, 180, 255);
const Color area_fill = rgba(100, 180, 255, 40);
const Color area_border = rgba(100, 180, 255, 200);
const Color ghost_free = rgba(90, 200, 120, 200);
const Color ghost_blocked = rgba(230, 80, 80, 200);
const Color minimap_bg = rgba(22, 22, 25, 230);
const Color minimap_border = rgba(90, 90, 96);
const Color minimap_node = rgba(180, 180, 188);
const Color minimap_view = rgba(255, 255, 255, 200);

const float node_border_thickness = 1.5f;
const float selected_thickness = 3.0f;
const double label_gap = 4.0;
const double note_text_pad = 6.0;
const double min_grid_px = 8.0;
const double max_grid_lines = 4096.0;

Rect node_bounds(Vec2 pos, double radius) {
    return Rect{pos.x - radius, pos.y - radius, radius * 2.0, radius * 2.0};
}

Rect points_bounds(const std::vector<Vec2>& pts) {
    double min_x = pts.front().x;
    double min_y = pts.front().y;
    double max_x = min_x;
    double max_y = min_y;
    for (const Vec2& p : pts) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }
    return Rect{min_x, min_y, max_x - min_x, max_y - min_y};
}

struct Builder {
    const canvas::ViewTransform& transform;
    const FrameOptions& options;
    Frame frame;
    Rect visible;

    Vec2 to_screen(Vec2 w) const { return transform.world_to_screen(w); }

    void emit(Primitive p) { frame.items.push_back(std::move(p)); }

    void grid() {
        const double step = options.grid_step;
        if (!options.show_grid || !(step > 0.0) || step * transform.zoom() < min_grid_px) return;
        const double x0 = std::floor(visible.x / step) * step;
        const double y0 = std::floor(visible.y / step) * step;
        // Line counts are fixed up front; at extreme pan x += step no longer advances.
        const double nx = std::floor((visible.right() - x0) / step) + 1.0;
        const double ny = std::floor((visible.bottom() - y0) / step) + 1.0;
        if (!std::isfinite(nx) || !std::isfinite(ny) || nx < 0.0 || ny < 0.0) return;
        if (nx + ny > max_grid_lines) return;
        for (int i = 0; i < static_cast<int>(nx); ++i) {
            const double x = x0 + step * i;
            emit(PolylinePrim{{to_screen(Vec2{x, visible.y}), to_screen(Vec2{x, visible.bottom()})}, grid_color, 1.0f});
        }
        for (int i = 0; i < static_cast<int>(ny); ++i) {
            const double y = y0 + step * i;
            emit(PolylinePrim{{to_screen(Vec2{visible.x, y}), to_screen(Vec2{visible.right(), y})}, grid_color, 1.0f});
        }
    }

    void connection(const graph_placement::ConnectionLine& line) {
        if (line.points.size() < 2) return;
        if (!graph_model::intersects(points_bounds(line.points), visible)) {
            ++frame.stats.connections_culled;
            return;
        }
        const ConnectionStyle style = connection_style(line.kind);
        PolylinePrim poly;
        poly.points.reserve(line.points.size());
        for (const Vec2& p : line.points) poly.points.push_back(to_screen(p));
        poly.color = style.color;
        poly.thickness = connection_width(line.strength);
        poly.dash = style.dash;
        poly.gap = style.gap;
        emit(std::move(poly));
        emit(TrianglePrim{to_screen(line.arrow_tip), to_screen(line.arrow_left), to_screen(line.arrow_right), style.color});
        if (options.show_connection_labels && !line.label.empty()) {
            emit(TextPrim{to_screen(line.label_anchor), line.label, label_muted, true});
        }
        ++frame.stats.connections_drawn;
    }

    void note(const graph_model::Note& n, bool dragged) {
        const Rect world{n.pos.x, n.pos.y, graph_placement::layout::note_width, graph_placement::layout::note_height};
        if (!graph_model::intersects(world, visible)) return;
        const Vec2 a = to_screen(Vec2{world.x, world.y});
        const Vec2 b = to_screen(Vec2{world.right(), world.bottom()});
        const float z = static_cast<float>(transform.zoom());
        const Color fill = dragged ? with_alpha(note_color(n.color), 200) : note_color(n.color);
        emit(RectPrim{graph_model::rect_from_corners(a, b), fill, dragged ? selected_border : rgba(0, 0, 0, 90),
            dragged ? selected_thickness : 1.0f, 4.0f * z});
        if (!n.title.empty()) {
            const Vec2 text_pos = a + Vec2{note_text_pad, note_text_pad} * transform.zoom();
            emit(TextPrim{text_pos, n.title, rgba(40, 40, 40), false});
        }
        ++frame.stats.notes_drawn;
    }

    void node(const graph_model::Node& n, bool selected, Color fill, Color border) {
        if (!graph_model::intersects(node_bounds(n.pos, n.radius), visible)) {
            ++frame.stats.nodes_culled;
            return;
        }
        const Vec2 c = to_screen(n.pos);
        const float r = static_cast<float>(n.radius * transform.zoom());
        emit(CirclePrim{c, r, fill, selected ? selected_border : border,
            selected ? selected_thickness : node_border_thickness});
        if (options.show_node_labels && !n.label.empty()) {
            emit(TextPrim{Vec2{c.x, c.y + r + label_gap}, n.label, text_color, true});
        }
        ++frame.stats.nodes_drawn;
    }
};

} // namespace

ConnectionStyle connection_style(graph_model::ConnectionKind kind) {
    switch (kind) {
    case graph_model::ConnectionKind::Influenced: return ConnectionStyle{rgba(59, 130, 246), 0.0f, 0.0f};
    case graph_model::ConnectionKind::Critiqued: return ConnectionStyle{rgba(239, 68, 68), 8.0f, 4.0f};
    case graph_model::ConnectionKind::BuiltUpon: return ConnectionStyle{rgba(16, 185, 129), 0.0f, 0.0f};
    case graph_model::ConnectionKind::Synthesized: return ConnectionStyle{rgba(139, 92, 246), 4.0f, 2.0f};
    }
    return ConnectionStyle{rgba(59, 130, 246), 0.0f, 0.0f};
}

float connection_width(int strength) {
    const int s = std::clamp(strength, 1, 5);
    return 1.0f + static_cast<float>(s - 1) / 4.0f * 3.0f;
}

Color note_color(graph_model::NoteColor color) {
    switch (color) {
    case graph_model::NoteColor::Yellow: return rgba(254, 240, 138);
    case graph_model::NoteColor::Pink: return rgba(251, 207, 232);
    case graph_model::NoteColor::Blue: return rgba(191, 219, 254);
    case graph_model::NoteColor::Green: return rgba(187, 247, 208);
    }
    return rgba(254, 240, 138);
}

Vec2 minimap_screen_origin(const canvas::ViewTransform& transform,
    const canvas::MinimapSync& minimap, const FrameOptions& options)
{
    const Vec2 corner = transform.canvas_origin() + transform.canvas_size();
    return corner - minimap.size() - Vec2{options.minimap_margin, options.minimap_margin};
}

Frame build_frame(const std::vector<graph_model::Node>& nodes,
    const std::vector<graph_model::Connection>& connections,
    const std::vector<graph_model::Note>& notes,
    const canvas::ViewTransform& transform,
    const canvas::InteractionState& interaction,
    const canvas::MinimapSync* minimap,
    const FrameOptions& options)
{
    Builder b{transform, options, Frame{}, transform.visible_world_rect()};
    const Vec2 origin = transform.canvas_origin();
    const Vec2 size = transform.canvas_size();
    b.frame.canvas = Rect{origin.x, origin.y, size.x, size.y};

    const canvas::SelectionState& selection = interaction.selection;
    const canvas::DragSession* drag = selection.drag_session();
    const canvas::modes::Connecting* connecting = selection.connecting();

    // Nodes as they should appear this frame: the dragged node follows the cursor.
    std::vector<graph_model::Node> shown = nodes;
    const graph_model::Node* dragged = nullptr;
    for (auto& n : shown) {
        if (drag && n.id == drag->node_id) {
            n.pos = drag->current_world_pos;
            dragged = &n;
        }
    }

    b.emit(ClipPush{b.frame.canvas});
    b.emit(RectPrim{b.frame.canvas, canvas_bg, 0, 0.0f, 0.0f});
    b.grid();

    std::vector<graph_model::Connection> filtered;
    filtered.reserve(connections.size());
    for (const auto& c : connections) {
        if (options.kind_visible(c.kind)) {
            filtered.push_back(c);
        } else {
            ++b.frame.stats.connections_filtered;
        }
    }
    for (const auto& line : graph_placement::compute_connection_lines(shown, filtered)) {
        b.connection(line);
    }

    for (const auto& n : shown) {
        if (&n == dragged) continue;
        const bool highlighted = selection.is_selected(n.id) || (connecting && connecting->source_id == n.id);
        b.node(n, highlighted, node_fill, node_border);
    }

    if (drag && dragged) {
        const float r = static_cast<float>(dragged->radius * transform.zoom());
        b.emit(CirclePrim{transform.world_to_screen(drag->candidate_pos), r, 0,
            drag->candidate_free ? ghost_free : ghost_blocked, 2.0f});
        b.node(*dragged, true, with_alpha(node_fill, 180), node_border);
    }

    // Notes sit above everything on the canvas; a dragged note follows the cursor.
    const canvas::PointerPress* note_drag = interaction.note_drag();
    for (graph_model::Note n : notes) {
        const bool moving = note_drag && n.id == note_drag->note->id;
        if (moving) n.pos = note_drag->note_pos;
        b.note(n, moving);
    }

    if (connecting) {
        for (const auto& n : shown) {
            if (n.id != connecting->source_id) continue;
            PolylinePrim band;
            band.points = {transform.world_to_screen(n.pos), transform.world_to_screen(connecting->cursor_world)};
            band.color = rubber_band;
            band.thickness = 2.0f;
            band.dash = 6.0f;
            band.gap = 4.0f;
            b.emit(std::move(band));
            break;
        }
    }

    if (interaction.press && interaction.press->kind == canvas::PressKind::AreaSelect && interaction.press->exceeded) {
        const Rect r = graph_model::rect_from_corners(interaction.press->start_screen, interaction.press->last_screen);
        b.emit(RectPrim{r, area_fill, area_border, 1.0f, 0.0f});
    }

    if (minimap && options.show_minimap && minimap->size().x > 0.0 && minimap->size().y > 0.0) {
        const Vec2 mo = minimap_screen_origin(transform, *minimap, options);
        const Rect mrect{mo.x, mo.y, minimap->size().x, minimap->size().y};
        b.frame.minimap = mrect;
        b.emit(ClipPush{mrect});
        b.emit(RectPrim{mrect, minimap_bg, minimap_border, 1.0f, 0.0f});

        std::unordered_map<std::string, Vec2> centers;
        for (const auto& n : shown) centers[n.id] = mo + minimap->world_to_minimap(n.pos);
        for (const auto& c : filtered) {
            auto from = centers.find(c.from_node_id);
            auto to = centers.find(c.to_node_id);
            if (from == centers.end() || to == centers.end()) continue;
            b.emit(PolylinePrim{{from->second, to->second}, with_alpha(connection_style(c.kind).color, 140), 1.0f});
        }
        for (const auto& n : shown) {
            const float r = std::max(1.5f, static_cast<float>(n.radius * minimap->scale()));
            const Color fill = selection.is_selected(n.id) ? selected_border : minimap_node;
            b.emit(CirclePrim{centers[n.id], r, fill, 0, 0.0f});
        }
        const Rect view = minimap->viewport_rect(transform);
        b.emit(RectPrim{Rect{mo.x + view.x, mo.y + view.y, view.width, view.height}, 0, minimap_view, 1.5f, 0.0f});
        b.emit(ClipPop{});
    }

    b.emit(ClipPop{});
    return std::move(b.frame);
}

Frame build_frame(const canvas::CanvasEngine& engine, const FrameOptions& options) {
    return build_frame(engine.nodes(), engine.connections(), engine.notes(),
        engine.transform(), engine.interaction(), &engine.minimap(), options);
}

} // namespace graph_render
