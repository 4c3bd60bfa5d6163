#include <canvas/interaction.hpp>
#include <canvas/logging.hpp>
#include <algorithm>
#include <cmath>

namespace canvas {

using graph_model::Vec2;

const char* to_string(Mode mode) {
    switch (mode) {
    case Mode::Idle: return "Idle";
    case Mode::SingleSelect: return "SingleSelect";
    case Mode::MultiSelect: return "MultiSelect";
    case Mode::Connecting: return "Connecting";
    case Mode::PlacingNote: return "PlacingNote";
    case Mode::Dragging: return "Dragging";
    }
    return "Idle";
}

std::optional<std::string> SelectionState::pending_connection_source_id() const {
    if (const auto* c = std::get_if<modes::Connecting>(&mode_state)) return c->source_id;
    return std::nullopt;
}

const DragSession* SelectionState::drag_session() const {
    if (const auto* d = std::get_if<modes::Dragging>(&mode_state)) return &d->session;
    return nullptr;
}

const modes::Connecting* SelectionState::connecting() const {
    return std::get_if<modes::Connecting>(&mode_state);
}

bool SelectionState::is_selected(const std::string& id) const {
    return std::find(selected_ids.begin(), selected_ids.end(), id) != selected_ids.end();
}

const PointerPress* InteractionState::note_drag() const {
    if (press && press->kind == PressKind::NoteArmed && press->exceeded && press->note) return &*press;
    return nullptr;
}

Gesture classify_press(Vec2 down_screen, double down_ms, Vec2 up_screen, double up_ms,
    const InteractionConfig& config)
{
    const bool still = graph_model::distance(down_screen, up_screen) <= config.drag_threshold_px;
    const bool quick = (up_ms - down_ms) < config.click_max_ms;
    return still && quick ? Gesture::Click : Gesture::Drag;
}

namespace {

ModeState mode_state_for(Mode mode) {
    switch (mode) {
    case Mode::SingleSelect: return modes::SingleSelect{};
    case Mode::MultiSelect: return modes::MultiSelect{};
    case Mode::PlacingNote: return modes::PlacingNote{};
    default: return modes::Idle{};
    }
}

// Working copy of the state plus the effects produced while handling one event.
class Reducer {
public:
    Reducer(const InteractionState& state, const ReduceContext& ctx)
        : ctx_(ctx)
        , s_(state)
    {
    }

    Transition finish() { return Transition{std::move(s_), std::move(fx_)}; }

    void handle(const PointerInput& in) {
        switch (in.phase) {
        case PointerPhase::Down: pointer_down(in); break;
        case PointerPhase::Move: pointer_move(in); break;
        case PointerPhase::Up: pointer_up(in); break;
        case PointerPhase::DoubleClick: double_click(in); break;
        }
    }

    void handle(const WheelInput& in) {
        const TransformConfig& tc = ctx_.transform.config();
        if (primary(in.mods)) {
            fx_.push_back(effects::PanBy{in.delta * tc.wheel_pan_speed});
        } else if (in.delta.y != 0.0 && std::isfinite(in.delta.y)) {
            fx_.push_back(effects::ZoomAt{in.screen, std::pow(tc.wheel_zoom_step, in.delta.y)});
        }
    }

    void handle(const KeyInput& in) {
        if (!in.down) return;
        const KeyChord& note = ctx_.config.note_mode_key;
        if (in.key == Key::Escape) {
            escape();
        } else if (in.key == note.key && (!note.primary || primary(in.mods))) {
            toggle_note_mode();
        } else if (in.key == Key::Plus || in.key == Key::Equals) {
            fx_.push_back(effects::ZoomIn{});
        } else if (in.key == Key::Minus) {
            fx_.push_back(effects::ZoomOut{});
        } else if (in.key == Key::Zero) {
            fx_.push_back(effects::ResetViewport{});
        } else if (in.key == Key::F) {
            fx_.push_back(effects::FitToContent{});
        }
    }

    void handle(const DataSynced&) {
        std::vector<std::string> kept;
        for (const auto& id : s_.selection.selected_ids) {
            if (ctx_.index.contains(id)) kept.push_back(id);
        }
        set_selection(std::move(kept));

        if (const auto* c = s_.selection.connecting()) {
            if (!ctx_.index.contains(c->source_id)) set_mode(modes::Idle{});
        } else if (const DragSession* d = s_.selection.drag_session()) {
            if (!ctx_.index.contains(d->node_id)) {
                const std::string node_id = d->node_id;
                s_.press.reset();
                drop_vanished_drag(node_id, "drag_discarded");
            }
        }
        if (mode() == Mode::SingleSelect || mode() == Mode::MultiSelect) {
            set_mode(mode_for_count(s_.selection.selected_ids.size()));
        }
        if (s_.press && s_.press->node_id && !ctx_.index.contains(*s_.press->node_id)) {
            s_.press->kind = PressKind::Consumed;
        }
        redraw();
    }

    void handle(const ViewReset&) {
        s_.press.reset();
        set_mode(modes::Idle{});
        set_selection({});
        redraw();
    }

private:
    Mode mode() const { return s_.selection.mode(); }
    bool primary(const Modifiers& m) const { return primary_down(m, ctx_.config.primary_modifier); }
    void set_mode(ModeState m) { s_.selection.mode_state = std::move(m); }
    void redraw() { fx_.push_back(effects::Redraw{}); }

    void set_selection(std::vector<std::string> ids) {
        if (ids == s_.selection.selected_ids) return;
        s_.selection.selected_ids = std::move(ids);
        fx_.push_back(effects::SelectionChanged{s_.selection.selected_ids});
    }

    static ModeState mode_for_count(std::size_t count) {
        if (count == 0) return modes::Idle{};
        if (count == 1) return modes::SingleSelect{};
        return modes::MultiSelect{};
    }

    void pointer_down(const PointerInput& in) {
        s_.press.reset();
        if (const DragSession* d = s_.selection.drag_session()) {
            // Pointer-up was lost; the unfinished drag is discarded.
            set_mode(mode_state_for(d->return_mode));
        }

        PointerPress p;
        p.start_screen = in.screen;
        p.start_world = in.world;
        p.last_screen = in.screen;
        p.start_ms = in.time_ms;
        p.mods = in.mods;

        const std::optional<std::string> hit_node = in.hit_note ? std::optional<std::string>{} : in.hit_node_id;
        p.node_id = hit_node;

        if (const auto* c = s_.selection.connecting()) {
            if (hit_node && *hit_node != c->source_id) {
                fx_.push_back(effects::RequestCreateConnection{c->source_id, *hit_node});
            }
            set_mode(modes::Idle{});
            p.kind = PressKind::Consumed;
            s_.press = p;
            redraw();
            return;
        }

        if (mode() == Mode::PlacingNote) {
            p.kind = PressKind::NotePlacement;
            s_.press = p;
            return;
        }

        if (in.hit_note) {
            p.kind = PressKind::NoteArmed;
            p.note = in.hit_note;
            p.note_pos = in.hit_note->pos;
        } else if (hit_node) {
            const std::string& hit = *hit_node;
            if (ctx_.config.quick_connect.matches(in.mods, ctx_.config.primary_modifier)) {
                set_mode(modes::Connecting{hit, in.world});
                p.kind = PressKind::Consumed;
            } else if (primary(in.mods)) {
                std::vector<std::string> ids = s_.selection.selected_ids;
                auto it = std::find(ids.begin(), ids.end(), hit);
                const bool was_selected = it != ids.end();
                if (was_selected) {
                    ids.erase(it);
                } else {
                    ids.push_back(hit);
                }
                set_selection(std::move(ids));
                if (s_.selection.selected_ids.empty()) {
                    set_mode(modes::Idle{});
                } else {
                    set_mode(modes::MultiSelect{});
                }
                p.kind = was_selected ? PressKind::NodeInert : PressKind::NodeArmed;
            } else if (mode() == Mode::MultiSelect && s_.selection.is_selected(hit)) {
                p.kind = PressKind::NodeArmed;
                p.replace_on_click = true;
            } else {
                set_selection({hit});
                set_mode(modes::SingleSelect{});
                p.kind = PressKind::NodeArmed;
            }
        } else if (in.mods.shift) {
            p.kind = PressKind::AreaSelect;
            p.additive = primary(in.mods);
        } else {
            p.kind = PressKind::Pan;
            p.connection_id = in.hit_connection_id;
        }

        s_.press = p;
        redraw();
    }

    void pointer_move(const PointerInput& in) {
        if (auto* c = std::get_if<modes::Connecting>(&s_.selection.mode_state)) {
            c->cursor_world = in.world;
            redraw();
        }
        if (!s_.press) return;

        PointerPress& p = *s_.press;
        const Vec2 prev = p.last_screen;
        p.last_screen = in.screen;

        if (!p.exceeded) {
            const double threshold = p.kind == PressKind::NoteArmed
                ? ctx_.config.note_drag_threshold_px : ctx_.config.drag_threshold_px;
            if (graph_model::distance(p.start_screen, in.screen) <= threshold) return;
            p.exceeded = true;
            threshold_crossed(in);
            return;
        }

        if (mode() == Mode::Dragging) {
            update_drag(in.world);
            return;
        }
        switch (p.kind) {
        case PressKind::Pan:
        case PressKind::NotePlacement:
            fx_.push_back(effects::PanBy{in.screen - prev});
            break;
        case PressKind::AreaSelect:
            redraw();
            break;
        case PressKind::NoteArmed:
            move_note(in.world);
            break;
        default:
            break;
        }
    }

    void threshold_crossed(const PointerInput& in) {
        PointerPress& p = *s_.press;
        switch (p.kind) {
        case PressKind::NodeArmed:
            begin_drag(in);
            break;
        case PressKind::Pan:
        case PressKind::NotePlacement:
            fx_.push_back(effects::PanBy{in.screen - p.start_screen});
            break;
        case PressKind::AreaSelect:
            redraw();
            break;
        case PressKind::NoteArmed:
            move_note(in.world);
            break;
        default:
            break;
        }
    }

    // Notes follow the cursor freely; the no-overlap rule covers nodes only.
    void move_note(Vec2 cursor_world) {
        PointerPress& p = *s_.press;
        if (!p.note) return;
        p.note_pos = p.note->pos + (cursor_world - p.start_world);
        redraw();
    }

    void finish_note_press(const PointerPress& p, bool click) {
        if (!p.note) return;
        if (p.exceeded) {
            const Vec2 dropped{std::round(p.note_pos.x), std::round(p.note_pos.y)};
            if (dropped != p.note->pos) fx_.push_back(effects::NoteMoved{p.note->id, dropped});
        } else if (click) {
            fx_.push_back(effects::RequestEditNote{p.note->id});
        }
    }

    void begin_drag(const PointerInput& in) {
        PointerPress& p = *s_.press;
        if (!p.node_id || (mode() != Mode::SingleSelect && mode() != Mode::MultiSelect)) {
            p.kind = PressKind::Consumed;
            return;
        }
        const auto node = ctx_.index.find(*p.node_id);
        if (!node) {
            p.kind = PressKind::Consumed;
            return;
        }
        DragSession d;
        d.node_id = node->id;
        d.start_world_pos = node->pos;
        d.current_world_pos = node->pos;
        d.candidate_pos = node->pos;
        d.grab_offset = p.start_world - node->pos;
        d.return_mode = mode();
        set_mode(modes::Dragging{d});
        update_drag(in.world);
    }

    void update_drag(Vec2 cursor_world) {
        auto* dragging = std::get_if<modes::Dragging>(&s_.selection.mode_state);
        if (!dragging) return;
        DragSession& d = dragging->session;
        d.current_world_pos = cursor_world - d.grab_offset;
        const auto node = ctx_.index.find(d.node_id);
        if (!node) {
            const std::string node_id = d.node_id;
            s_.press.reset();
            drop_vanished_drag(node_id, "drag_discarded");
            redraw();
            return;
        }
        const graph_placement::PlacementResult r =
            ctx_.index.nearest_free_position(d.current_world_pos, node->radius, d.node_id);
        d.candidate_pos = r.position;
        d.candidate_free = r.is_free;
        redraw();
    }

    // The dragged node was deleted externally: no commit, and it leaves the selection.
    void drop_vanished_drag(const std::string& node_id, const char* event) {
        canvas_logger()->warn("{} node={} reason=node_removed", event, node_id);
        std::vector<std::string> kept = s_.selection.selected_ids;
        kept.erase(std::remove(kept.begin(), kept.end(), node_id), kept.end());
        const std::size_t count = kept.size();
        set_selection(std::move(kept));
        set_mode(mode_for_count(count));
    }

    void commit_drag() {
        const DragSession d = *s_.selection.drag_session();
        const auto node = ctx_.index.find(d.node_id);
        if (!node) {
            drop_vanished_drag(d.node_id, "drag_commit_rejected");
            return;
        }

        const graph_placement::PlacementResult r =
            ctx_.index.nearest_free_position(d.current_world_pos, node->radius, d.node_id);
        set_mode(mode_state_for(d.return_mode));
        if (!r.is_free) {
            canvas_logger()->warn("drag_commit_rejected node={} reason=no_free_position depth={}",
                d.node_id, r.overlap_depth);
            return;
        }
        if (r.position != node->pos) {
            fx_.push_back(effects::NodeMoved{d.node_id, r.position});
        }
    }

    void pointer_up(const PointerInput& in) {
        if (!s_.press) return;

        PointerInput as_move = in;
        as_move.phase = PointerPhase::Move;
        pointer_move(as_move);
        if (!s_.press) return;

        const PointerPress p = *s_.press;
        s_.press.reset();

        if (mode() == Mode::Dragging) {
            commit_drag();
            redraw();
            return;
        }

        const bool click = !p.exceeded
            && classify_press(p.start_screen, p.start_ms, in.screen, in.time_ms, ctx_.config) == Gesture::Click;

        switch (p.kind) {
        case PressKind::NodeArmed:
            if (click && p.replace_on_click && p.node_id) {
                set_selection({*p.node_id});
                set_mode(modes::SingleSelect{});
            }
            break;
        case PressKind::Pan:
            if (click && p.connection_id) {
                fx_.push_back(effects::RequestEditConnection{*p.connection_id});
            } else if (click) {
                empty_click(p);
            }
            break;
        case PressKind::AreaSelect:
            if (p.exceeded) {
                finish_area_select(p);
            } else if (click) {
                empty_click(p);
            }
            break;
        case PressKind::NotePlacement:
            if (click) {
                fx_.push_back(effects::RequestCreateNote{p.start_world});
                set_mode(modes::Idle{});
            }
            break;
        case PressKind::NoteArmed:
            finish_note_press(p, click);
            break;
        case PressKind::NodeInert:
        case PressKind::Consumed:
            break;
        }
        redraw();
    }

    void empty_click(const PointerPress& p) {
        set_selection({});
        set_mode(modes::Idle{});
        if (!ctx_.config.create_entity_requires_primary_modifier || primary(p.mods)) {
            fx_.push_back(effects::RequestCreateEntity{p.start_world});
        }
    }

    void finish_area_select(const PointerPress& p) {
        const Vec2 a = ctx_.transform.screen_to_world(p.start_screen);
        const Vec2 b = ctx_.transform.screen_to_world(p.last_screen);
        const std::vector<std::string> inside = ctx_.index.query_rect(graph_model::rect_from_corners(a, b));

        std::vector<std::string> ids;
        if (p.additive) ids = s_.selection.selected_ids;
        for (const auto& id : inside) {
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
        }
        const std::size_t count = ids.size();
        set_selection(std::move(ids));
        set_mode(mode_for_count(count));
    }

    void double_click(const PointerInput& in) {
        s_.press.reset();
        if (in.hit_note || !in.hit_node_id) return;
        fx_.push_back(effects::RequestEditEntity{*in.hit_node_id});
        set_mode(modes::Idle{});
        redraw();
    }

    void escape() {
        s_.press.reset();
        switch (mode()) {
        case Mode::Connecting:
        case Mode::PlacingNote:
            set_mode(modes::Idle{});
            break;
        case Mode::Dragging:
            set_mode(mode_state_for(s_.selection.drag_session()->return_mode));
            break;
        case Mode::SingleSelect:
        case Mode::MultiSelect:
        case Mode::Idle:
            set_selection({});
            set_mode(modes::Idle{});
            break;
        }
        redraw();
    }

    void toggle_note_mode() {
        s_.press.reset();
        if (mode() == Mode::PlacingNote) {
            set_mode(modes::Idle{});
        } else {
            set_mode(modes::PlacingNote{});
        }
        redraw();
    }

    const ReduceContext& ctx_;
    InteractionState s_;
    std::vector<Effect> fx_;
};

} // namespace

Transition reduce(const InteractionState& state, const InputEvent& event, const ReduceContext& ctx) {
    Reducer r(state, ctx);
    std::visit([&](const auto& e) { r.handle(e); }, event);
    return r.finish();
}

InteractionMachine::InteractionMachine(const InteractionConfig& config)
    : config_(config)
{
}

std::vector<Effect> InteractionMachine::dispatch(const InputEvent& event,
    const graph_placement::SpatialIndex& index, const ViewTransform& transform)
{
    const ReduceContext ctx{config_, index, transform};
    Transition t = reduce(state_, event, ctx);
    const Mode before = state_.selection.mode();
    state_ = std::move(t.state);
    const Mode after = state_.selection.mode();
    if (before != after) {
        canvas_logger()->debug("mode_transition from={} to={}", to_string(before), to_string(after));
    }
    return std::move(t.effects);
}

} // namespace canvas
