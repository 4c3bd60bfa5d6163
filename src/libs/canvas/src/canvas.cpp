#include <canvas/canvas.hpp>
#include <canvas/logging.hpp>
#include <graph_placement/connection_lines.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <type_traits>
#include <utility>

namespace {

using graph_model::Vec2;

double steady_now_ms() {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

std::string pair_key(const std::string& a, const std::string& b) {
    if (a < b) return a + "|" + b;
    return b + "|" + a;
}

} // namespace

namespace canvas {

CanvasEngine::CanvasEngine(const EngineConfig& config, CanvasCallbacks callbacks, Clock clock)
    : config_(config)
    , callbacks_(std::move(callbacks))
    , clock_(clock ? std::move(clock) : Clock(steady_now_ms))
    , transform_(config.transform)
    , index_(config.placement)
    , machine_(config.interaction)
    , minimap_(config.minimap)
    , redraw_(callbacks_.on_request_redraw)
{
}

void CanvasEngine::set_callbacks(CanvasCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
    redraw_.set_callback(callbacks_.on_request_redraw);
}

void CanvasEngine::switch_view(const graph_model::GraphSnapshot& snapshot) {
    canvas_logger()->info("view_switch from={} to={} nodes={}", view_id_, snapshot.view_id, snapshot.nodes.size());
    active_overlap_pairs_.clear();
    transform_.reset_viewport();
    dispatch(ViewReset{});
    load_snapshot(snapshot);
}

void CanvasEngine::sync(const graph_model::GraphSnapshot& snapshot) {
    load_snapshot(snapshot);
}

void CanvasEngine::load_snapshot(const graph_model::GraphSnapshot& snapshot) {
    view_id_ = snapshot.view_id;
    connections_ = snapshot.connections;
    notes_ = snapshot.notes;
    nodes_.clear();
    index_.clear();

    std::vector<std::string> pending;
    for (graph_model::Node node : snapshot.nodes) {
        if (!std::isfinite(node.radius) || node.radius <= 0.0) node.radius = config_.node_radius;
        if (!node.positioned) {
            pending.push_back(node.id);
            nodes_.push_back(std::move(node));
            continue;
        }
        if (!index_.upsert(node.id, node.pos, node.radius)) {
            canvas_logger()->warn("node_rejected id={} x={} y={}", node.id, node.pos.x, node.pos.y);
            continue;
        }
        nodes_.push_back(std::move(node));
    }

    log_overlaps();
    auto_place_pending(std::move(pending));
    dispatch(DataSynced{});
    content_changed();
}

void CanvasEngine::auto_place_pending(std::vector<std::string> pending) {
    for (const auto& id : pending) {
        auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const graph_model::Node& n) { return n.id == id; });
        if (it == nodes_.end() || id.empty()) continue;

        const graph_placement::PlacementResult r = index_.nearest_free_position(
            transform_.screen_to_world(transform_.canvas_center()), it->radius, id);
        if (!r.is_free) {
            canvas_logger()->warn("auto_place_best_effort id={} depth={} rings={}", id, r.overlap_depth, r.rings_searched);
        }
        if (!index_.upsert(id, r.position, it->radius)) {
            canvas_logger()->warn("node_rejected id={} reason=auto_place", id);
            nodes_.erase(it);
            continue;
        }
        it->pos = r.position;
        it->positioned = true;
        canvas_logger()->info("auto_placed id={} x={} y={}", id, r.position.x, r.position.y);
        if (callbacks_.on_node_moved) callbacks_.on_node_moved(id, r.position);
    }
}

bool CanvasEngine::upsert_node(const graph_model::Node& node) {
    graph_model::Node n = node;
    if (!std::isfinite(n.radius) || n.radius <= 0.0) n.radius = config_.node_radius;

    auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const graph_model::Node& m) { return m.id == n.id; });
    if (!n.positioned) {
        if (n.id.empty()) return false;
        if (it != nodes_.end()) {
            *it = n;
        } else {
            nodes_.push_back(n);
        }
        index_.remove(n.id);
        auto_place_pending({n.id});
    } else {
        if (!index_.upsert(n.id, n.pos, n.radius)) {
            canvas_logger()->warn("node_rejected id={} x={} y={}", n.id, n.pos.x, n.pos.y);
            return false;
        }
        if (it != nodes_.end()) {
            *it = n;
        } else {
            nodes_.push_back(n);
        }
    }
    log_overlaps();
    dispatch(DataSynced{});
    content_changed();
    return index_.contains(n.id);
}

bool CanvasEngine::remove_node(const std::string& id) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const graph_model::Node& n) { return n.id == id; });
    if (it == nodes_.end()) return false;
    nodes_.erase(it);
    index_.remove(id);
    log_overlaps();
    dispatch(DataSynced{});
    content_changed();
    return true;
}

graph_placement::PlacementResult CanvasEngine::suggest_position(Vec2 desired_world) const {
    return index_.nearest_free_position(desired_world, config_.node_radius);
}

graph_placement::PlacementResult CanvasEngine::suggest_position() const {
    return suggest_position(transform_.screen_to_world(transform_.canvas_center()));
}

PointerInput CanvasEngine::make_pointer(PointerPhase phase, Vec2 screen, const Modifiers& mods) const {
    PointerInput in;
    in.phase = phase;
    in.screen = screen;
    in.world = transform_.screen_to_world(screen);
    in.mods = mods;
    in.time_ms = clock_();
    in.hit_note = pick_note(in.world);
    if (!in.hit_note) in.hit_node_id = index_.pick(in.world);
    // Curves are only routed for presses; moves never need them.
    if (phase == PointerPhase::Down && !in.hit_note && !in.hit_node_id) {
        in.hit_connection_id = pick_connection(in.world);
    }
    return in;
}

std::optional<std::string> CanvasEngine::pick_connection(Vec2 world) const {
    std::vector<graph_model::Connection> pickable;
    for (const auto& c : connections_) {
        if (pickable_kinds_[static_cast<std::size_t>(c.kind)]) pickable.push_back(c);
    }
    if (pickable.empty()) return std::nullopt;
    const auto lines = graph_placement::compute_connection_lines(nodes_, pickable);
    return graph_placement::pick_connection(lines, world,
        graph_placement::layout::connection_pick_px / transform_.zoom());
}

std::optional<NoteHit> CanvasEngine::pick_note(Vec2 world) const {
    for (auto it = notes_.rbegin(); it != notes_.rend(); ++it) {
        const graph_model::Rect r{it->pos.x, it->pos.y, graph_placement::layout::note_width,
            graph_placement::layout::note_height};
        if (r.contains(world)) return NoteHit{it->id, it->pos};
    }
    return std::nullopt;
}

void CanvasEngine::handle_pointer_down(Vec2 screen, const Modifiers& mods) {
    dispatch(make_pointer(PointerPhase::Down, screen, mods));
}

void CanvasEngine::handle_pointer_move(Vec2 screen, const Modifiers& mods) {
    dispatch(make_pointer(PointerPhase::Move, screen, mods));
}

void CanvasEngine::handle_pointer_up(Vec2 screen, const Modifiers& mods) {
    dispatch(make_pointer(PointerPhase::Up, screen, mods));
}

void CanvasEngine::handle_double_click(Vec2 screen, const Modifiers& mods) {
    dispatch(make_pointer(PointerPhase::DoubleClick, screen, mods));
}

void CanvasEngine::handle_wheel(Vec2 screen, Vec2 delta, const Modifiers& mods) {
    dispatch(WheelInput{screen, delta, mods});
}

void CanvasEngine::handle_key_down(Key key, const Modifiers& mods) {
    dispatch(KeyInput{key, mods, true});
}

void CanvasEngine::handle_key_up(Key key, const Modifiers& mods) {
    dispatch(KeyInput{key, mods, false});
}

void CanvasEngine::set_canvas_rect(Vec2 origin, Vec2 size) {
    const Vec2 old_origin = transform_.canvas_origin();
    const Vec2 old_size = transform_.canvas_size();
    transform_.set_canvas_rect(origin, size);
    if (old_origin != transform_.canvas_origin() || old_size != transform_.canvas_size()) redraw_.request();
}

void CanvasEngine::zoom_in() {
    transform_.zoom_in();
    redraw_.request();
}

void CanvasEngine::zoom_out() {
    transform_.zoom_out();
    redraw_.request();
}

void CanvasEngine::reset_view() {
    transform_.reset_viewport();
    redraw_.request();
}

bool CanvasEngine::fit_to_content() {
    const auto bounds = index_.content_bounds();
    if (!bounds) {
        transform_.reset_viewport();
        redraw_.request();
        return false;
    }
    const bool fitted = transform_.fit_to_content(*bounds);
    if (!fitted) canvas_logger()->debug("fit_ignored canvas_w={} canvas_h={}", transform_.canvas_size().x, transform_.canvas_size().y);
    redraw_.request();
    return fitted;
}

void CanvasEngine::set_minimap_size(Vec2 size) {
    minimap_.set_size(size);
    redraw_.request();
}

void CanvasEngine::handle_minimap_pointer_down(Vec2 local) {
    if (minimap_.pointer_down(local, transform_)) redraw_.request();
}

void CanvasEngine::handle_minimap_pointer_move(Vec2 local) {
    if (minimap_.pointer_move(local, transform_)) redraw_.request();
}

void CanvasEngine::handle_minimap_pointer_up() {
    minimap_.pointer_up();
}

std::optional<std::string> CanvasEngine::node_at(Vec2 screen) const {
    return index_.pick(transform_.screen_to_world(screen));
}

std::optional<NoteHit> CanvasEngine::note_at(Vec2 screen) const {
    return pick_note(transform_.screen_to_world(screen));
}

std::optional<std::string> CanvasEngine::connection_at(Vec2 screen) const {
    return pick_connection(transform_.screen_to_world(screen));
}

void CanvasEngine::set_connection_kind_pickable(graph_model::ConnectionKind kind, bool pickable) {
    pickable_kinds_[static_cast<std::size_t>(kind)] = pickable;
}

void CanvasEngine::dispatch(const InputEvent& event) {
    apply(machine_.dispatch(event, index_, transform_));
}

void CanvasEngine::apply(const std::vector<Effect>& fx) {
    auto logger = canvas_logger();
    for (const Effect& effect : fx) {
        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, effects::RequestCreateEntity>) {
                logger->debug("intent create_entity x={} y={}", e.world_pos.x, e.world_pos.y);
                if (callbacks_.on_request_create_entity) callbacks_.on_request_create_entity(e.world_pos);
            } else if constexpr (std::is_same_v<T, effects::RequestEditEntity>) {
                logger->debug("intent edit_entity id={}", e.id);
                if (callbacks_.on_request_edit_entity) callbacks_.on_request_edit_entity(e.id);
            } else if constexpr (std::is_same_v<T, effects::RequestCreateConnection>) {
                logger->debug("intent create_connection from={} to={}", e.from_id, e.to_id);
                if (callbacks_.on_request_create_connection) callbacks_.on_request_create_connection(e.from_id, e.to_id);
            } else if constexpr (std::is_same_v<T, effects::RequestEditConnection>) {
                logger->debug("intent edit_connection id={}", e.id);
                if (callbacks_.on_request_edit_connection) callbacks_.on_request_edit_connection(e.id);
            } else if constexpr (std::is_same_v<T, effects::NodeMoved>) {
                commit_node_position(e.id, e.world_pos);
            } else if constexpr (std::is_same_v<T, effects::RequestCreateNote>) {
                logger->debug("intent create_note x={} y={}", e.world_pos.x, e.world_pos.y);
                if (callbacks_.on_request_create_note) callbacks_.on_request_create_note(e.world_pos);
            } else if constexpr (std::is_same_v<T, effects::RequestEditNote>) {
                logger->debug("intent edit_note id={}", e.id);
                if (callbacks_.on_request_edit_note) callbacks_.on_request_edit_note(e.id);
            } else if constexpr (std::is_same_v<T, effects::NoteMoved>) {
                commit_note_position(e.id, e.world_pos);
            } else if constexpr (std::is_same_v<T, effects::SelectionChanged>) {
                logger->debug("selection_changed count={}", e.ids.size());
                if (callbacks_.on_selection_changed) callbacks_.on_selection_changed(e.ids);
            } else if constexpr (std::is_same_v<T, effects::PanBy>) {
                transform_.pan_by(e.delta_screen);
                redraw_.request();
            } else if constexpr (std::is_same_v<T, effects::ZoomAt>) {
                transform_.zoom_at(e.screen_anchor, e.factor);
                redraw_.request();
            } else if constexpr (std::is_same_v<T, effects::ZoomIn>) {
                zoom_in();
            } else if constexpr (std::is_same_v<T, effects::ZoomOut>) {
                zoom_out();
            } else if constexpr (std::is_same_v<T, effects::ResetViewport>) {
                reset_view();
            } else if constexpr (std::is_same_v<T, effects::FitToContent>) {
                fit_to_content();
            } else if constexpr (std::is_same_v<T, effects::Redraw>) {
                redraw_.request();
            }
        }, effect);
    }
}

void CanvasEngine::commit_node_position(const std::string& id, Vec2 pos) {
    if (!index_.move(id, pos)) {
        canvas_logger()->warn("move_rejected id={} x={} y={}", id, pos.x, pos.y);
        return;
    }
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const graph_model::Node& n) { return n.id == id; });
    if (it != nodes_.end()) it->pos = pos;
    canvas_logger()->debug("intent node_moved id={} x={} y={}", id, pos.x, pos.y);
    log_overlaps();
    content_changed();
    if (callbacks_.on_node_moved) callbacks_.on_node_moved(id, pos);
}

void CanvasEngine::commit_note_position(const std::string& id, Vec2 pos) {
    auto it = std::find_if(notes_.begin(), notes_.end(), [&](const graph_model::Note& n) { return n.id == id; });
    if (it == notes_.end()) {
        canvas_logger()->warn("note_move_rejected id={} reason=note_removed", id);
        return;
    }
    it->pos = pos;
    canvas_logger()->debug("intent note_moved id={} x={} y={}", id, pos.x, pos.y);
    redraw_.request();
    if (callbacks_.on_note_moved) callbacks_.on_note_moved(id, pos);
}

void CanvasEngine::content_changed() {
    minimap_.update_content(index_.content_bounds());
    redraw_.request();
}

void CanvasEngine::log_overlaps() {
    auto logger = canvas_logger();
    std::unordered_set<std::string> current_pairs;

    for (const auto& [a_id, b_id] : index_.overlapping_pairs()) {
        const std::string key = pair_key(a_id, b_id);
        current_pairs.insert(key);
        if (active_overlap_pairs_.find(key) == active_overlap_pairs_.end()) {
            const auto a = index_.find(a_id);
            const auto b = index_.find(b_id);
            logger->warn(
                "overlap_detected pair={} a={} b={} a_pos=({}, {}) b_pos=({}, {}) distance={}",
                key, a_id, b_id, a->pos.x, a->pos.y, b->pos.x, b->pos.y,
                graph_model::distance(a->pos, b->pos));
        }
    }

    for (const auto& key : active_overlap_pairs_) {
        if (current_pairs.find(key) == current_pairs.end()) {
            logger->info("overlap_resolved pair={}", key);
        }
    }

    active_overlap_pairs_ = std::move(current_pairs);
}

} // namespace canvas
