#pragma once

#include <canvas/config.hpp>
#include <canvas/interaction.hpp>
#include <canvas/minimap.hpp>
#include <canvas/redraw_scheduler.hpp>
#include <canvas/view_transform.hpp>
#include <graph_model/types.hpp>
#include <graph_placement/spatial_index.hpp>
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace canvas {

// Intents raised for the collaborator that owns the entity records.
struct CanvasCallbacks {
    std::function<void(graph_model::Vec2)> on_request_create_entity;
    std::function<void(const std::string&)> on_request_edit_entity;
    std::function<void(const std::string&, const std::string&)> on_request_create_connection;
    std::function<void(const std::string&)> on_request_edit_connection;
    std::function<void(const std::string&, graph_model::Vec2)> on_node_moved;
    std::function<void(graph_model::Vec2)> on_request_create_note;
    std::function<void(const std::string&)> on_request_edit_note;
    std::function<void(const std::string&, graph_model::Vec2)> on_note_moved;
    std::function<void(const std::vector<std::string>&)> on_selection_changed;
    std::function<void()> on_request_redraw;
};

// Milliseconds from an arbitrary epoch; injected so tests control time.
using Clock = std::function<double()>;

class CanvasEngine {
public:
    explicit CanvasEngine(const EngineConfig& config = {}, CanvasCallbacks callbacks = {}, Clock clock = {});

    const EngineConfig& config() const { return config_; }
    void set_callbacks(CanvasCallbacks callbacks);

    // New view: viewport, selection and sessions are reset.
    void switch_view(const graph_model::GraphSnapshot& snapshot);
    // Same view, fresh data: selection and sessions referring to vanished nodes are dropped.
    void sync(const graph_model::GraphSnapshot& snapshot);
    bool upsert_node(const graph_model::Node& node);
    bool remove_node(const std::string& id);

    // Collision-free spot for a new node near a world point.
    graph_placement::PlacementResult suggest_position(graph_model::Vec2 desired_world) const;
    // Same, anchored at the world point under the canvas center.
    graph_placement::PlacementResult suggest_position() const;

    void handle_pointer_down(graph_model::Vec2 screen, const Modifiers& mods);
    void handle_pointer_move(graph_model::Vec2 screen, const Modifiers& mods);
    void handle_pointer_up(graph_model::Vec2 screen, const Modifiers& mods);
    void handle_double_click(graph_model::Vec2 screen, const Modifiers& mods);
    // delta in wheel notches; +y zooms in.
    void handle_wheel(graph_model::Vec2 screen, graph_model::Vec2 delta, const Modifiers& mods);
    void handle_key_down(Key key, const Modifiers& mods);
    void handle_key_up(Key key, const Modifiers& mods);

    void set_canvas_rect(graph_model::Vec2 origin, graph_model::Vec2 size);
    void zoom_in();
    void zoom_out();
    void reset_view();
    bool fit_to_content();

    void set_minimap_size(graph_model::Vec2 size);
    void handle_minimap_pointer_down(graph_model::Vec2 local);
    void handle_minimap_pointer_move(graph_model::Vec2 local);
    void handle_minimap_pointer_up();

    bool redraw_pending() const { return redraw_.pending(); }
    void frame_rendered() { redraw_.frame_rendered(); }

    const ViewTransform& transform() const { return transform_; }
    const graph_placement::SpatialIndex& index() const { return index_; }
    const MinimapSync& minimap() const { return minimap_; }
    const InteractionState& interaction() const { return machine_.state(); }
    const SelectionState& selection() const { return machine_.selection(); }
    Mode mode() const { return machine_.mode(); }

    const std::string& view_id() const { return view_id_; }
    const std::vector<graph_model::Node>& nodes() const { return nodes_; }
    const std::vector<graph_model::Connection>& connections() const { return connections_; }
    const std::vector<graph_model::Note>& notes() const { return notes_; }
    std::optional<std::string> node_at(graph_model::Vec2 screen) const;
    // Topmost note under a screen point; later notes draw above earlier ones.
    std::optional<NoteHit> note_at(graph_model::Vec2 screen) const;
    // Topmost pickable connection near a screen point.
    std::optional<std::string> connection_at(graph_model::Vec2 screen) const;
    // Hidden kinds are skipped by connection picking.
    void set_connection_kind_pickable(graph_model::ConnectionKind kind, bool pickable);
    std::size_t current_overlap_count() const { return active_overlap_pairs_.size(); }

private:
    void load_snapshot(const graph_model::GraphSnapshot& snapshot);
    void auto_place_pending(std::vector<std::string> pending);
    void dispatch(const InputEvent& event);
    void apply(const std::vector<Effect>& fx);
    void commit_node_position(const std::string& id, graph_model::Vec2 pos);
    void commit_note_position(const std::string& id, graph_model::Vec2 pos);
    std::optional<NoteHit> pick_note(graph_model::Vec2 world) const;
    std::optional<std::string> pick_connection(graph_model::Vec2 world) const;
    void content_changed();
    void log_overlaps();
    PointerInput make_pointer(PointerPhase phase, graph_model::Vec2 screen, const Modifiers& mods) const;

    EngineConfig config_;
    CanvasCallbacks callbacks_;
    Clock clock_;
    ViewTransform transform_;
    graph_placement::SpatialIndex index_;
    InteractionMachine machine_;
    MinimapSync minimap_;
    RedrawScheduler redraw_;

    std::string view_id_;
    std::vector<graph_model::Node> nodes_;
    std::vector<graph_model::Connection> connections_;
    std::vector<graph_model::Note> notes_;
    std::array<bool, 4> pickable_kinds_{true, true, true, true};
    std::unordered_set<std::string> active_overlap_pairs_;
};

} // namespace canvas
