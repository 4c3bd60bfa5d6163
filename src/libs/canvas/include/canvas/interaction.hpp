#pragma once

#include <canvas/config.hpp>
#include <canvas/view_transform.hpp>
#include <graph_model/types.hpp>
#include <graph_placement/spatial_index.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace canvas {

// Enumerator order matches the ModeState alternatives.
enum class Mode { Idle, SingleSelect, MultiSelect, Connecting, PlacingNote, Dragging };

const char* to_string(Mode mode);

struct DragSession {
    std::string node_id;
    graph_model::Vec2 start_world_pos;   // node center when the drag began
    graph_model::Vec2 current_world_pos; // node center following the cursor
    graph_model::Vec2 candidate_pos;     // nearest collision-free center
    bool candidate_free = true;
    graph_model::Vec2 grab_offset;       // cursor minus node center at press time
    Mode return_mode = Mode::SingleSelect;
};

namespace modes {
struct Idle {};
struct SingleSelect {};
struct MultiSelect {};
struct Connecting {
    std::string source_id;
    graph_model::Vec2 cursor_world; // live end of the rubber-band line
};
struct PlacingNote {};
struct Dragging {
    DragSession session;
};
} // namespace modes

using ModeState = std::variant<modes::Idle, modes::SingleSelect, modes::MultiSelect,
    modes::Connecting, modes::PlacingNote, modes::Dragging>;

struct SelectionState {
    ModeState mode_state;
    // Insertion order; bulk actions iterate in this order.
    std::vector<std::string> selected_ids;

    Mode mode() const { return static_cast<Mode>(mode_state.index()); }
    std::optional<std::string> pending_connection_source_id() const;
    const DragSession* drag_session() const;
    const modes::Connecting* connecting() const;
    bool is_selected(const std::string& id) const;
};

enum class PressKind {
    NodeArmed,     // press on a selected node; crossing the threshold starts a drag
    NodeInert,     // press on a node that ended up unselected
    Pan,           // plain press on empty canvas
    AreaSelect,    // shift press on empty canvas
    NotePlacement, // any press while placing a note
    NoteArmed,     // press on a sticky note; a click edits it, a drag moves it freely
    Consumed       // press already fully handled on pointerdown
};

// Topmost sticky note under the pointer and its top-left corner.
struct NoteHit {
    std::string id;
    graph_model::Vec2 pos;
};

struct PointerPress {
    PressKind kind = PressKind::Consumed;
    graph_model::Vec2 start_screen;
    graph_model::Vec2 start_world;
    graph_model::Vec2 last_screen;
    double start_ms = 0.0;
    std::optional<std::string> node_id;
    Modifiers mods;
    bool exceeded = false;         // latched once movement passes the drag threshold
    bool replace_on_click = false; // plain press on a member of a multi-selection
    bool additive = false;         // area select keeps the existing selection
    std::optional<std::string> connection_id; // connection under a pan press
    std::optional<NoteHit> note;   // pressed note, position as of the press
    graph_model::Vec2 note_pos;    // live top-left of a dragged note
};

struct InteractionState {
    SelectionState selection;
    std::optional<PointerPress> press;

    // Press moving a sticky note, or null.
    const PointerPress* note_drag() const;
};

// --- input ---

enum class PointerPhase { Down, Move, Up, DoubleClick };

struct PointerInput {
    PointerPhase phase = PointerPhase::Move;
    graph_model::Vec2 screen;
    graph_model::Vec2 world;
    Modifiers mods;
    double time_ms = 0.0;
    std::optional<std::string> hit_node_id;
    // Notes sit above nodes: when set, hit_node_id is ignored.
    std::optional<NoteHit> hit_note;
    // Connection curve under the pointer; only consulted when nothing else is hit.
    std::optional<std::string> hit_connection_id;
};

struct WheelInput {
    graph_model::Vec2 screen;
    graph_model::Vec2 delta; // notches; +y scrolls away from the user
    Modifiers mods;
};

struct KeyInput {
    Key key = Key::Unknown;
    Modifiers mods;
    bool down = true;
};

// Node data changed outside the engine; drop references to vanished nodes.
struct DataSynced {};
// Active view switched; everything ephemeral goes.
struct ViewReset {};

using InputEvent = std::variant<PointerInput, WheelInput, KeyInput, DataSynced, ViewReset>;

// --- output ---

namespace effects {
struct RequestCreateEntity { graph_model::Vec2 world_pos; };
struct RequestEditEntity { std::string id; };
struct RequestCreateConnection { std::string from_id; std::string to_id; };
struct RequestEditConnection { std::string id; };
struct NodeMoved { std::string id; graph_model::Vec2 world_pos; };
struct RequestCreateNote { graph_model::Vec2 world_pos; };
struct RequestEditNote { std::string id; };
struct NoteMoved { std::string id; graph_model::Vec2 world_pos; };
struct SelectionChanged { std::vector<std::string> ids; };
struct PanBy { graph_model::Vec2 delta_screen; };
struct ZoomAt { graph_model::Vec2 screen_anchor; double factor = 1.0; };
struct ZoomIn {};
struct ZoomOut {};
struct ResetViewport {};
struct FitToContent {};
struct Redraw {};
} // namespace effects

using Effect = std::variant<effects::RequestCreateEntity, effects::RequestEditEntity,
    effects::RequestCreateConnection, effects::RequestEditConnection, effects::NodeMoved, effects::RequestCreateNote,
    effects::RequestEditNote, effects::NoteMoved, effects::SelectionChanged, effects::PanBy, effects::ZoomAt, effects::ZoomIn, effects::ZoomOut,
    effects::ResetViewport, effects::FitToContent, effects::Redraw>;

struct ReduceContext {
    const InteractionConfig& config;
    const graph_placement::SpatialIndex& index;
    const ViewTransform& transform;
};

struct Transition {
    InteractionState state;
    std::vector<Effect> effects;
};

// Pure transition function: same state, event and context give the same result.
Transition reduce(const InteractionState& state, const InputEvent& event, const ReduceContext& ctx);

enum class Gesture { Click, Drag };

// Click iff movement <= drag threshold and duration < click window.
Gesture classify_press(graph_model::Vec2 down_screen, double down_ms,
    graph_model::Vec2 up_screen, double up_ms, const InteractionConfig& config);

// Owns the interaction state and feeds events through reduce().
class InteractionMachine {
public:
    explicit InteractionMachine(const InteractionConfig& config = {});

    const InteractionConfig& config() const { return config_; }
    void set_config(const InteractionConfig& config) { config_ = config; }

    const InteractionState& state() const { return state_; }
    const SelectionState& selection() const { return state_.selection; }
    Mode mode() const { return state_.selection.mode(); }

    std::vector<Effect> dispatch(const InputEvent& event,
        const graph_placement::SpatialIndex& index, const ViewTransform& transform);

private:
    InteractionConfig config_;
    InteractionState state_;
};

} // namespace canvas
