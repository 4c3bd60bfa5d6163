#pragma once

#include <graph_placement/placement_constants.hpp>
#include <graph_placement/spatial_index.hpp>

namespace canvas {

struct Modifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;
};

// Which physical key acts as "primary" (Ctrl on most hosts, Cmd/Meta on macOS).
enum class PrimaryModifier { Ctrl, Meta };

inline bool primary_down(const Modifiers& m, PrimaryModifier primary) {
    return primary == PrimaryModifier::Meta ? m.meta : m.ctrl;
}

// Required modifiers; keys not listed may also be held.
struct ModifierChord {
    bool shift = false;
    bool alt = false;
    bool primary = false;

    bool matches(const Modifiers& m, PrimaryModifier p) const {
        if (shift && !m.shift) return false;
        if (alt && !m.alt) return false;
        if (primary && !primary_down(m, p)) return false;
        return shift || alt || primary;
    }
};

enum class Key { Unknown, Escape, Plus, Equals, Minus, Zero, F, S };

struct KeyChord {
    Key key = Key::Unknown;
    bool primary = false;
};

struct TransformConfig {
    double zoom_min = 0.1;
    double zoom_max = 10.0;
    double button_zoom_step = 1.1;
    double wheel_zoom_step = 1.1;
    double wheel_pan_speed = 40.0; // screen px per wheel notch
    double fit_margin = 40.0;      // screen px
};

struct InteractionConfig {
    // Movement <= threshold is a click, > threshold is a drag (screen px).
    double drag_threshold_px = 5.0;
    // Sticky notes start moving after this much movement (screen px).
    double note_drag_threshold_px = 2.0;
    // Presses lasting this long or longer are never clicks.
    double click_max_ms = 500.0;
    PrimaryModifier primary_modifier = PrimaryModifier::Ctrl;
    ModifierChord quick_connect{true, true, false};
    KeyChord note_mode_key{Key::S, true};
    bool create_entity_requires_primary_modifier = false;
};

struct MinimapConfig {
    double width = 200.0;
    double height = 150.0;
    double padding = 4.0;          // minimap px
    double content_margin = 40.0;  // world units around the content bounds
    double empty_extent = 1000.0;  // world square shown for an empty view
};

struct EngineConfig {
    TransformConfig transform;
    InteractionConfig interaction;
    graph_placement::PlacementParams placement;
    double node_radius = graph_placement::layout::node_radius;
    MinimapConfig minimap;
};

inline PrimaryModifier host_primary_modifier() {
#ifdef __APPLE__
    return PrimaryModifier::Meta;
#else
    return PrimaryModifier::Ctrl;
#endif
}

} // namespace canvas
