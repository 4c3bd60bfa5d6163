#pragma once

namespace graph_placement {

// Shared placement constants (used by the spatial index, engine config and renderer).
// All values in world units unless stated otherwise.

namespace layout {

constexpr double node_radius = 20.0;
// Extra gap between node boundaries beyond their radii.
constexpr double min_separation = 10.0;

// Ring search: radial step between rings and the bound on ring count.
constexpr double ring_step = 4.0;
constexpr int max_rings = 96;
// Inner rings still sample at least this many angles.
constexpr int min_angular_steps = 8;

// Upper bounds accepted for configured search parameters.
constexpr int max_rings_limit = 1024;
constexpr int angular_steps_limit = 360;

// Broad-phase AABBs are stored in float; pad them so rounding never drops a neighbor.
constexpr double aabb_pad = 1.0;

// Connection curves bow sideways by this fraction of their length.
constexpr double curve_bend = 0.12;
constexpr double arrow_length = 10.0;
constexpr double arrow_half_width = 5.0;
constexpr int curve_segments = 16;
// Presses within this many screen px of a curve pick the connection.
constexpr double connection_pick_px = 10.0;

// Sticky note card; notes are picked as this rect but never take part in collision checks.
constexpr double note_width = 140.0;
constexpr double note_height = 70.0;

// Search span covered by the ring search for a given configuration.
inline constexpr double search_reach(double step, int rings) {
    return step * static_cast<double>(rings);
}

} // namespace layout
} // namespace graph_placement
