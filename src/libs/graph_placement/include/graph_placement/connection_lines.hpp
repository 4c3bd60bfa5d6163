#pragma once

#include <graph_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graph_placement {

struct ConnectionLine {
    std::string connection_id;
    std::string from_node_id;
    std::string to_node_id;
    graph_model::ConnectionKind kind = graph_model::ConnectionKind::Influenced;
    std::string label;
    int strength = 3;
    std::vector<graph_model::Vec2> points;   // curve polyline in world coords, boundary to boundary
    graph_model::Vec2 arrow_tip;
    graph_model::Vec2 arrow_left;
    graph_model::Vec2 arrow_right;
    graph_model::Vec2 label_anchor;          // curve midpoint
};

// Route every connection whose endpoints are both present in `nodes`.
// Connections with a missing endpoint or coincident endpoints are skipped.
std::vector<ConnectionLine> compute_connection_lines(
    const std::vector<graph_model::Node>& nodes,
    const std::vector<graph_model::Connection>& connections);

// Topmost line (last routed) whose curve passes within `tolerance` of `world`.
std::optional<std::string> pick_connection(const std::vector<ConnectionLine>& lines,
    graph_model::Vec2 world, double tolerance);

} // namespace graph_placement
