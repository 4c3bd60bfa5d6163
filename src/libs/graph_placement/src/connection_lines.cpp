#include <graph_placement/connection_lines.hpp>
#include <graph_placement/placement_constants.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace graph_placement {

namespace {

using graph_model::Vec2;

struct Disc {
    Vec2 center;
    double radius = 0.0;
};

Vec2 quadratic_point(Vec2 p0, Vec2 c, Vec2 p1, double t) {
    const double u = 1.0 - t;
    return p0 * (u * u) + c * (2.0 * u * t) + p1 * (t * t);
}

// Point where the segment from `outside` toward the disc center crosses its boundary.
Vec2 boundary_toward(const Disc& d, Vec2 outside) {
    const Vec2 dir = outside - d.center;
    const double len = graph_model::length(dir);
    if (len <= 0.0) return d.center;
    return d.center + dir * (d.radius / len);
}

double distance_to_segment(Vec2 p, Vec2 a, Vec2 b) {
    const Vec2 ab = b - a;
    const double len2 = ab.x * ab.x + ab.y * ab.y;
    if (len2 <= 0.0) return graph_model::distance(p, a);
    const Vec2 ap = p - a;
    const double t = std::clamp((ap.x * ab.x + ap.y * ab.y) / len2, 0.0, 1.0);
    return graph_model::distance(p, a + ab * t);
}

} // namespace

std::vector<ConnectionLine> compute_connection_lines(
    const std::vector<graph_model::Node>& nodes,
    const std::vector<graph_model::Connection>& connections)
{
    std::unordered_map<std::string, Disc> discs;
    for (const auto& n : nodes) {
        discs[n.id] = Disc{n.pos, n.radius};
    }

    std::vector<ConnectionLine> lines;
    lines.reserve(connections.size());

    for (const auto& c : connections) {
        auto from_it = discs.find(c.from_node_id);
        auto to_it = discs.find(c.to_node_id);
        if (from_it == discs.end() || to_it == discs.end()) continue;
        const Disc& from = from_it->second;
        const Disc& to = to_it->second;

        const Vec2 delta = to.center - from.center;
        const double len = graph_model::length(delta);
        if (len <= 0.0) continue;

        // Bow the curve to the left of travel so A->B and B->A stay distinguishable.
        const Vec2 normal{-delta.y / len, delta.x / len};
        const Vec2 mid = (from.center + to.center) * 0.5;
        const Vec2 control = mid + normal * (len * layout::curve_bend);

        const Vec2 start = boundary_toward(from, control);
        const Vec2 end = boundary_toward(to, control);

        ConnectionLine line;
        line.connection_id = c.id;
        line.from_node_id = c.from_node_id;
        line.to_node_id = c.to_node_id;
        line.kind = c.kind;
        line.label = c.label;
        line.strength = c.strength;

        line.points.reserve(layout::curve_segments + 1);
        for (int i = 0; i <= layout::curve_segments; ++i) {
            const double t = static_cast<double>(i) / static_cast<double>(layout::curve_segments);
            line.points.push_back(quadratic_point(start, control, end, t));
        }
        line.label_anchor = quadratic_point(start, control, end, 0.5);

        // Arrowhead aligned with the curve tangent at the target end.
        Vec2 tangent = end - control;
        const double tlen = graph_model::length(tangent);
        if (tlen > 0.0) {
            tangent = tangent / tlen;
        } else {
            tangent = delta / len;
        }
        const Vec2 side{-tangent.y, tangent.x};
        const Vec2 base = end - tangent * layout::arrow_length;
        line.arrow_tip = end;
        line.arrow_left = base + side * layout::arrow_half_width;
        line.arrow_right = base - side * layout::arrow_half_width;

        lines.push_back(std::move(line));
    }

    return lines;
}

std::optional<std::string> pick_connection(const std::vector<ConnectionLine>& lines,
    Vec2 world, double tolerance)
{
    if (!(tolerance >= 0.0)) return std::nullopt;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto& pts = it->points;
        for (std::size_t i = 1; i < pts.size(); ++i) {
            if (distance_to_segment(world, pts[i - 1], pts[i]) <= tolerance) return it->connection_id;
        }
    }
    return std::nullopt;
}

} // namespace graph_placement
