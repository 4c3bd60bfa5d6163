#include <graph_render/frame.hpp>
#include <algorithm>

namespace graph_render {

using graph_model::Vec2;

std::vector<std::vector<Vec2>> dash_polyline(const std::vector<Vec2>& points, double dash, double gap) {
    std::vector<std::vector<Vec2>> out;
    if (points.size() < 2) return out;
    if (!(dash > 0.0) || !(gap > 0.0)) {
        out.push_back(points);
        return out;
    }

    bool in_dash = true;
    double remaining = dash;
    std::vector<Vec2> current{points.front()};

    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        const Vec2 a = points[i];
        const Vec2 b = points[i + 1];
        const double len = graph_model::distance(a, b);
        if (!(len > 0.0)) continue;
        const Vec2 dir = (b - a) / len;

        double t = 0.0;
        while (t < len) {
            const double step = std::min(remaining, len - t);
            t += step;
            remaining -= step;
            const Vec2 p = a + dir * t;
            if (in_dash) current.push_back(p);
            if (remaining <= 0.0) {
                if (in_dash) {
                    out.push_back(std::move(current));
                    current.clear();
                } else {
                    current = {p};
                }
                in_dash = !in_dash;
                remaining = in_dash ? dash : gap;
            }
        }
    }
    if (in_dash && current.size() >= 2) out.push_back(std::move(current));
    return out;
}

} // namespace graph_render
