#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graph_model {

struct Vec2 {
    double x = 0;
    double y = 0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double s) { return Vec2{a.x * s, a.y * s}; }
inline Vec2 operator/(Vec2 a, double s) { return Vec2{a.x / s, a.y / s}; }
inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }

inline double length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }
inline double distance(Vec2 a, Vec2 b) { return length(b - a); }
inline bool is_finite(Vec2 v) { return std::isfinite(v.x) && std::isfinite(v.y); }

// Axis-aligned rectangle, top-left origin.
struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    Vec2 center() const { return Vec2{x + width * 0.5, y + height * 0.5}; }
    bool contains(Vec2 p) const { return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom(); }
};

// Normalized rect spanning two arbitrary corners.
inline Rect rect_from_corners(Vec2 a, Vec2 b) {
    const double x0 = std::min(a.x, b.x);
    const double y0 = std::min(a.y, b.y);
    return Rect{x0, y0, std::max(a.x, b.x) - x0, std::max(a.y, b.y) - y0};
}

inline Rect inflate(const Rect& r, double amount) {
    return Rect{r.x - amount, r.y - amount, r.width + amount * 2.0, r.height + amount * 2.0};
}

inline bool intersects(const Rect& a, const Rect& b) {
    return a.x <= b.right() && b.x <= a.right() && a.y <= b.bottom() && b.y <= a.bottom();
}

// Camera state: world point `pan` sits at the canvas origin, scaled by `zoom`.
struct Viewport {
    double pan_x = 0;
    double pan_y = 0;
    double zoom = 1.0;
};

enum class ConnectionKind { Influenced, Critiqued, BuiltUpon, Synthesized };

inline constexpr ConnectionKind all_connection_kinds[] = {
    ConnectionKind::Influenced, ConnectionKind::Critiqued,
    ConnectionKind::BuiltUpon, ConnectionKind::Synthesized,
};

inline const char* to_string(ConnectionKind kind) {
    switch (kind) {
    case ConnectionKind::Influenced: return "influenced";
    case ConnectionKind::Critiqued: return "critiqued";
    case ConnectionKind::BuiltUpon: return "built_upon";
    case ConnectionKind::Synthesized: return "synthesized";
    }
    return "influenced";
}

inline std::optional<ConnectionKind> connection_kind_from_string(std::string_view s) {
    for (ConnectionKind k : all_connection_kinds) {
        if (s == to_string(k)) return k;
    }
    return std::nullopt;
}

// One thinker rendered on the canvas. Radius is in world units.
struct Node {
    std::string id;
    std::string label;
    Vec2 pos;
    double radius = 20.0;
    // False for entities that were never placed; the engine auto-places them.
    bool positioned = true;
};

struct Connection {
    std::string id;
    std::string from_node_id;
    std::string to_node_id;
    ConnectionKind kind = ConnectionKind::Influenced;
    std::string label;
    int strength = 3; // 1..5
};

enum class NoteColor { Yellow, Pink, Blue, Green };

// Sticky note pinned to the canvas. Notes do not take part in collision checks.
struct Note {
    std::string id;
    std::string title;
    Vec2 pos;
    NoteColor color = NoteColor::Yellow;
};

struct GraphSnapshot {
    std::string view_id;
    std::string name;
    std::vector<Node> nodes;
    std::vector<Connection> connections;
    std::vector<Note> notes;
};

} // namespace graph_model
