#include <graph_loaders/json_loader.hpp>
#include <canvas/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace graph_loaders {

namespace {

using nlohmann::json;

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

graph_model::NoteColor note_color_from_string(const std::string& s) {
    if (s == "pink") return graph_model::NoteColor::Pink;
    if (s == "blue") return graph_model::NoteColor::Blue;
    if (s == "green") return graph_model::NoteColor::Green;
    return graph_model::NoteColor::Yellow;
}

std::optional<graph_model::GraphSnapshot> parse_snapshot(const json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("nodes") || !j["nodes"].is_array()) return std::nullopt;

    graph_model::GraphSnapshot s;
    s.view_id = string_or(j, "view_id", "default");
    s.name = string_or(j, "name", "");

    for (const auto& n : j["nodes"]) {
        if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) return std::nullopt;
        graph_model::Node node;
        node.id = n["id"].get<std::string>();
        node.label = string_or(n, "label", node.id);
        const bool has_x = n.contains("x") && n["x"].is_number();
        const bool has_y = n.contains("y") && n["y"].is_number();
        node.positioned = has_x && has_y;
        if (node.positioned) node.pos = graph_model::Vec2{n["x"].get<double>(), n["y"].get<double>()};
        if (n.contains("radius") && n["radius"].is_number()) node.radius = n["radius"].get<double>();
        s.nodes.push_back(std::move(node));
    }

    if (j.contains("connections")) {
        if (!j["connections"].is_array()) return std::nullopt;
        for (const auto& c : j["connections"]) {
            if (!c.is_object()) return std::nullopt;
            if (!c.contains("from") || !c["from"].is_string()) return std::nullopt;
            if (!c.contains("to") || !c["to"].is_string()) return std::nullopt;
            graph_model::Connection conn;
            conn.from_node_id = c["from"].get<std::string>();
            conn.to_node_id = c["to"].get<std::string>();
            conn.id = string_or(c, "id", conn.from_node_id + "->" + conn.to_node_id);
            conn.label = string_or(c, "label", "");
            if (c.contains("kind") && c["kind"].is_string()) {
                const std::string kind = c["kind"].get<std::string>();
                if (auto k = graph_model::connection_kind_from_string(kind)) {
                    conn.kind = *k;
                } else {
                    canvas::canvas_logger()->warn("loader_unknown_kind connection={} kind={}", conn.id, kind);
                }
            }
            if (c.contains("strength") && c["strength"].is_number_integer())
                conn.strength = std::clamp(c["strength"].get<int>(), 1, 5);
            s.connections.push_back(std::move(conn));
        }
    }

    if (j.contains("notes")) {
        if (!j["notes"].is_array()) return std::nullopt;
        for (const auto& n : j["notes"]) {
            if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) return std::nullopt;
            graph_model::Note note;
            note.id = n["id"].get<std::string>();
            note.title = string_or(n, "title", "");
            note.pos.x = n.contains("x") && n["x"].is_number() ? n["x"].get<double>() : 0.0;
            note.pos.y = n.contains("y") && n["y"].is_number() ? n["y"].get<double>() : 0.0;
            note.color = note_color_from_string(string_or(n, "color", "yellow"));
            s.notes.push_back(std::move(note));
        }
    }

    return s;
}

// Each reader leaves `out` untouched when the key is absent and fails on a type mismatch.
bool read(const json& obj, const char* key, double& out) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number()) return false;
    out = obj[key].get<double>();
    return true;
}

bool read(const json& obj, const char* key, int& out) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number_integer()) return false;
    out = obj[key].get<int>();
    return true;
}

bool read(const json& obj, const char* key, bool& out) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) return false;
    out = obj[key].get<bool>();
    return true;
}

const json* section(const json& j, const char* key, bool& ok) {
    if (!j.contains(key)) return nullptr;
    if (!j[key].is_object()) {
        ok = false;
        return nullptr;
    }
    return &j[key];
}

std::optional<canvas::Key> key_from_string(const std::string& s) {
    if (s == "escape") return canvas::Key::Escape;
    if (s == "+") return canvas::Key::Plus;
    if (s == "=") return canvas::Key::Equals;
    if (s == "-") return canvas::Key::Minus;
    if (s == "0") return canvas::Key::Zero;
    if (s == "f") return canvas::Key::F;
    if (s == "s") return canvas::Key::S;
    return std::nullopt;
}

bool parse_interaction(const json& j, canvas::InteractionConfig& c) {
    bool ok = read(j, "drag_threshold_px", c.drag_threshold_px)
        && read(j, "note_drag_threshold_px", c.note_drag_threshold_px)
        && read(j, "click_max_ms", c.click_max_ms)
        && read(j, "create_entity_requires_primary_modifier", c.create_entity_requires_primary_modifier);
    if (!ok) return false;

    if (j.contains("primary_modifier")) {
        if (!j["primary_modifier"].is_string()) return false;
        const std::string m = j["primary_modifier"].get<std::string>();
        if (m == "ctrl") {
            c.primary_modifier = canvas::PrimaryModifier::Ctrl;
        } else if (m == "meta") {
            c.primary_modifier = canvas::PrimaryModifier::Meta;
        } else {
            return false;
        }
    }
    if (const json* qc = section(j, "quick_connect", ok)) {
        ok = read(*qc, "shift", c.quick_connect.shift) && read(*qc, "alt", c.quick_connect.alt)
            && read(*qc, "primary", c.quick_connect.primary);
    }
    if (!ok) return false;
    if (const json* nk = section(j, "note_mode_key", ok)) {
        if (nk->contains("key")) {
            if (!(*nk)["key"].is_string()) return false;
            const auto key = key_from_string((*nk)["key"].get<std::string>());
            if (!key) return false;
            c.note_mode_key.key = *key;
        }
        ok = read(*nk, "primary", c.note_mode_key.primary);
    }
    return ok;
}

std::optional<canvas::EngineConfig> parse_config(const json& j) {
    if (!j.is_object()) return std::nullopt;
    canvas::EngineConfig c;
    bool ok = read(j, "node_radius", c.node_radius);

    if (const json* t = section(j, "transform", ok)) {
        ok = read(*t, "zoom_min", c.transform.zoom_min) && read(*t, "zoom_max", c.transform.zoom_max)
            && read(*t, "button_zoom_step", c.transform.button_zoom_step)
            && read(*t, "wheel_zoom_step", c.transform.wheel_zoom_step)
            && read(*t, "wheel_pan_speed", c.transform.wheel_pan_speed)
            && read(*t, "fit_margin", c.transform.fit_margin);
    }
    if (!ok) return std::nullopt;
    if (const json* i = section(j, "interaction", ok)) {
        ok = parse_interaction(*i, c.interaction);
    }
    if (!ok) return std::nullopt;
    if (const json* p = section(j, "placement", ok)) {
        ok = read(*p, "min_separation", c.placement.min_separation) && read(*p, "ring_step", c.placement.ring_step)
            && read(*p, "max_rings", c.placement.max_rings)
            && read(*p, "min_angular_steps", c.placement.min_angular_steps);
    }
    if (!ok) return std::nullopt;
    if (const json* m = section(j, "minimap", ok)) {
        ok = read(*m, "width", c.minimap.width) && read(*m, "height", c.minimap.height)
            && read(*m, "padding", c.minimap.padding) && read(*m, "content_margin", c.minimap.content_margin)
            && read(*m, "empty_extent", c.minimap.empty_extent);
    }
    if (!ok) return std::nullopt;
    return c;
}

} // namespace

std::optional<graph_model::GraphSnapshot> load_graph_snapshot_from_json(std::istream& in) {
    try {
        json j = json::parse(in);
        auto snapshot = parse_snapshot(j);
        if (!snapshot) canvas::canvas_logger()->warn("loader_rejected kind=snapshot reason=schema");
        return snapshot;
    } catch (const json::exception& e) {
        canvas::canvas_logger()->warn("loader_rejected kind=snapshot error={}", e.what());
        return std::nullopt;
    }
}

std::optional<graph_model::GraphSnapshot> load_graph_snapshot_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_graph_snapshot_from_json(f);
}

std::optional<canvas::EngineConfig> load_engine_config_from_json(std::istream& in) {
    try {
        json j = json::parse(in);
        auto config = parse_config(j);
        if (!config) canvas::canvas_logger()->warn("loader_rejected kind=config reason=schema");
        return config;
    } catch (const json::exception& e) {
        canvas::canvas_logger()->warn("loader_rejected kind=config error={}", e.what());
        return std::nullopt;
    }
}

std::optional<canvas::EngineConfig> load_engine_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_engine_config_from_json(f);
}

} // namespace graph_loaders
