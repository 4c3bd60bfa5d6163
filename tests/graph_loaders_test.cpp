#include <gtest/gtest.h>
#include <graph_loaders/demo_graph.hpp>
#include <graph_loaders/json_loader.hpp>
#include <algorithm>
#include <sstream>
#include <unordered_set>

using graph_model::ConnectionKind;

namespace {

std::optional<graph_model::GraphSnapshot> load_snapshot(const std::string& text) {
    std::istringstream in(text);
    return graph_loaders::load_graph_snapshot_from_json(in);
}

std::optional<canvas::EngineConfig> load_config(const std::string& text) {
    std::istringstream in(text);
    return graph_loaders::load_engine_config_from_json(in);
}

} // namespace

TEST(GraphLoadersTest, LoadsSnapshotWithDefaults) {
    const auto s = load_snapshot(R"({
        "view_id": "early-modern",
        "name": "Early modern",
        "nodes": [
            {"id": "descartes", "label": "Descartes", "x": 10, "y": 20, "radius": 24},
            {"id": "spinoza", "x": 80},
            {"id": "leibniz"}
        ],
        "connections": [
            {"from": "descartes", "to": "spinoza", "kind": "critiqued", "strength": 9, "label": "method"},
            {"from": "spinoza", "to": "leibniz", "kind": "mystery"}
        ],
        "notes": [
            {"id": "n1", "title": "Rationalists", "x": 5, "y": 6, "color": "green"}
        ]
    })");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->view_id, "early-modern");
    ASSERT_EQ(s->nodes.size(), 3u);
    EXPECT_EQ(s->nodes[0].label, "Descartes");
    EXPECT_TRUE(s->nodes[0].positioned);
    EXPECT_DOUBLE_EQ(s->nodes[0].pos.y, 20.0);
    EXPECT_DOUBLE_EQ(s->nodes[0].radius, 24.0);
    EXPECT_EQ(s->nodes[1].label, "spinoza");
    EXPECT_FALSE(s->nodes[1].positioned);
    EXPECT_FALSE(s->nodes[2].positioned);

    ASSERT_EQ(s->connections.size(), 2u);
    EXPECT_EQ(s->connections[0].id, "descartes->spinoza");
    EXPECT_EQ(s->connections[0].kind, ConnectionKind::Critiqued);
    EXPECT_EQ(s->connections[0].strength, 5);
    EXPECT_EQ(s->connections[0].label, "method");
    EXPECT_EQ(s->connections[1].kind, ConnectionKind::Influenced);

    ASSERT_EQ(s->notes.size(), 1u);
    EXPECT_EQ(s->notes[0].color, graph_model::NoteColor::Green);
    EXPECT_EQ(s->notes[0].title, "Rationalists");
}

TEST(GraphLoadersTest, RejectsMalformedSnapshots) {
    EXPECT_FALSE(load_snapshot("{ not json").has_value());
    EXPECT_FALSE(load_snapshot(R"({"view_id": "x"})").has_value());
    EXPECT_FALSE(load_snapshot(R"({"nodes": [{"label": "no id"}]})").has_value());
    EXPECT_FALSE(load_snapshot(R"({"nodes": [], "connections": [{"from": "a"}]})").has_value());
    EXPECT_FALSE(load_snapshot(R"({"nodes": [], "notes": {}})").has_value());
    EXPECT_FALSE(graph_loaders::load_graph_snapshot_from_json_file("does/not/exist.json").has_value());

    const auto empty = load_snapshot(R"({"nodes": []})");
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->view_id, "default");
}

TEST(GraphLoadersTest, ConfigOverridesOnlyGivenKeys) {
    const auto c = load_config(R"({
        "node_radius": 26,
        "transform": {"zoom_max": 4, "wheel_pan_speed": 25},
        "interaction": {
            "drag_threshold_px": 4,
            "note_drag_threshold_px": 3,
            "primary_modifier": "meta",
            "quick_connect": {"shift": false, "alt": true, "primary": true},
            "note_mode_key": {"key": "s", "primary": false}
        },
        "placement": {"max_rings": 60},
        "minimap": {"width": 240}
    })");
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(c->node_radius, 26.0);
    EXPECT_DOUBLE_EQ(c->transform.zoom_max, 4.0);
    EXPECT_DOUBLE_EQ(c->transform.zoom_min, 0.1);
    EXPECT_DOUBLE_EQ(c->transform.wheel_pan_speed, 25.0);
    EXPECT_DOUBLE_EQ(c->interaction.drag_threshold_px, 4.0);
    EXPECT_DOUBLE_EQ(c->interaction.note_drag_threshold_px, 3.0);
    EXPECT_DOUBLE_EQ(c->interaction.click_max_ms, 500.0);
    EXPECT_EQ(c->interaction.primary_modifier, canvas::PrimaryModifier::Meta);
    EXPECT_FALSE(c->interaction.quick_connect.shift);
    EXPECT_TRUE(c->interaction.quick_connect.primary);
    EXPECT_EQ(c->interaction.note_mode_key.key, canvas::Key::S);
    EXPECT_FALSE(c->interaction.note_mode_key.primary);
    EXPECT_EQ(c->placement.max_rings, 60);
    EXPECT_DOUBLE_EQ(c->placement.min_separation, 10.0);
    EXPECT_DOUBLE_EQ(c->minimap.width, 240.0);
    EXPECT_DOUBLE_EQ(c->minimap.height, 150.0);
}

TEST(GraphLoadersTest, ConfigWithWrongTypesIsRejected) {
    EXPECT_TRUE(load_config("{}").has_value());
    EXPECT_FALSE(load_config(R"({"node_radius": "big"})").has_value());
    EXPECT_FALSE(load_config(R"({"transform": 3})").has_value());
    EXPECT_FALSE(load_config(R"({"placement": {"max_rings": 2.5}})").has_value());
    EXPECT_FALSE(load_config(R"({"interaction": {"primary_modifier": "hyper"}})").has_value());
    EXPECT_FALSE(load_config(R"({"interaction": {"note_mode_key": {"key": "q"}}})").has_value());
    EXPECT_FALSE(load_config("[1, 2]").has_value());
}

TEST(GraphLoadersTest, DemoGraphIsConsistent) {
    const graph_model::GraphSnapshot demo = graph_loaders::generate_demo_graph();
    EXPECT_EQ(demo.view_id, "demo");

    std::unordered_set<std::string> ids;
    for (const auto& n : demo.nodes) ids.insert(n.id);
    EXPECT_EQ(ids.size(), demo.nodes.size());
    for (const auto& c : demo.connections) {
        EXPECT_TRUE(ids.count(c.from_node_id)) << c.id;
        EXPECT_TRUE(ids.count(c.to_node_id)) << c.id;
    }
    EXPECT_TRUE(std::any_of(demo.nodes.begin(), demo.nodes.end(),
        [](const graph_model::Node& n) { return !n.positioned; }));
}
