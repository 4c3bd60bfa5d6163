#include <graph_loaders/demo_graph.hpp>

namespace graph_loaders {

graph_model::GraphSnapshot generate_demo_graph() {
    using graph_model::ConnectionKind;

    graph_model::GraphSnapshot out;
    out.view_id = "demo";
    out.name = "Western philosophy (demo)";

    auto thinker = [&](const char* id, const char* label, double x, double y) {
        graph_model::Node n;
        n.id = id;
        n.label = label;
        n.pos = graph_model::Vec2{x, y};
        out.nodes.push_back(std::move(n));
    };
    auto unplaced = [&](const char* id, const char* label) {
        graph_model::Node n;
        n.id = id;
        n.label = label;
        n.positioned = false;
        out.nodes.push_back(std::move(n));
    };
    auto link = [&](const char* from, const char* to, ConnectionKind kind, int strength, const char* label = "") {
        graph_model::Connection c;
        c.id = std::string(from) + "->" + to;
        c.from_node_id = from;
        c.to_node_id = to;
        c.kind = kind;
        c.strength = strength;
        c.label = label;
        out.connections.push_back(std::move(c));
    };

    thinker("socrates", "Socrates", 80, 120);
    thinker("plato", "Plato", 220, 80);
    thinker("aristotle", "Aristotle", 360, 140);
    thinker("descartes", "Descartes", 180, 320);
    thinker("spinoza", "Spinoza", 320, 300);
    thinker("leibniz", "Leibniz", 460, 320);
    thinker("locke", "Locke", 120, 480);
    thinker("hume", "Hume", 260, 500);
    thinker("kant", "Kant", 420, 480);
    thinker("hegel", "Hegel", 560, 440);
    thinker("marx", "Marx", 700, 380);
    thinker("kierkegaard", "Kierkegaard", 680, 540);
    unplaced("nietzsche", "Nietzsche");
    unplaced("schopenhauer", "Schopenhauer");

    link("socrates", "plato", ConnectionKind::Influenced, 5, "mentor");
    link("plato", "aristotle", ConnectionKind::Influenced, 5, "mentor");
    link("aristotle", "plato", ConnectionKind::Critiqued, 3, "theory of forms");
    link("descartes", "spinoza", ConnectionKind::Influenced, 4);
    link("spinoza", "leibniz", ConnectionKind::Critiqued, 2);
    link("locke", "hume", ConnectionKind::BuiltUpon, 4, "empiricism");
    link("hume", "kant", ConnectionKind::Influenced, 5, "dogmatic slumber");
    link("leibniz", "kant", ConnectionKind::Influenced, 3);
    link("kant", "hegel", ConnectionKind::BuiltUpon, 4);
    link("hegel", "marx", ConnectionKind::Synthesized, 4, "dialectics");
    link("hegel", "kierkegaard", ConnectionKind::Critiqued, 4);
    link("kant", "schopenhauer", ConnectionKind::BuiltUpon, 3);
    link("schopenhauer", "nietzsche", ConnectionKind::Influenced, 5);

    graph_model::Note note;
    note.id = "note-rationalists";
    note.title = "Continental rationalists";
    note.pos = graph_model::Vec2{140, 220};
    note.color = graph_model::NoteColor::Blue;
    out.notes.push_back(note);

    return out;
}

} // namespace graph_loaders
