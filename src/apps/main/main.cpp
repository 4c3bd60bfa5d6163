// Thinker canvas viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <canvas/logging.hpp>
#include <graph_loaders/demo_graph.hpp>
#include <graph_loaders/json_loader.hpp>
#include <graph_render/frame_builder.hpp>
#include <graph_render_imgui/painter.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

using graph_model::Vec2;

// Stands in for the data service: owns the records and applies the engine's intents.
struct InMemoryStore {
    graph_model::GraphSnapshot snapshot;
    bool dirty = false;
    int next_id = 1;

    std::string make_id(const char* prefix) { return std::string(prefix) + "-" + std::to_string(next_id++); }

    graph_model::Node* find(const std::string& id) {
        auto it = std::find_if(snapshot.nodes.begin(), snapshot.nodes.end(),
            [&](const graph_model::Node& n) { return n.id == id; });
        return it == snapshot.nodes.end() ? nullptr : &*it;
    }

    graph_model::Note* find_note(const std::string& id) {
        auto it = std::find_if(snapshot.notes.begin(), snapshot.notes.end(),
            [&](const graph_model::Note& n) { return n.id == id; });
        return it == snapshot.notes.end() ? nullptr : &*it;
    }

    graph_model::Connection* find_connection(const std::string& id) {
        auto it = std::find_if(snapshot.connections.begin(), snapshot.connections.end(),
            [&](const graph_model::Connection& c) { return c.id == id; });
        return it == snapshot.connections.end() ? nullptr : &*it;
    }

    void add_thinker(std::optional<Vec2> pos, const std::string& label = {}) {
        graph_model::Node n;
        n.id = make_id("thinker");
        n.label = label.empty() ? "Thinker " + std::to_string(next_id - 1) : label;
        n.positioned = pos.has_value();
        if (pos) n.pos = *pos;
        snapshot.nodes.push_back(std::move(n));
        dirty = true;
    }

    void add_connection(const std::string& from, const std::string& to) {
        graph_model::Connection c;
        c.id = make_id("connection");
        c.from_node_id = from;
        c.to_node_id = to;
        snapshot.connections.push_back(std::move(c));
        dirty = true;
    }

    void add_note(Vec2 pos) {
        graph_model::Note note;
        note.id = make_id("note");
        note.title = "Note";
        note.pos = pos;
        snapshot.notes.push_back(std::move(note));
        dirty = true;
    }

    // Engine already holds the new position, so no re-sync is needed.
    void record_move(const std::string& id, Vec2 pos) {
        if (graph_model::Node* n = find(id)) {
            n->pos = pos;
            n->positioned = true;
        }
    }

    void record_note_move(const std::string& id, Vec2 pos) {
        if (graph_model::Note* n = find_note(id)) n->pos = pos;
    }
};

canvas::Modifiers current_modifiers(const ImGuiIO& io) {
    canvas::Modifiers m;
    m.shift = io.KeyShift;
    m.ctrl = io.KeyCtrl;
    m.alt = io.KeyAlt;
    m.meta = io.KeySuper;
    return m;
}

struct KeyBinding {
    ImGuiKey imgui_key;
    canvas::Key key;
};

const KeyBinding key_bindings[] = {
    {ImGuiKey_Escape, canvas::Key::Escape},
    {ImGuiKey_KeypadAdd, canvas::Key::Plus},
    {ImGuiKey_Equal, canvas::Key::Equals},
    {ImGuiKey_Minus, canvas::Key::Minus},
    {ImGuiKey_KeypadSubtract, canvas::Key::Minus},
    {ImGuiKey_0, canvas::Key::Zero},
    {ImGuiKey_F, canvas::Key::F},
    {ImGuiKey_S, canvas::Key::S},
};

bool rect_contains(const graph_model::Rect& r, ImVec2 p) {
    return r.width > 0.0 && r.contains(Vec2{p.x, p.y});
}

} // namespace

int main(int argc, char* argv[])
{
    bool auto_placement_test = false;
    std::string graph_path;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--auto-placement-test") {
            auto_placement_test = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            graph_path = arg;
        }
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Thinker canvas", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    canvas::EngineConfig config;
    config.interaction.primary_modifier = canvas::host_primary_modifier();
    if (!config_path.empty()) {
        if (auto loaded = graph_loaders::load_engine_config_from_json_file(config_path)) {
            config = *loaded;
        } else {
            (void)fprintf(stderr, "config %s rejected, using defaults\n", config_path.c_str());
        }
    }

    InMemoryStore store;
    {
        std::vector<std::string> graph_paths;
        if (!graph_path.empty()) graph_paths.push_back(graph_path);
        graph_paths.push_back("data/thinkers.json");
        graph_paths.push_back("thinkers.json");
        bool loaded_any = false;
        for (const auto& path : graph_paths) {
            if (auto loaded = graph_loaders::load_graph_snapshot_from_json_file(path)) {
                store.snapshot = std::move(*loaded);
                loaded_any = true;
                break;
            }
        }
        if (!loaded_any) store.snapshot = graph_loaders::generate_demo_graph();
    }

    std::string editing_id;
    char edit_buffer[128] = {};
    std::optional<Vec2> pending_create;
    char create_buffer[128] = {};
    std::string editing_note_id;
    char note_buffer[128] = {};
    std::string editing_connection_id;
    int connection_kind = 0;
    char connection_label[128] = {};

    canvas::CanvasCallbacks callbacks;
    callbacks.on_request_create_entity = [&](Vec2 world) {
        pending_create = world;
        create_buffer[0] = '\0';
    };
    callbacks.on_request_edit_entity = [&](const std::string& id) {
        if (const graph_model::Node* n = store.find(id)) {
            editing_id = id;
            std::snprintf(edit_buffer, sizeof(edit_buffer), "%s", n->label.c_str());
        }
    };
    callbacks.on_request_create_connection = [&](const std::string& from, const std::string& to) {
        store.add_connection(from, to);
    };
    callbacks.on_node_moved = [&](const std::string& id, Vec2 pos) { store.record_move(id, pos); };
    callbacks.on_request_create_note = [&](Vec2 world) { store.add_note(world); };
    callbacks.on_request_edit_note = [&](const std::string& id) {
        if (const graph_model::Note* n = store.find_note(id)) {
            editing_note_id = id;
            std::snprintf(note_buffer, sizeof(note_buffer), "%s", n->title.c_str());
        }
    };
    callbacks.on_note_moved = [&](const std::string& id, Vec2 pos) { store.record_note_move(id, pos); };
    callbacks.on_request_edit_connection = [&](const std::string& id) {
        if (const graph_model::Connection* c = store.find_connection(id)) {
            editing_connection_id = id;
            connection_kind = static_cast<int>(c->kind);
            std::snprintf(connection_label, sizeof(connection_label), "%s", c->label.c_str());
        }
    };

    canvas::CanvasEngine engine(config, callbacks);
    engine.switch_view(store.snapshot);

    graph_render::FrameOptions frame_options;
    bool minimap_active = false;
    bool fit_pending = true;

    bool running = true;
    int frame = 0;
    const int test_burst = 40;
    const int max_test_frames = 600;
    int test_added = 0;
    int test_exit_code = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        if (store.dirty) {
            store.dirty = false;
            engine.sync(store.snapshot);
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Thinker canvas", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        if (ImGui::Button("+")) engine.zoom_in();
        ImGui::SameLine();
        if (ImGui::Button("-")) engine.zoom_out();
        ImGui::SameLine();
        if (ImGui::Button("Reset")) engine.reset_view();
        ImGui::SameLine();
        if (ImGui::Button("Fit")) engine.fit_to_content();
        for (graph_model::ConnectionKind kind : graph_model::all_connection_kinds) {
            ImGui::SameLine();
            bool visible = frame_options.kind_visible(kind);
            if (ImGui::Checkbox(graph_model::to_string(kind), &visible)) {
                frame_options.set_kind_visible(kind, visible);
                engine.set_connection_kind_pickable(kind, visible);
            }
        }
        ImGui::SameLine();
        ImGui::Checkbox("Labels", &frame_options.show_connection_labels);
        ImGui::SameLine();
        ImGui::Text("mode=%s selected=%zu zoom=%.2f", canvas::to_string(engine.mode()),
            engine.selection().selected_ids.size(), engine.transform().zoom());

        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove);
            const ImVec2 origin = ImGui::GetWindowPos();
            engine.set_canvas_rect(Vec2{origin.x, origin.y}, Vec2{canvas_size.x, canvas_size.y});
            if (fit_pending) {
                engine.fit_to_content();
                fit_pending = false;
            }

            const graph_render::Frame drawn = graph_render::build_frame(engine, frame_options);
            const ImVec2 mouse = io.MousePos;
            const Vec2 mouse_v{mouse.x, mouse.y};
            const bool hovered = ImGui::IsWindowHovered();
            const canvas::Modifiers mods = current_modifiers(io);
            const Vec2 minimap_origin{drawn.minimap.x, drawn.minimap.y};

            if (hovered && ImGui::IsMouseClicked(0)) {
                if (rect_contains(drawn.minimap, mouse)) {
                    minimap_active = true;
                    engine.handle_minimap_pointer_down(mouse_v - minimap_origin);
                } else {
                    engine.handle_pointer_down(mouse_v, mods);
                    if (ImGui::IsMouseDoubleClicked(0)) engine.handle_double_click(mouse_v, mods);
                }
            } else if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
                if (minimap_active) {
                    engine.handle_minimap_pointer_move(mouse_v - minimap_origin);
                } else if (hovered || ImGui::IsMouseDown(0)) {
                    engine.handle_pointer_move(mouse_v, mods);
                }
            }
            if (ImGui::IsMouseReleased(0)) {
                if (minimap_active) {
                    engine.handle_minimap_pointer_up();
                    minimap_active = false;
                } else {
                    engine.handle_pointer_up(mouse_v, mods);
                }
            }
            if (hovered && (io.MouseWheel != 0.0f || io.MouseWheelH != 0.0f)) {
                engine.handle_wheel(mouse_v, Vec2{io.MouseWheelH, io.MouseWheel}, mods);
            }
            if (ImGui::IsWindowFocused() && !io.WantTextInput) {
                for (const KeyBinding& b : key_bindings) {
                    if (ImGui::IsKeyPressed(b.imgui_key, false)) engine.handle_key_down(b.key, mods);
                    if (ImGui::IsKeyReleased(b.imgui_key)) engine.handle_key_up(b.key, mods);
                }
            }

            graph_render::paint_frame(ImGui::GetWindowDrawList(), graph_render::build_frame(engine, frame_options));
            engine.frame_rendered();
            ImGui::EndChild();
        }
        ImGui::End();

        if (!editing_id.empty()) {
            ImGui::SetNextWindowSize(ImVec2(320, 0), ImGuiCond_Appearing);
            bool open = true;
            if (ImGui::Begin("Edit thinker", &open, ImGuiWindowFlags_AlwaysAutoResize)) {
                ImGui::InputText("Name", edit_buffer, sizeof(edit_buffer));
                if (ImGui::Button("Save")) {
                    if (graph_model::Node* n = store.find(editing_id)) {
                        n->label = edit_buffer;
                        store.dirty = true;
                    }
                    open = false;
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel")) open = false;
            }
            ImGui::End();
            if (!open) editing_id.clear();
        }

        if (!editing_note_id.empty()) {
            bool open = true;
            if (ImGui::Begin("Edit note", &open, ImGuiWindowFlags_AlwaysAutoResize)) {
                ImGui::InputText("Title", note_buffer, sizeof(note_buffer));
                if (ImGui::Button("Save")) {
                    if (graph_model::Note* n = store.find_note(editing_note_id)) {
                        n->title = note_buffer;
                        store.dirty = true;
                    }
                    open = false;
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel")) open = false;
            }
            ImGui::End();
            if (!open) editing_note_id.clear();
        }

        if (!editing_connection_id.empty()) {
            bool open = true;
            if (ImGui::Begin("Edit connection", &open, ImGuiWindowFlags_AlwaysAutoResize)) {
                for (graph_model::ConnectionKind kind : graph_model::all_connection_kinds) {
                    ImGui::RadioButton(graph_model::to_string(kind), &connection_kind, static_cast<int>(kind));
                }
                ImGui::InputText("Label", connection_label, sizeof(connection_label));
                if (ImGui::Button("Save")) {
                    if (graph_model::Connection* c = store.find_connection(editing_connection_id)) {
                        c->kind = static_cast<graph_model::ConnectionKind>(connection_kind);
                        c->label = connection_label;
                        store.dirty = true;
                    }
                    open = false;
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel")) open = false;
            }
            ImGui::End();
            if (!open) editing_connection_id.clear();
        }

        if (pending_create) {
            bool open = true;
            if (ImGui::Begin("New thinker", &open, ImGuiWindowFlags_AlwaysAutoResize)) {
                ImGui::InputText("Name", create_buffer, sizeof(create_buffer));
                if (ImGui::Button("Create")) {
                    const auto spot = engine.suggest_position(*pending_create);
                    store.add_thinker(spot.position, create_buffer);
                    open = false;
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel")) open = false;
            }
            ImGui::End();
            if (!open) pending_create.reset();
        }

        if (auto_placement_test) {
            if (test_added < test_burst && !store.dirty) {
                store.add_thinker(std::nullopt);
                ++test_added;
            }
            const bool all_added = test_added >= test_burst && !store.dirty;
            if (all_added || frame >= max_test_frames) {
                const auto pairs = engine.index().overlapping_pairs();
                (void)fprintf(stderr,
                    "[auto-placement-test] finished frame=%d nodes=%zu overlap_count=%zu\n",
                    frame, engine.index().size(), pairs.size());
                canvas::canvas_logger()->info("auto_placement_test nodes={} overlap_count={}",
                    engine.index().size(), pairs.size());
                test_exit_code = all_added && pairs.empty() ? 0 : 2;
                running = false;
            }
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (auto_placement_test) {
        return test_exit_code;
    }
    return 0;
}
