#pragma once

#include <canvas/config.hpp>
#include <graph_model/types.hpp>
#include <istream>
#include <optional>
#include <string>

namespace graph_loaders {

// Nodes without "x"/"y" are loaded as unpositioned and placed by the engine.
std::optional<graph_model::GraphSnapshot> load_graph_snapshot_from_json(std::istream& in);
std::optional<graph_model::GraphSnapshot> load_graph_snapshot_from_json_file(const std::string& path);

// Missing keys keep their defaults; a key with the wrong type rejects the whole config.
std::optional<canvas::EngineConfig> load_engine_config_from_json(std::istream& in);
std::optional<canvas::EngineConfig> load_engine_config_from_json_file(const std::string& path);

} // namespace graph_loaders
