#pragma once

#include <graph_model/types.hpp>

namespace graph_loaders {

// Small philosophers graph used by the viewer when no JSON file is given.
// A few thinkers are left unpositioned so the engine auto-places them.
graph_model::GraphSnapshot generate_demo_graph();

} // namespace graph_loaders
