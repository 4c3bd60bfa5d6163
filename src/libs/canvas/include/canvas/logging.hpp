#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace canvas {

// Engine logger writing logs/thinker_canvas_latest.log under the project root.
// Falls back to spdlog's default logger when the file sink cannot be opened.
std::shared_ptr<spdlog::logger> canvas_logger();

} // namespace canvas
