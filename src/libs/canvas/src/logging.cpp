#include <canvas/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace canvas {

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

} // namespace

std::shared_ptr<spdlog::logger> canvas_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "thinker_canvas_latest.log";
        logger = spdlog::basic_logger_mt("thinker_canvas", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Canvas logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace canvas
