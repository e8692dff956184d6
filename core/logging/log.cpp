#include "logging/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sweep {
namespace logsys {

namespace {
const char* LOGGER_NAME = "sweep";
std::mutex g_mutex;
spdlog::level::level_enum g_level = spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    // Looked up every time: the host may register its own "sweep" logger,
    // or drop the registry, at any point.
    if (auto logger = spdlog::get(LOGGER_NAME)) return logger;

    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_level(g_level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    auto logger = get();
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    logger->set_level(level);
}

} // namespace logsys
} // namespace sweep
