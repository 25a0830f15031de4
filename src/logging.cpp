#include "suid/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace suid {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> CreateDefaultLogger() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_logger) {
        g_logger = CreateDefaultLogger();
    }
    return g_logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

} // namespace suid
