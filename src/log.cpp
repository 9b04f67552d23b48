#include "stencil/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace stencil {
namespace log {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_level(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_default_logger();
    }
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = logger ? std::move(logger) : make_default_logger();
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace log
} // namespace stencil
