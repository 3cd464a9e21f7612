#include "metamcp/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace metamcp::log {

namespace {
constexpr const char* kLoggerName = "metamcp";
std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_init_flag, [] {
        g_logger = spdlog::get(kLoggerName);
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt(kLoggerName);
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [pid %P] %v");
        }
    });
    return g_logger;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace")   return spdlog::level::trace;
    if (name == "debug")   return spdlog::level::debug;
    if (name == "info")    return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")   return spdlog::level::err;
    if (name == "off")     return spdlog::level::off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

std::string excerpt(std::string_view text, std::size_t max_len) {
    if (text.size() <= max_len) return std::string(text);
    return std::string(text.substr(0, max_len)) + "...";
}

} // namespace metamcp::log
