#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace metamcp::log {

/// The shared "metamcp" logger. Always writes to stderr so that stdout stays
/// reserved for protocol traffic.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "off".
/// Throws std::invalid_argument for anything else.
spdlog::level::level_enum parse_level(std::string_view name);

/// Shorten a raw input line for diagnostics.
std::string excerpt(std::string_view text, std::size_t max_len = 120);

} // namespace metamcp::log
