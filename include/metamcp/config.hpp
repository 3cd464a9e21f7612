#pragma once
#include "process.hpp"
#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace metamcp {

/// Runtime settings shared by the executables. Environment first, then
/// command-line flags on top.
struct Config {
    std::filesystem::path sessions_dir;
    std::string engine = "Rscript";
    std::vector<std::string> engine_flags{"--vanilla"};
    std::string engine_script = "scripts/entry/mcp_tools.R";
    std::chrono::milliseconds timeout{30000};
    std::string worker = "metamcp-server";
    std::optional<std::string> worker_script;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string http_host = "127.0.0.1";
    uint16_t http_port = 8080;

    /// Defaults overridden by SESSIONS_DIR and the METAMCP_* variables.
    /// Naming an engine drops the default interpreter flags unless
    /// METAMCP_ENGINE_ARGS is also set; the same holds for --engine and
    /// --engine-args on the command line.
    /// Throws std::invalid_argument for malformed numeric or level values.
    static Config from_environment();

    /// Consume "--flag value" and "--flag=value" options from argv[1..].
    /// Returns the remaining positional arguments in order.
    /// Throws std::invalid_argument for unknown flags or bad values.
    std::vector<std::string> apply_arguments(int argc, const char* const argv[]);

    /// Publish the settings as environment variables so that a spawned
    /// worker resolves the same configuration.
    void export_environment() const;

    /// Interpreter, its flags and the handler script.
    [[nodiscard]] CommandSpec engine_command() const;
    /// Worker program with its optional script argument.
    [[nodiscard]] CommandSpec worker_command() const;
};

/// Parse a strictly positive millisecond count.
std::chrono::milliseconds parse_timeout_ms(const std::string& text);
uint16_t parse_port(const std::string& text);

} // namespace metamcp
