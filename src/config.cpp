#include "metamcp/config.hpp"
#include "metamcp/log.hpp"
#include "metamcp/sessions.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace metamcp {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

long long parse_integer(const std::string& text, const char* what) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
    }
    if (used != text.size()) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}

} // anonymous namespace

std::chrono::milliseconds parse_timeout_ms(const std::string& text) {
    long long value = parse_integer(text, "timeout");
    if (value <= 0) throw std::invalid_argument("Timeout must be positive: " + text);
    return std::chrono::milliseconds(value);
}

uint16_t parse_port(const std::string& text) {
    long long value = parse_integer(text, "port");
    if (value < 0 || value > 65535) throw std::invalid_argument("Port out of range: " + text);
    return static_cast<uint16_t>(value);
}

Config Config::from_environment() {
    Config cfg;
    cfg.sessions_dir = SessionPathResolver::default_root();
    if (auto v = env("METAMCP_ENGINE")) {
        // The default flags belong to the default interpreter
        cfg.engine = *v;
        cfg.engine_flags.clear();
    }
    if (const char* v = std::getenv("METAMCP_ENGINE_ARGS")) cfg.engine_flags = split_words(v);
    if (auto v = env("METAMCP_ENGINE_SCRIPT")) cfg.engine_script = *v;
    if (auto v = env("METAMCP_TIMEOUT_MS")) cfg.timeout = parse_timeout_ms(*v);
    if (auto v = env("METAMCP_WORKER")) cfg.worker = *v;
    if (auto v = env("METAMCP_WORKER_SCRIPT")) cfg.worker_script = *v;
    if (auto v = env("METAMCP_LOG_LEVEL")) cfg.log_level = log::parse_level(*v);
    if (auto v = env("METAMCP_HTTP_HOST")) cfg.http_host = *v;
    if (auto v = env("METAMCP_HTTP_PORT")) cfg.http_port = parse_port(*v);
    return cfg;
}

std::vector<std::string> Config::apply_arguments(int argc, const char* const argv[]) {
    std::vector<std::string> positional;
    std::optional<std::vector<std::string>> flags_arg;
    bool engine_arg = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(std::move(arg));
            continue;
        }

        std::string flag = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        auto take_value = [&]() -> std::string {
            if (value) return *value;
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + flag);
            return argv[++i];
        };

        if (flag == "--sessions-dir") {
            sessions_dir = std::filesystem::absolute(take_value()).lexically_normal();
        } else if (flag == "--engine") {
            engine = take_value();
            engine_arg = true;
        } else if (flag == "--engine-args") {
            flags_arg = split_words(take_value());
        } else if (flag == "--engine-script") {
            engine_script = take_value();
        } else if (flag == "--timeout-ms") {
            timeout = parse_timeout_ms(take_value());
        } else if (flag == "--worker") {
            worker = take_value();
        } else if (flag == "--worker-script") {
            worker_script = take_value();
        } else if (flag == "--log-level") {
            log_level = log::parse_level(take_value());
        } else if (flag == "--host") {
            http_host = take_value();
        } else if (flag == "--port") {
            http_port = parse_port(take_value());
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }
    if (flags_arg) {
        engine_flags = std::move(*flags_arg);
    } else if (engine_arg) {
        engine_flags.clear();
    }
    return positional;
}

void Config::export_environment() const {
    std::string flags;
    for (const auto& f : engine_flags) {
        if (!flags.empty()) flags += ' ';
        flags += f;
    }
    if (!sessions_dir.empty()) ::setenv(SessionPathResolver::ROOT_ENV, sessions_dir.c_str(), 1);
    ::setenv("METAMCP_ENGINE", engine.c_str(), 1);
    ::setenv("METAMCP_ENGINE_ARGS", flags.c_str(), 1);
    ::setenv("METAMCP_ENGINE_SCRIPT", engine_script.c_str(), 1);
    ::setenv("METAMCP_TIMEOUT_MS", std::to_string(timeout.count()).c_str(), 1);
    ::setenv("METAMCP_LOG_LEVEL", spdlog::level::to_string_view(log_level).data(), 1);
}

CommandSpec Config::engine_command() const {
    CommandSpec cmd{engine, engine_flags};
    if (!engine_script.empty()) cmd.args.push_back(engine_script);
    return cmd;
}

CommandSpec Config::worker_command() const {
    CommandSpec cmd{worker, {}};
    if (worker_script) cmd.args.push_back(*worker_script);
    return cmd;
}

} // namespace metamcp
