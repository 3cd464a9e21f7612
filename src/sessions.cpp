#include "metamcp/sessions.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace metamcp {

namespace {
constexpr std::size_t kMaxSessionIdLength = 128;
constexpr const char* kSessionSubdirs[] = {"data", "processing", "results", "input"};
}

SessionPathResolver::SessionPathResolver(fs::path root)
    : root_(fs::absolute(root).lexically_normal()) {
}

fs::path SessionPathResolver::default_root() {
    const char* env = std::getenv(ROOT_ENV);
    if (env) {
        std::string value(env);
        if (value.find_first_not_of(" \t\r\n") != std::string::npos) {
            return fs::absolute(value).lexically_normal();
        }
    }
    return fs::current_path() / "sessions";
}

bool SessionPathResolver::is_valid_session_id(std::string_view id) {
    if (id.empty() || id.size() > kMaxSessionIdLength) return false;
    if (id == "." || id == "..") return false;
    return id.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

fs::path SessionPathResolver::resolve(const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        throw SessionError("Invalid session_id");
    }

    fs::path dir = root_ / session_id;
    std::error_code ec;
    bool created = fs::create_directories(dir, ec);
    if (ec) {
        log::logger()->error("Cannot create session directory {}: {}", dir.string(), ec.message());
        throw SessionError("Unable to prepare session directory");
    }
    for (const char* sub : kSessionSubdirs) {
        fs::create_directories(dir / sub, ec);
        if (ec) {
            log::logger()->error("Cannot create {}/{}: {}", dir.string(), sub, ec.message());
            throw SessionError("Unable to prepare session directory");
        }
    }
    if (created) {
        log::logger()->info("Created session directory {}", dir.string());
    }
    return dir;
}

} // namespace metamcp
