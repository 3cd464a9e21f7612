#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace metamcp {

/// Maps opaque session ids to working directories under a root.
/// Directories are created on first use and never removed here.
class SessionPathResolver {
public:
    /// Environment variable overriding the default root.
    static constexpr const char* ROOT_ENV = "SESSIONS_DIR";

    explicit SessionPathResolver(std::filesystem::path root);

    /// $SESSIONS_DIR if set and non-blank, otherwise <cwd>/sessions.
    [[nodiscard]] static std::filesystem::path default_root();

    /// Return <root>/<session_id>, creating it together with its data,
    /// processing, results and input subdirectories when missing.
    /// Idempotent. Throws SessionError for unusable ids or I/O failures.
    std::filesystem::path resolve(const std::string& session_id) const;

    /// Ids must be 1..128 bytes and must not name a parent or nested path.
    [[nodiscard]] static bool is_valid_session_id(std::string_view session_id);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace metamcp
