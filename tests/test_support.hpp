#pragma once
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace metamcp::testing {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "metamcp-XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// Write an executable /bin/sh script and return its path.
inline std::filesystem::path write_script(const std::filesystem::path& dir,
                                          const std::string& name,
                                          const std::string& body) {
    auto path = dir / name;
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    ::chmod(path.c_str(), 0755);
    return path;
}

/// Stand-in for the statistics engine: answers per tool name the way the
/// real handler script would, driven by the three positional arguments.
inline std::filesystem::path write_stub_engine(const std::filesystem::path& dir) {
    return write_script(dir, "stub_engine.sh", R"(tool="$1"; args="$2"; dir="$3"
case "$tool" in
  health_check) echo '{"status":"ok"}' ;;
  get_session_status) printf '{"status":"success","session_path":"%s"}\n' "$dir" ;;
  perform_meta_analysis) echo 'Error in rma(): internal detail' >&2; exit 1 ;;
  generate_report) sleep 30 ;;
  *) echo "raw output for $tool"; echo 'note' >&2 ;;
esac)");
}

/// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(std::string name, const std::string& value) : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str())) old_ = old, had_old_ = true;
        ::setenv(name_.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (had_old_) ::setenv(name_.c_str(), old_.c_str(), 1);
        else ::unsetenv(name_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string old_;
    bool had_old_ = false;
};

} // namespace metamcp::testing
