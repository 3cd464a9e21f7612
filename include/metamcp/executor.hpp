#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace metamcp {

/// Runs one tool invocation to completion and returns the engine's JSON
/// with its member order intact. Implementations throw EngineError / EngineTimeoutError / ValidationError
/// with caller-safe messages.
class IToolExecutor {
public:
    virtual ~IToolExecutor() = default;

    virtual nlohmann::ordered_json execute(const std::string& tool_name,
                                           const nlohmann::json& arguments,
                                           const std::filesystem::path& working_dir,
                                           std::chrono::milliseconds timeout) = 0;
};

} // namespace metamcp
