#pragma once
#include "types.hpp"
#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace metamcp {

/// The closed set of tools the engine implements.
enum class ToolName {
    HealthCheck,
    InitializeMetaAnalysis,
    UploadStudyData,
    PerformMetaAnalysis,
    GenerateForestPlot,
    AssessPublicationBias,
    GenerateReport,
    GetSessionStatus
};

constexpr std::array<ToolName, 8> ALL_TOOLS = {
    ToolName::HealthCheck,
    ToolName::InitializeMetaAnalysis,
    ToolName::UploadStudyData,
    ToolName::PerformMetaAnalysis,
    ToolName::GenerateForestPlot,
    ToolName::AssessPublicationBias,
    ToolName::GenerateReport,
    ToolName::GetSessionStatus,
};

[[nodiscard]] std::string_view to_string(ToolName tool);
[[nodiscard]] std::optional<ToolName> parse_tool_name(std::string_view name);

/// Definitions in enumeration order. Built once, never modified.
[[nodiscard]] const std::vector<ToolDefinition>& tool_registry();

/// Check arguments against the tool's contract.
/// Throws ValidationError describing the first offending parameter.
void validate_arguments(ToolName tool, const nlohmann::json& arguments);

} // namespace metamcp
