#include "metamcp/tools.hpp"
#include "metamcp/error.hpp"
#include <algorithm>
#include <initializer_list>

namespace metamcp {

namespace {

using json = nlohmann::json;

json session_id_schema() {
    return {{"type", "string"}};
}

ToolDefinition make_tool(ToolName tool, std::string description, json properties,
                         std::vector<std::string> required = {}) {
    ToolDefinition def;
    def.name = std::string(to_string(tool));
    def.description = std::move(description);
    def.input_schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) def.input_schema["required"] = required;
    return def;
}

std::vector<ToolDefinition> build_registry() {
    std::vector<ToolDefinition> tools;
    tools.reserve(ALL_TOOLS.size());

    tools.push_back(make_tool(ToolName::HealthCheck,
        "Check the health status of the meta-analysis server",
        {{"detailed", {{"type", "boolean"}, {"default", false}}}}));

    tools.push_back(make_tool(ToolName::InitializeMetaAnalysis,
        "Start new meta-analysis project with guided setup",
        {
            {"name", {{"type", "string"}, {"description", "Name for the meta-analysis project"}}},
            {"study_type", {{"type", "string"},
                            {"enum", {"clinical_trial", "observational", "diagnostic"}}}},
            {"effect_measure", {{"type", "string"},
                                {"enum", {"OR", "RR", "MD", "SMD", "HR", "PROP", "MEAN"}}}},
            {"analysis_model", {{"type", "string"}, {"enum", {"fixed", "random", "auto"}}}}
        },
        {"name", "study_type", "effect_measure", "analysis_model"}));

    tools.push_back(make_tool(ToolName::UploadStudyData,
        "Upload and validate study data",
        {
            {"session_id", session_id_schema()},
            {"data_format", {{"type", "string"}, {"enum", {"csv", "excel", "revman"}}}},
            {"data_content", {{"type", "string"}}},
            {"validation_level", {{"type", "string"}, {"enum", {"basic", "comprehensive"}}}}
        },
        {"session_id", "data_format", "data_content", "validation_level"}));

    tools.push_back(make_tool(ToolName::PerformMetaAnalysis,
        "Execute meta-analysis with automated checks",
        {
            {"session_id", session_id_schema()},
            {"heterogeneity_test", {{"type", "boolean"}, {"default", true}}},
            {"publication_bias", {{"type", "boolean"}, {"default", true}}},
            {"sensitivity_analysis", {{"type", "boolean"}, {"default", false}}}
        },
        {"session_id"}));

    tools.push_back(make_tool(ToolName::GenerateForestPlot,
        "Create publication-ready forest plot",
        {
            {"session_id", session_id_schema()},
            {"plot_style", {{"type", "string"},
                            {"enum", {"classic", "modern", "journal_specific"}}}},
            {"confidence_level", {{"type", "number"}, {"default", 0.95}}},
            {"custom_labels", {{"type", "object"}}}
        },
        {"session_id", "plot_style"}));

    tools.push_back(make_tool(ToolName::AssessPublicationBias,
        "Perform publication bias assessment",
        {
            {"session_id", session_id_schema()},
            {"methods", {{"type", "array"},
                         {"items", {{"type", "string"},
                                    {"enum", {"funnel_plot", "egger_test", "begg_test", "trim_fill"}}}}}}
        },
        {"session_id", "methods"}));

    tools.push_back(make_tool(ToolName::GenerateReport,
        "Create comprehensive meta-analysis report",
        {
            {"session_id", session_id_schema()},
            {"format", {{"type", "string"}, {"enum", {"html", "pdf", "word"}}}},
            {"include_code", {{"type", "boolean"}, {"default", false}}},
            {"journal_template", {{"type", "string"}}}
        },
        {"session_id", "format"}));

    tools.push_back(make_tool(ToolName::GetSessionStatus,
        "Get the current status of a meta-analysis session",
        {{"session_id", session_id_schema()}},
        {"session_id"}));

    return tools;
}

bool is_one_of(const json& value, std::initializer_list<const char*> allowed) {
    if (!value.is_string()) return false;
    const auto& s = value.get_ref<const std::string&>();
    return std::any_of(allowed.begin(), allowed.end(),
                       [&s](const char* a) { return s == a; });
}

const json* find(const json& args, const char* key) {
    auto it = args.find(key);
    return it == args.end() ? nullptr : &*it;
}

void require_enum(const json& args, const char* key, std::initializer_list<const char*> allowed) {
    const json* v = find(args, key);
    if (!v || !is_one_of(*v, allowed)) {
        throw ValidationError(std::string("Invalid ") + key);
    }
}

void require_string(const json& args, const char* key) {
    const json* v = find(args, key);
    if (!v || !v->is_string() || v->get_ref<const std::string&>().empty()) {
        throw ValidationError(std::string("Parameter '") + key
                              + "' is required and must be a string");
    }
}

void optional_boolean(const json& args, const char* key) {
    const json* v = find(args, key);
    if (v && !v->is_boolean()) {
        throw ValidationError(std::string("Parameter '") + key + "' must be a boolean");
    }
}

} // anonymous namespace

std::string_view to_string(ToolName tool) {
    switch (tool) {
        case ToolName::HealthCheck:            return "health_check";
        case ToolName::InitializeMetaAnalysis: return "initialize_meta_analysis";
        case ToolName::UploadStudyData:        return "upload_study_data";
        case ToolName::PerformMetaAnalysis:    return "perform_meta_analysis";
        case ToolName::GenerateForestPlot:     return "generate_forest_plot";
        case ToolName::AssessPublicationBias:  return "assess_publication_bias";
        case ToolName::GenerateReport:         return "generate_report";
        case ToolName::GetSessionStatus:       return "get_session_status";
    }
    return "";
}

std::optional<ToolName> parse_tool_name(std::string_view name) {
    for (ToolName tool : ALL_TOOLS) {
        if (to_string(tool) == name) return tool;
    }
    return std::nullopt;
}

const std::vector<ToolDefinition>& tool_registry() {
    static const std::vector<ToolDefinition> registry = build_registry();
    return registry;
}

void validate_arguments(ToolName tool, const nlohmann::json& args) {
    if (!args.is_object()) {
        throw ValidationError("Arguments must be an object");
    }

    switch (tool) {
        case ToolName::HealthCheck:
            optional_boolean(args, "detailed");
            return;

        case ToolName::InitializeMetaAnalysis:
            require_string(args, "name");
            require_enum(args, "study_type", {"clinical_trial", "observational", "diagnostic"});
            require_enum(args, "effect_measure", {"OR", "RR", "MD", "SMD", "HR", "PROP", "MEAN"});
            require_enum(args, "analysis_model", {"fixed", "random", "auto"});
            return;

        default:
            break;
    }

    // Everything else operates on an existing session
    require_string(args, "session_id");

    switch (tool) {
        case ToolName::UploadStudyData:
            require_enum(args, "data_format", {"csv", "excel", "revman"});
            require_string(args, "data_content");
            require_enum(args, "validation_level", {"basic", "comprehensive"});
            break;

        case ToolName::PerformMetaAnalysis:
            optional_boolean(args, "heterogeneity_test");
            optional_boolean(args, "publication_bias");
            optional_boolean(args, "sensitivity_analysis");
            break;

        case ToolName::GenerateForestPlot: {
            require_enum(args, "plot_style", {"classic", "modern", "journal_specific"});
            const json* level = find(args, "confidence_level");
            if (level) {
                if (!level->is_number() || level->get<double>() <= 0.0 || level->get<double>() >= 1.0) {
                    throw ValidationError(
                        "Parameter 'confidence_level' must be a number between 0 and 1");
                }
            }
            break;
        }

        case ToolName::AssessPublicationBias: {
            const json* methods = find(args, "methods");
            if (!methods || !methods->is_array()) {
                throw ValidationError("Parameter 'methods' is required and must be an array");
            }
            for (const auto& m : *methods) {
                if (!is_one_of(m, {"funnel_plot", "egger_test", "begg_test", "trim_fill"})) {
                    throw ValidationError("Invalid method: " + (m.is_string() ? m.get<std::string>() : m.dump()));
                }
            }
            break;
        }

        case ToolName::GenerateReport:
            require_enum(args, "format", {"html", "pdf", "word"});
            optional_boolean(args, "include_code");
            break;

        default:
            break;
    }
}

} // namespace metamcp
