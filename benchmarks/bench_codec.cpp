#include <benchmark/benchmark.h>
#include "metamcp/codec.hpp"
#include "metamcp/json_rpc.hpp"
#include "metamcp/tools.hpp"
#include "metamcp/types.hpp"
#include <string>

using namespace metamcp;

static const std::string kListRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

static const std::string kCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"upload_study_data","arguments":{"session_id":"3f2b9c1e","data_format":"csv","validation_level":"comprehensive","data_content":"study,effect_size,variance\nA,0.42,0.013\nB,0.31,0.021\nC,0.55,0.017\n"}}})";

// An engine result of the size a full analysis report tends to produce
static nlohmann::json make_engine_result(int n_studies) {
    nlohmann::json studies = nlohmann::json::array();
    for (int i = 0; i < n_studies; ++i) {
        studies.push_back({
            {"study", "Study " + std::to_string(i)},
            {"effect_size", 0.1 * i},
            {"ci_lower", 0.1 * i - 0.2},
            {"ci_upper", 0.1 * i + 0.2},
            {"weight", 100.0 / n_studies}
        });
    }
    return {
        {"status", "success"},
        {"overall_effect", 0.42},
        {"heterogeneity", {{"i_squared", 37.5}, {"tau_squared", 0.012}, {"q_pvalue", 0.08}}},
        {"studies", studies}
    };
}

static void BM_ParseListRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kListRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kListRequest.size());
}
BENCHMARK(BM_ParseListRequest)->MinTime(1.0);

static void BM_ParseCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCallRequest.size());
}
BENCHMARK(BM_ParseCallRequest)->MinTime(1.0);

static void BM_SerializeToolList(benchmark::State& state) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json{{"tools", tool_registry()}};
    JsonRpcMessage msg = resp;

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolList)->MinTime(1.0);

static void BM_DisplayText(benchmark::State& state) {
    auto result = make_engine_result(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto text = to_display_text(result);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_DisplayText)->Arg(5)->Arg(50)->Arg(500);

static void BM_ValidateUpload(benchmark::State& state) {
    auto args = Codec::parse(kCallRequest);
    const auto& req = std::get<JsonRpcRequest>(args);
    const auto& arguments = req.params->at("arguments");

    for (auto _ : state) {
        validate_arguments(ToolName::UploadStudyData, arguments);
    }
}
BENCHMARK(BM_ValidateUpload)->MinTime(1.0);
