#include <benchmark/benchmark.h>
#include "metamcp/dispatcher.hpp"
#include "metamcp/router.hpp"
#include "metamcp/sessions.hpp"
#include <filesystem>
#include <memory>
#include <string>

using namespace metamcp;

namespace {

// Answers every call without spawning anything, so only the dispatch
// path is measured.
class ConstantExecutor : public IToolExecutor {
public:
    nlohmann::ordered_json execute(const std::string&, const nlohmann::json&,
                                   const std::filesystem::path&,
                                   std::chrono::milliseconds) override {
        return {{"status", "ok"}};
    }
};

JsonRpcRequest make_request(const std::string& method, nlohmann::json params = nullptr) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    if (!params.is_null()) req.params = std::move(params);
    return req;
}

} // namespace

static void BM_RouterUnknownMethod(benchmark::State& state) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    JsonRpcMessage msg = make_request("resources/list");

    for (auto _ : state) {
        auto resp = router.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    ConstantExecutor executor;
    SessionPathResolver sessions(std::filesystem::temp_directory_path() / "metamcp-bench");
    ToolDispatcher dispatcher(executor, sessions);
    JsonRpcMessage msg = make_request("tools/list");

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

static void BM_DispatchToolCall(benchmark::State& state) {
    ConstantExecutor executor;
    SessionPathResolver sessions(std::filesystem::temp_directory_path() / "metamcp-bench");
    ToolDispatcher dispatcher(executor, sessions);
    JsonRpcMessage msg = make_request("tools/call",
        {{"name", "health_check"}, {"arguments", {{"detailed", true}}}});

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolCall)->MinTime(1.0);

static void BM_DispatchUnknownTool(benchmark::State& state) {
    ConstantExecutor executor;
    SessionPathResolver sessions(std::filesystem::temp_directory_path() / "metamcp-bench");
    ToolDispatcher dispatcher(executor, sessions);
    JsonRpcMessage msg = make_request("tools/call", {{"name", "run_arbitrary_code"}});

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownTool)->MinTime(1.0);
