#include <benchmark/benchmark.h>
#include "devagent/adapters/adapter_registry.hpp"
#include "devagent/codec.hpp"
#include "devagent/logging.hpp"
#include "devagent/router.hpp"
#include "devagent/server.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace devagent;

namespace {

std::shared_ptr<spdlog::logger> silent() {
    return make_logger("bench", spdlog::level::off);
}

class EchoAdapter : public ToolAdapter {
public:
    explicit EchoAdapter(std::string name) : name_(std::move(name)) {}

    ToolDefinition tool_definition() const override {
        ToolDefinition def;
        def.name = name_;
        def.description = "Echo the query back";
        def.input_schema = nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"minLength", 1}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", 50}}}
            }},
            {"required", {"query"}}
        };
        return def;
    }

    ExecutionResult execute(const nlohmann::json& args, const ExecutionContext&) override {
        return make_success(args.at("query"));
    }

private:
    std::string name_;
};

} // namespace

static void BM_RouterDispatch(benchmark::State& state) {
    Router router(silent());
    for (int64_t i = 0; i < state.range(0); ++i) {
        router.on_request("method_" + std::to_string(i),
            [](const nlohmann::json&, const RequestId&) -> HandlerResult {
                return nlohmann::json::object();
            });
    }
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "method_0";
    const JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = router.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterDispatch)->Arg(1)->Arg(100);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    Router router(silent());
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered";
    const JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = router.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod);

static void BM_RegistryExecute(benchmark::State& state) {
    AdapterRegistry::Options opts;
    opts.enable_rate_limiting = state.range(0) != 0;
    opts.rate_limit_capacity = 1e12;
    opts.rate_limit_refill_rate = 1e12;
    opts.logger = silent();
    AdapterRegistry registry(std::move(opts));
    registry.register_adapter(std::make_shared<EchoAdapter>("dev_search"));

    ExecutionContext ctx;
    ctx.logger = silent();
    registry.initialize_all(ctx);

    const nlohmann::json args = {{"query", "token bucket"}, {"limit", 10}};
    for (auto _ : state) {
        auto result = registry.execute_tool("dev_search", args, ctx);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RegistryExecute)->Arg(0)->Arg(1);

static void BM_ServerToolsCall(benchmark::State& state) {
    DevAgentServer::Options opts;
    opts.logger = silent();
    opts.registry.logger = opts.logger;
    opts.registry.enable_rate_limiting = false;
    DevAgentServer server(std::move(opts));
    server.register_adapter(std::make_shared<EchoAdapter>("dev_search"));

    const auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"dev_search","arguments":{"query":"token bucket"}}})");

    for (auto _ : state) {
        auto resp = server.handle_message(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsCall);

static void BM_ServerParseAndHandle(benchmark::State& state) {
    DevAgentServer::Options opts;
    opts.logger = silent();
    opts.registry.logger = opts.logger;
    DevAgentServer server(std::move(opts));

    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto resp = server.handle_message(Codec::parse(line));
        auto out = Codec::serialize(*resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ServerParseAndHandle);
