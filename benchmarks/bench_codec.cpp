#include <benchmark/benchmark.h>
#include "devagent/codec.hpp"
#include "devagent/json_rpc.hpp"
#include "devagent/types.hpp"
#include <string>
#include <vector>

using namespace devagent;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kSearchCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"dev_search","arguments":{"query":"token bucket refill","limit":10,"scoreThreshold":0.4}}})";

// tools/call request whose arguments carry a sizeable diff, like a review tool
static std::string make_large_call(size_t bytes) {
    std::string diff;
    while (diff.size() < bytes) {
        diff += "+    const double refill = elapsed * refill_rate_;\n";
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "dev_review"}, {"arguments", {{"diff", diff}}}}}
    };
    return req.dump();
}

static const std::string kLargeCall = make_large_call(64 * 1024);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSearchCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSearchCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeCall.size());
}
BENCHMARK(BM_ParseLargeToolCall);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson);

static void BM_SerializeToolResult(benchmark::State& state) {
    CallToolResult result;
    result.content.push_back(TextContent{std::string(2048, 'x')});
    nlohmann::json payload;
    to_json(payload, result);
    auto resp = Codec::create_response(RequestId{int64_t{42}}, payload);

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult);

static void BM_SerializeError(benchmark::State& state) {
    auto resp = Codec::create_error_response(
        RequestId{int64_t{3}},
        Codec::create_error(error::InvalidParams, "query is required",
                            nlohmann::json{{"suggestion", "Check the tool input schema and try again"}}));

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeError);
