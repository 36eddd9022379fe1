#include <benchmark/benchmark.h>
#include "devagent/rate_limiter.hpp"
#include <string>
#include <vector>

using namespace devagent;

static void BM_TokenBucketConsume(benchmark::State& state) {
    TokenBucket bucket(1e12, 1e12);
    for (auto _ : state) {
        benchmark::DoNotOptimize(bucket.try_consume());
    }
}
BENCHMARK(BM_TokenBucketConsume);

static void BM_TokenBucketExhausted(benchmark::State& state) {
    TokenBucket bucket(1.0, 0.0001);
    bucket.try_consume();
    for (auto _ : state) {
        benchmark::DoNotOptimize(bucket.try_consume());
        benchmark::DoNotOptimize(bucket.retry_after());
    }
}
BENCHMARK(BM_TokenBucketExhausted);

static void BM_RateLimiterCheck(benchmark::State& state) {
    RateLimiter limiter(1e12, 1e12);
    std::vector<std::string> tools;
    for (int64_t i = 0; i < state.range(0); ++i) {
        tools.push_back("dev_tool_" + std::to_string(i));
    }

    size_t i = 0;
    for (auto _ : state) {
        auto result = limiter.check(tools[i++ % tools.size()]);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RateLimiterCheck)->Arg(1)->Arg(8)->Arg(64);

static void BM_RateLimiterContended(benchmark::State& state) {
    static RateLimiter limiter(1e12, 1e12);
    for (auto _ : state) {
        auto result = limiter.check("dev_search");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RateLimiterContended)->Threads(1)->Threads(4);
