#pragma once
#include "tool_adapter.hpp"
#include "../rate_limiter.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devagent {

struct ToolStats {
    uint64_t calls = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t rate_limited = 0;
    double total_duration_ms = 0.0;
};

struct RegistryStats {
    size_t total_adapters = 0;
    size_t available_adapters = 0;
    std::vector<std::string> tool_names;
    std::map<std::string, ToolStats> tools;
};

void to_json(nlohmann::json& j, const ToolStats& s);
void to_json(nlohmann::json& j, const RegistryStats& s);

/// Owns the registered tool adapters: lifecycle, validated and rate-limited
/// dispatch, per-tool counters. All public methods are thread-safe; adapter
/// code always runs without the registry lock held.
class AdapterRegistry {
public:
    struct Options {
        bool enable_rate_limiting = true;
        double rate_limit_capacity = 100.0;    // burst
        double rate_limit_refill_rate = 10.0;  // per second
        std::map<std::string, RateLimitConfig> tool_limits;
        TokenBucket::Clock clock;              // empty: steady_clock
        std::shared_ptr<spdlog::logger> logger;
    };

    AdapterRegistry();
    explicit AdapterRegistry(Options opts);

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    /// Throws ConfigurationError if the tool name is already registered.
    void register_adapter(std::shared_ptr<ToolAdapter> adapter);

    /// Shuts the adapter down and removes it. Unknown names are ignored.
    void unregister(const std::string& name);

    /// Initialize every adapter. One failing adapter is logged and marked
    /// unavailable; the rest still start.
    void initialize_all(const AdapterContext& context);

    /// Definitions of available tools, in registration order.
    [[nodiscard]] std::vector<ToolDefinition> tool_definitions() const;

    /// Look up, rate-limit, validate and run a tool. Never throws.
    ExecutionResult execute_tool(const std::string& name,
                                 const nlohmann::json& args,
                                 const ExecutionContext& context);

    [[nodiscard]] bool has_tool(const std::string& name) const;
    [[nodiscard]] bool is_available(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> tool_names() const;
    [[nodiscard]] RegistryStats stats() const;

    /// nullopt when rate limiting is disabled.
    [[nodiscard]] std::optional<std::map<std::string, BucketStatus>> rate_limit_status();
    void reset_rate_limit(const std::string& name);
    void reset_all_rate_limits();

    /// Shut every adapter down, logging individual failures, then clear.
    void shutdown_all();

private:
    struct Entry {
        std::shared_ptr<ToolAdapter> adapter;
        ToolDefinition definition;
        bool available = true;
        std::string unavailable_reason;
        ToolStats stats;
    };

    void record(const std::string& name, bool success, double duration_ms);

    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<RateLimiter> rate_limiter_;

    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Entry> adapters_;
};

} // namespace devagent
