#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <spdlog/common.h>
#include "rate_limiter.hpp"

namespace devagent {

/// Process-wide settings shared with adapters through their context.
struct Config {
    std::filesystem::path repository_path;
    std::filesystem::path storage_path;

    spdlog::level::level_enum log_level = spdlog::level::info;

    bool rate_limiting_enabled = true;
    double rate_limit_capacity = 100.0;
    double rate_limit_refill_rate = 10.0;
    std::map<std::string, RateLimitConfig> tool_limits;

    int worker_count = 1;
    size_t queue_capacity = 256;

    std::filesystem::path vector_store_path() const { return storage_path / "vectors.lance"; }
    std::filesystem::path github_state_path() const { return storage_path / "github-state.json"; }
};

/// Build a Config from the environment:
///   WORKSPACE_FOLDER_PATHS > REPOSITORY_PATH > current directory
///   DEV_AGENT_STORAGE_PATH (default <repository>/.dev-agent)
///   LOG_LEVEL, DEV_AGENT_RATE_LIMIT_CAPACITY, DEV_AGENT_RATE_LIMIT_REFILL_RATE,
///   DEV_AGENT_RATE_LIMIT_DISABLED, DEV_AGENT_WORKERS, DEV_AGENT_QUEUE_CAPACITY
/// Throws ConfigurationError on malformed values.
[[nodiscard]] Config load_config_from_env();

/// Where the repository path came from, for the startup log line.
[[nodiscard]] std::string repository_path_source();

/// Returns the value of the environment variable, or `fallback` when unset or empty.
[[nodiscard]] std::string get_env_or(const char* name, const std::string& fallback);

} // namespace devagent
