#pragma once
#include "tool_adapter.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace devagent {

struct HealthCheckConfig {
    std::filesystem::path repository_path;
    std::filesystem::path vector_store_path;
    std::optional<std::filesystem::path> github_state_path;
};

enum class CheckStatus { Pass, Warn, Fail };

struct CheckResult {
    CheckStatus status = CheckStatus::Pass;
    std::string message;
    std::optional<nlohmann::json> details;
};

void to_json(nlohmann::json& j, const CheckResult& c);

/// `dev_health`: readiness of the repository, vector storage and GitHub index.
class HealthAdapter : public ToolAdapter {
public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    explicit HealthAdapter(HealthCheckConfig config, WallClock clock = nullptr);

    ToolDefinition tool_definition() const override;
    void initialize(const AdapterContext& context) override;
    ExecutionResult execute(const nlohmann::json& args,
                            const ExecutionContext& context) override;

    CheckResult check_repository(bool verbose) const;
    CheckResult check_vector_storage(bool verbose) const;
    CheckResult check_github_index(bool verbose) const;

    /// True when every check passes.
    [[nodiscard]] bool healthy() const;

private:
    std::chrono::system_clock::time_point now() const;

    HealthCheckConfig config_;
    WallClock clock_;
    std::chrono::system_clock::time_point start_time_;
};

/// "healthy" when every check passes, "degraded" with any warning,
/// "unhealthy" with any failure.
[[nodiscard]] std::string overall_status(const std::vector<CheckResult>& checks);

/// 65s -> "1m 5s", 3700s -> "1h 1m", 90000s -> "1d 1h 0m".
[[nodiscard]] std::string format_uptime(std::chrono::milliseconds uptime);

/// Parses "2024-01-15T10:30:00Z" style UTC timestamps; fractional seconds
/// are accepted and dropped.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string& text);

[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace devagent
