#pragma once
#include "../config.hpp"
#include "../json_rpc.hpp"
#include "../types.hpp"
#include "../validation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace devagent {

/// Semantic failure categories reported by adapters and the registry.
enum class ErrorCode {
    InvalidParams,
    NotFound,
    RateLimited,
    Timeout,
    InternalError,
    GitHubCliError,
    IndexerError,
    Unavailable,
};

/// "INVALID_PARAMS", "NOT_FOUND", ...
std::string_view error_code_name(ErrorCode code);

/// JSON-RPC error code sent to the client for a semantic code.
int wire_code(ErrorCode code);

struct ToolError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    std::optional<nlohmann::json> details;
    std::optional<std::string> suggestion;
    bool recoverable = false;
};

struct ToolOutput {
    nlohmann::json data;
    std::optional<nlohmann::json> metadata;
};

using ExecutionResult = std::variant<ToolOutput, ToolError>;

inline ExecutionResult make_success(nlohmann::json data,
                                    std::optional<nlohmann::json> metadata = std::nullopt) {
    return ToolOutput{std::move(data), std::move(metadata)};
}

inline ExecutionResult make_failure(ErrorCode code, std::string message,
                                    std::optional<std::string> suggestion = std::nullopt,
                                    std::optional<nlohmann::json> details = std::nullopt) {
    ToolError err;
    err.code = code;
    err.message = std::move(message);
    err.suggestion = std::move(suggestion);
    err.details = std::move(details);
    err.recoverable = code == ErrorCode::RateLimited || code == ErrorCode::Timeout
                      || code == ErrorCode::InvalidParams;
    return err;
}

/// Handed to adapters once, at initialization.
struct AdapterContext {
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<const Config> config;
};

/// Handed to adapters on every call.
struct ExecutionContext : AdapterContext {
    std::optional<RequestId> request_id;
};

/// A pluggable tool. The registry only ever talks to this surface.
class ToolAdapter {
public:
    virtual ~ToolAdapter() = default;

    /// Must return the same definition for the adapter's lifetime.
    [[nodiscard]] virtual ToolDefinition tool_definition() const = 0;

    /// Throwing marks the adapter unavailable; other adapters still start.
    virtual void initialize(const AdapterContext& /*context*/) {}

    /// Extra checks beyond the input schema. Runs after schema validation.
    [[nodiscard]] virtual ValidationResult validate(const nlohmann::json& /*args*/) const {
        return ValidationResult::ok();
    }

    /// May throw; the registry turns exceptions into INTERNAL_ERROR.
    virtual ExecutionResult execute(const nlohmann::json& args,
                                    const ExecutionContext& context) = 0;

    virtual void shutdown() {}
};

} // namespace devagent
