#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace devagent {

class DevAgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line that could not be turned into a JSON-RPC message.
/// `code` is ParseError for invalid JSON, InvalidRequest for a bad envelope.
class ParseError : public DevAgentError {
public:
    int code;
    ParseError(int code, const std::string& msg)
        : DevAgentError(msg), code(code) {}
};

/// Thrown by protocol handlers; the router turns it into an error response.
class ProtocolError : public DevAgentError {
public:
    int code;
    std::optional<nlohmann::json> data;
    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : DevAgentError(msg), code(code), data(std::move(data)) {}
};

class TransportError : public DevAgentError {
public:
    using DevAgentError::DevAgentError;
};

/// Startup misconfiguration: duplicate tools, bad limits, bad env values.
class ConfigurationError : public DevAgentError {
public:
    using DevAgentError::DevAgentError;
};

namespace error {
    constexpr int ParseError         = -32700;
    constexpr int InvalidRequest     = -32600;
    constexpr int MethodNotFound     = -32601;
    constexpr int InvalidParams      = -32602;
    constexpr int InternalError      = -32603;
    // Application range
    constexpr int ToolExecutionError = -32001;  // unknown, rate-limited or unavailable tool
    constexpr int Timeout            = -32002;
    constexpr int GitHubCliError     = -32003;
    constexpr int IndexerError       = -32004;
} // namespace error

} // namespace devagent
