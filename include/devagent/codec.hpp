#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace devagent {

class Codec {
public:
    /// Parse one line into a request or notification.
    /// Throws ParseError (code ParseError or InvalidRequest) on bad input.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// True iff the message carries a non-null id and expects a response.
    [[nodiscard]] static bool is_request(const JsonRpcMessage& msg);

    [[nodiscard]] static JsonRpcResponse create_response(RequestId id, nlohmann::json result);

    /// Error envelope. Without an id the sentinel 0 is used so the client
    /// still observes the failure.
    [[nodiscard]] static JsonRpcResponse create_error_response(std::optional<RequestId> id,
                                                               JsonRpcError error);

    [[nodiscard]] static JsonRpcError create_error(int code, std::string message,
                                                   std::optional<nlohmann::json> data = std::nullopt);

    /// Serialize to compact single-line JSON (no trailing newline).
    /// Invalid UTF-8 in strings is replaced rather than rejected.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace devagent
