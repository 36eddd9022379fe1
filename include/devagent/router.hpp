#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <spdlog/spdlog.h>

namespace devagent {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   const RequestId& id)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

class Router {
public:
    explicit Router(std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Register a request handler for a method. Replaces any previous one.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Requests always yield exactly one
    /// response; notifications never do.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace devagent
