#include "devagent/router.hpp"
#include "devagent/codec.hpp"
#include "devagent/error.hpp"
#include "devagent/logging.hpp"

namespace devagent {

Router::Router(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : make_logger("router")) {}

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                return Codec::create_error_response(req->id, Codec::create_error(
                    error::MethodNotFound, "Unknown method: " + req->method));
            }
            handler = it->second;
        }

        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        // Handlers run without the lock so they may call back into the router.
        try {
            auto result = handler(params, req->id);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return Codec::create_response(req->id, std::move(*ok));
            }
            return Codec::create_error_response(req->id, std::get<JsonRpcError>(std::move(result)));
        } catch (const ProtocolError& e) {
            return Codec::create_error_response(req->id,
                Codec::create_error(e.code, e.what(), e.data));
        } catch (const nlohmann::json::exception& e) {
            // Malformed params (wrong types, missing keys) surfaced by json accessors.
            return Codec::create_error_response(req->id,
                Codec::create_error(error::InvalidParams, e.what()));
        } catch (const std::exception& e) {
            return Codec::create_error_response(req->id,
                Codec::create_error(error::InternalError, e.what()));
        }
    }

    const auto& notif = std::get<JsonRpcNotification>(msg);
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            logger_->debug("Ignoring notification {}", notif.method);
            return std::nullopt;
        }
        handler = it->second;
    }

    nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    try {
        handler(params);
    } catch (const std::exception& e) {
        // Notifications have no response channel; log and move on.
        logger_->error("Notification handler for {} failed: {}", notif.method, e.what());
    }
    return std::nullopt;
}

} // namespace devagent
