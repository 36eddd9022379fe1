#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace devagent {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;
using CloseCallback = std::function<void()>;

/// Abstract line transport. Callbacks are single-slot; the last
/// registration wins. Register them before start().
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual void on_message(MessageCallback cb) = 0;
    virtual void on_error(ErrorCallback cb) = 0;
    virtual void on_close(CloseCallback cb) = 0;

    /// Begin reading on a background thread. Returns immediately.
    virtual void start() = 0;

    /// Queue a response for the peer. Throws if it cannot be serialized;
    /// write failures and sends after stop() go to the error callback.
    virtual void send(const JsonRpcResponse& msg) = 0;

    /// Stop reading, flush queued output and join threads. Idempotent.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_ready() const = 0;
};

} // namespace devagent
