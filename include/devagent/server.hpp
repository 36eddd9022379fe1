#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "config.hpp"
#include "session.hpp"
#include "adapters/adapter_registry.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace devagent {

enum class ServerState {
    Constructed,
    Starting,
    Running,
    Stopping,
    Stopped
};

[[nodiscard]] const char* server_state_name(ServerState s);

/// The MCP server: protocol handlers over a transport, with tool calls
/// dispatched through an AdapterRegistry.
class DevAgentServer {
public:
    struct Options {
        Implementation server_info;   // empty name: "dev-agent" / current version
        std::shared_ptr<const Config> config;
        AdapterRegistry::Options registry;
        int worker_count = 1;         // 1 keeps responses in arrival order
        size_t queue_capacity = 256;
        std::shared_ptr<spdlog::logger> logger;
    };

    /// A null transport means stdin/stdout.
    explicit DevAgentServer(Options opts, std::unique_ptr<ITransport> transport = nullptr);
    ~DevAgentServer();

    DevAgentServer(const DevAgentServer&) = delete;
    DevAgentServer& operator=(const DevAgentServer&) = delete;

    /// Only allowed before start(); throws DevAgentError afterwards.
    void register_adapter(std::shared_ptr<ToolAdapter> adapter);

    /// Initialize adapters, spawn workers and start the transport.
    /// On failure everything is rolled back, the state becomes Stopped and
    /// the exception propagates.
    void start();

    /// Drain queued and in-flight requests, shut adapters down and close
    /// the transport. Idempotent.
    void stop();

    /// Block until the transport reaches end of input or stop() is called.
    void wait();

    /// start(), wait(), stop().
    void serve();

    [[nodiscard]] ServerState state() const;
    [[nodiscard]] SessionState session_state() const;

    /// Protocol version negotiated by the last initialize; empty before it.
    [[nodiscard]] std::string protocol_version() const;
    [[nodiscard]] std::optional<Implementation> client_info() const;

    /// Process one message synchronously. Requests always produce a response.
    std::optional<JsonRpcResponse> handle_message(const JsonRpcMessage& msg);

    AdapterRegistry& registry();
    [[nodiscard]] RegistryStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Server options derived from a loaded Config.
[[nodiscard]] DevAgentServer::Options server_options_from_config(std::shared_ptr<const Config> config,
                                                                 std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace devagent
