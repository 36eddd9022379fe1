#include "devagent/server.hpp"
#include "devagent/channel.hpp"
#include "devagent/codec.hpp"
#include "devagent/error.hpp"
#include "devagent/logging.hpp"
#include "devagent/router.hpp"
#include "devagent/version.hpp"
#include "devagent/transport/stdio_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace devagent {

const char* server_state_name(ServerState s) {
    switch (s) {
        case ServerState::Constructed: return "constructed";
        case ServerState::Starting:    return "starting";
        case ServerState::Running:     return "running";
        case ServerState::Stopping:    return "stopping";
        case ServerState::Stopped:     return "stopped";
    }
    return "unknown";
}

namespace {

const char* const kUnimplementedMethods[] = {
    "resources/list",
    "resources/read",
    "resources/templates/list",
    "prompts/list",
    "prompts/get",
};

AdapterRegistry::Options with_logger(AdapterRegistry::Options opts,
                                     const std::shared_ptr<spdlog::logger>& logger) {
    if (!opts.logger) opts.logger = logger;
    return opts;
}

} // namespace

// ----------- DevAgentServer::Impl -----------

struct DevAgentServer::Impl {
    Options opts;
    std::shared_ptr<spdlog::logger> logger;
    std::unique_ptr<ITransport> transport;
    AdapterRegistry registry;
    Session session;
    Router router;

    std::mutex lifecycle_mutex;
    std::atomic<ServerState> state{ServerState::Constructed};

    std::unique_ptr<Channel<JsonRpcMessage>> channel;
    std::vector<std::thread> workers;

    std::mutex wait_mutex;
    std::condition_variable wait_cv;
    bool input_closed{false};
    bool stop_requested{false};

    Impl(Options o, std::unique_ptr<ITransport> t)
        : opts(std::move(o)),
          logger(opts.logger ? opts.logger : make_logger("server")),
          transport(t ? std::move(t) : std::make_unique<StdioTransport>()),
          registry(with_logger(opts.registry, logger)),
          router(logger) {
        if (opts.server_info.name.empty()) {
            opts.server_info.name = std::string(SERVER_NAME);
            opts.server_info.version = std::string(SERVER_VERSION);
        }
        if (opts.worker_count < 1) opts.worker_count = 1;
        if (opts.queue_capacity == 0) opts.queue_capacity = 1;
        if (!opts.config) opts.config = std::make_shared<Config>();
        setup_handlers();
    }

    ExecutionContext execution_context(const RequestId& id) const {
        ExecutionContext ctx;
        ctx.logger = logger;
        ctx.config = opts.config;
        ctx.request_id = id;
        return ctx;
    }

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params, const RequestId&) -> HandlerResult {
            std::string protocol(FALLBACK_PROTOCOL_VERSION);
            auto pv = params.find("protocolVersion");
            if (pv != params.end() && pv->is_string()) {
                protocol = pv->get<std::string>();
            }

            std::optional<Implementation> client;
            auto ci = params.find("clientInfo");
            if (ci != params.end() && ci->is_object()) {
                Implementation impl;
                impl.name = ci->value("name", std::string());
                impl.version = ci->value("version", std::string());
                client = std::move(impl);
            }

            session.begin_initialize(protocol, client);
            logger->info("Client initialized: {} {} (protocol {})",
                         client ? client->name : std::string("unknown"),
                         client ? client->version : std::string(),
                         protocol);

            InitializeResult result;
            result.protocol_version = protocol;
            result.server_info = opts.server_info;
            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        auto on_initialized = [this](const nlohmann::json&) {
            session.mark_ready();
            auto client = session.client_info();
            logger->info("Session ready: {} (protocol {})",
                         client ? client->name : std::string("unknown client"),
                         session.protocol_version());
        };
        router.on_notification("initialized", on_initialized);
        router.on_notification("notifications/initialized", on_initialized);

        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            logger->info("Client cancelled request {}",
                         params.contains("requestId") ? params["requestId"].dump() : std::string("?"));
        });

        router.on_request("ping", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json&, const RequestId&) -> HandlerResult {
            return nlohmann::json{{"tools", registry.tool_definitions()}};
        });

        router.on_request("tools/call", [this](const nlohmann::json& params, const RequestId& id) -> HandlerResult {
            auto name_it = params.find("name");
            if (name_it == params.end() || !name_it->is_string()) {
                return JsonRpcError{error::InvalidParams, "name is required", std::nullopt};
            }
            std::string name = name_it->get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

            auto result = registry.execute_tool(name, arguments, execution_context(id));

            if (auto* err = std::get_if<ToolError>(&result)) {
                nlohmann::json data = nlohmann::json::object();
                if (err->details) data["details"] = *err->details;
                if (err->suggestion) data["suggestion"] = *err->suggestion;
                std::optional<nlohmann::json> payload;
                if (!data.empty()) payload = std::move(data);
                return JsonRpcError{wire_code(err->code), err->message, std::move(payload)};
            }

            const auto& output = std::get<ToolOutput>(result);
            CallToolResult call_result;
            call_result.content.push_back(TextContent{
                output.data.is_string()
                    ? output.data.get<std::string>()
                    : output.data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)});
            nlohmann::json j;
            to_json(j, call_result);
            return j;
        });

        for (const char* method : kUnimplementedMethods) {
            std::string m(method);
            router.on_request(m, [m](const nlohmann::json&, const RequestId&) -> HandlerResult {
                return JsonRpcError{error::MethodNotFound, "Method not implemented: " + m, std::nullopt};
            });
        }
    }

    std::optional<JsonRpcResponse> handle(const JsonRpcMessage& msg) {
        if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            logger->debug("Request {} (id {})", req->method, request_id_to_string(req->id));
        } else {
            logger->debug("Notification {}", std::get<JsonRpcNotification>(msg).method);
        }
        return router.dispatch(msg);
    }

    void worker_loop() {
        while (auto msg = channel->pop()) {
            std::optional<JsonRpcResponse> response;
            try {
                response = handle(*msg);
            } catch (const std::exception& e) {
                logger->error("Failed to handle message: {}", e.what());
                if (const auto* req = std::get_if<JsonRpcRequest>(&*msg)) {
                    response = Codec::create_error_response(
                        req->id, Codec::create_error(error::InternalError, e.what()));
                }
            }
            if (response) send_response(*response);
        }
    }

    /// A response that cannot be serialized is replaced by an internal
    /// error for the same id.
    void send_response(const JsonRpcResponse& response) {
        try {
            transport->send(response);
            return;
        } catch (const std::exception& e) {
            logger->error("Failed to send response {}: {}", request_id_to_string(response.id), e.what());
        }
        try {
            transport->send(Codec::create_error_response(
                response.id, Codec::create_error(error::InternalError, "Failed to serialize response")));
        } catch (const std::exception& e) {
            logger->error("Dropping response {}: {}", request_id_to_string(response.id), e.what());
        }
    }

    void wire_transport() {
        transport->on_message([this](JsonRpcMessage msg) {
            if (!channel->push(std::move(msg))) {
                logger->warn("Dropping message received during shutdown");
            }
        });
        transport->on_error([this](std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const ParseError& e) {
                logger->warn("Invalid message ({}): {}", e.code, e.what());
            } catch (const std::exception& e) {
                logger->error("Transport error: {}", e.what());
            }
        });
        transport->on_close([this]() {
            logger->info("Input closed");
            {
                std::lock_guard<std::mutex> lock(wait_mutex);
                input_closed = true;
            }
            wait_cv.notify_all();
        });
    }

    void join_workers() {
        if (channel) channel->close();
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
        workers.clear();
    }
};

// ----------- DevAgentServer -----------

DevAgentServer::DevAgentServer(Options opts, std::unique_ptr<ITransport> transport)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(transport))) {
}

DevAgentServer::~DevAgentServer() {
    stop();
}

void DevAgentServer::register_adapter(std::shared_ptr<ToolAdapter> adapter) {
    if (impl_->state.load() != ServerState::Constructed) {
        throw DevAgentError("Adapters must be registered before the server starts");
    }
    impl_->registry.register_adapter(std::move(adapter));
}

void DevAgentServer::start() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->state.load() != ServerState::Constructed) {
        throw DevAgentError(std::string("Cannot start server in state ")
                            + server_state_name(impl_->state.load()));
    }
    impl_->state = ServerState::Starting;
    impl_->logger->info("Starting {} {}", impl_->opts.server_info.name,
                        impl_->opts.server_info.version);

    try {
        AdapterContext ctx;
        ctx.logger = impl_->logger;
        ctx.config = impl_->opts.config;
        impl_->registry.initialize_all(ctx);

        impl_->channel = std::make_unique<Channel<JsonRpcMessage>>(impl_->opts.queue_capacity);
        impl_->wire_transport();
        for (int i = 0; i < impl_->opts.worker_count; ++i) {
            impl_->workers.emplace_back([this] { impl_->worker_loop(); });
        }

        impl_->transport->start();
    } catch (const std::exception& e) {
        impl_->logger->error("Failed to start server: {}", e.what());
        impl_->join_workers();
        impl_->registry.shutdown_all();
        impl_->transport->stop();
        impl_->state = ServerState::Stopped;
        throw;
    }

    impl_->state = ServerState::Running;
    impl_->logger->info("Server running with {} tool(s), {} worker(s)",
                        impl_->registry.tool_definitions().size(), impl_->opts.worker_count);
}

void DevAgentServer::stop() {
    {
        std::lock_guard<std::mutex> wlock(impl_->wait_mutex);
        impl_->stop_requested = true;
    }
    impl_->wait_cv.notify_all();

    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    ServerState s = impl_->state.load();
    if (s == ServerState::Stopped) return;
    if (s == ServerState::Constructed) {
        impl_->state = ServerState::Stopped;
        return;
    }

    impl_->state = ServerState::Stopping;
    impl_->logger->info("Stopping server");

    impl_->join_workers();
    impl_->registry.shutdown_all();
    impl_->transport->stop();

    impl_->state = ServerState::Stopped;
    impl_->logger->info("Server stopped");
}

void DevAgentServer::wait() {
    std::unique_lock<std::mutex> lock(impl_->wait_mutex);
    impl_->wait_cv.wait(lock, [this] {
        return impl_->input_closed || impl_->stop_requested;
    });
}

void DevAgentServer::serve() {
    start();
    wait();
    stop();
}

ServerState DevAgentServer::state() const {
    return impl_->state.load();
}

SessionState DevAgentServer::session_state() const {
    return impl_->session.state();
}

std::string DevAgentServer::protocol_version() const {
    return impl_->session.protocol_version();
}

std::optional<Implementation> DevAgentServer::client_info() const {
    return impl_->session.client_info();
}

std::optional<JsonRpcResponse> DevAgentServer::handle_message(const JsonRpcMessage& msg) {
    return impl_->handle(msg);
}

AdapterRegistry& DevAgentServer::registry() {
    return impl_->registry;
}

RegistryStats DevAgentServer::stats() const {
    return impl_->registry.stats();
}

DevAgentServer::Options server_options_from_config(std::shared_ptr<const Config> config,
                                                   std::shared_ptr<spdlog::logger> logger) {
    DevAgentServer::Options opts;
    opts.server_info = Implementation{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.worker_count = config->worker_count;
    opts.queue_capacity = config->queue_capacity;
    opts.registry.enable_rate_limiting = config->rate_limiting_enabled;
    opts.registry.rate_limit_capacity = config->rate_limit_capacity;
    opts.registry.rate_limit_refill_rate = config->rate_limit_refill_rate;
    opts.registry.tool_limits = config->tool_limits;
    opts.registry.logger = logger;
    opts.logger = std::move(logger);
    opts.config = std::move(config);
    return opts;
}

} // namespace devagent
