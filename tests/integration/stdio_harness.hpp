#pragma once
#include "devagent/server.hpp"
#include "devagent/transport/stdio_transport.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

namespace devagent::test {

/// Runs DevAgentServer::serve() on a background thread over a pair of
/// pipes; the test plays the client by writing and reading raw lines.
class StdioHarness {
public:
    explicit StdioHarness(DevAgentServer::Options opts = default_options()) {
        if (::pipe(c2s_) < 0 || ::pipe(s2c_) < 0) {
            throw std::runtime_error("pipe failed");
        }
        server_ = std::make_unique<DevAgentServer>(
            std::move(opts), std::make_unique<StdioTransport>(c2s_[0], s2c_[1]));
    }

    ~StdioHarness() {
        close_input();
        if (thread_.joinable()) thread_.join();
        server_.reset();
        if (s2c_[0] >= 0) ::close(s2c_[0]);
    }

    static DevAgentServer::Options default_options() {
        DevAgentServer::Options opts;
        opts.logger = quiet_logger("server");
        opts.registry.logger = opts.logger;
        return opts;
    }

    DevAgentServer& server() { return *server_; }

    void run() {
        thread_ = std::thread([this] {
            try {
                server_->serve();
            } catch (const std::exception& e) {
                serve_error_ = e.what();
            }
        });
    }

    bool send_line(const std::string& line) { return write_all(c2s_[1], line + "\n"); }
    bool send(const nlohmann::json& message) { return send_line(message.dump()); }

    /// Next line from the server as JSON, or null on timeout/EOF.
    nlohmann::json receive(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        auto line = read_line(s2c_[0], buffer_, timeout);
        if (!line) return nullptr;
        return nlohmann::json::parse(*line);
    }

    nlohmann::json request(int64_t id, const std::string& method,
                           nlohmann::json params = nullptr) {
        nlohmann::json msg{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null()) msg["params"] = std::move(params);
        send(msg);
        return receive();
    }

    void notify(const std::string& method) {
        send(nlohmann::json{{"jsonrpc", "2.0"}, {"method", method}});
    }

    /// Close the client's write end; the server sees end of input.
    void close_input() {
        if (c2s_[1] >= 0) {
            ::close(c2s_[1]);
            c2s_[1] = -1;
        }
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    const std::string& serve_error() const { return serve_error_; }

private:
    int c2s_[2]{-1, -1};
    int s2c_[2]{-1, -1};
    std::unique_ptr<DevAgentServer> server_;
    std::thread thread_;
    std::string buffer_;
    std::string serve_error_;
};

} // namespace devagent::test
