/// dev-agent-mcp: serves the dev-agent tools over stdio.
/// Configuration comes from the environment (see devagent/config.hpp).
/// Runs until end of input, SIGINT or SIGTERM.

#include <devagent/devagent.hpp>
#include <atomic>
#include <csignal>
#include <exception>
#include <memory>
#include <pthread.h>
#include <thread>

int main() {
    auto logger = devagent::make_logger("dev-agent");

    std::shared_ptr<const devagent::Config> config;
    try {
        auto loaded = std::make_shared<devagent::Config>(devagent::load_config_from_env());
        logger->set_level(loaded->log_level);
        config = std::move(loaded);
    } catch (const devagent::ConfigurationError& e) {
        logger->critical("Invalid configuration: {}", e.what());
        return 1;
    }

    logger->info("Repository: {} (from {})", config->repository_path.string(),
                 devagent::repository_path_source());
    logger->info("Storage: {}", config->storage_path.string());

    // Block the shutdown signals in every thread; a dedicated thread waits
    // for them synchronously.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    devagent::DevAgentServer server{devagent::server_options_from_config(config, logger)};

    devagent::HealthCheckConfig health;
    health.repository_path = config->repository_path;
    health.vector_store_path = config->vector_store_path();
    health.github_state_path = config->github_state_path();
    server.register_adapter(std::make_shared<devagent::HealthAdapter>(std::move(health)));

    std::atomic<bool> finished{false};
    std::thread signal_thread([&] {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) return;
        if (finished.load()) return;
        logger->info("Received signal {}, shutting down", sig);
        server.stop();
    });

    int exit_code = 0;
    try {
        server.serve();
    } catch (const std::exception& e) {
        logger->critical("Server failed: {}", e.what());
        exit_code = 1;
    }

    finished = true;
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    return exit_code;
}
