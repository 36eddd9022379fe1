#include "devagent/config.hpp"
#include "devagent/error.hpp"
#include "devagent/logging.hpp"
#include <cstdlib>
#include <stdexcept>

namespace devagent {

namespace {

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

double env_positive_double(const char* name, double fallback) {
    auto raw = env(name);
    if (!raw) return fallback;
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(*raw, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(name) + " must be a number, got '" + *raw + "'");
    }
    if (used != raw->size() || !(value > 0.0)) {
        throw ConfigurationError(std::string(name) + " must be a positive number, got '" + *raw + "'");
    }
    return value;
}

long env_positive_long(const char* name, long fallback) {
    auto raw = env(name);
    if (!raw) return fallback;
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(*raw, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(name) + " must be an integer, got '" + *raw + "'");
    }
    if (used != raw->size() || value <= 0) {
        throw ConfigurationError(std::string(name) + " must be a positive integer, got '" + *raw + "'");
    }
    return value;
}

bool env_flag(const char* name) {
    auto raw = env(name);
    return raw && (*raw == "1" || *raw == "true" || *raw == "yes");
}

} // anonymous namespace

std::string get_env_or(const char* name, const std::string& fallback) {
    auto v = env(name);
    return v ? *v : fallback;
}

std::string repository_path_source() {
    if (env("WORKSPACE_FOLDER_PATHS")) return "WORKSPACE_FOLDER_PATHS";
    if (env("REPOSITORY_PATH")) return "REPOSITORY_PATH";
    return "cwd";
}

Config load_config_from_env() {
    Config config;

    if (auto workspace = env("WORKSPACE_FOLDER_PATHS")) {
        // Editors may pass several folders; the first one is the workspace root.
        config.repository_path = workspace->substr(0, workspace->find(','));
    } else if (auto repo = env("REPOSITORY_PATH")) {
        config.repository_path = *repo;
    } else {
        config.repository_path = std::filesystem::current_path();
    }

    config.storage_path = get_env_or("DEV_AGENT_STORAGE_PATH",
                                     (config.repository_path / ".dev-agent").string());

    if (auto level = env("LOG_LEVEL")) {
        config.log_level = parse_log_level(*level);
    }

    config.rate_limiting_enabled = !env_flag("DEV_AGENT_RATE_LIMIT_DISABLED");
    config.rate_limit_capacity =
        env_positive_double("DEV_AGENT_RATE_LIMIT_CAPACITY", config.rate_limit_capacity);
    config.rate_limit_refill_rate =
        env_positive_double("DEV_AGENT_RATE_LIMIT_REFILL_RATE", config.rate_limit_refill_rate);

    config.worker_count = static_cast<int>(
        env_positive_long("DEV_AGENT_WORKERS", config.worker_count));
    config.queue_capacity = static_cast<size_t>(
        env_positive_long("DEV_AGENT_QUEUE_CAPACITY", static_cast<long>(config.queue_capacity)));

    return config;
}

} // namespace devagent
