#include "devagent/adapters/adapter_registry.hpp"
#include "devagent/error.hpp"
#include "devagent/logging.hpp"
#include <algorithm>
#include <chrono>

namespace devagent {

void to_json(nlohmann::json& j, const ToolStats& s) {
    j = {
        {"calls", s.calls},
        {"successes", s.successes},
        {"failures", s.failures},
        {"rateLimited", s.rate_limited},
        {"totalDurationMs", s.total_duration_ms}
    };
}

void to_json(nlohmann::json& j, const RegistryStats& s) {
    j = {
        {"totalAdapters", s.total_adapters},
        {"availableAdapters", s.available_adapters},
        {"toolNames", s.tool_names},
        {"tools", s.tools}
    };
}

AdapterRegistry::AdapterRegistry() : AdapterRegistry(Options{}) {}

AdapterRegistry::AdapterRegistry(Options opts)
    : logger_(opts.logger ? std::move(opts.logger) : make_logger("registry")) {
    if (opts.enable_rate_limiting) {
        rate_limiter_ = std::make_unique<RateLimiter>(opts.rate_limit_capacity,
                                                      opts.rate_limit_refill_rate,
                                                      std::move(opts.tool_limits),
                                                      std::move(opts.clock));
    }
}

void AdapterRegistry::register_adapter(std::shared_ptr<ToolAdapter> adapter) {
    if (!adapter) {
        throw ConfigurationError("Cannot register a null adapter");
    }
    ToolDefinition def = adapter->tool_definition();
    if (def.name.empty()) {
        throw ConfigurationError("Tool definition has an empty name");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (adapters_.count(def.name) > 0) {
        throw ConfigurationError("Adapter already registered: " + def.name);
    }
    const std::string name = def.name;
    Entry entry;
    entry.adapter = std::move(adapter);
    entry.definition = std::move(def);
    adapters_.emplace(name, std::move(entry));
    order_.push_back(name);
    logger_->debug("Registered tool {}", name);
}

void AdapterRegistry::unregister(const std::string& name) {
    std::shared_ptr<ToolAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = adapters_.find(name);
        if (it == adapters_.end()) return;
        adapter = std::move(it->second.adapter);
        adapters_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    }
    try {
        adapter->shutdown();
    } catch (const std::exception& e) {
        logger_->error("Shutdown of {} failed: {}", name, e.what());
    } catch (...) {
        logger_->error("Shutdown of {} failed: unknown exception", name);
    }
}

void AdapterRegistry::initialize_all(const AdapterContext& context) {
    std::vector<std::pair<std::string, std::shared_ptr<ToolAdapter>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& name : order_) {
            snapshot.emplace_back(name, adapters_.at(name).adapter);
        }
    }

    for (auto& [name, adapter] : snapshot) {
        std::optional<std::string> failure;
        try {
            adapter->initialize(context);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = adapters_.find(name);
        if (it == adapters_.end()) continue;
        if (failure) {
            logger_->error("Adapter {} failed to initialize, marking unavailable: {}", name, *failure);
            it->second.available = false;
            it->second.unavailable_reason = *failure;
        } else {
            it->second.available = true;
            it->second.unavailable_reason.clear();
        }
    }
}

std::vector<ToolDefinition> AdapterRegistry::tool_definitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDefinition> defs;
    defs.reserve(order_.size());
    for (const auto& name : order_) {
        const auto& entry = adapters_.at(name);
        if (entry.available) defs.push_back(entry.definition);
    }
    return defs;
}

void AdapterRegistry::record(const std::string& name, bool success, double duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(name);
    if (it == adapters_.end()) return;
    auto& s = it->second.stats;
    if (success) ++s.successes; else ++s.failures;
    s.total_duration_ms += duration_ms;
}

ExecutionResult AdapterRegistry::execute_tool(const std::string& name,
                                              const nlohmann::json& args,
                                              const ExecutionContext& context) {
    const std::shared_ptr<spdlog::logger>& logger = context.logger ? context.logger : logger_;

    std::shared_ptr<ToolAdapter> adapter;
    nlohmann::json schema;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = adapters_.find(name);
        if (it == adapters_.end()) {
            return make_failure(ErrorCode::NotFound, "Tool not found: " + name,
                                "Call tools/list to see the available tools");
        }
        if (!it->second.available) {
            return make_failure(ErrorCode::Unavailable,
                                "Tool unavailable: " + name + " (" + it->second.unavailable_reason + ")",
                                "Check the server logs and restart the server");
        }
        ++it->second.stats.calls;
        adapter = it->second.adapter;
        schema = it->second.definition.input_schema;
    }

    if (rate_limiter_) {
        auto limit = rate_limiter_->check(name);
        if (!limit.allowed) {
            logger->warn("Rate limit exceeded for {} (retry after {}s)", name, limit.retry_after);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = adapters_.find(name);
                if (it != adapters_.end()) ++it->second.stats.rate_limited;
            }
            const auto secs = std::to_string(limit.retry_after);
            return make_failure(ErrorCode::RateLimited,
                                "Rate limit exceeded for " + name + ". Try again in " + secs + " second(s).",
                                "Wait " + secs + " second(s) before retrying",
                                nlohmann::json{{"retryAfter", limit.retry_after}});
        }
    }

    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started] {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
    };

    try {
        auto validation = validate_arguments(schema, args);
        if (validation.valid) {
            validation = adapter->validate(args.is_null() ? nlohmann::json::object() : args);
        }
        if (!validation.valid) {
            record(name, false, elapsed_ms());
            return make_failure(ErrorCode::InvalidParams,
                                validation.error.empty() ? "Invalid arguments" : validation.error,
                                "Check the tool input schema and try again",
                                validation.details);
        }

        auto result = adapter->execute(args.is_null() ? nlohmann::json::object() : args, context);
        const double duration = elapsed_ms();

        if (auto* out = std::get_if<ToolOutput>(&result)) {
            if (out->metadata && out->metadata->is_object() && !out->metadata->contains("duration_ms")) {
                (*out->metadata)["duration_ms"] = static_cast<int64_t>(duration);
            }
            record(name, true, duration);
        } else {
            const auto& err = std::get<ToolError>(result);
            logger->debug("Tool {} returned {}: {}", name, error_code_name(err.code), err.message);
            record(name, false, duration);
        }
        return result;
    } catch (const std::exception& e) {
        logger->error("Tool execution failed: {}: {}", name, e.what());
        record(name, false, elapsed_ms());
        return make_failure(ErrorCode::InternalError, e.what(),
                            "Check the tool arguments and try again");
    } catch (...) {
        logger->error("Tool execution failed: {}: unknown exception", name);
        record(name, false, elapsed_ms());
        return make_failure(ErrorCode::InternalError, "Tool execution failed",
                            "Check the tool arguments and try again");
    }
}

bool AdapterRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.count(name) > 0;
}

bool AdapterRegistry::is_available(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(name);
    return it != adapters_.end() && it->second.available;
}

std::vector<std::string> AdapterRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

RegistryStats AdapterRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats s;
    s.total_adapters = adapters_.size();
    s.tool_names = order_;
    for (const auto& name : order_) {
        const auto& entry = adapters_.at(name);
        if (entry.available) ++s.available_adapters;
        s.tools[name] = entry.stats;
    }
    return s;
}

std::optional<std::map<std::string, BucketStatus>> AdapterRegistry::rate_limit_status() {
    if (!rate_limiter_) return std::nullopt;
    return rate_limiter_->status();
}

void AdapterRegistry::reset_rate_limit(const std::string& name) {
    if (rate_limiter_) rate_limiter_->reset(name);
}

void AdapterRegistry::reset_all_rate_limits() {
    if (rate_limiter_) rate_limiter_->reset_all();
}

void AdapterRegistry::shutdown_all() {
    std::vector<std::pair<std::string, std::shared_ptr<ToolAdapter>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& name : order_) {
            snapshot.emplace_back(name, adapters_.at(name).adapter);
        }
        adapters_.clear();
        order_.clear();
    }

    for (auto& [name, adapter] : snapshot) {
        try {
            adapter->shutdown();
        } catch (const std::exception& e) {
            logger_->error("Shutdown of {} failed: {}", name, e.what());
        } catch (...) {
            logger_->error("Shutdown of {} failed: unknown exception", name);
        }
    }
    logger_->debug("Shut down {} adapter(s)", snapshot.size());
}

} // namespace devagent
