#include "devagent/adapters/health_adapter.hpp"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace devagent {

namespace fs = std::filesystem;

namespace {

const char* status_name(CheckStatus s) {
    switch (s) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Warn: return "warn";
        case CheckStatus::Fail: return "fail";
    }
    return "fail";
}

const char* status_marker(CheckStatus s) {
    switch (s) {
        case CheckStatus::Pass: return "[PASS]";
        case CheckStatus::Warn: return "[WARN]";
        case CheckStatus::Fail: return "[FAIL]";
    }
    return "[FAIL]";
}

std::optional<nlohmann::json> path_details(bool verbose, const fs::path& p) {
    if (!verbose) return std::nullopt;
    return nlohmann::json{{"path", p.string()}};
}

std::string upper(std::string s) {
    for (auto& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

} // namespace

void to_json(nlohmann::json& j, const CheckResult& c) {
    j = nlohmann::json{{"status", status_name(c.status)}, {"message", c.message}};
    if (c.details) j["details"] = *c.details;
}

std::string overall_status(const std::vector<CheckResult>& checks) {
    bool warn = false;
    for (const auto& c : checks) {
        if (c.status == CheckStatus::Fail) return "unhealthy";
        if (c.status == CheckStatus::Warn) warn = true;
    }
    return warn ? "degraded" : "healthy";
}

std::string format_uptime(std::chrono::milliseconds uptime) {
    long long seconds = uptime.count() / 1000;
    long long minutes = seconds / 60;
    long long hours = minutes / 60;
    long long days = hours / 24;

    std::ostringstream out;
    if (days > 0) {
        out << days << "d " << hours % 24 << "h " << minutes % 60 << "m";
    } else if (hours > 0) {
        out << hours << "h " << minutes % 60 << "m";
    } else if (minutes > 0) {
        out << minutes << "m " << seconds % 60 << "s";
    } else {
        out << seconds << "s";
    }
    return out.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;

    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31
        || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::time_t t = ::timegm(&tm);
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

HealthAdapter::HealthAdapter(HealthCheckConfig config, WallClock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    start_time_ = now();
}

std::chrono::system_clock::time_point HealthAdapter::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

ToolDefinition HealthAdapter::tool_definition() const {
    ToolDefinition def;
    def.name = "dev_health";
    def.description = "Check the health status of the dev-agent MCP server and its "
                      "dependencies (vector storage, repository, GitHub index)";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"verbose", {
                {"type", "boolean"},
                {"description", "Include detailed diagnostic information"},
                {"default", false}
            }}
        }}
    };
    return def;
}

void HealthAdapter::initialize(const AdapterContext& context) {
    if (context.logger) {
        context.logger->debug("Health checks: repository={} vectors={}",
                              config_.repository_path.string(),
                              config_.vector_store_path.string());
    }
}

CheckResult HealthAdapter::check_repository(bool verbose) const {
    const auto& path = config_.repository_path;
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return {CheckStatus::Fail,
                "Repository not accessible: " + (ec ? ec.message() : std::string("path does not exist")),
                path_details(verbose, path)};
    }
    if (!fs::is_directory(st)) {
        return {CheckStatus::Fail, "Repository path is not a directory", std::nullopt};
    }
    if (fs::exists(path / ".git", ec)) {
        return {CheckStatus::Pass, "Repository accessible and is a Git repository",
                path_details(verbose, path)};
    }
    return {CheckStatus::Warn, "Repository accessible but not a Git repository",
            path_details(verbose, path)};
}

CheckResult HealthAdapter::check_vector_storage(bool verbose) const {
    const auto& path = config_.vector_store_path;
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return {CheckStatus::Fail,
                "Vector storage not accessible: " + (ec ? ec.message() : std::string("path does not exist")),
                path_details(verbose, path)};
    }
    if (!fs::is_directory(st)) {
        return {CheckStatus::Fail, "Vector storage path is not a directory", std::nullopt};
    }

    size_t count = 0;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        ++count;
    }
    if (ec) {
        return {CheckStatus::Fail, "Vector storage not accessible: " + ec.message(),
                path_details(verbose, path)};
    }

    if (count == 0) {
        return {CheckStatus::Warn, "Vector storage is empty (repository may not be indexed)",
                path_details(verbose, path)};
    }

    std::optional<nlohmann::json> details;
    if (verbose) details = nlohmann::json{{"path", path.string()}, {"fileCount", count}};
    return {CheckStatus::Pass,
            "Vector storage operational (" + std::to_string(count) + " files)",
            details};
}

CheckResult HealthAdapter::check_github_index(bool verbose) const {
    if (!config_.github_state_path) {
        return {CheckStatus::Warn, "GitHub index not configured", std::nullopt};
    }
    const auto& path = *config_.github_state_path;

    std::ifstream in(path);
    if (!in) {
        return {CheckStatus::Warn, "GitHub index not accessible: cannot open " + path.string(),
                path_details(verbose, path)};
    }

    nlohmann::json state;
    try {
        state = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return {CheckStatus::Warn, std::string("GitHub index not accessible: ") + e.what(),
                path_details(verbose, path)};
    }

    size_t items = 0;
    if (state.is_object() && state.contains("items") && state["items"].is_array()) {
        items = state["items"].size();
    }

    std::optional<std::chrono::system_clock::time_point> last_indexed;
    if (state.is_object() && state.contains("lastIndexed") && state["lastIndexed"].is_string()) {
        last_indexed = parse_iso8601(state["lastIndexed"].get<std::string>());
    }
    if (!last_indexed) {
        return {CheckStatus::Warn, "GitHub index exists but has no lastIndexed timestamp",
                path_details(verbose, path)};
    }

    auto age_hours = std::chrono::duration_cast<std::chrono::hours>(now() - *last_indexed).count();

    std::optional<nlohmann::json> details;
    if (verbose) {
        details = nlohmann::json{{"path", path.string()},
                                 {"lastIndexed", format_iso8601(*last_indexed)}};
    }

    if (age_hours > 24) {
        return {CheckStatus::Warn,
                "GitHub index is " + std::to_string(age_hours) + "h old (" + std::to_string(items)
                    + " items) - consider re-indexing",
                details};
    }
    return {CheckStatus::Pass,
            "GitHub index operational (" + std::to_string(items) + " items, indexed "
                + std::to_string(age_hours) + "h ago)",
            details};
}

bool HealthAdapter::healthy() const {
    std::vector<CheckResult> checks{check_vector_storage(false), check_repository(false)};
    if (config_.github_state_path) checks.push_back(check_github_index(false));
    return overall_status(checks) == "healthy";
}

ExecutionResult HealthAdapter::execute(const nlohmann::json& args,
                                       const ExecutionContext& context) {
    bool verbose = false;
    if (args.is_object()) {
        auto it = args.find("verbose");
        if (it != args.end() && it->is_boolean()) verbose = it->get<bool>();
    }

    std::vector<std::pair<std::string, CheckResult>> named{
        {"vectorStorage", check_vector_storage(verbose)},
        {"repository", check_repository(verbose)},
    };
    if (config_.github_state_path) {
        named.emplace_back("githubIndex", check_github_index(verbose));
    }

    std::vector<CheckResult> results;
    nlohmann::json checks = nlohmann::json::object();
    for (const auto& [name, check] : named) {
        results.push_back(check);
        checks[name] = check;
    }

    auto timestamp = now();
    auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - start_time_);
    if (uptime.count() < 0) uptime = std::chrono::milliseconds(0);
    std::string status = overall_status(results);

    std::ostringstream report;
    report << "**MCP Server Health: " << upper(status) << "**\n\n";
    report << "**Uptime:** " << format_uptime(uptime) << "\n";
    report << "**Timestamp:** " << format_iso8601(timestamp) << "\n\n";
    report << "**Component Status:**\n";
    static const std::map<std::string, std::string> labels{
        {"vectorStorage", "Vector Storage"},
        {"repository", "Repository"},
        {"githubIndex", "GitHub Index"},
    };
    for (const auto& [name, check] : named) {
        report << "\n" << status_marker(check.status) << " **" << labels.at(name) << ":** "
               << check.message;
        if (verbose && check.details) {
            report << "\n   *Details:* " << check.details->dump();
        }
    }

    if (context.logger) {
        context.logger->debug("dev_health: {}", status);
    }

    nlohmann::json data{
        {"status", status},
        {"checks", checks},
        {"timestamp", format_iso8601(timestamp)},
        {"uptime", uptime.count()},
        {"formattedReport", report.str()},
    };
    return make_success(std::move(data));
}

} // namespace devagent
