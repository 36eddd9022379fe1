#include <gtest/gtest.h>
#include "devagent/adapters/health_adapter.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

using namespace devagent;
using devagent::test::quiet_logger;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class HealthAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("devagent-health-" + std::to_string(rd()));
        repo_ = root_ / "repo";
        vectors_ = root_ / "storage" / "vectors.lance";
        state_ = root_ / "storage" / "github-state.json";
        fs::create_directories(repo_);

        now_ = std::make_shared<std::chrono::system_clock::time_point>(
            *parse_iso8601("2025-01-10T12:00:00Z"));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    HealthAdapter make_adapter(bool with_github = true) {
        HealthCheckConfig config;
        config.repository_path = repo_;
        config.vector_store_path = vectors_;
        if (with_github) config.github_state_path = state_;
        auto now = now_;
        return HealthAdapter(config, [now] { return *now; });
    }

    void make_git_repo() { fs::create_directories(repo_ / ".git"); }

    void make_vectors(int files) {
        fs::create_directories(vectors_);
        for (int i = 0; i < files; ++i) {
            std::ofstream(vectors_ / ("part-" + std::to_string(i) + ".lance")) << "data";
        }
    }

    void write_state(const std::string& content) {
        fs::create_directories(state_.parent_path());
        std::ofstream(state_) << content;
    }

    nlohmann::json run(HealthAdapter& adapter, bool verbose = false) {
        ExecutionContext ctx;
        ctx.logger = quiet_logger();
        auto result = adapter.execute(nlohmann::json{{"verbose", verbose}}, ctx);
        EXPECT_TRUE(std::holds_alternative<ToolOutput>(result));
        return std::get<ToolOutput>(result).data;
    }

    fs::path root_, repo_, vectors_, state_;
    std::shared_ptr<std::chrono::system_clock::time_point> now_;
};

} // namespace

TEST_F(HealthAdapterTest, ToolDefinition) {
    auto adapter = make_adapter();
    auto def = adapter.tool_definition();
    EXPECT_EQ(def.name, "dev_health");
    EXPECT_EQ(def.input_schema["properties"]["verbose"]["type"], "boolean");
}

TEST_F(HealthAdapterTest, RepositoryChecks) {
    auto adapter = make_adapter();
    EXPECT_EQ(adapter.check_repository(false).status, CheckStatus::Warn);

    make_git_repo();
    auto pass = adapter.check_repository(true);
    EXPECT_EQ(pass.status, CheckStatus::Pass);
    EXPECT_EQ(pass.message, "Repository accessible and is a Git repository");
    ASSERT_TRUE(pass.details.has_value());
    EXPECT_EQ((*pass.details)["path"], repo_.string());

    fs::remove_all(repo_);
    EXPECT_EQ(adapter.check_repository(false).status, CheckStatus::Fail);
}

TEST_F(HealthAdapterTest, VectorStorageChecks) {
    auto adapter = make_adapter();
    auto missing = adapter.check_vector_storage(false);
    EXPECT_EQ(missing.status, CheckStatus::Fail);
    EXPECT_FALSE(missing.details.has_value());

    fs::create_directories(vectors_);
    EXPECT_EQ(adapter.check_vector_storage(false).status, CheckStatus::Warn);

    make_vectors(3);
    auto pass = adapter.check_vector_storage(true);
    EXPECT_EQ(pass.status, CheckStatus::Pass);
    EXPECT_EQ(pass.message, "Vector storage operational (3 files)");
    EXPECT_EQ((*pass.details)["fileCount"], 3);
}

TEST_F(HealthAdapterTest, GitHubIndexChecks) {
    auto adapter = make_adapter();
    EXPECT_EQ(adapter.check_github_index(false).status, CheckStatus::Warn);

    write_state(R"({"items":[1,2]})");
    EXPECT_EQ(adapter.check_github_index(false).message,
              "GitHub index exists but has no lastIndexed timestamp");

    write_state(R"({"lastIndexed":"2025-01-10T09:00:00.000Z","items":[1,2]})");
    auto fresh = adapter.check_github_index(false);
    EXPECT_EQ(fresh.status, CheckStatus::Pass);
    EXPECT_EQ(fresh.message, "GitHub index operational (2 items, indexed 3h ago)");

    write_state(R"({"lastIndexed":"2025-01-08T12:00:00Z","items":[]})");
    auto stale = adapter.check_github_index(true);
    EXPECT_EQ(stale.status, CheckStatus::Warn);
    EXPECT_EQ(stale.message, "GitHub index is 48h old (0 items) - consider re-indexing");
    EXPECT_EQ((*stale.details)["lastIndexed"], "2025-01-08T12:00:00.000Z");

    write_state("{not json");
    EXPECT_EQ(adapter.check_github_index(false).status, CheckStatus::Warn);
}

TEST_F(HealthAdapterTest, HealthyWhenEverythingPasses) {
    make_git_repo();
    make_vectors(1);
    write_state(R"({"lastIndexed":"2025-01-10T11:00:00Z","items":[]})");
    auto adapter = make_adapter();
    *now_ += 65s;

    auto data = run(adapter);
    EXPECT_EQ(data["status"], "healthy");
    EXPECT_EQ(data["uptime"], 65000);
    EXPECT_EQ(data["timestamp"], "2025-01-10T12:01:05.000Z");
    EXPECT_EQ(data["checks"]["repository"]["status"], "pass");
    EXPECT_EQ(data["checks"]["vectorStorage"]["status"], "pass");
    EXPECT_EQ(data["checks"]["githubIndex"]["status"], "pass");

    const auto report = data["formattedReport"].get<std::string>();
    EXPECT_NE(report.find("MCP Server Health: HEALTHY"), std::string::npos);
    EXPECT_NE(report.find("**Uptime:** 1m 5s"), std::string::npos);
    EXPECT_NE(report.find("[PASS] **Vector Storage:**"), std::string::npos);
    EXPECT_EQ(report.find("*Details:*"), std::string::npos);
    EXPECT_TRUE(adapter.healthy());
}

TEST_F(HealthAdapterTest, DegradedOnWarning) {
    make_vectors(1);
    auto adapter = make_adapter(false);
    auto data = run(adapter, true);
    EXPECT_EQ(data["status"], "degraded");
    EXPECT_FALSE(data["checks"].contains("githubIndex"));
    EXPECT_NE(data["formattedReport"].get<std::string>().find("*Details:*"), std::string::npos);
    EXPECT_FALSE(adapter.healthy());
}

TEST_F(HealthAdapterTest, UnhealthyOnFailure) {
    make_git_repo();
    auto adapter = make_adapter(false);
    auto data = run(adapter);
    EXPECT_EQ(data["status"], "unhealthy");
    EXPECT_EQ(data["checks"]["vectorStorage"]["status"], "fail");
}

TEST(HealthFormatting, OverallStatus) {
    EXPECT_EQ(overall_status({}), "healthy");
    EXPECT_EQ(overall_status({{CheckStatus::Pass, "", std::nullopt},
                              {CheckStatus::Warn, "", std::nullopt}}), "degraded");
    EXPECT_EQ(overall_status({{CheckStatus::Warn, "", std::nullopt},
                              {CheckStatus::Fail, "", std::nullopt}}), "unhealthy");
}

TEST(HealthFormatting, Uptime) {
    EXPECT_EQ(format_uptime(std::chrono::milliseconds(5400)), "5s");
    EXPECT_EQ(format_uptime(65s), "1m 5s");
    EXPECT_EQ(format_uptime(3700s), "1h 1m");
    EXPECT_EQ(format_uptime(90000s), "1d 1h 0m");
}

TEST(HealthFormatting, Iso8601) {
    auto tp = parse_iso8601("2024-02-29T23:59:58.123Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(format_iso8601(*tp), "2024-02-29T23:59:58.000Z");
    EXPECT_EQ(format_iso8601(*tp + std::chrono::milliseconds(42)), "2024-02-29T23:59:58.042Z");

    EXPECT_TRUE(parse_iso8601("2024-01-01T00:00:00").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2024-01-01T00:00:00+02:00").has_value());
}
