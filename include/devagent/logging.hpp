#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace devagent {

/// Build a logger writing to stderr only; stdout carries protocol traffic.
/// The logger is not added to the spdlog registry, so several servers in
/// one process (tests) can each own one under the same name.
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

/// "debug", "info", "warn", "error" or "off" (case-insensitive).
/// Throws ConfigurationError on anything else.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view text);

} // namespace devagent
