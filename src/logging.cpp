#include "devagent/logging.hpp"
#include "devagent/error.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace devagent {

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

spdlog::level::level_enum parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")   return spdlog::level::trace;
    if (lowered == "debug")   return spdlog::level::debug;
    if (lowered == "info")    return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error")   return spdlog::level::err;
    if (lowered == "off")     return spdlog::level::off;
    throw ConfigurationError("Unknown log level: " + std::string(text));
}

} // namespace devagent
