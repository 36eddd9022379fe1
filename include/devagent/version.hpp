#pragma once
#include <string_view>

namespace devagent {

constexpr std::string_view SERVER_NAME               = "dev-agent";
constexpr std::string_view SERVER_VERSION            = "0.1.4";
constexpr std::string_view FALLBACK_PROTOCOL_VERSION = "1.0";
constexpr std::string_view JSONRPC_VERSION           = "2.0";

} // namespace devagent
