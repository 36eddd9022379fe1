#pragma once

/// Umbrella header for the dev-agent MCP server core.

#include "version.hpp"
#include "error.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "rate_limiter.hpp"
#include "validation.hpp"
#include "session.hpp"
#include "router.hpp"
#include "channel.hpp"
#include "server.hpp"
#include "adapters/tool_adapter.hpp"
#include "adapters/adapter_registry.hpp"
#include "adapters/health_adapter.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
