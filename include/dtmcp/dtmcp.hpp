#pragma once

/// Umbrella header for the datetime MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "civil_date.hpp"
#include "timezone.hpp"
#include "calendar.hpp"
#include "tool_registry.hpp"
#include "tool_dispatcher.hpp"
#include "router.hpp"
#include "server.hpp"
#include "logging.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
