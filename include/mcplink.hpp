#pragma once

#include "mcplink/client/cancellation.hpp"
#include "mcplink/client/client.hpp"
#include "mcplink/client/connection.hpp"
#include "mcplink/client/transports.hpp"
#include "mcplink/client/types.hpp"
#include "mcplink/content.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/mcp/frame.hpp"
#include "mcplink/resources/registry.hpp"
#include "mcplink/resources/resource.hpp"
#include "mcplink/server/server.hpp"
#include "mcplink/server/stdio_server.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/tools/arguments.hpp"
#include "mcplink/tools/builder.hpp"
#include "mcplink/tools/registry.hpp"
#include "mcplink/tools/tool.hpp"
#include "mcplink/types.hpp"
#include "mcplink/util/json.hpp"
#include "mcplink/util/log.hpp"
#include "mcplink/version.hpp"
