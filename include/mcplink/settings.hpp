#pragma once
#include "mcplink/types.hpp"

#include <cstdint>
#include <string>

namespace mcplink
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string protocol_version{DEFAULT_PROTOCOL_VERSION};
    std::string client_name{"mcplink"};
    std::string client_version{"1.0.0"};
    /// Default per-call deadline in milliseconds (0 = wait indefinitely)
    int64_t call_timeout_ms{0};
    /// How long close() waits for a child to exit after stdin is closed
    int64_t close_grace_ms{2000};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcplink
