#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace mcplink
{

using Json = nlohmann::json;

/// JSON-RPC version tag carried by every frame
constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol revision negotiated by default during initialize
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

/// Peer-supplied objects are read leniently: a missing or mistyped field
/// yields the fallback instead of a json::type_error.
inline std::string string_field(const Json& j, const char* key, std::string fallback = {})
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

inline bool bool_field(const Json& j, const char* key, bool fallback)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean())
        return fallback;
    return it->get<bool>();
}

/// Name/version pair exchanged as clientInfo / serverInfo
struct Implementation
{
    std::string name;
    std::string version;
};

inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}

inline void from_json(const Json& j, Implementation& impl)
{
    impl.name = string_field(j, "name");
    impl.version = string_field(j, "version");
}

} // namespace mcplink
