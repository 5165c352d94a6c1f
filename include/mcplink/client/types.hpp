#pragma once
#include "mcplink/content.hpp"
#include "mcplink/resources/resource.hpp"
#include "mcplink/tools/tool.hpp"
#include "mcplink/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcplink::client
{

/// Result of the initialize handshake
struct InitializeResult
{
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;
    std::optional<std::string> instructions;

    bool has_capability(const std::string& name) const
    {
        return capabilities.is_object() && capabilities.contains(name);
    }
};

using CallToolResult = ToolResult;

inline void from_json(const Json& j, InitializeResult& r)
{
    r.protocol_version = string_field(j, "protocolVersion");
    auto caps = j.find("capabilities");
    r.capabilities = caps != j.end() && caps->is_object() ? *caps : Json::object();
    auto info = j.find("serverInfo");
    if (info != j.end() && info->is_object())
        r.server_info = info->get<Implementation>();
    auto instructions = j.find("instructions");
    if (instructions != j.end() && instructions->is_string())
        r.instructions = instructions->get<std::string>();
}

} // namespace mcplink::client
