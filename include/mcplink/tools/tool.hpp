#pragma once
#include "mcplink/content.hpp"
#include "mcplink/types.hpp"

#include <functional>
#include <string>

namespace mcplink::tools
{

class Arguments;

/// Name, description and input schema of one tool, as listed by tools/list.
/// Built once (usually through ToolBuilder) and never modified afterwards.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    Json input_schema = Json{{"type", "object"}};
};

/// Invocation handler. Throwing is allowed; the registry turns any exception
/// into an error ToolResult.
using ToolHandler = std::function<ToolResult(const Arguments&)>;

// nlohmann::json adapters (wire names follow MCP: inputSchema)
inline void to_json(Json& j, const ToolDescriptor& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.input_schema}};
    if (!t.description.empty())
        j["description"] = t.description;
}

inline void from_json(const Json& j, ToolDescriptor& t)
{
    t.name = j.at("name").get<std::string>();
    t.description = string_field(j, "description");
    auto schema = j.find("inputSchema");
    t.input_schema = schema != j.end() && schema->is_object() ? *schema : Json::object();
}

} // namespace mcplink::tools
