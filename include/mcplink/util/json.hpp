#pragma once
#include "mcplink/exceptions.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mcplink::util::json
{

using json = nlohmann::json;

/// Parse text, reporting malformed input as ValidationError
inline json parse(const std::string& s)
{
    try
    {
        return json::parse(s);
    }
    catch (const json::parse_error& e)
    {
        throw mcplink::ValidationError(std::string("invalid JSON: ") + e.what());
    }
}

/// Single-line form; invalid UTF-8 in strings is replaced rather than thrown
inline std::string dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

} // namespace mcplink::util::json
