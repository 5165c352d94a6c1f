#include "mcplink/server/server.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/mcp/frame.hpp"
#include "mcplink/util/json.hpp"
#include "mcplink/util/log.hpp"

namespace mcplink::server
{

namespace
{
/// Thrown inside the dispatcher to select a specific JSON-RPC error code
struct ProtocolError : public Error
{
    ProtocolError(int code, const std::string& message) : Error(message), code(code) {}
    int code;
};

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return mcp::to_json(mcp::make_error(id, code, message));
}

const Json& require_object_params(const Json& params)
{
    if (!params.is_object())
        throw ProtocolError(mcp::INVALID_PARAMS, "params must be an object");
    return params;
}

std::string require_string_param(const Json& params, const char* key)
{
    const auto& obj = require_object_params(params);
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get<std::string>().empty())
        throw ProtocolError(mcp::INVALID_PARAMS, std::string("Missing ") + key);
    return it->get<std::string>();
}
} // namespace

McpServer::McpServer(std::string name, std::string version, std::string protocol_version)
    : info_{std::move(name), std::move(version)}, protocol_version_(std::move(protocol_version))
{
}

void McpServer::set_instructions(std::string instructions)
{
    instructions_ = std::move(instructions);
}

std::optional<std::string> McpServer::handle_line(const std::string& line)
{
    if (line.find_first_not_of(" \t\r") == std::string::npos)
        return std::nullopt;

    Json message;
    try
    {
        message = util::json::parse(line);
    }
    catch (const ValidationError& e)
    {
        log::debug("server", e.what());
        return util::json::dump(jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error"));
    }

    auto reply = handle(message);
    if (!reply)
        return std::nullopt;
    return util::json::dump(*reply);
}

std::optional<Json> McpServer::handle(const Json& message)
{
    if (!message.is_object())
        return jsonrpc_error(Json(), mcp::INVALID_REQUEST, "Invalid Request");

    Json id = message.value("id", Json());
    auto tag = message.find("jsonrpc");
    if (tag == message.end() || !tag->is_string() || tag->get<std::string>() != JSONRPC_VERSION)
        return jsonrpc_error(id, mcp::INVALID_REQUEST, "Invalid Request: jsonrpc must be \"2.0\"");

    auto method_it = message.find("method");
    if (method_it == message.end())
    {
        // A response to something we never sent; nothing to answer
        log::debug("server", "ignoring response frame");
        return std::nullopt;
    }
    if (!method_it->is_string())
        return jsonrpc_error(id, mcp::INVALID_REQUEST, "Invalid Request: method must be a string");

    const std::string method = method_it->get<std::string>();
    const Json params = message.value("params", Json::object());
    const bool is_notification = !message.contains("id") || message["id"].is_null();

    if (is_notification)
    {
        if (method == "notifications/initialized")
        {
            initialized_ = true;
            log::info("server", info_.name + ": client initialized");
        }
        else
        {
            log::debug("server", "ignoring notification " + method);
        }
        return std::nullopt;
    }

    try
    {
        return mcp::to_json(mcp::make_result(id, handle_request(method, params)));
    }
    catch (const ProtocolError& e)
    {
        return jsonrpc_error(id, e.code, e.what());
    }
    catch (const NotFoundError& e)
    {
        return jsonrpc_error(id, mcp::INVALID_PARAMS, e.what());
    }
    catch (const ValidationError& e)
    {
        return jsonrpc_error(id, mcp::INVALID_PARAMS, e.what());
    }
    catch (const std::exception& e)
    {
        log::warn("server", method + " failed: " + e.what());
        return jsonrpc_error(id, mcp::INTERNAL_ERROR, e.what());
    }
    catch (...)
    {
        log::error("server", method + " failed with a non-standard exception");
        return jsonrpc_error(id, mcp::INTERNAL_ERROR, "Internal error");
    }
}

Json McpServer::handle_request(const std::string& method, const Json& params)
{
    if (method == "initialize")
        return initialize_result(params);

    if (method == "ping")
        return Json::object();

    if (method == "tools/list")
        return Json{{"tools", tools_.list()}};

    if (method == "tools/call")
        return call_tool(params);

    if (method == "resources/list")
        return Json{{"resources", resources_.list()}};

    if (method == "resources/templates/list")
        return Json{{"resourceTemplates", resources_.list_templates()}};

    if (method == "resources/read")
        return read_resource(params);

    throw ProtocolError(mcp::METHOD_NOT_FOUND, "Method '" + method + "' not found");
}

Json McpServer::initialize_result(const Json& params) const
{
    // Answer with our version; the client decides whether it can live with it
    if (params.is_object() && params.contains("protocolVersion"))
        log::debug("server", "client requested protocol " +
                                 params["protocolVersion"].dump());

    Json capabilities = Json::object();
    if (tools_.size() > 0)
        capabilities["tools"] = Json::object();
    if (resources_.size() > 0)
        capabilities["resources"] = Json::object();

    Json result = {{"protocolVersion", protocol_version_},
                   {"capabilities", capabilities},
                   {"serverInfo", info_}};
    if (instructions_)
        result["instructions"] = *instructions_;
    return result;
}

Json McpServer::call_tool(const Json& params)
{
    std::string name = require_string_param(params, "name");
    Json arguments = params.value("arguments", Json::object());
    return tools_.dispatch(name, arguments);
}

Json McpServer::read_resource(const Json& params)
{
    std::string uri = require_string_param(params, "uri");
    Json contents = Json::array();
    contents.push_back(resources_.read(uri));
    return Json{{"contents", contents}};
}

} // namespace mcplink::server
