#pragma once
#include "mcplink/resources/registry.hpp"
#include "mcplink/tools/registry.hpp"
#include "mcplink/types.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace mcplink::server
{

/**
 * MCP server core: owns one ToolRegistry and one ResourceRegistry and answers
 * JSON-RPC messages addressed to them.
 *
 * Handled methods: initialize, notifications/initialized, ping, tools/list,
 * tools/call, resources/list, resources/templates/list, resources/read.
 *
 * Protocol failures become JSON-RPC errors (-32700 unparsable line, -32600
 * invalid envelope, -32601 unknown method, -32602 bad params, -32603 internal).
 * A failing tool is not a protocol failure: tools/call still succeeds, with
 * isError set in the result.
 *
 * The server is transport-agnostic. StdioServerWrapper feeds it lines from a
 * stream; InProcessTransport calls handle_line() from its worker thread.
 */
class McpServer
{
  public:
    McpServer(std::string name, std::string version,
              std::string protocol_version = DEFAULT_PROTOCOL_VERSION);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    tools::ToolRegistry& tools()
    {
        return tools_;
    }
    const tools::ToolRegistry& tools() const
    {
        return tools_;
    }
    resources::ResourceRegistry& resources()
    {
        return resources_;
    }
    const resources::ResourceRegistry& resources() const
    {
        return resources_;
    }

    const std::string& name() const
    {
        return info_.name;
    }
    const std::string& version() const
    {
        return info_.version;
    }
    const std::string& protocol_version() const
    {
        return protocol_version_;
    }

    /// Free-form usage hints returned from initialize
    void set_instructions(std::string instructions);

    /// Process one decoded message. Returns the response for requests and
    /// nullopt for notifications (and for stray responses, which are ignored).
    std::optional<Json> handle(const Json& message);

    /// Process one raw line; an unparsable line yields a -32700 reply with a null id
    std::optional<std::string> handle_line(const std::string& line);

    /// True once the client has sent notifications/initialized
    bool initialized() const
    {
        return initialized_.load();
    }

  private:
    Json handle_request(const std::string& method, const Json& params);
    Json initialize_result(const Json& params) const;
    Json call_tool(const Json& params);
    Json read_resource(const Json& params);

    Implementation info_;
    std::string protocol_version_;
    std::optional<std::string> instructions_;
    std::atomic<bool> initialized_{false};

    tools::ToolRegistry tools_;
    resources::ResourceRegistry resources_;
};

} // namespace mcplink::server
