#pragma once
#include "mcplink/client/connection.hpp"
#include "mcplink/client/transports.hpp"
#include "mcplink/client/types.hpp"
#include "mcplink/settings.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink::client
{

struct ClientOptions
{
    std::string protocol_version{DEFAULT_PROTOCOL_VERSION};
    Implementation client_info{"mcplink", "1.0.0"};
    /// Applied to every call whose CallOptions has no timeout of its own (0 = none)
    std::chrono::milliseconds default_timeout{0};
    /// Grace period handed to StdioTransport by Client::spawn
    std::chrono::milliseconds close_grace{2000};

    static ClientOptions from_settings(const Settings& settings);
};

/**
 * MCP client session over one Connection.
 *
 * initialize() must succeed before anything else; every other operation
 * throws NotInitializedError until it has. Errors:
 * - TransportError / ConnectionClosedError: the session is gone
 * - RpcError: the server rejected this request
 * - CancelledError / CallTimeoutError: this caller gave up
 * Tool failures are not errors: call_tool() returns them with is_error set.
 */
class Client
{
  public:
    explicit Client(std::unique_ptr<Transport> transport, ClientOptions options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Launch `command` as a stdio MCP server. Does not initialize.
    static std::unique_ptr<Client> spawn(const std::string& command,
                                         const std::vector<std::string>& args = {},
                                         const std::map<std::string, std::string>& env = {},
                                         ClientOptions options = {});

    /// Handshake: initialize request, then notifications/initialized.
    /// Throws RpcError if the server refuses.
    const InitializeResult& initialize(const CallOptions& options = {});

    bool initialized() const;
    /// Throws NotInitializedError before the handshake
    const InitializeResult& server() const;

    std::vector<tools::ToolDescriptor> list_tools(const CallOptions& options = {});
    CallToolResult call_tool(const std::string& name, const Json& arguments = Json::object(),
                             const CallOptions& options = {});

    std::vector<resources::ResourceDescriptor> list_resources(const CallOptions& options = {});
    std::vector<resources::ResourceTemplate>
    list_resource_templates(const CallOptions& options = {});
    std::vector<resources::ResourceContent> read_resource(const std::string& uri,
                                                          const CallOptions& options = {});

    void ping(const CallOptions& options = {});

    /// Raw request after the handshake, for methods without a typed wrapper
    Json call(const std::string& method, const Json& params = Json::object(),
              const CallOptions& options = {});

    void close();

    Connection& connection()
    {
        return *connection_;
    }

  private:
    void require_initialized() const;
    CallOptions with_defaults(const CallOptions& options) const;

    ClientOptions options_;
    std::unique_ptr<Connection> connection_;

    mutable std::mutex state_mutex_;
    std::optional<InitializeResult> server_;
};

} // namespace mcplink::client
