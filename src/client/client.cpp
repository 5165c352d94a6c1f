#include "mcplink/client/client.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/log.hpp"

namespace mcplink::client
{

namespace
{

// A result the peer shaped wrongly is reported as ValidationError, never as a
// raw json exception.
const Json& require_object(const Json& result, const std::string& method)
{
    if (!result.is_object())
        throw ValidationError(method + ": result is not an object, got " + result.type_name());
    return result;
}

template <typename T>
T decode(const Json& j, const std::string& method)
{
    try
    {
        return j.get<T>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(method + ": malformed result: " + e.what());
    }
}

template <typename T>
std::vector<T> decode_list(const Json& result, const char* key, const std::string& method)
{
    std::vector<T> out;
    auto items = require_object(result, method).find(key);
    if (items == result.end() || !items->is_array())
        return out;
    for (const auto& item : *items)
        out.push_back(decode<T>(item, method));
    return out;
}

} // namespace

ClientOptions ClientOptions::from_settings(const Settings& settings)
{
    ClientOptions options;
    options.protocol_version = settings.protocol_version;
    options.client_info = Implementation{settings.client_name, settings.client_version};
    options.default_timeout = std::chrono::milliseconds(settings.call_timeout_ms);
    options.close_grace = std::chrono::milliseconds(settings.close_grace_ms);
    return options;
}

Client::Client(std::unique_ptr<Transport> transport, ClientOptions options)
    : options_(std::move(options)), connection_(std::make_unique<Connection>(std::move(transport)))
{
}

Client::~Client() = default;

std::unique_ptr<Client> Client::spawn(const std::string& command,
                                      const std::vector<std::string>& args,
                                      const std::map<std::string, std::string>& env,
                                      ClientOptions options)
{
    StdioOptions stdio;
    stdio.env = env;
    stdio.close_grace = options.close_grace;
    auto transport = std::make_unique<StdioTransport>(command, args, stdio);
    return std::make_unique<Client>(std::move(transport), std::move(options));
}

const InitializeResult& Client::initialize(const CallOptions& options)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (server_)
            return *server_;
    }

    Json params = {{"protocolVersion", options_.protocol_version},
                   {"capabilities", Json::object()},
                   {"clientInfo", options_.client_info}};

    Json result = connection_->call("initialize", params, with_defaults(options));
    auto init = decode<InitializeResult>(require_object(result, "initialize"), "initialize");
    if (init.protocol_version != options_.protocol_version)
        log::warn("client", "server answered with protocol " + init.protocol_version +
                                " (requested " + options_.protocol_version + ")");

    connection_->notify("notifications/initialized", Json::object());
    log::debug("client", "initialized with " + init.server_info.name + " " +
                             init.server_info.version);

    std::lock_guard<std::mutex> lock(state_mutex_);
    server_ = std::move(init);
    return *server_;
}

bool Client::initialized() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_.has_value();
}

const InitializeResult& Client::server() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!server_)
        throw NotInitializedError("client is not initialized");
    return *server_;
}

void Client::require_initialized() const
{
    if (!initialized())
        throw NotInitializedError("client is not initialized; call initialize() first");
}

CallOptions Client::with_defaults(const CallOptions& options) const
{
    CallOptions merged = options;
    if (merged.timeout.count() <= 0)
        merged.timeout = options_.default_timeout;
    return merged;
}

Json Client::call(const std::string& method, const Json& params, const CallOptions& options)
{
    require_initialized();
    return connection_->call(method, params, with_defaults(options));
}

std::vector<tools::ToolDescriptor> Client::list_tools(const CallOptions& options)
{
    return decode_list<tools::ToolDescriptor>(call("tools/list", Json::object(), options), "tools",
                                              "tools/list");
}

CallToolResult Client::call_tool(const std::string& name, const Json& arguments,
                                 const CallOptions& options)
{
    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    Json result = call("tools/call", params, options);
    return decode<CallToolResult>(require_object(result, "tools/call"), "tools/call");
}

std::vector<resources::ResourceDescriptor> Client::list_resources(const CallOptions& options)
{
    return decode_list<resources::ResourceDescriptor>(
        call("resources/list", Json::object(), options), "resources", "resources/list");
}

std::vector<resources::ResourceTemplate> Client::list_resource_templates(const CallOptions& options)
{
    return decode_list<resources::ResourceTemplate>(
        call("resources/templates/list", Json::object(), options), "resourceTemplates",
        "resources/templates/list");
}

std::vector<resources::ResourceContent> Client::read_resource(const std::string& uri,
                                                              const CallOptions& options)
{
    return decode_list<resources::ResourceContent>(
        call("resources/read", Json{{"uri", uri}}, options), "contents", "resources/read");
}

void Client::ping(const CallOptions& options)
{
    call("ping", Json::object(), options);
}

void Client::close()
{
    connection_->close();
}

} // namespace mcplink::client
