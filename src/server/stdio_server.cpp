#include "mcplink/server/stdio_server.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/log.hpp"

#include <iostream>
#include <string>

namespace mcplink::server
{

StdioServerWrapper::StdioServerWrapper(std::shared_ptr<McpServer> server)
    : StdioServerWrapper(std::move(server), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(std::shared_ptr<McpServer> server, std::istream& in,
                                       std::ostream& out)
    : server_(std::move(server)), in_(in), out_(out)
{
    if (!server_)
        throw ValidationError("StdioServerWrapper requires a server");
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::optional<std::string> reply;
        try
        {
            reply = server_->handle_line(line);
        }
        catch (const std::exception& e)
        {
            // handle_line() reports protocol failures as replies; anything
            // escaping it is a bug in a registered callback
            log::error("stdio_server", std::string("unhandled error: ") + e.what());
            continue;
        }
        catch (...)
        {
            log::error("stdio_server", "unhandled non-standard exception");
            continue;
        }

        if (reply)
        {
            out_ << *reply << '\n';
            out_.flush();
        }
    }

    log::debug("stdio_server", stop_requested_ ? "stopped" : "input closed");
    running_ = false;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    run_loop();

    return true;
}

bool StdioServerWrapper::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace mcplink::server
