#include "mcplink/client/transports.hpp"

#include "../internal/child_process.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/server/server.hpp"
#include "mcplink/util/log.hpp"

namespace mcplink::client
{

// =============================================================================
// StdioTransport
// =============================================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args,
                               StdioOptions options)
    : command_(std::move(command)), args_(std::move(args)), options_(std::move(options)),
      process_(std::make_unique<process::Process>())
{
    process::ProcessOptions popts;
    popts.environment = options_.env;
    popts.working_directory = options_.working_directory;
    if (options_.stderr_log)
        popts.stderr_path = options_.stderr_log->string();

    try
    {
        process_->spawn(command_, args_, popts);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(std::string("StdioTransport: ") + e.what());
    }
    log::debug("stdio", "spawned '" + command_ + "' pid " + std::to_string(process_->pid()));
}

StdioTransport::~StdioTransport()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        log::warn("stdio", std::string("close during destruction: ") + e.what());
    }
}

void StdioTransport::write_frame(const std::string& frame)
{
    if (frame.find('\n') != std::string::npos)
        throw ValidationError("frame must not contain a newline");

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load())
        throw ConnectionClosedError("StdioTransport: transport closed");
    try
    {
        process_->stdin_pipe().write_all(frame + "\n");
    }
    catch (const process::ProcessError& e)
    {
        if (closed_.load())
            throw ConnectionClosedError("StdioTransport: transport closed");
        throw TransportError(std::string("StdioTransport: ") + e.what());
    }
}

std::optional<std::string> StdioTransport::read_line()
{
    try
    {
        return process_->stdout_pipe().read_line();
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(std::string("StdioTransport: ") + e.what());
    }
}

void StdioTransport::close()
{
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_.exchange(true))
        return;

    // Release a writer blocked on a full pipe before waiting for its lock
    process_->stdin_pipe().interrupt();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        process_->stdin_pipe().close();
    }

    // A well-behaved server exits on stdin EOF
    bool forced = false;
    std::optional<int> code;
    try
    {
        code = process_->wait_for(options_.close_grace);
        if (!code)
        {
            forced = true;
            log::warn("stdio", "'" + command_ + "' did not exit after stdin closed; terminating");
            process_->terminate();
            code = process_->wait_for(options_.close_grace);
        }
        if (!code)
        {
            process_->kill();
            code = process_->wait();
        }
    }
    catch (const process::ProcessError& e)
    {
        process_->stdout_pipe().interrupt();
        throw TransportError(std::string("StdioTransport: ") + e.what());
    }

    // Grandchildren may still hold stdout open; never leave the reader blocked
    process_->stdout_pipe().interrupt();
    exit_code_ = code;

    if (!forced && *code != 0)
        throw TransportError("StdioTransport: '" + command_ + "' exited with code " +
                             std::to_string(*code));
}

int StdioTransport::pid() const
{
    return process_->pid();
}

std::optional<int> StdioTransport::exit_code() const
{
    std::lock_guard<std::mutex> lock(close_mutex_);
    return exit_code_;
}

// =============================================================================
// InProcessTransport
// =============================================================================

InProcessTransport::InProcessTransport(std::shared_ptr<server::McpServer> server)
    : server_(std::move(server))
{
    worker_ = std::thread([this]() { serve(); });
}

InProcessTransport::~InProcessTransport()
{
    close();
    if (worker_.joinable())
        worker_.join();
}

void InProcessTransport::write_frame(const std::string& frame)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        throw ConnectionClosedError("InProcessTransport: transport closed");
    outbound_.push_back(frame);
    cv_.notify_all();
}

std::optional<std::string> InProcessTransport::read_line()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !inbound_.empty() || closed_; });
    if (inbound_.empty())
        return std::nullopt;
    std::string line = std::move(inbound_.front());
    inbound_.pop_front();
    return line;
}

void InProcessTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

void InProcessTransport::serve()
{
    for (;;)
    {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !outbound_.empty() || closed_; });
            if (closed_)
                return;
            frame = std::move(outbound_.front());
            outbound_.pop_front();
        }

        std::optional<std::string> reply;
        try
        {
            reply = server_->handle_line(frame);
        }
        catch (const std::exception& e)
        {
            log::error("inprocess", std::string("server failed to handle frame: ") + e.what());
            continue;
        }
        if (!reply)
            continue;

        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        inbound_.push_back(std::move(*reply));
        cv_.notify_all();
    }
}

} // namespace mcplink::client
