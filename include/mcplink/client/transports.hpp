#pragma once
#include "mcplink/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcplink::process
{
class Process;
}

namespace mcplink::server
{
class McpServer;
}

namespace mcplink::client
{

/// Duplex, newline-delimited frame channel to one peer.
///
/// write_frame() may be called from many threads at once; implementations
/// serialize writes so frames never interleave. read_line() is called from a
/// single reader thread. close() must release both a reader blocked in
/// read_line() and a writer blocked in write_frame().
class Transport
{
  public:
    virtual ~Transport() = default;

    /// Send one frame; the implementation appends the newline delimiter
    virtual void write_frame(const std::string& frame) = 0;

    /// Next inbound frame without its delimiter; nullopt on EOF
    virtual std::optional<std::string> read_line() = 0;

    /// Tear down the channel. Throws TransportError if the peer failed.
    virtual void close() = 0;
};

struct StdioOptions
{
    /// Variables added to (or overriding) the inherited environment
    std::map<std::string, std::string> env;
    /// Append child stderr here instead of inheriting ours
    std::optional<std::filesystem::path> stderr_log;
    std::string working_directory;
    /// After stdin is closed, how long to wait before SIGTERM (and again before SIGKILL)
    std::chrono::milliseconds close_grace{2000};
};

/// Launches an MCP server as a subprocess and speaks to it over its stdin/stdout.
class StdioTransport : public Transport
{
  public:
    /// Spawns immediately; throws TransportError if the command cannot be started.
    explicit StdioTransport(std::string command, std::vector<std::string> args = {},
                            StdioOptions options = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void write_frame(const std::string& frame) override;
    std::optional<std::string> read_line() override;

    /// Close the child's stdin and reap it. A non-zero exit status is reported
    /// as TransportError unless the child had to be terminated by us.
    void close() override;

    int pid() const;
    /// Exit status once close() has reaped the child
    std::optional<int> exit_code() const;
    const std::string& command() const
    {
        return command_;
    }

  private:
    std::string command_;
    std::vector<std::string> args_;
    StdioOptions options_;
    std::unique_ptr<process::Process> process_;
    std::mutex write_mutex_;
    mutable std::mutex close_mutex_;
    std::atomic<bool> closed_{false};
    std::optional<int> exit_code_;
};

/// Transport whose peer is an McpServer living in this process.
/// Written frames are queued and handled in order on a worker thread; the
/// reply (if any) is queued for read_line(). close() returns at once, while
/// the destructor waits for a handler that is still running.
class InProcessTransport : public Transport
{
  public:
    explicit InProcessTransport(std::shared_ptr<server::McpServer> server);
    ~InProcessTransport() override;

    InProcessTransport(const InProcessTransport&) = delete;
    InProcessTransport& operator=(const InProcessTransport&) = delete;

    void write_frame(const std::string& frame) override;
    std::optional<std::string> read_line() override;
    void close() override;

  private:
    void serve();

    std::shared_ptr<server::McpServer> server_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> outbound_;
    std::deque<std::string> inbound_;
    bool closed_{false};
    std::thread worker_;
};

} // namespace mcplink::client
