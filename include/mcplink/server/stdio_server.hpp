#pragma once
#include "mcplink/server/server.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <thread>

namespace mcplink::server
{

/**
 * Line-delimited JSON-RPC loop around an McpServer.
 *
 * Reads one request per line from the input stream (stdin by default) and
 * writes one reply per line to the output stream (stdout by default). The
 * output stream carries protocol frames only; diagnostics go to stderr.
 *
 * Usage:
 *   auto server = std::make_shared<McpServer>("myserver", "1.0.0");
 *   server->tools().register_tool(...);
 *   StdioServerWrapper wrapper(server);
 *   wrapper.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    explicit StdioServerWrapper(std::shared_ptr<McpServer> server);

    /// Streams are borrowed and must outlive the wrapper
    StdioServerWrapper(std::shared_ptr<McpServer> server, std::istream& in, std::ostream& out);

    ~StdioServerWrapper();

    StdioServerWrapper(const StdioServerWrapper&) = delete;
    StdioServerWrapper& operator=(const StdioServerWrapper&) = delete;

    /**
     * Serve until EOF on the input stream or stop().
     *
     * @return false if the wrapper was already running
     */
    bool run();

    /// Run the loop on a background thread
    bool start_async();

    /**
     * Request the loop to stop and join the background thread, if any.
     * A loop blocked reading the input stream only notices at the next line
     * or at EOF. Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

  private:
    void run_loop();

    std::shared_ptr<McpServer> server_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;
};

} // namespace mcplink::server
