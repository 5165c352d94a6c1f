#pragma once
#include "mcplink/client/cancellation.hpp"
#include "mcplink/client/transports.hpp"
#include "mcplink/mcp/frame.hpp"
#include "mcplink/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mcplink::client
{

/// Per-call options
struct CallOptions
{
    /// Deadline for the response (0 = no deadline)
    std::chrono::milliseconds timeout{0};

    /// Fires CancelledError in the waiting caller when cancelled
    CancellationToken cancel;
};

/// Request/response correlation over a Transport.
///
/// call() may be used from any number of threads. Each call gets a fresh id
/// from an atomic counter and a single-slot waiter in the pending map; one
/// background reader thread routes every inbound response to the waiter whose
/// id it carries, whatever order responses arrive in.
///
/// Outcomes of call():
/// - the peer's `result`                           -> returned
/// - a JSON-RPC error from the peer                -> RpcError (connection stays open)
/// - send failure, peer exit, close()              -> TransportError / ConnectionClosedError
/// - cancellation token or deadline                -> CancelledError / CallTimeoutError
///
/// Frames are written by a dedicated writer thread, so a peer that stops
/// reading never holds a caller past its deadline or cancellation. A request
/// whose caller gave up before it reached the wire is not sent. A response
/// that arrives after its caller gave up is dropped.
class Connection
{
  public:
    using NotificationHandler =
        std::function<void(const std::string& method, const Json& params)>;

    explicit Connection(std::unique_ptr<Transport> transport);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Issue a request and block for its outcome (see class comment)
    Json call(const std::string& method, const Json& params = Json(),
              const CallOptions& options = {});

    /// Send a notification; no response is expected. Returns once the frame
    /// has been handed to the transport.
    void notify(const std::string& method, const Json& params = Json());

    /// Close the transport, stop the reader and writer and fail every
    /// outstanding call with ConnectionClosedError. Rethrows a transport
    /// shutdown failure after the pending calls have been released. Idempotent.
    ///
    /// May be called from the notification handler. The reader thread is then
    /// joined by a later close() from another thread or by the destructor, so
    /// the handler must not destroy the Connection itself.
    void close();

    bool is_closed() const;

    /// Number of calls currently waiting for a response
    size_t pending_count() const;

    /// Handler for peer-initiated notifications (runs on the reader thread)
    void set_notification_handler(NotificationHandler handler);

  private:
    struct Waiter;

    struct Outbound
    {
        std::string frame;
        int64_t id{0};
        std::shared_ptr<Waiter> waiter;
        std::shared_ptr<std::promise<void>> sent;
    };

    bool enqueue(Outbound item);
    void stop_writer();
    void writer_loop();
    void reader_loop();
    void deliver(mcp::Response response);
    void dispatch_notification(const mcp::Notification& note);
    void reject_peer_request(const mcp::Request& request);
    void remove_pending(int64_t id, const std::shared_ptr<Waiter>& waiter);
    void fail_all(const std::string& reason);
    bool on_reader_thread() const;

    std::unique_ptr<Transport> transport_;
    std::atomic<int64_t> next_id_{0};

    mutable std::mutex pending_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<Waiter>> pending_;
    bool closed_{false};
    std::string close_reason_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    std::mutex out_mutex_;
    std::condition_variable out_cv_;
    std::deque<Outbound> outbox_;
    bool writer_stopped_{false};

    std::mutex close_mutex_;
    std::thread writer_;
    std::thread reader_;
    std::atomic<std::thread::id> reader_id_{};
    std::atomic<bool> shutdown_started_{false};
};

} // namespace mcplink::client
