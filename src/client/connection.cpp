#include "mcplink/client/connection.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/log.hpp"

#include <condition_variable>
#include <optional>
#include <vector>

namespace mcplink::client
{

struct Connection::Waiter
{
    enum class State
    {
        Pending,
        Responded,
        Failed,
        Abandoned
    };

    std::mutex mutex;
    std::condition_variable cv;
    State state{State::Pending};
    bool cancelled{false};
    mcp::Response response;
    std::exception_ptr error;

    // Each waiter is resolved at most once; later attempts are no-ops.
    bool resolve(mcp::Response resp)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Pending)
            return false;
        response = std::move(resp);
        state = State::Responded;
        cv.notify_all();
        return true;
    }

    bool fail(std::exception_ptr err)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Pending)
            return false;
        error = std::move(err);
        state = State::Failed;
        cv.notify_all();
        return true;
    }

    void wake_cancelled()
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
        cv.notify_all();
    }

    bool abandoned()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return state == State::Abandoned;
    }
};

namespace
{

using Clock = std::chrono::steady_clock;

// No deadline for a zero timeout or one too large to add to now().
std::optional<Clock::time_point> deadline_after(std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
        return std::nullopt;
    const auto now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom)
        return std::nullopt;
    return now + timeout;
}

} // namespace

Connection::Connection(std::unique_ptr<Transport> transport) : transport_(std::move(transport))
{
    if (!transport_)
        throw ValidationError("Connection requires a transport");
    writer_ = std::thread([this]() { writer_loop(); });
    try
    {
        reader_ = std::thread([this]() { reader_loop(); });
    }
    catch (...)
    {
        stop_writer();
        writer_.join();
        throw;
    }
}

Connection::~Connection()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        log::warn("connection", std::string("close during destruction: ") + e.what());
    }

    // Only reachable when the connection is destroyed from its own reader
    // thread, after close() skipped the joins.
    if (writer_.joinable())
        writer_.join();
    if (reader_.joinable())
        reader_.detach();
}

Json Connection::call(const std::string& method, const Json& params, const CallOptions& options)
{
    if (options.cancel.is_cancelled())
        throw CancelledError(method + " cancelled");

    const int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto waiter = std::make_shared<Waiter>();

    mcp::Request request;
    request.id = id;
    request.method = method;
    if (!params.is_null())
        request.params = params;
    std::string frame = mcp::encode(request);

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_)
            throw ConnectionClosedError(close_reason_);
        pending_.emplace(id, waiter);
    }

    // Both the deadline and the cancellation cover the time spent queued
    // behind, or blocked in, the transport write.
    auto registration = options.cancel.on_cancel([waiter]() { waiter->wake_cancelled(); });
    const auto deadline = deadline_after(options.timeout);

    if (!enqueue(Outbound{std::move(frame), id, waiter, nullptr}))
    {
        remove_pending(id, waiter);
        throw ConnectionClosedError("connection closed");
    }

    std::unique_lock<std::mutex> lock(waiter->mutex);
    auto settled = [&waiter]()
    { return waiter->state != Waiter::State::Pending || waiter->cancelled; };

    bool timed_out = false;
    if (deadline)
        timed_out = !waiter->cv.wait_until(lock, *deadline, settled);
    else
        waiter->cv.wait(lock, settled);

    if (waiter->state == Waiter::State::Responded)
    {
        mcp::Response response = std::move(waiter->response);
        lock.unlock();
        if (response.error)
            throw RpcError(response.error->code, response.error->message);
        return response.result ? std::move(*response.result) : Json();
    }

    if (waiter->state == Waiter::State::Failed)
        std::rethrow_exception(waiter->error);

    waiter->state = Waiter::State::Abandoned;
    lock.unlock();
    remove_pending(id, waiter);

    if (timed_out)
        throw CallTimeoutError(method + " timed out after " +
                               std::to_string(options.timeout.count()) + " ms");
    throw CancelledError(method + " cancelled");
}

void Connection::notify(const std::string& method, const Json& params)
{
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_)
            throw ConnectionClosedError(close_reason_);
    }

    mcp::Notification note;
    note.method = method;
    if (!params.is_null())
        note.params = params;

    auto sent = std::make_shared<std::promise<void>>();
    auto written = sent->get_future();
    if (!enqueue(Outbound{mcp::encode(note), 0, nullptr, sent}))
        throw ConnectionClosedError("connection closed");
    written.get();
}

void Connection::close()
{
    if (on_reader_thread())
    {
        // Called from the notification handler: the reader cannot join itself.
        // The joins are left to a later close() or to the destructor.
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            if (!closed_)
            {
                closed_ = true;
                close_reason_ = "connection closed";
            }
        }
        std::exception_ptr shutdown_error;
        if (!shutdown_started_.exchange(true))
        {
            try
            {
                transport_->close();
            }
            catch (const std::exception&)
            {
                shutdown_error = std::current_exception();
            }
        }
        stop_writer();
        fail_all("connection closed");
        if (shutdown_error)
            std::rethrow_exception(shutdown_error);
        return;
    }

    std::lock_guard<std::mutex> close_lock(close_mutex_);
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_ && shutdown_started_ && !reader_.joinable() && !writer_.joinable())
            return;
        if (!closed_)
        {
            closed_ = true;
            close_reason_ = "connection closed";
        }
    }

    // Closing the transport first interrupts a writer blocked on a full pipe
    // and a reader blocked on an idle one.
    std::exception_ptr shutdown_error;
    if (!shutdown_started_.exchange(true))
    {
        try
        {
            transport_->close();
        }
        catch (const std::exception&)
        {
            shutdown_error = std::current_exception();
        }
    }

    stop_writer();
    if (writer_.joinable())
        writer_.join();
    if (reader_.joinable())
        reader_.join();

    fail_all("connection closed");

    if (shutdown_error)
        std::rethrow_exception(shutdown_error);
}

bool Connection::is_closed() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return closed_;
}

size_t Connection::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void Connection::set_notification_handler(NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

bool Connection::enqueue(Outbound item)
{
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        if (writer_stopped_)
            return false;
        outbox_.push_back(std::move(item));
    }
    out_cv_.notify_one();
    return true;
}

void Connection::stop_writer()
{
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        writer_stopped_ = true;
    }
    out_cv_.notify_all();
}

void Connection::writer_loop()
{
    for (;;)
    {
        Outbound item;
        {
            std::unique_lock<std::mutex> lock(out_mutex_);
            out_cv_.wait(lock, [this]() { return writer_stopped_ || !outbox_.empty(); });
            if (writer_stopped_)
                break;
            item = std::move(outbox_.front());
            outbox_.pop_front();
        }

        // The caller gave up before the request reached the wire
        if (item.waiter && item.waiter->abandoned())
            continue;

        try
        {
            transport_->write_frame(item.frame);
            if (item.sent)
                item.sent->set_value();
        }
        catch (const std::exception& e)
        {
            std::exception_ptr error;
            if (is_closed())
                error = std::make_exception_ptr(ConnectionClosedError("connection closed"));
            else if (dynamic_cast<const TransportError*>(&e))
                error = std::current_exception();
            else
                error = std::make_exception_ptr(
                    TransportError(std::string("failed to send frame: ") + e.what()));

            if (item.waiter)
            {
                remove_pending(item.id, item.waiter);
                item.waiter->fail(error);
            }
            if (item.sent)
                item.sent->set_exception(error);
            else if (!item.waiter)
                log::warn("connection", std::string("could not send frame: ") + e.what());
        }
    }

    // Notifications that never reached the wire; their callers are waiting
    std::deque<Outbound> unsent;
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        unsent.swap(outbox_);
    }
    for (auto& item : unsent)
    {
        if (item.sent)
            item.sent->set_exception(
                std::make_exception_ptr(ConnectionClosedError("connection closed")));
    }
}

void Connection::reader_loop()
{
    reader_id_.store(std::this_thread::get_id());
    std::string reason = "connection closed by peer";
    try
    {
        while (auto line = transport_->read_line())
        {
            if (line->empty())
                continue;

            mcp::Frame frame;
            try
            {
                frame = mcp::decode_line(*line);
            }
            catch (const ValidationError& e)
            {
                log::warn("connection", std::string("skipping malformed frame: ") + e.what());
                continue;
            }

            switch (frame.kind)
            {
            case mcp::FrameKind::Response:
                deliver(std::move(frame.response));
                break;
            case mcp::FrameKind::Notification:
                dispatch_notification(frame.notification);
                break;
            case mcp::FrameKind::Request:
                reject_peer_request(frame.request);
                break;
            }
        }
    }
    catch (const std::exception& e)
    {
        reason = std::string("connection lost: ") + e.what();
        log::error("connection", reason);
    }

    fail_all(reason);
}

void Connection::deliver(mcp::Response response)
{
    auto id = response.int_id();
    if (!id)
    {
        log::warn("connection", "skipping response with non-integer id " + response.id.dump());
        return;
    }

    std::shared_ptr<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*id);
        if (it == pending_.end())
        {
            log::debug("connection", "dropping response for id " + std::to_string(*id) +
                                         " with no pending call");
            return;
        }
        waiter = std::move(it->second);
        pending_.erase(it);
    }
    waiter->resolve(std::move(response));
}

void Connection::dispatch_notification(const mcp::Notification& note)
{
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (!handler)
    {
        log::debug("connection", "ignoring notification " + note.method);
        return;
    }
    try
    {
        handler(note.method, note.params.value_or(Json::object()));
    }
    catch (const std::exception& e)
    {
        log::warn("connection", "notification handler for " + note.method + " failed: " + e.what());
    }
}

void Connection::reject_peer_request(const mcp::Request& request)
{
    auto reply = mcp::make_error(request.id, mcp::METHOD_NOT_FOUND,
                                 "Method not handled: " + request.method);
    if (!enqueue(Outbound{mcp::encode(reply), 0, nullptr, nullptr}))
        log::debug("connection", "not answering " + request.method + " on a closed connection");
}

void Connection::remove_pending(int64_t id, const std::shared_ptr<Waiter>& waiter)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it != pending_.end() && it->second == waiter)
        pending_.erase(it);
}

void Connection::fail_all(const std::string& reason)
{
    std::vector<std::shared_ptr<Waiter>> waiters;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!closed_)
        {
            closed_ = true;
            close_reason_ = reason;
        }
        waiters.reserve(pending_.size());
        for (auto& [id, waiter] : pending_)
            waiters.push_back(std::move(waiter));
        pending_.clear();
    }
    auto error = std::make_exception_ptr(ConnectionClosedError(reason));
    for (auto& waiter : waiters)
        waiter->fail(error);
}

bool Connection::on_reader_thread() const
{
    return std::this_thread::get_id() == reader_id_.load();
}

} // namespace mcplink::client
