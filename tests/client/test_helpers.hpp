/// @file tests/client/test_helpers.hpp
/// @brief Scripted in-memory peer for connection and client tests
#pragma once

#include "mcplink/client/connection.hpp"
#include "mcplink/client/transports.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/util/json.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mcplink;

/// State shared between a test and the transport handed to a Connection.
/// The test plays the server: it inspects written frames and pushes replies.
struct ScriptedPeer
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> written;
    std::deque<std::string> inbound;
    bool eof = false;
    bool closed = false;
    bool fail_writes = false;
    /// Peer stops reading: writes block until the transport is closed
    bool stall_writes = false;
    int stalled_writes = 0;
    int close_count = 0;

    void push(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(mutex);
        inbound.push_back(line);
        cv.notify_all();
    }

    void push(const Json& message)
    {
        push(message.dump());
    }

    /// Simulate the peer closing its end
    void end()
    {
        std::lock_guard<std::mutex> lock(mutex);
        eof = true;
        cv.notify_all();
    }

    /// Block until at least n frames were written; returns them parsed
    std::vector<Json> wait_for_writes(size_t n,
                                      std::chrono::milliseconds limit = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex);
        bool ok = cv.wait_for(lock, limit, [&] { return written.size() >= n; });
        assert(ok);
        (void)ok;
        std::vector<Json> out;
        for (const auto& w : written)
            out.push_back(util::json::parse(w));
        return out;
    }

    size_t write_count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return written.size();
    }

    int stalled_count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return stalled_writes;
    }

    void resume_writes()
    {
        std::lock_guard<std::mutex> lock(mutex);
        stall_writes = false;
        cv.notify_all();
    }
};

class ScriptedTransport : public client::Transport
{
  public:
    explicit ScriptedTransport(std::shared_ptr<ScriptedPeer> peer) : peer_(std::move(peer)) {}

    void write_frame(const std::string& frame) override
    {
        std::unique_lock<std::mutex> lock(peer_->mutex);
        if (peer_->fail_writes)
            throw TransportError("scripted write failure");
        if (peer_->stall_writes && !peer_->closed)
        {
            peer_->stalled_writes++;
            peer_->cv.notify_all();
            peer_->cv.wait(lock, [this] { return !peer_->stall_writes || peer_->closed; });
        }
        if (peer_->closed)
            throw ConnectionClosedError("scripted transport closed");
        peer_->written.push_back(frame);
        peer_->cv.notify_all();
    }

    std::optional<std::string> read_line() override
    {
        std::unique_lock<std::mutex> lock(peer_->mutex);
        peer_->cv.wait(lock, [this]
                       { return !peer_->inbound.empty() || peer_->eof || peer_->closed; });
        if (peer_->inbound.empty())
            return std::nullopt;
        std::string line = std::move(peer_->inbound.front());
        peer_->inbound.pop_front();
        return line;
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(peer_->mutex);
        peer_->closed = true;
        peer_->close_count++;
        peer_->cv.notify_all();
    }

  private:
    std::shared_ptr<ScriptedPeer> peer_;
};

inline Json result_frame(const Json& id, const Json& result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

inline Json error_frame(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

/// Poll until pred() holds or the limit passes
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(5))
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
