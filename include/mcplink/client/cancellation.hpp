#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace mcplink::client
{

struct CancellationState;

/// Observer side of a cancellation signal. Default-constructed tokens never fire.
/// Copies share state with the CancellationSource that produced them.
class CancellationToken
{
  public:
    /// Deregisters its callback on destruction
    class Registration
    {
      public:
        Registration() = default;
        ~Registration()
        {
            reset();
        }
        Registration(Registration&& other) noexcept
            : token_(std::move(other.token_)), id_(other.id_)
        {
            other.id_ = 0;
        }
        Registration& operator=(Registration&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                token_ = std::move(other.token_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();

      private:
        friend class CancellationToken;
        std::shared_ptr<CancellationState> token_;
        uint64_t id_{0};
    };

    CancellationToken() = default;

    bool can_be_cancelled() const
    {
        return static_cast<bool>(state_);
    }
    bool is_cancelled() const;

    /// Run `fn` once when cancellation fires; immediately if it already has.
    /// The callback runs on the cancelling thread and must not block.
    Registration on_cancel(std::function<void()> fn) const;

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationState> state)
        : state_(std::move(state))
    {
    }
    std::shared_ptr<CancellationState> state_;
};

struct CancellationState
{
    std::mutex mutex;
    bool cancelled{false};
    uint64_t next_id{1};
    std::unordered_map<uint64_t, std::function<void()>> callbacks;
};

/// Owner side of a cancellation signal
class CancellationSource
{
  public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    CancellationToken token() const
    {
        return CancellationToken(state_);
    }

    /// Fire the signal; idempotent
    void cancel();

    bool is_cancelled() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

  private:
    std::shared_ptr<CancellationState> state_;
};

inline bool CancellationToken::is_cancelled() const
{
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

inline CancellationToken::Registration CancellationToken::on_cancel(std::function<void()> fn) const
{
    Registration reg;
    if (!state_)
        return reg;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled)
        {
            reg.token_ = state_;
            reg.id_ = state_->next_id++;
            state_->callbacks.emplace(reg.id_, std::move(fn));
            return reg;
        }
    }
    fn();
    return reg;
}

inline void CancellationToken::Registration::reset()
{
    if (!token_)
        return;
    {
        std::lock_guard<std::mutex> lock(token_->mutex);
        token_->callbacks.erase(id_);
    }
    token_.reset();
    id_ = 0;
}

inline void CancellationSource::cancel()
{
    std::unordered_map<uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    for (auto& [id, fn] : callbacks)
        fn();
}

} // namespace mcplink::client
