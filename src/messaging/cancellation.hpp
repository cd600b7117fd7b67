#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace agora::messaging {

namespace detail {
struct CancellationState;
} // namespace detail

// Keeps a cancellation callback registered. Destruction unregisters it and
// waits for the callback if it is currently running.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

private:
    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

// Observer side of a cancellation signal. A default-constructed token
// is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;
    bool can_be_cancelled() const { return state_ != nullptr; }

    // Callback runs on the cancelling thread. Nothing is registered if the
    // token is already cancelled; callers check is_cancelled() afterwards.
    CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;

    // Idempotent
    void cancel();
    bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// Deadline and cancellation for a suspending call. No deadline means wait
// until the operation completes, is cancelled or the mailbox closes.
struct WaitOptions {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    CancellationToken cancel;

    static WaitOptions forever() { return WaitOptions{}; }

    static WaitOptions until(std::chrono::steady_clock::time_point time) {
        WaitOptions options;
        options.deadline = time;
        return options;
    }

    template <typename Rep, typename Period>
    static WaitOptions within(std::chrono::duration<Rep, Period> timeout) {
        return until(std::chrono::steady_clock::now() +
                     std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

    WaitOptions with_cancel(CancellationToken token) const {
        WaitOptions options = *this;
        options.cancel = std::move(token);
        return options;
    }
};

} // namespace agora::messaging
