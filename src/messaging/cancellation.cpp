#include "messaging/cancellation.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace agora::messaging {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

CancellationRegistration::CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (!state_) {
        return;
    }
    // cancel() runs callbacks under this mutex, so taking it here also
    // waits out a callback that is in progress.
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

bool CancellationToken::is_cancelled() const {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.load(std::memory_order_acquire)) {
        return {};
    }
    uint64_t id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return CancellationRegistration(state_, id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

void CancellationSource::cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    for (auto& [id, callback] : state_->callbacks) {
        callback();
    }
    state_->callbacks.clear();
}

bool CancellationSource::is_cancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace agora::messaging
