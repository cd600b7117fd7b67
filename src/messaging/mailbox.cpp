#include "messaging/mailbox.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace agora::messaging {

const char* overflow_policy_to_string(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::BLOCK:       return "block";
        case OverflowPolicy::DROP_OLDEST: return "drop-oldest";
        case OverflowPolicy::REJECT:      return "reject";
        default: return "unknown";
    }
}

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "block") return OverflowPolicy::BLOCK;
    if (lower == "drop-oldest" || lower == "drop_oldest") return OverflowPolicy::DROP_OLDEST;
    if (lower == "reject") return OverflowPolicy::REJECT;
    return std::nullopt;
}

Mailbox::Mailbox(MailboxOptions options) : options_(options) {}

SendResult Mailbox::send(Message message, const WaitOptions& wait) {
    CancellationRegistration registration;
    if (options_.capacity > 0 && options_.overflow == OverflowPolicy::BLOCK &&
        wait.cancel.can_be_cancelled()) {
        registration = wait.cancel.on_cancel([this]() { wake_all(); });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return SendResult{DeliveryStatus::CLOSED};
    }

    if (at_capacity()) {
        switch (options_.overflow) {
            case OverflowPolicy::REJECT:
                spdlog::debug("Mailbox full ({}), rejected {}", options_.capacity, message.id().to_string());
                return SendResult{DeliveryStatus::MAILBOX_FULL};

            case OverflowPolicy::DROP_OLDEST:
                spdlog::warn("Mailbox full ({}), dropping oldest message {}",
                             options_.capacity, queue_.front().id().to_string());
                queue_.pop_front();
                dropped_++;
                break;

            case OverflowPolicy::BLOCK: {
                auto status = wait_for(lock, not_full_, [this]() { return !at_capacity(); }, wait);
                if (status != DeliveryStatus::OK) {
                    // Pass on a wakeup this sender may have absorbed
                    if (!at_capacity()) {
                        not_full_.notify_one();
                    }
                    if (status == DeliveryStatus::TIMED_OUT) {
                        return SendResult{DeliveryStatus::MAILBOX_FULL};
                    }
                    return SendResult{status};
                }
                break;
            }
        }
    }

    queue_.push_back(std::move(message));

    // Selective receivers may not want this message, so a single wakeup
    // could land on the wrong waiter.
    if (selective_waiters_ > 0) {
        not_empty_.notify_all();
    } else {
        not_empty_.notify_one();
    }
    return SendResult{DeliveryStatus::OK};
}

ReceiveResult Mailbox::receive(const WaitOptions& wait) {
    CancellationRegistration registration;
    if (wait.cancel.can_be_cancelled()) {
        registration = wait.cancel.on_cancel([this]() { wake_all(); });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto status = wait_for(lock, not_empty_, [this]() { return !queue_.empty(); }, wait);
    if (status != DeliveryStatus::OK) {
        return ReceiveResult{status, std::nullopt};
    }

    ReceiveResult result{DeliveryStatus::OK, std::move(queue_.front())};
    queue_.pop_front();
    not_full_.notify_one();
    return result;
}

ReceiveResult Mailbox::receive_matching(const Predicate& predicate, const WaitOptions& wait) {
    CancellationRegistration registration;
    if (wait.cancel.can_be_cancelled()) {
        registration = wait.cancel.on_cancel([this]() { wake_all(); });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    std::deque<Message>::iterator found;
    auto ready = [&]() {
        found = std::find_if(queue_.begin(), queue_.end(), predicate);
        return found != queue_.end();
    };

    selective_waiters_++;
    auto status = wait_for(lock, not_empty_, ready, wait);
    selective_waiters_--;

    if (status != DeliveryStatus::OK) {
        return ReceiveResult{status, std::nullopt};
    }

    ReceiveResult result{DeliveryStatus::OK, std::move(*found)};
    queue_.erase(found);
    not_full_.notify_one();
    return result;
}

std::optional<Message> Mailbox::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    std::optional<Message> message(std::move(queue_.front()));
    queue_.pop_front();
    not_full_.notify_one();
    return message;
}

size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Mailbox::is_empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::vector<Message> Mailbox::drain() {
    std::vector<Message> messages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages.reserve(queue_.size());
        while (!queue_.empty()) {
            messages.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
    }
    not_full_.notify_all();
    return messages;
}

void Mailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool Mailbox::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

uint64_t Mailbox::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

DeliveryStatus Mailbox::wait_for(std::unique_lock<std::mutex>& lock,
                                 std::condition_variable& cv,
                                 const std::function<bool()>& ready,
                                 const WaitOptions& wait) {
    while (true) {
        if (ready()) {
            return DeliveryStatus::OK;
        }
        if (closed_) {
            return DeliveryStatus::CLOSED;
        }
        if (wait.cancel.is_cancelled()) {
            return DeliveryStatus::CANCELLED;
        }
        if (wait.deadline) {
            if (std::chrono::steady_clock::now() >= *wait.deadline) {
                return DeliveryStatus::TIMED_OUT;
            }
            cv.wait_until(lock, *wait.deadline);
        } else {
            cv.wait(lock);
        }
    }
}

void Mailbox::wake_all() {
    // Taking the lock orders the wakeup after any waiter's predicate check
    { std::lock_guard<std::mutex> lock(mutex_); }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool Mailbox::at_capacity() const {
    return options_.capacity > 0 && queue_.size() >= options_.capacity;
}

} // namespace agora::messaging
