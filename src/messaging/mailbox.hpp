#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "messaging/cancellation.hpp"
#include "messaging/message.hpp"
#include "messaging/status.hpp"

namespace agora::messaging {

// What a bounded mailbox does with a send while at capacity
enum class OverflowPolicy {
    BLOCK,        // Suspend the sender until space frees up
    DROP_OLDEST,  // Evict the head message to make room
    REJECT        // Fail the send with MAILBOX_FULL
};

const char* overflow_policy_to_string(OverflowPolicy policy);
std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& str);

struct MailboxOptions {
    size_t capacity = 0;  // 0 = unbounded
    OverflowPolicy overflow = OverflowPolicy::BLOCK;
};

struct ReceiveResult {
    DeliveryStatus status = DeliveryStatus::OK;
    std::optional<Message> message;

    bool ok() const { return status == DeliveryStatus::OK && message.has_value(); }
};

// Per-agent FIFO inbox. Safe for any number of concurrent producers and
// consumers; every accepted message is handed to exactly one receiver.
class Mailbox {
public:
    using Predicate = std::function<bool(const Message&)>;

    explicit Mailbox(MailboxOptions options = {});

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    SendResult send(Message message, const WaitOptions& wait = WaitOptions::forever());

    // Suspends while empty. CLOSED is only reported once the queue is empty.
    ReceiveResult receive(const WaitOptions& wait = WaitOptions::forever());

    // Oldest message satisfying the predicate; everything else keeps its place
    ReceiveResult receive_matching(const Predicate& predicate,
                                   const WaitOptions& wait = WaitOptions::forever());

    std::optional<Message> try_receive();

    size_t size() const;
    bool is_empty() const;

    std::vector<Message> drain();

    // Rejects further sends and wakes all waiters
    void close();
    bool is_closed() const;

    uint64_t dropped_count() const;
    const MailboxOptions& options() const { return options_; }

private:
    DeliveryStatus wait_for(std::unique_lock<std::mutex>& lock,
                            std::condition_variable& cv,
                            const std::function<bool()>& ready,
                            const WaitOptions& wait);
    void wake_all();
    bool at_capacity() const;

    const MailboxOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Message> queue_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
    size_t selective_waiters_ = 0;
};

} // namespace agora::messaging
