#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "messaging/router.hpp"

namespace agora::protocols {

constexpr std::chrono::milliseconds kDefaultReplyTimeout{5000};

enum class ExchangeState {
    IDLE,
    REQUEST_SENT,
    REPLIED,
    TIMED_OUT,
    CANCELLED
};

const char* exchange_state_to_string(ExchangeState state);

struct RequestResult {
    messaging::DeliveryStatus status = messaging::DeliveryStatus::OK;
    std::optional<messaging::Message> request;  // As routed, with its conversation id

    bool ok() const { return status == messaging::DeliveryStatus::OK; }
};

struct ReplyResult {
    messaging::DeliveryStatus status = messaging::DeliveryStatus::OK;
    ExchangeState state = ExchangeState::IDLE;
    std::optional<messaging::Message> reply;

    bool ok() const { return status == messaging::DeliveryStatus::OK && reply.has_value(); }
};

/**
 * Synchronous request/reply between two registered agents, layered on
 * Router::route and Mailbox selective receive.
 *
 * Replies are matched on conversation id and in_reply_to. While the
 * requester waits, unrelated messages stay queued in its mailbox in
 * arrival order; nothing is consumed except the matching reply.
 * Requests are sent at most once and never retracted on timeout.
 */
class RequestReply {
public:
    RequestReply(messaging::Router& router,
                 messaging::AgentId requester,
                 messaging::AgentId responder,
                 std::chrono::milliseconds default_timeout = kDefaultReplyTimeout);

    // Requester side
    RequestResult send_request(const messaging::Message& request);
    RequestResult send_request(messaging::Performative performative, const std::string& content);

    // Without a deadline in `wait`, the conversation's deadline
    // (send time + default timeout) applies.
    ReplyResult receive_reply(const messaging::Message& request,
                              const messaging::WaitOptions& wait = messaging::WaitOptions{});

    ReplyResult request(const messaging::Message& request,
                        const messaging::WaitOptions& wait = messaging::WaitOptions{});

    // Responder side
    messaging::ReceiveResult receive_request(const messaging::WaitOptions& wait = messaging::WaitOptions::forever());
    messaging::ReceiveResult receive_request(messaging::Performative expected,
                                             const messaging::WaitOptions& wait = messaging::WaitOptions::forever());

    messaging::SendResult send_reply(const messaging::Message& request,
                                     messaging::Performative performative,
                                     const std::string& content);
    // The reply must go from responder to requester and answer the request
    // currently pending in its conversation; otherwise INVALID_MESSAGE.
    messaging::SendResult send_reply(const messaging::Message& reply);

    size_t pending_count() const;
    ExchangeState state(const std::string& conversation_id) const;

    messaging::AgentId requester() const { return requester_; }
    messaging::AgentId responder() const { return responder_; }
    std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
    struct Conversation {
        messaging::MessageId request_id;
        std::chrono::steady_clock::time_point deadline;
        ExchangeState state = ExchangeState::IDLE;
    };

    // Resolves the exchange only if the record still belongs to request_id
    // and is in REQUEST_SENT; otherwise returns NO_PENDING_REQUEST.
    ReplyResult resolve(const std::string& conversation_id,
                        messaging::MessageId request_id,
                        messaging::DeliveryStatus status,
                        std::optional<messaging::Message> reply);

    messaging::Router& router_;
    messaging::AgentId requester_;
    messaging::AgentId responder_;
    std::chrono::milliseconds default_timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Conversation> conversations_;
};

} // namespace agora::protocols
