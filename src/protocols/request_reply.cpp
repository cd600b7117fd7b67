#include "protocols/request_reply.hpp"
#include <spdlog/spdlog.h>

namespace agora::protocols {

using messaging::DeliveryStatus;
using messaging::Message;
using messaging::WaitOptions;

const char* exchange_state_to_string(ExchangeState state) {
    switch (state) {
        case ExchangeState::IDLE:         return "IDLE";
        case ExchangeState::REQUEST_SENT: return "REQUEST_SENT";
        case ExchangeState::REPLIED:      return "REPLIED";
        case ExchangeState::TIMED_OUT:    return "TIMED_OUT";
        case ExchangeState::CANCELLED:    return "CANCELLED";
        default: return "UNKNOWN";
    }
}

RequestReply::RequestReply(messaging::Router& router,
                           messaging::AgentId requester,
                           messaging::AgentId responder,
                           std::chrono::milliseconds default_timeout)
    : router_(router),
      requester_(requester),
      responder_(responder),
      default_timeout_(default_timeout) {}

RequestResult RequestReply::send_request(const Message& request) {
    if (request.sender() != requester_ || request.receiver() != responder_) {
        spdlog::warn("Request {} does not go from {} to {}", request.id().to_string(),
                     requester_.to_string(), responder_.to_string());
        return RequestResult{DeliveryStatus::INVALID_MESSAGE, std::nullopt};
    }

    Message outgoing = request.conversation_id()
        ? request
        : request.with_conversation_id(messaging::new_conversation_id());
    const std::string& conversation_id = *outgoing.conversation_id();

    // Reserve the conversation in IDLE so a concurrent request cannot reuse it
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conversations_.count(conversation_id) > 0) {
            spdlog::warn("Conversation {} already has a request in flight", conversation_id);
            return RequestResult{DeliveryStatus::INVALID_MESSAGE, std::nullopt};
        }
        conversations_[conversation_id] = Conversation{outgoing.id(), {}, ExchangeState::IDLE};
    }

    auto result = router_.route(outgoing);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!result.ok()) {
            conversations_.erase(conversation_id);
        } else {
            auto& conversation = conversations_[conversation_id];
            conversation.deadline = std::chrono::steady_clock::now() + default_timeout_;
            conversation.state = ExchangeState::REQUEST_SENT;
        }
    }

    if (!result.ok()) {
        spdlog::warn("Request {} in conversation {} not delivered: {}", outgoing.id().to_string(),
                     conversation_id, messaging::delivery_status_to_string(result.status));
        return RequestResult{result.status, std::nullopt};
    }

    spdlog::debug("Conversation {}: request {} sent to {}", conversation_id,
                  outgoing.id().to_string(), responder_.to_string());
    return RequestResult{DeliveryStatus::OK, std::move(outgoing)};
}

RequestResult RequestReply::send_request(messaging::Performative performative, const std::string& content) {
    return send_request(Message(requester_, responder_, performative, content));
}

ReplyResult RequestReply::receive_reply(const Message& request, const WaitOptions& wait) {
    if (!request.conversation_id()) {
        return ReplyResult{DeliveryStatus::NO_PENDING_REQUEST, ExchangeState::IDLE, std::nullopt};
    }
    const std::string conversation_id = *request.conversation_id();

    WaitOptions effective = wait;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end() || it->second.request_id != request.id()) {
            return ReplyResult{DeliveryStatus::NO_PENDING_REQUEST, ExchangeState::IDLE, std::nullopt};
        }
        if (!effective.deadline) {
            effective.deadline = it->second.deadline;
        }
    }

    auto inbox = router_.mailbox(requester_);
    if (!inbox) {
        return resolve(conversation_id, request.id(), DeliveryStatus::UNKNOWN_AGENT, std::nullopt);
    }

    const auto request_id = request.id();
    auto result = inbox->receive_matching(
        [&conversation_id, request_id](const Message& candidate) {
            return candidate.conversation_id() == conversation_id &&
                   candidate.in_reply_to() == request_id;
        },
        effective);

    return resolve(conversation_id, request_id, result.status, std::move(result.message));
}

ReplyResult RequestReply::request(const Message& request, const WaitOptions& wait) {
    auto sent = send_request(request);
    if (!sent.ok()) {
        return ReplyResult{sent.status, ExchangeState::IDLE, std::nullopt};
    }
    return receive_reply(*sent.request, wait);
}

messaging::ReceiveResult RequestReply::receive_request(const WaitOptions& wait) {
    auto inbox = router_.mailbox(responder_);
    if (!inbox) {
        return messaging::ReceiveResult{DeliveryStatus::UNKNOWN_AGENT, std::nullopt};
    }
    return inbox->receive(wait);
}

messaging::ReceiveResult RequestReply::receive_request(messaging::Performative expected, const WaitOptions& wait) {
    auto inbox = router_.mailbox(responder_);
    if (!inbox) {
        return messaging::ReceiveResult{DeliveryStatus::UNKNOWN_AGENT, std::nullopt};
    }
    return inbox->receive_matching(
        [expected](const Message& candidate) { return candidate.performative() == expected; },
        wait);
}

messaging::SendResult RequestReply::send_reply(const Message& request,
                                               messaging::Performative performative,
                                               const std::string& content) {
    if (!request.conversation_id()) {
        return messaging::SendResult{DeliveryStatus::INVALID_MESSAGE};
    }

    Message reply = Message(responder_, request.sender(), performative, content)
        .with_conversation_id(*request.conversation_id())
        .with_reply_to(request.id());
    return send_reply(reply);
}

messaging::SendResult RequestReply::send_reply(const Message& reply) {
    if (!reply.in_reply_to() || !reply.conversation_id()) {
        spdlog::warn("Reply {} lacks conversation correlation", reply.id().to_string());
        return messaging::SendResult{DeliveryStatus::INVALID_MESSAGE};
    }
    if (reply.sender() != responder_ || reply.receiver() != requester_) {
        spdlog::warn("Reply {} does not go from {} to {}", reply.id().to_string(),
                     responder_.to_string(), requester_.to_string());
        return messaging::SendResult{DeliveryStatus::INVALID_MESSAGE};
    }

    // The record may still be IDLE when the responder answers before
    // send_request has finished routing.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conversations_.find(*reply.conversation_id());
        if (it == conversations_.end() || it->second.request_id != *reply.in_reply_to()) {
            spdlog::warn("Reply {} answers {} which is not pending in conversation {}",
                         reply.id().to_string(), reply.in_reply_to()->to_string(),
                         *reply.conversation_id());
            return messaging::SendResult{DeliveryStatus::INVALID_MESSAGE};
        }
    }

    auto result = router_.route(reply);
    if (result.ok()) {
        spdlog::debug("Conversation {}: reply {} to request {}", *reply.conversation_id(),
                      reply.id().to_string(), reply.in_reply_to()->to_string());
    }
    return result;
}

size_t RequestReply::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

ExchangeState RequestReply::state(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return ExchangeState::IDLE;
    }
    return it->second.state;
}

ReplyResult RequestReply::resolve(const std::string& conversation_id,
                                  messaging::MessageId request_id,
                                  DeliveryStatus status,
                                  std::optional<Message> reply) {
    ExchangeState final_state;
    switch (status) {
        case DeliveryStatus::OK:        final_state = ExchangeState::REPLIED; break;
        case DeliveryStatus::TIMED_OUT: final_state = ExchangeState::TIMED_OUT; break;
        default:                        final_state = ExchangeState::CANCELLED; break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end() || it->second.request_id != request_id ||
            it->second.state != ExchangeState::REQUEST_SENT) {
            // Another waiter already resolved this exchange. A reply taken
            // from the mailbox meanwhile is handed back, not dropped.
            spdlog::debug("Conversation {}: request {} already resolved", conversation_id,
                          request_id.to_string());
            return ReplyResult{DeliveryStatus::NO_PENDING_REQUEST, ExchangeState::IDLE, std::move(reply)};
        }
        conversations_.erase(it);
    }

    if (status == DeliveryStatus::TIMED_OUT) {
        spdlog::warn("Conversation {}: no reply from {} before deadline",
                     conversation_id, responder_.to_string());
    } else if (status != DeliveryStatus::OK) {
        spdlog::info("Conversation {} ended: {}", conversation_id,
                     messaging::delivery_status_to_string(status));
    }

    return ReplyResult{status, final_state, std::move(reply)};
}

} // namespace agora::protocols
