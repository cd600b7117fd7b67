#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "messaging/ids.hpp"
#include "messaging/performative.hpp"

namespace agora::messaging {

// Unit of communication between agents. Values are immutable; the with_*
// helpers return modified copies.
class Message {
public:
    Message(AgentId sender, AgentId receiver, Performative performative, std::string content);

    MessageId id() const { return id_; }
    AgentId sender() const { return sender_; }
    AgentId receiver() const { return receiver_; }
    Performative performative() const { return performative_; }
    const std::string& content() const { return content_; }
    const std::optional<std::string>& conversation_id() const { return conversation_id_; }
    const std::optional<MessageId>& in_reply_to() const { return in_reply_to_; }
    const std::optional<std::string>& topic() const { return topic_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    bool is_reply() const { return in_reply_to_.has_value(); }

    // Same id, extra correlation data
    Message with_conversation_id(std::string conversation_id) const;
    Message with_reply_to(MessageId request_id) const;
    Message with_topic(std::string topic) const;

    // Copy for another receiver. Gets a fresh id so delivery history
    // tracks each copy separately.
    Message readdressed(AgentId receiver) const;

private:
    MessageId id_;
    AgentId sender_;
    AgentId receiver_;
    Performative performative_;
    std::string content_;
    std::optional<std::string> conversation_id_;
    std::optional<MessageId> in_reply_to_;
    std::optional<std::string> topic_;
    std::chrono::system_clock::time_point created_at_;
};

// Diagnostic view (logs, stats dumps). Not a wire format.
nlohmann::json to_json(const Message& message);

// Fluent construction. build() throws std::invalid_argument when a
// required field (sender, receiver, performative, content) is missing.
class MessageBuilder {
public:
    MessageBuilder& sender(AgentId sender);
    MessageBuilder& receiver(AgentId receiver);
    MessageBuilder& performative(Performative performative);
    MessageBuilder& content(std::string content);
    MessageBuilder& conversation_id(std::string conversation_id);
    MessageBuilder& in_reply_to(MessageId request_id);
    MessageBuilder& topic(std::string topic);

    Message build() const;

private:
    std::optional<AgentId> sender_;
    std::optional<AgentId> receiver_;
    std::optional<Performative> performative_;
    std::optional<std::string> content_;
    std::optional<std::string> conversation_id_;
    std::optional<MessageId> in_reply_to_;
    std::optional<std::string> topic_;
};

} // namespace agora::messaging
