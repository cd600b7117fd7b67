#include "messaging/message.hpp"
#include <stdexcept>

namespace agora::messaging {

Message::Message(AgentId sender, AgentId receiver, Performative performative, std::string content)
    : id_(new_message_id()),
      sender_(sender),
      receiver_(receiver),
      performative_(performative),
      content_(std::move(content)),
      created_at_(std::chrono::system_clock::now()) {}

Message Message::with_conversation_id(std::string conversation_id) const {
    Message copy = *this;
    copy.conversation_id_ = std::move(conversation_id);
    return copy;
}

Message Message::with_reply_to(MessageId request_id) const {
    Message copy = *this;
    copy.in_reply_to_ = request_id;
    return copy;
}

Message Message::with_topic(std::string topic) const {
    Message copy = *this;
    copy.topic_ = std::move(topic);
    return copy;
}

Message Message::readdressed(AgentId receiver) const {
    Message copy = *this;
    copy.id_ = new_message_id();
    copy.receiver_ = receiver;
    return copy;
}

nlohmann::json to_json(const Message& message) {
    nlohmann::json j{
        {"id", message.id().to_string()},
        {"sender", message.sender().to_string()},
        {"receiver", message.receiver().to_string()},
        {"performative", performative_to_string(message.performative())},
        {"content", message.content()},
        {"created_at", std::chrono::duration_cast<std::chrono::milliseconds>(
            message.created_at().time_since_epoch()).count()}
    };
    if (message.conversation_id()) {
        j["conversation_id"] = *message.conversation_id();
    }
    if (message.in_reply_to()) {
        j["in_reply_to"] = message.in_reply_to()->to_string();
    }
    if (message.topic()) {
        j["topic"] = *message.topic();
    }
    return j;
}

MessageBuilder& MessageBuilder::sender(AgentId sender) {
    sender_ = sender;
    return *this;
}

MessageBuilder& MessageBuilder::receiver(AgentId receiver) {
    receiver_ = receiver;
    return *this;
}

MessageBuilder& MessageBuilder::performative(Performative performative) {
    performative_ = performative;
    return *this;
}

MessageBuilder& MessageBuilder::content(std::string content) {
    content_ = std::move(content);
    return *this;
}

MessageBuilder& MessageBuilder::conversation_id(std::string conversation_id) {
    conversation_id_ = std::move(conversation_id);
    return *this;
}

MessageBuilder& MessageBuilder::in_reply_to(MessageId request_id) {
    in_reply_to_ = request_id;
    return *this;
}

MessageBuilder& MessageBuilder::topic(std::string topic) {
    topic_ = std::move(topic);
    return *this;
}

Message MessageBuilder::build() const {
    if (!sender_) throw std::invalid_argument("sender required");
    if (!receiver_) throw std::invalid_argument("receiver required");
    if (!performative_) throw std::invalid_argument("performative required");
    if (!content_) throw std::invalid_argument("content required");

    Message message(*sender_, *receiver_, *performative_, *content_);
    if (conversation_id_) {
        message = message.with_conversation_id(*conversation_id_);
    }
    if (in_reply_to_) {
        message = message.with_reply_to(*in_reply_to_);
    }
    if (topic_) {
        message = message.with_topic(*topic_);
    }
    return message;
}

} // namespace agora::messaging
