#include "messaging/ids.hpp"
#include <atomic>

namespace agora::messaging {

namespace {

std::atomic<uint64_t> next_agent_id{1};
std::atomic<uint64_t> next_message_id{1};
std::atomic<uint64_t> next_conversation_id{1};

} // namespace

std::string AgentId::to_string() const {
    return "agent-" + std::to_string(value_);
}

std::string MessageId::to_string() const {
    return "msg-" + std::to_string(value_);
}

AgentId new_agent_id() {
    return AgentId(next_agent_id.fetch_add(1, std::memory_order_relaxed));
}

MessageId new_message_id() {
    return MessageId(next_message_id.fetch_add(1, std::memory_order_relaxed));
}

std::string new_conversation_id() {
    return "conv-" + std::to_string(next_conversation_id.fetch_add(1, std::memory_order_relaxed));
}

} // namespace agora::messaging
