#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace agora::messaging {

// Opaque participant identifier. Zero is reserved for "no agent".
class AgentId {
public:
    AgentId() = default;
    explicit AgentId(uint64_t value) : value_(value) {}

    uint64_t value() const { return value_; }
    bool valid() const { return value_ != 0; }
    std::string to_string() const;

    bool operator==(const AgentId& other) const { return value_ == other.value_; }
    bool operator!=(const AgentId& other) const { return value_ != other.value_; }
    bool operator<(const AgentId& other) const { return value_ < other.value_; }

private:
    uint64_t value_ = 0;
};

// Opaque message identifier, assigned once when a message is constructed.
class MessageId {
public:
    MessageId() = default;
    explicit MessageId(uint64_t value) : value_(value) {}

    uint64_t value() const { return value_; }
    bool valid() const { return value_ != 0; }
    std::string to_string() const;

    bool operator==(const MessageId& other) const { return value_ == other.value_; }
    bool operator!=(const MessageId& other) const { return value_ != other.value_; }
    bool operator<(const MessageId& other) const { return value_ < other.value_; }

private:
    uint64_t value_ = 0;
};

// Process-unique id generators (thread-safe)
AgentId new_agent_id();
MessageId new_message_id();
std::string new_conversation_id();

} // namespace agora::messaging

namespace std {

template <>
struct hash<agora::messaging::AgentId> {
    size_t operator()(const agora::messaging::AgentId& id) const noexcept {
        return std::hash<uint64_t>()(id.value());
    }
};

template <>
struct hash<agora::messaging::MessageId> {
    size_t operator()(const agora::messaging::MessageId& id) const noexcept {
        return std::hash<uint64_t>()(id.value());
    }
};

} // namespace std
