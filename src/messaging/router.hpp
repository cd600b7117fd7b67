#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "messaging/mailbox.hpp"

namespace agora::messaging {

struct RouterOptions {
    MailboxOptions mailbox;               // Defaults for newly registered agents
    size_t history_capacity = 65536;      // Delivery history bound (0 = unbounded)
};

struct BroadcastOutcome {
    AgentId agent;
    DeliveryStatus status;

    bool ok() const { return status == DeliveryStatus::OK; }
};

struct RouterStats {
    size_t agents = 0;
    size_t topics = 0;
    size_t history = 0;
    uint64_t routed = 0;
    uint64_t failed = 0;
};

nlohmann::json to_json(const RouterStats& stats);

// Registry of agent mailboxes and the delivery engine between them.
// Each Router is an independent fabric; nothing is process-global.
class Router {
public:
    Router();
    explicit Router(RouterOptions options);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Idempotent: an already registered agent gets its existing mailbox
    std::shared_ptr<Mailbox> register_agent(AgentId agent);
    std::shared_ptr<Mailbox> register_agent(AgentId agent, const MailboxOptions& options);

    // Closes the agent's mailbox and drops its topic subscriptions
    bool deregister_agent(AgentId agent);

    // Enqueue into the receiver's mailbox, then record the id in the
    // delivery history. A successful return implies has_routed(id).
    SendResult route(const Message& message, const WaitOptions& wait = WaitOptions::forever());

    // One copy per target, each with its own id. Outcomes follow the
    // order of `agents`; failures do not stop the remaining deliveries.
    std::vector<BroadcastOutcome> broadcast(const Message& message_template,
                                            const std::vector<AgentId>& agents,
                                            const WaitOptions& wait = WaitOptions::forever());

    std::vector<BroadcastOutcome> broadcast_all(const Message& message_template, bool include_sender = false);

    // Topics
    bool subscribe(AgentId agent, const std::string& topic);
    bool unsubscribe(AgentId agent, const std::string& topic);
    std::vector<AgentId> subscribers(const std::string& topic) const;
    std::vector<BroadcastOutcome> publish(const std::string& topic,
                                          const Message& message_template,
                                          const WaitOptions& wait = WaitOptions::forever());

    // False for ids never routed or already evicted from the history
    bool has_routed(MessageId id) const;

    size_t agent_count() const;
    bool is_registered(AgentId agent) const;
    std::shared_ptr<Mailbox> mailbox(AgentId agent) const;
    size_t history_size() const;
    RouterStats stats() const;

    const RouterOptions& options() const { return options_; }

private:
    void record_delivery(MessageId id);
    std::vector<AgentId> registered_agents() const;

    const RouterOptions options_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<AgentId, std::shared_ptr<Mailbox>> mailboxes_;

    mutable std::mutex topics_mutex_;
    std::unordered_map<std::string, std::set<AgentId>> topics_;

    mutable std::shared_mutex history_mutex_;
    std::unordered_set<MessageId> history_;
    std::deque<MessageId> history_order_;  // Oldest first, for eviction

    std::atomic<uint64_t> routed_count_{0};
    std::atomic<uint64_t> failed_count_{0};
};

} // namespace agora::messaging
