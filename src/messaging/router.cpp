#include "messaging/router.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agora::messaging {

nlohmann::json to_json(const RouterStats& stats) {
    return nlohmann::json{
        {"agents", stats.agents},
        {"topics", stats.topics},
        {"history", stats.history},
        {"routed", stats.routed},
        {"failed", stats.failed}
    };
}

Router::Router() : Router(RouterOptions{}) {}

Router::Router(RouterOptions options) : options_(options) {
    spdlog::debug("Router initialized (mailbox_capacity={}, overflow={}, history_capacity={})",
                  options_.mailbox.capacity,
                  overflow_policy_to_string(options_.mailbox.overflow),
                  options_.history_capacity);
}

Router::~Router() {
    // Agents may still hold their mailbox handles; make blocked receivers return
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    for (auto& [agent, mailbox] : mailboxes_) {
        mailbox->close();
    }
    mailboxes_.clear();
}

std::shared_ptr<Mailbox> Router::register_agent(AgentId agent) {
    return register_agent(agent, options_.mailbox);
}

std::shared_ptr<Mailbox> Router::register_agent(AgentId agent, const MailboxOptions& options) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = mailboxes_.find(agent);
    if (it != mailboxes_.end()) {
        spdlog::debug("Agent {} already registered, reusing mailbox", agent.to_string());
        return it->second;
    }

    auto mailbox = std::make_shared<Mailbox>(options);
    mailboxes_.emplace(agent, mailbox);
    spdlog::info("Agent {} registered (capacity={}, overflow={})",
                 agent.to_string(), options.capacity, overflow_policy_to_string(options.overflow));
    return mailbox;
}

bool Router::deregister_agent(AgentId agent) {
    std::shared_ptr<Mailbox> mailbox;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = mailboxes_.find(agent);
        if (it == mailboxes_.end()) {
            return false;
        }
        mailbox = std::move(it->second);
        mailboxes_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        for (auto it = topics_.begin(); it != topics_.end(); ) {
            it->second.erase(agent);
            if (it->second.empty()) {
                it = topics_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t pending = mailbox->size();
    mailbox->close();
    if (pending > 0) {
        spdlog::warn("Agent {} deregistered with {} undelivered message(s)", agent.to_string(), pending);
    } else {
        spdlog::info("Agent {} deregistered", agent.to_string());
    }
    return true;
}

SendResult Router::route(const Message& message, const WaitOptions& wait) {
    auto target = mailbox(message.receiver());
    if (!target) {
        failed_count_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Route {} failed: agent {} not registered",
                      message.id().to_string(), message.receiver().to_string());
        return SendResult{DeliveryStatus::UNKNOWN_AGENT};
    }

    // Registry lock is released here; only the target mailbox is locked
    auto result = target->send(message, wait);
    if (result.status == DeliveryStatus::CLOSED) {
        // Deregistered between lookup and enqueue
        result.status = DeliveryStatus::UNKNOWN_AGENT;
    }
    if (!result.ok()) {
        failed_count_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Route {} to {} failed: {}", message.id().to_string(),
                      message.receiver().to_string(), delivery_status_to_string(result.status));
        return result;
    }

    record_delivery(message.id());
    routed_count_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("Routed {} {} -> {} ({})", message.id().to_string(),
                  message.sender().to_string(), message.receiver().to_string(),
                  performative_to_string(message.performative()));
    return result;
}

std::vector<BroadcastOutcome> Router::broadcast(const Message& message_template,
                                                const std::vector<AgentId>& agents,
                                                const WaitOptions& wait) {
    std::vector<BroadcastOutcome> outcomes;
    outcomes.reserve(agents.size());

    for (const auto& agent : agents) {
        auto result = route(message_template.readdressed(agent), wait);
        outcomes.push_back(BroadcastOutcome{agent, result.status});
    }

    size_t delivered = std::count_if(outcomes.begin(), outcomes.end(),
                                     [](const BroadcastOutcome& o) { return o.ok(); });
    spdlog::debug("Agent {} broadcast to {}/{} agents",
                  message_template.sender().to_string(), delivered, agents.size());
    return outcomes;
}

std::vector<BroadcastOutcome> Router::broadcast_all(const Message& message_template, bool include_sender) {
    std::vector<AgentId> targets;
    for (const auto& agent : registered_agents()) {
        if (agent == message_template.sender() && !include_sender) {
            continue;
        }
        targets.push_back(agent);
    }
    return broadcast(message_template, targets);
}

bool Router::subscribe(AgentId agent, const std::string& topic) {
    if (topic.empty()) {
        return false;
    }

    // Checked under the topics lock so a concurrent deregister_agent either
    // sees this subscription and clears it, or makes this check fail.
    std::lock_guard<std::mutex> lock(topics_mutex_);
    if (!is_registered(agent)) {
        return false;
    }
    topics_[topic].insert(agent);
    spdlog::debug("Agent {} subscribed to '{}'", agent.to_string(), topic);
    return true;
}

bool Router::unsubscribe(AgentId agent, const std::string& topic) {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return false;
    }

    bool removed = it->second.erase(agent) > 0;
    if (it->second.empty()) {
        topics_.erase(it);
    }
    return removed;
}

std::vector<AgentId> Router::subscribers(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return {};
    }
    return std::vector<AgentId>(it->second.begin(), it->second.end());
}

std::vector<BroadcastOutcome> Router::publish(const std::string& topic,
                                              const Message& message_template,
                                              const WaitOptions& wait) {
    auto targets = subscribers(topic);
    if (targets.empty()) {
        spdlog::debug("Publish to '{}' has no subscribers", topic);
        return {};
    }
    return broadcast(message_template.with_topic(topic), targets, wait);
}

bool Router::has_routed(MessageId id) const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    return history_.count(id) > 0;
}

size_t Router::agent_count() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return mailboxes_.size();
}

bool Router::is_registered(AgentId agent) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return mailboxes_.count(agent) > 0;
}

std::shared_ptr<Mailbox> Router::mailbox(AgentId agent) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = mailboxes_.find(agent);
    if (it == mailboxes_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t Router::history_size() const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    return history_.size();
}

RouterStats Router::stats() const {
    RouterStats stats;
    stats.agents = agent_count();
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        stats.topics = topics_.size();
    }
    stats.history = history_size();
    stats.routed = routed_count_.load(std::memory_order_relaxed);
    stats.failed = failed_count_.load(std::memory_order_relaxed);
    return stats;
}

void Router::record_delivery(MessageId id) {
    std::unique_lock<std::shared_mutex> lock(history_mutex_);
    if (!history_.insert(id).second) {
        return;
    }
    history_order_.push_back(id);

    if (options_.history_capacity == 0) {
        return;
    }
    while (history_order_.size() > options_.history_capacity) {
        history_.erase(history_order_.front());
        history_order_.pop_front();
    }
}

std::vector<AgentId> Router::registered_agents() const {
    std::vector<AgentId> agents;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        agents.reserve(mailboxes_.size());
        for (const auto& [agent, mailbox] : mailboxes_) {
            agents.push_back(agent);
        }
    }
    std::sort(agents.begin(), agents.end());
    return agents;
}

} // namespace agora::messaging
