#include "messaging/fabric.hpp"
#include "core/logger.hpp"
#include <spdlog/spdlog.h>

namespace agora::messaging {

Fabric::Fabric() : Fabric(core::config::FabricConfig{}) {}

Fabric::Fabric(const core::config::FabricConfig& config)
    : config_(config), router_(config.router_options()) {
    core::set_log_level(core::level_from_string(config_.log_level));
    spdlog::debug("Fabric created: {}", config_.to_json().dump());
}

AgentId Fabric::spawn_agent() {
    AgentId agent = new_agent_id();
    router_.register_agent(agent);
    return agent;
}

std::unique_ptr<protocols::RequestReply> Fabric::exchange(AgentId requester, AgentId responder) {
    return std::make_unique<protocols::RequestReply>(router_, requester, responder, config_.reply_timeout);
}

} // namespace agora::messaging
