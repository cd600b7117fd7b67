#pragma once
#include <memory>
#include "core/config.hpp"
#include "messaging/router.hpp"
#include "protocols/request_reply.hpp"

namespace agora::messaging {

// Owns one router built from a FabricConfig. Create one per independent
// messaging domain (an application, a test case).
class Fabric {
public:
    Fabric();
    explicit Fabric(const core::config::FabricConfig& config);

    Fabric(const Fabric&) = delete;
    Fabric& operator=(const Fabric&) = delete;

    // Fresh agent id registered with the router
    AgentId spawn_agent();

    // Request/reply helper using the configured reply timeout
    std::unique_ptr<protocols::RequestReply> exchange(AgentId requester, AgentId responder);

    Router& router() { return router_; }
    const core::config::FabricConfig& config() const { return config_; }

private:
    core::config::FabricConfig config_;
    Router router_;
};

} // namespace agora::messaging
