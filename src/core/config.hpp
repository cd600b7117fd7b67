#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "messaging/router.hpp"

namespace agora::core::config {

// Load KEY=VALUE pairs from a .env file into the environment. Existing
// variables win. Returns false if the file cannot be read.
bool load_dotenv(const std::filesystem::path& path);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer environment variable; fallback when missing or not a number.
long long get_env_int(const std::string& key, long long fallback);

// Fabric-wide settings
struct FabricConfig {
    size_t mailbox_capacity = 0;  // 0 = unbounded
    messaging::OverflowPolicy overflow_policy = messaging::OverflowPolicy::BLOCK;
    size_t history_capacity = 65536;
    std::chrono::milliseconds reply_timeout{5000};
    std::string log_level = "info";

    // AGORA_MAILBOX_CAPACITY, AGORA_OVERFLOW_POLICY, AGORA_HISTORY_CAPACITY,
    // AGORA_REPLY_TIMEOUT_MS, AGORA_LOG_LEVEL
    static FabricConfig from_env();

    // Missing keys keep their defaults; mistyped values throw nlohmann::json errors
    static FabricConfig from_json(const nlohmann::json& j);

    messaging::RouterOptions router_options() const;
    nlohmann::json to_json() const;
};

// Parse a JSON config file; throws std::runtime_error if unreadable
FabricConfig load_config_file(const std::filesystem::path& path);

} // namespace agora::core::config
