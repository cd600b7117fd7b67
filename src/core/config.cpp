#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace agora::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

messaging::OverflowPolicy parse_policy(const std::string& value, messaging::OverflowPolicy fallback) {
    auto policy = messaging::overflow_policy_from_string(value);
    if (!policy) {
        spdlog::warn("Unknown overflow policy '{}', keeping {}", value,
                     messaging::overflow_policy_to_string(fallback));
        return fallback;
    }
    return *policy;
}

} // namespace

bool load_dotenv(const std::filesystem::path& path) {
    static std::mutex loaded_mutex;
    static std::set<std::filesystem::path> loaded;

    std::lock_guard<std::mutex> lock(loaded_mutex);
    if (loaded.count(path) > 0) return true;

    std::ifstream file(path);
    if (!file) {
        return false;
    }
    loaded.insert(path);

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7));
        }
        std::string value = unquote(trim(line.substr(eq_pos + 1)));

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
    spdlog::debug("Loaded environment from {}", path.string());
    return true;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

long long get_env_int(const std::string& key, long long fallback) {
    auto value = get_env(key);
    if (value.empty()) return fallback;

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("{}='{}' is not an integer, using {}", key, value, fallback);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("{}='{}' is not an integer, using {}", key, value, fallback);
        return fallback;
    }
}

FabricConfig FabricConfig::from_env() {
    FabricConfig config;

    auto capacity = get_env_int("AGORA_MAILBOX_CAPACITY", 0);
    config.mailbox_capacity = capacity > 0 ? static_cast<size_t>(capacity) : 0;

    auto policy = get_env("AGORA_OVERFLOW_POLICY");
    if (!policy.empty()) {
        config.overflow_policy = parse_policy(policy, config.overflow_policy);
    }

    auto history = get_env_int("AGORA_HISTORY_CAPACITY", static_cast<long long>(config.history_capacity));
    config.history_capacity = history > 0 ? static_cast<size_t>(history) : 0;

    auto timeout_ms = get_env_int("AGORA_REPLY_TIMEOUT_MS", config.reply_timeout.count());
    if (timeout_ms > 0) {
        config.reply_timeout = std::chrono::milliseconds(timeout_ms);
    }

    config.log_level = get_env_or("AGORA_LOG_LEVEL", config.log_level);
    return config;
}

FabricConfig FabricConfig::from_json(const nlohmann::json& j) {
    FabricConfig config;

    if (j.contains("mailbox")) {
        const auto& mailbox = j.at("mailbox");
        config.mailbox_capacity = mailbox.value("capacity", config.mailbox_capacity);
        if (mailbox.contains("overflow")) {
            config.overflow_policy = parse_policy(mailbox.at("overflow").get<std::string>(),
                                                  config.overflow_policy);
        }
    }

    config.history_capacity = j.value("history_capacity", config.history_capacity);

    if (j.contains("reply_timeout_ms")) {
        config.reply_timeout = std::chrono::milliseconds(j.at("reply_timeout_ms").get<int64_t>());
    }

    config.log_level = j.value("log_level", config.log_level);
    return config;
}

messaging::RouterOptions FabricConfig::router_options() const {
    messaging::RouterOptions options;
    options.mailbox.capacity = mailbox_capacity;
    options.mailbox.overflow = overflow_policy;
    options.history_capacity = history_capacity;
    return options;
}

nlohmann::json FabricConfig::to_json() const {
    return nlohmann::json{
        {"mailbox", {
            {"capacity", mailbox_capacity},
            {"overflow", messaging::overflow_policy_to_string(overflow_policy)}
        }},
        {"history_capacity", history_capacity},
        {"reply_timeout_ms", reply_timeout.count()},
        {"log_level", log_level}
    };
}

FabricConfig load_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("invalid config file " + path.string() + ": " + e.what());
    }
    spdlog::info("Loaded fabric config from {}", path.string());
    return FabricConfig::from_json(j);
}

} // namespace agora::core::config
