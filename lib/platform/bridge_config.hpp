#ifndef BRIDGE_CONFIG_HPP
#define BRIDGE_CONFIG_HPP

#include <log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace platform {

/**
 * @brief Runtime configuration for the analog keyboard bridge
 *
 * Serialized as a flat JSON object. Every key is optional; missing keys keep
 * their defaults. Vendor and product ids may be given as numbers or as hex
 * strings ("0x41E4").
 */
struct BridgeConfig {
    uint16_t vendorId = 0x41E4;
    uint16_t productId = 0x2103;

    // Device watcher
    uint32_t searchBackoffMs = 2000;
    uint32_t bridgeRetryDelayMs = 2000;

    // Bridge server
    uint32_t reconnectPauseMs = 500;
    uint32_t acceptPollMs = 100;
    uint32_t httpReadTimeoutMs = 2000;
    bool openBrowser = true;

    // Monitor output
    uint32_t monitorIntervalMs = 50;

    /**
     * @brief Load configuration from a JSON file
     * @param path File to read
     * @return true if the file was read and applied; on false the current
     *         values are left untouched
     */
    bool loadFromFile(const std::string& path);
};

/**
 * @brief Parse a 16-bit id from a JSON number or a "0x"-prefixed hex string
 * @throws std::invalid_argument if the value is not a valid 16-bit id
 */
inline uint16_t parseHidId(const nlohmann::json& value) {
    unsigned long parsed = 0;
    if (value.is_number_integer() && value.get<long long>() >= 0) {
        parsed = value.get<unsigned long>();
    } else if (value.is_string()) {
        std::string text = value.get<std::string>();
        size_t consumed = 0;
        parsed = std::stoul(text, &consumed, 0);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters in id \"" + text + "\"");
        }
    } else {
        throw std::invalid_argument("id must be a non-negative number or a hex string");
    }

    if (parsed > 0xFFFF) {
        throw std::invalid_argument("id out of 16-bit range");
    }
    return static_cast<uint16_t>(parsed);
}

inline void to_json(nlohmann::json& j, const BridgeConfig& config) {
    char vid[8];
    char pid[8];
    snprintf(vid, sizeof(vid), "0x%04X", static_cast<unsigned int>(config.vendorId));
    snprintf(pid, sizeof(pid), "0x%04X", static_cast<unsigned int>(config.productId));

    j = nlohmann::json{
        {"vendor_id", vid},
        {"product_id", pid},
        {"search_backoff_ms", config.searchBackoffMs},
        {"bridge_retry_delay_ms", config.bridgeRetryDelayMs},
        {"reconnect_pause_ms", config.reconnectPauseMs},
        {"accept_poll_ms", config.acceptPollMs},
        {"http_read_timeout_ms", config.httpReadTimeoutMs},
        {"open_browser", config.openBrowser},
        {"monitor_interval_ms", config.monitorIntervalMs}
    };
}

inline void from_json(const nlohmann::json& j, BridgeConfig& config) {
    if (j.contains("vendor_id")) {
        config.vendorId = parseHidId(j.at("vendor_id"));
    }
    if (j.contains("product_id")) {
        config.productId = parseHidId(j.at("product_id"));
    }
    config.searchBackoffMs = j.value("search_backoff_ms", config.searchBackoffMs);
    config.bridgeRetryDelayMs = j.value("bridge_retry_delay_ms", config.bridgeRetryDelayMs);
    config.reconnectPauseMs = j.value("reconnect_pause_ms", config.reconnectPauseMs);
    config.acceptPollMs = j.value("accept_poll_ms", config.acceptPollMs);
    config.httpReadTimeoutMs = j.value("http_read_timeout_ms", config.httpReadTimeoutMs);
    config.openBrowser = j.value("open_browser", config.openBrowser);
    config.monitorIntervalMs = j.value("monitor_interval_ms", config.monitorIntervalMs);
}

inline bool BridgeConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logInfo("Config %s not found, using defaults", path.c_str());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            logError("Config %s: top level must be an object", path.c_str());
            return false;
        }

        BridgeConfig parsed = *this;
        from_json(j, parsed);
        *this = parsed;
        logInfo("Loaded config from %s", path.c_str());
        return true;
    } catch (const std::exception& e) {
        logError("Error loading config %s: %s", path.c_str(), e.what());
        return false;
    }
}

} // namespace platform

#endif // BRIDGE_CONFIG_HPP
