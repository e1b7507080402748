
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace shotlink {

enum class ConnectionType : uint8_t { Bluetooth = 0, WiFi = 1 };

const char* to_string(ConnectionType t);

// Immutable after startup; every component copies what it needs.
struct BridgeConfig {
    ConnectionType connection_type{ConnectionType::WiFi};
    std::string device_name{"shotlink"};
    uint16_t window_size{8};
    uint16_t retry_limit{5};
    std::chrono::milliseconds session_ttl{std::chrono::seconds(300)};

    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{46090};
    uint16_t max_frame_payload{512};
    std::chrono::milliseconds retransmit_timeout{250};
    std::chrono::milliseconds retransmit_timeout_max{4000};
    uint32_t initial_credit{0};
    std::chrono::milliseconds credit_heartbeat{2000};

    std::chrono::milliseconds camera_timeout{5000};
    uint16_t camera_retry_limit{3};
    std::chrono::milliseconds camera_retry_backoff{100};
    uint32_t camera_read_chunk{64 * 1024};
    std::chrono::milliseconds camera_poll_interval{1000};

    size_t history_limit{32};
};

// Maps an option name (camelCase or the daemon's --kebab-case flag without
// dashes) onto cfg. Returns false and fills err on unknown names or bad values.
bool apply_option(BridgeConfig& cfg, const std::string& name,
                  const std::string& value, std::string& err);
bool validate_config(const BridgeConfig& cfg, std::string& err);

} // namespace shotlink
