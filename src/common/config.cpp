
#include "config.hpp"
#include "protocol.hpp"
#include "util.hpp"

namespace shotlink {

const char *to_string(ConnectionType t) {
  return t == ConnectionType::Bluetooth ? "bluetooth" : "wifi";
}

static bool parse_uint(const std::string &s, uint64_t max, uint64_t &out) {
  if (s.empty() || s.size() > 20)
    return false;
  uint64_t v = 0;
  for (char ch : s) {
    if (ch < '0' || ch > '9')
      return false;
    uint64_t next = v * 10 + (uint64_t)(ch - '0');
    if (next < v)
      return false;
    v = next;
  }
  if (v > max)
    return false;
  out = v;
  return true;
}

bool apply_option(BridgeConfig &cfg, const std::string &name,
                  const std::string &value, std::string &err) {
  uint64_t v = 0;
  auto number = [&](uint64_t max) {
    if (parse_uint(value, max, v))
      return true;
    err = "bad value for " + name + ": " + value;
    return false;
  };
  auto millis = [&]() { return std::chrono::milliseconds((int64_t)v); };

  if (name == "connectionType" || name == "transport") {
    if (value == "wifi")
      cfg.connection_type = ConnectionType::WiFi;
    else if (value == "bluetooth" || value == "ble")
      cfg.connection_type = ConnectionType::Bluetooth;
    else {
      err = "unknown connection type: " + value;
      return false;
    }
  } else if (name == "deviceName" || name == "name") {
    if (value.empty()) {
      err = "device name must not be empty";
      return false;
    }
    cfg.device_name = value;
  } else if (name == "windowSize" || name == "window") {
    if (!number(0xFFFF))
      return false;
    cfg.window_size = (uint16_t)v;
  } else if (name == "retryLimit" || name == "retries") {
    if (!number(0xFFFF))
      return false;
    cfg.retry_limit = (uint16_t)v;
  } else if (name == "sessionTtl" || name == "ttl-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.session_ttl = millis();
  } else if (name == "listen") {
    if (!parse_host_port(value, cfg.listen_host, cfg.listen_port)) {
      err = "bad listen address: " + value;
      return false;
    }
  } else if (name == "maxFramePayload" || name == "frame-payload") {
    if (!number(0xFFFF))
      return false;
    cfg.max_frame_payload = (uint16_t)v;
  } else if (name == "retransmitTimeout" || name == "rto-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.retransmit_timeout = millis();
  } else if (name == "retransmitTimeoutMax" || name == "rto-max-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.retransmit_timeout_max = millis();
  } else if (name == "initialCredit" || name == "initial-credit") {
    if (!number(0xFFFFFFFFu))
      return false;
    cfg.initial_credit = (uint32_t)v;
  } else if (name == "creditHeartbeat" || name == "heartbeat-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.credit_heartbeat = millis();
  } else if (name == "cameraTimeout" || name == "camera-timeout-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.camera_timeout = millis();
  } else if (name == "cameraRetryLimit" || name == "camera-retries") {
    if (!number(0xFFFF))
      return false;
    cfg.camera_retry_limit = (uint16_t)v;
  } else if (name == "cameraReadChunk" || name == "read-chunk") {
    if (!number(0xFFFFFFFFu))
      return false;
    cfg.camera_read_chunk = (uint32_t)v;
  } else if (name == "cameraPollInterval" || name == "poll-ms") {
    if (!number(INT32_MAX))
      return false;
    cfg.camera_poll_interval = millis();
  } else {
    err = "unknown option: " + name;
    return false;
  }
  return true;
}

bool validate_config(const BridgeConfig &cfg, std::string &err) {
  if (cfg.window_size == 0) {
    err = "windowSize must be at least 1";
    return false;
  }
  if (cfg.max_frame_payload < kMinFramePayload) {
    err = "maxFramePayload must be at least " +
          std::to_string(kMinFramePayload) + " bytes";
    return false;
  }
  if (cfg.max_frame_payload > kMaxFramePayload - kFrameOverhead) {
    err = "maxFramePayload exceeds the frame length field";
    return false;
  }
  if (cfg.session_ttl.count() <= 0) {
    err = "sessionTtl must be positive";
    return false;
  }
  if (cfg.retransmit_timeout.count() <= 0 ||
      cfg.retransmit_timeout_max < cfg.retransmit_timeout) {
    err = "retransmit timeouts must be positive and max >= base";
    return false;
  }
  if (cfg.camera_read_chunk == 0) {
    err = "cameraReadChunk must be positive";
    return false;
  }
  if (cfg.credit_heartbeat.count() <= 0 ||
      cfg.camera_poll_interval.count() <= 0) {
    err = "heartbeat and poll intervals must be positive";
    return false;
  }
  return true;
}

} // namespace shotlink
