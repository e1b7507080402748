
#include "util.hpp"
#include "logging.hpp"
#include <sodium.h>

namespace shotlink {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  std::string digits = s.substr(pos + 1);
  if (digits.empty() || digits.size() > 5)
    return false;
  uint32_t p = 0;
  for (char ch : digits) {
    if (ch < '0' || ch > '9')
      return false;
    p = p * 10 + (uint32_t)(ch - '0');
  }
  if (p > 65535)
    return false;
  port = (uint16_t)p;
  return true;
}

SessionId generate_session_id() {
  static const bool ready = [] {
    if (sodium_init() < 0) {
      Logger::instance().log(LogLevel::ERROR, "util",
                             "sodium_init failed, session ids unavailable");
      return false;
    }
    return true;
  }();
  SessionId id{};
  if (ready)
    randombytes_buf(id.data(), id.size());
  id[6] = (uint8_t)((id[6] & 0x0F) | 0x40);
  id[8] = (uint8_t)((id[8] & 0x3F) | 0x80);
  return id;
}

std::string to_string(const SessionId &id) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); i++) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      out.push_back('-');
    out.push_back(digits[id[i] >> 4]);
    out.push_back(digits[id[i] & 0x0F]);
  }
  return out;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool parse_session_id(const std::string &s, SessionId &out) {
  SessionId id{};
  size_t n = 0;
  for (size_t i = 0; i < s.size();) {
    if (s[i] == '-') {
      i++;
      continue;
    }
    if (i + 1 >= s.size() || n >= id.size())
      return false;
    int hi = hex_value(s[i]), lo = hex_value(s[i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    id[n++] = (uint8_t)((hi << 4) | lo);
    i += 2;
  }
  if (n != id.size())
    return false;
  out = id;
  return true;
}

void truncate_utf8(std::string &s, size_t max_bytes) {
  if (s.size() <= max_bytes)
    return;
  size_t cut = max_bytes;
  while (cut > 0 && ((uint8_t)s[cut] & 0xC0) == 0x80)
    cut--;
  s.resize(cut);
}

} // namespace shotlink
