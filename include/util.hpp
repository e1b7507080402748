
#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include "protocol.hpp"

namespace shotlink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// Random (version 4) UUID drawn from libsodium's CSPRNG.
SessionId generate_session_id();
std::string to_string(const SessionId& id);
bool parse_session_id(const std::string& s, SessionId& out);

// Cuts s to at most max_bytes without splitting a UTF-8 sequence.
void truncate_utf8(std::string& s, size_t max_bytes);

} // namespace shotlink
