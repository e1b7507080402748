
#include "protocol.hpp"
#include <algorithm>
#include <array>

namespace shotlink {

namespace {

void put_u8(std::vector<uint8_t> &out, uint8_t v) { out.push_back(v); }

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  for (int s = 24; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

void put_u64(std::vector<uint8_t> &out, uint64_t v) {
  for (int s = 56; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

void put_str(std::vector<uint8_t> &out, const std::string &s) {
  size_t n = std::min(s.size(), (size_t)0xFFFF);
  put_u16(out, (uint16_t)n);
  out.insert(out.end(), s.begin(), s.begin() + n);
}

uint32_t load_u32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint16_t load_u16(const uint8_t *p) {
  return (uint16_t)((p[0] << 8) | p[1]);
}

// Bounds-checked big-endian cursor; any overrun latches ok_ to false.
class WireReader {
public:
  explicit WireReader(const std::vector<uint8_t> &buf) : buf_(buf) {}

  uint8_t u8() {
    if (!need(1))
      return 0;
    return buf_[pos_++];
  }
  uint16_t u16() {
    if (!need(2))
      return 0;
    uint16_t v = load_u16(buf_.data() + pos_);
    pos_ += 2;
    return v;
  }
  uint32_t u32() {
    if (!need(4))
      return 0;
    uint32_t v = load_u32(buf_.data() + pos_);
    pos_ += 4;
    return v;
  }
  uint64_t u64() {
    uint64_t hi = u32();
    uint64_t lo = u32();
    return (hi << 32) | lo;
  }
  std::string str() {
    uint16_t n = u16();
    if (!need(n))
      return std::string();
    std::string s((const char *)buf_.data() + pos_, n);
    pos_ += n;
    return s;
  }
  void id(SessionId &out) {
    if (!need(out.size()))
      return;
    std::copy(buf_.begin() + pos_, buf_.begin() + pos_ + out.size(),
              out.begin());
    pos_ += out.size();
  }
  bool ok() const { return ok_; }
  bool at_end() const { return pos_ == buf_.size(); }

private:
  bool need(size_t n) {
    if (!ok_ || buf_.size() - pos_ < n) {
      ok_ = false;
      return false;
    }
    return true;
  }

  const std::vector<uint8_t> &buf_;
  size_t pos_{0};
  bool ok_{true};
};

} // namespace

std::vector<uint8_t> encode_frame(const Frame &f) {
  size_t n = std::min(f.payload.size(), kMaxFramePayload);
  std::vector<uint8_t> out;
  out.reserve(kFrameOverhead + n);
  put_u16(out, kFrameMagic);
  put_u32(out, f.seq);
  put_u8(out, (uint8_t)f.type);
  put_u16(out, (uint16_t)n);
  out.insert(out.end(), f.payload.begin(), f.payload.begin() + n);
  put_u32(out, crc32(out.data(), out.size()));
  return out;
}

DecodeStatus decode_frame(const uint8_t *data, size_t len, Frame &out,
                          size_t &consumed, size_t max_payload) {
  consumed = 0;
  if (len < 2)
    return DecodeStatus::NeedMore;
  if (load_u16(data) != kFrameMagic) {
    consumed = 1;
    return DecodeStatus::Corrupt;
  }
  if (len < kFrameHeaderSize)
    return DecodeStatus::NeedMore;
  uint8_t type = data[6];
  uint16_t plen = load_u16(data + 7);
  if (plen > max_payload) {
    consumed = 1;
    return DecodeStatus::Corrupt;
  }
  size_t need = kFrameOverhead + plen;
  if (len < need)
    return DecodeStatus::NeedMore;
  uint32_t want = load_u32(data + kFrameHeaderSize + plen);
  if (crc32(data, kFrameHeaderSize + plen) != want ||
      type > (uint8_t)FrameType::Control) {
    consumed = 1;
    return DecodeStatus::Corrupt;
  }
  out.seq = load_u32(data + 2);
  out.type = (FrameType)type;
  out.payload.assign(data + kFrameHeaderSize, data + kFrameHeaderSize + plen);
  consumed = need;
  return DecodeStatus::Ok;
}

size_t encoded_list_entry_size(const ListEntry &e) {
  return 4 + 8 + 2 + std::min(e.name.size(), (size_t)0xFFFF);
}

std::vector<uint8_t> encode_control(const ControlMessage &m) {
  std::vector<uint8_t> out;
  put_u8(out, (uint8_t)m.type);
  switch (m.type) {
  case ControlType::HELLO:
    put_str(out, m.text);
    break;
  case ControlType::CREDIT_GRANT:
    put_u32(out, (uint32_t)std::min<uint64_t>(m.size, 0xFFFFFFFFu));
    break;
  case ControlType::SESSION_RESUME:
  case ControlType::CREDIT_REQUEST:
    out.insert(out.end(), m.session_id.begin(), m.session_id.end());
    put_u64(out, m.offset);
    break;
  case ControlType::DELETE_REQUEST:
  case ControlType::PULL_REQUEST:
    put_u32(out, m.object_id);
    break;
  case ControlType::DELETE_ACK:
    put_u32(out, m.object_id);
    put_u8(out, m.status);
    break;
  case ControlType::SESSION_OFFER:
    out.insert(out.end(), m.session_id.begin(), m.session_id.end());
    put_u32(out, m.object_id);
    put_u64(out, m.offset);
    put_u64(out, m.size);
    put_str(out, m.text);
    break;
  case ControlType::SESSION_STATUS:
    out.insert(out.end(), m.session_id.begin(), m.session_id.end());
    put_u32(out, m.object_id);
    put_u8(out, m.status);
    put_u8(out, m.reason);
    put_u16(out, m.code);
    put_u64(out, m.offset);
    put_u64(out, m.size);
    break;
  case ControlType::CANCEL:
    out.insert(out.end(), m.session_id.begin(), m.session_id.end());
    break;
  case ControlType::LIST_REQUEST:
    break;
  case ControlType::LIST_RESPONSE:
    put_u8(out, m.status);
    put_u16(out, (uint16_t)std::min(m.entries.size(), (size_t)0xFFFF));
    for (size_t i = 0; i < m.entries.size() && i < 0xFFFF; i++) {
      put_u32(out, m.entries[i].object_id);
      put_u64(out, m.entries[i].size);
      put_str(out, m.entries[i].name);
    }
    break;
  }
  return out;
}

bool decode_control(const std::vector<uint8_t> &payload, ControlMessage &out) {
  WireReader r(payload);
  uint8_t type = r.u8();
  if (!r.ok() || type < (uint8_t)ControlType::HELLO ||
      type > (uint8_t)ControlType::LIST_RESPONSE)
    return false;
  out = ControlMessage{};
  out.type = (ControlType)type;
  switch (out.type) {
  case ControlType::HELLO:
    out.text = r.str();
    break;
  case ControlType::CREDIT_GRANT:
    out.size = r.u32();
    break;
  case ControlType::SESSION_RESUME:
  case ControlType::CREDIT_REQUEST:
    r.id(out.session_id);
    out.offset = r.u64();
    break;
  case ControlType::DELETE_REQUEST:
  case ControlType::PULL_REQUEST:
    out.object_id = r.u32();
    break;
  case ControlType::DELETE_ACK:
    out.object_id = r.u32();
    out.status = r.u8();
    break;
  case ControlType::SESSION_OFFER:
    r.id(out.session_id);
    out.object_id = r.u32();
    out.offset = r.u64();
    out.size = r.u64();
    out.text = r.str();
    break;
  case ControlType::SESSION_STATUS:
    r.id(out.session_id);
    out.object_id = r.u32();
    out.status = r.u8();
    out.reason = r.u8();
    out.code = r.u16();
    out.offset = r.u64();
    out.size = r.u64();
    break;
  case ControlType::CANCEL:
    r.id(out.session_id);
    break;
  case ControlType::LIST_REQUEST:
    break;
  case ControlType::LIST_RESPONSE: {
    out.status = r.u8();
    uint16_t count = r.u16();
    for (uint16_t i = 0; i < count && r.ok(); i++) {
      ListEntry e;
      e.object_id = r.u32();
      e.size = r.u64();
      e.name = r.str();
      out.entries.push_back(std::move(e));
    }
    break;
  }
  }
  return r.ok() && r.at_end();
}

std::vector<uint8_t> encode_data_chunk(uint64_t offset, const uint8_t *data,
                                       size_t len) {
  std::vector<uint8_t> out;
  out.reserve(kDataChunkHeaderSize + len);
  put_u64(out, offset);
  out.insert(out.end(), data, data + len);
  return out;
}

bool decode_data_chunk(const std::vector<uint8_t> &payload, uint64_t &offset,
                       std::vector<uint8_t> &bytes) {
  if (payload.size() < kDataChunkHeaderSize)
    return false;
  offset = ((uint64_t)load_u32(payload.data()) << 32) |
           load_u32(payload.data() + 4);
  bytes.assign(payload.begin() + kDataChunkHeaderSize, payload.end());
  return true;
}

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

} // namespace shotlink
