
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace shotlink {

constexpr uint16_t kFrameMagic = 0x534C; // 'SL'
constexpr size_t kFrameHeaderSize = 9;   // magic, seq, type, length
constexpr size_t kFrameTrailerSize = 4;  // crc32
constexpr size_t kFrameOverhead = kFrameHeaderSize + kFrameTrailerSize;
constexpr size_t kMaxFramePayload = 0xFFFF;
constexpr size_t kDataChunkHeaderSize = 8; // object offset
// SESSION_STATUS is the largest fixed-size control message.
constexpr size_t kSessionStatusSize = 41;
constexpr size_t kSessionOfferHeaderSize = 39; // without the filename bytes
constexpr size_t kListHeaderSize = 4;          // type, final flag, count
constexpr size_t kMinFramePayload = kSessionStatusSize + kListHeaderSize;

enum class FrameType : uint8_t { Data = 0, Ack = 1, Control = 2 };

struct Frame {
    uint32_t seq{0};
    FrameType type{FrameType::Data};
    std::vector<uint8_t> payload;
};

enum class DecodeStatus { Ok, NeedMore, Corrupt };

std::vector<uint8_t> encode_frame(const Frame& f);
// Parses the frame at the front of data. On Corrupt, consumed is 1 so the
// caller can rescan for the next magic marker. A length field above
// max_payload is treated as corruption.
DecodeStatus decode_frame(const uint8_t* data, size_t len, Frame& out, size_t& consumed,
                          size_t max_payload = kMaxFramePayload);

using SessionId = std::array<uint8_t, 16>;

enum class ControlType : uint8_t {
    HELLO = 1,
    CREDIT_GRANT = 2,
    SESSION_RESUME = 3,
    DELETE_REQUEST = 4,
    DELETE_ACK = 5,
    SESSION_OFFER = 6,
    SESSION_STATUS = 7,
    CANCEL = 8,
    PULL_REQUEST = 9,
    CREDIT_REQUEST = 10,
    LIST_REQUEST = 11,
    LIST_RESPONSE = 12
};

enum class DeleteStatus : uint8_t {
    Success = 0,
    InUse = 1,
    NotFound = 2,
    Failed = 3,
    NoCamera = 4
};

struct ListEntry {
    uint32_t object_id{0};
    uint64_t size{0};
    std::string name;
};

// Field use per type:
//   HELLO           text = client identity
//   CREDIT_GRANT    size = granted bytes
//   SESSION_RESUME  session_id, offset
//   DELETE_REQUEST  object_id
//   DELETE_ACK      object_id, status (DeleteStatus)
//   SESSION_OFFER   session_id, object_id, offset, size, text = filename
//   SESSION_STATUS  session_id, object_id, status (SessionState), reason,
//                   code (camera response), offset (acked), size
//   CANCEL          session_id
//   PULL_REQUEST    object_id
//   CREDIT_REQUEST  session_id, offset (acked)
//   LIST_RESPONSE   status (1 = final), entries
struct ControlMessage {
    ControlType type{ControlType::HELLO};
    SessionId session_id{};
    uint32_t object_id{0};
    uint64_t offset{0};
    uint64_t size{0};
    uint8_t status{0};
    uint8_t reason{0};
    uint16_t code{0};
    std::string text;
    std::vector<ListEntry> entries;
};

std::vector<uint8_t> encode_control(const ControlMessage& m);
bool decode_control(const std::vector<uint8_t>& payload, ControlMessage& out);
size_t encoded_list_entry_size(const ListEntry& e);

std::vector<uint8_t> encode_data_chunk(uint64_t offset, const uint8_t* data, size_t len);
bool decode_data_chunk(const std::vector<uint8_t>& payload, uint64_t& offset,
                       std::vector<uint8_t>& bytes);

uint32_t crc32(const uint8_t* data, size_t len);

} // namespace shotlink
