
#pragma once
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "framing.hpp"
#include "protocol.hpp"

namespace shotlink {

// Carried in SESSION_OFFER / SESSION_STATUS when the object size is not known.
constexpr uint64_t kUnknownSize = ~0ull;

enum class SessionState : uint8_t {
    Queued = 0,
    Streaming,
    Paused,
    Interrupted,
    Completed,
    Aborted
};

enum class AbortReason : uint8_t {
    None = 0,
    CameraDetached,
    CameraError,
    TtlExpired,
    Cancelled,
    ObjectRemoved,
    PeerUnresponsive,
    NotFound,
    UnknownSession
};

const char* to_string(SessionState s);
const char* to_string(AbortReason r);
inline bool is_terminal(SessionState s) {
    return s == SessionState::Completed || s == SessionState::Aborted;
}

struct TransferSession {
    using clock = std::chrono::steady_clock;

    SessionId id{};
    uint32_t object_id{0};
    std::string filename;
    std::optional<uint64_t> total_size;
    uint64_t acked_offset{0};
    SessionState state{SessionState::Queued};
    AbortReason reason{AbortReason::None};
    uint16_t camera_code{0};
    std::string client_id;
    clock::time_point created{clock::now()};
    clock::time_point updated{clock::now()};
};

// Streams one session at a time over a framing layer, metering bytes by the
// client's credit. Credit is banked between sessions and dies with the link.
class SessionController : public std::enable_shared_from_this<SessionController> {
public:
    struct Callbacks {
        std::function<void(uint64_t acked_offset)> on_progress;
        std::function<void(SessionState)> on_state; // Streaming <-> Paused
        std::function<void()> on_complete;
        std::function<void()> on_ready; // more bytes may be pushed
    };

    SessionController(asio::io_context& io, std::shared_ptr<FramingLayer> framing,
                      const BridgeConfig& cfg);

    void set_callbacks(Callbacks cb) { cb_ = std::move(cb); }

    // Starts streaming s from its acked offset and sends SESSION_OFFER.
    void begin(const TransferSession& s);
    // Detaches the active session; unused credit returns to the bank.
    void end();
    void stop();

    void grant(uint64_t bytes);
    void set_total(uint64_t size);

    bool active() const { return active_; }
    const SessionId& session_id() const { return id_; }
    SessionState state() const { return state_; }
    uint64_t next_offset() const { return next_offset_; }
    uint64_t acked_offset() const { return acked_offset_; }
    uint64_t credit() const { return active_ ? credit_ : bank_; }
    uint64_t bank() const { return bank_; }
    size_t chunk_size() const;

    // Bytes the controller would accept right now.
    uint64_t wanted() const;
    // Sends bytes read at offset. Bytes below next_offset() are dropped;
    // returns the number of new bytes sent.
    size_t push(uint64_t offset, const uint8_t* data, size_t len);
    // Cumulative acknowledgment from the framing layer.
    void on_acked(uint32_t highest_seq);

private:
    struct Pending {
        uint32_t seq;
        uint64_t end_offset;
    };

    void set_state(SessionState s);
    void check_complete();
    void arm_heartbeat();
    void send_credit_request();

    asio::io_context& io_;
    std::shared_ptr<FramingLayer> framing_;
    std::chrono::milliseconds heartbeat_;
    asio::steady_timer heartbeat_timer_;
    Callbacks cb_;

    bool active_{false};
    SessionId id_{};
    uint32_t object_id_{0};
    std::optional<uint64_t> total_;
    SessionState state_{SessionState::Queued};
    uint64_t next_offset_{0};
    uint64_t acked_offset_{0};
    uint64_t credit_{0};
    uint64_t bank_{0};
    std::deque<Pending> pending_;
};

} // namespace shotlink
