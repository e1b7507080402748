
#pragma once
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include "config.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace shotlink {

enum class LinkStatus { Disconnected, Connecting, Connected };

struct ConnectionState {
    ConnectionType transport{ConnectionType::WiFi};
    LinkStatus status{LinkStatus::Disconnected};
    uint16_t max_frame_payload{0};
    size_t in_flight{0};
};

struct FramingConfig {
    uint16_t window_size{8};
    uint16_t retry_limit{5};
    std::chrono::milliseconds rto{250};
    std::chrono::milliseconds rto_max{4000};
    uint16_t max_payload{512};

    static FramingConfig from(const BridgeConfig& cfg);
};

// Reliable, ordered delivery of Data and Control frames over one Connection.
// Sequenced frames are held until cumulatively acknowledged and resent on a
// per-frame timer with capped exponential backoff.
class FramingLayer : public std::enable_shared_from_this<FramingLayer> {
public:
    using DeliverHandler = std::function<void(FrameType, std::vector<uint8_t>&&)>;
    using AckHandler = std::function<void(uint32_t highest_acked)>;
    using ErrorHandler = std::function<void(std::error_code)>;

    FramingLayer(asio::io_context& io, ConnectionPtr conn, const FramingConfig& cfg);
    ~FramingLayer();

    void start(DeliverHandler on_deliver, AckHandler on_ack, ErrorHandler on_error);
    // Returns the assigned sequence number, 0 when the link is down.
    uint32_t submit(FrameType type, std::vector<uint8_t> payload);
    size_t window_available() const;
    uint16_t max_payload() const { return state_.max_frame_payload; }
    const ConnectionState& state() const { return state_; }
    bool connected() const { return state_.status == LinkStatus::Connected; }
    bool idle() const { return in_flight_.empty() && backlog_.empty(); }
    uint32_t last_acked() const { return last_acked_; }
    // Tears the link down without notifying the error handler.
    void close();

private:
    using clock = std::chrono::steady_clock;

    struct Outbound {
        uint32_t seq{0};
        std::vector<uint8_t> wire;
        uint16_t retries{0};
        std::chrono::milliseconds rto{0};
        clock::time_point deadline;
    };

    void on_bytes(const uint8_t* data, size_t len);
    void handle_frame(Frame&& f);
    void handle_ack(const Frame& f);
    void send_ack();
    void pump();
    void transmit(Outbound& o);
    void arm_timer();
    void on_timer();
    void fail(std::error_code ec);
    void teardown();

    asio::io_context& io_;
    ConnectionPtr conn_;
    FramingConfig cfg_;
    ConnectionState state_;
    asio::steady_timer timer_;
    bool timer_armed_{false};

    DeliverHandler on_deliver_;
    AckHandler on_ack_;
    ErrorHandler on_error_;

    uint32_t next_seq_{1};
    uint32_t last_acked_{0};
    std::deque<Outbound> in_flight_;
    std::deque<Outbound> backlog_;

    uint32_t expected_seq_{1};
    std::map<uint32_t, Frame> reorder_;
    std::vector<uint8_t> inbuf_;
};

} // namespace shotlink
