
#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace shotlink {
namespace testing {

// Runs every ready handler until the loop is idle. Pending timers stay armed.
inline void drain(asio::io_context& io) {
    for (int i = 0; i < 100000; i++) {
        io.restart();
        if (io.poll() == 0)
            break;
    }
}

inline void run_for(asio::io_context& io, std::chrono::milliseconds d) {
    io.restart();
    io.run_for(d);
    drain(io);
}

// Loop-local Connection. Outbound bytes are handed to on_send from a posted
// handler, inbound bytes arrive through inject().
class MemoryConnection : public Connection {
public:
    explicit MemoryConnection(asio::io_context& io, size_t max_frame = 64 * 1024,
                              ConnectionType type = ConnectionType::WiFi)
        : io_(io), max_frame_(max_frame), type_(type), alive_(std::make_shared<bool>(true)) {}
    ~MemoryConnection() override { *alive_ = false; }

    ConnectionType type() const override { return type_; }
    std::string peer() const override { return "memory"; }
    size_t max_frame_size() const override { return max_frame_; }
    bool is_open() const override { return open_; }

    void send(std::vector<uint8_t> bytes, SendHandler done) override {
        std::error_code ec;
        if (!open_) {
            ec = make_error_code(TransportErrc::link_lost);
        } else {
            sent_bytes += bytes.size();
            auto alive = alive_;
            asio::post(io_, [this, alive, bytes] {
                if (*alive && open_ && on_send)
                    on_send(bytes);
            });
        }
        if (done)
            asio::post(io_, [done, ec] { done(ec); });
    }

    void receive(ChunkHandler on_chunk, CloseHandler on_closed) override {
        on_chunk_ = std::move(on_chunk);
        on_closed_ = std::move(on_closed);
    }

    void close() override { finish(asio::error::operation_aborted); }

    // Peer side
    void inject(std::vector<uint8_t> bytes) {
        auto alive = alive_;
        asio::post(io_, [this, alive, bytes] {
            if (*alive && open_ && on_chunk_)
                on_chunk_(bytes.data(), bytes.size());
        });
    }
    void drop() { finish(make_error_code(TransportErrc::link_lost)); }

    std::function<void(const std::vector<uint8_t>&)> on_send;
    size_t sent_bytes{0};
    size_t close_calls{0};

private:
    void finish(std::error_code ec) {
        close_calls++;
        if (!open_)
            return;
        open_ = false;
        on_chunk_ = nullptr;
        auto h = std::move(on_closed_);
        on_closed_ = nullptr;
        if (h)
            h(ec);
    }

    asio::io_context& io_;
    size_t max_frame_;
    ConnectionType type_;
    bool open_{true};
    ChunkHandler on_chunk_;
    CloseHandler on_closed_;
    std::shared_ptr<bool> alive_;
};

// Phone side of a link: decodes bridge frames, acknowledges them in order and
// collects control messages and streamed bytes.
class ClientPeer {
public:
    explicit ClientPeer(std::shared_ptr<MemoryConnection> conn) : conn_(std::move(conn)) {
        conn_->on_send = [this](const std::vector<uint8_t>& bytes) { on_bytes(bytes); };
    }

    void send_control(const ControlMessage& m) {
        Frame f;
        f.seq = next_seq_++;
        f.type = FrameType::Control;
        f.payload = encode_control(m);
        conn_->inject(encode_frame(f));
    }

    void hello(const std::string& id) {
        ControlMessage m;
        m.type = ControlType::HELLO;
        m.text = id;
        send_control(m);
    }
    void grant(uint64_t bytes) {
        ControlMessage m;
        m.type = ControlType::CREDIT_GRANT;
        m.size = bytes;
        send_control(m);
    }
    void resume(const SessionId& id, uint64_t offset) {
        ControlMessage m;
        m.type = ControlType::SESSION_RESUME;
        m.session_id = id;
        m.offset = offset;
        send_control(m);
    }
    void request(ControlType type, uint32_t object_id) {
        ControlMessage m;
        m.type = type;
        m.object_id = object_id;
        send_control(m);
    }
    void cancel(const SessionId& id) {
        ControlMessage m;
        m.type = ControlType::CANCEL;
        m.session_id = id;
        send_control(m);
    }

    std::vector<ControlMessage> of_type(ControlType t) const {
        std::vector<ControlMessage> out;
        for (auto& m : controls)
            if (m.type == t)
                out.push_back(m);
        return out;
    }

    bool auto_ack{true};
    // Return true to lose an inbound sequenced frame.
    std::function<bool(const Frame&)> drop;

    std::vector<ControlMessage> controls;
    std::vector<uint8_t> received;       // contiguous object bytes
    uint64_t base_offset{0};             // offset of received[0]
    std::vector<uint64_t> chunk_offsets; // offset of every data frame delivered
    size_t duplicates{0};
    bool gap{false};
    uint32_t expected{1};

private:
    void on_bytes(const std::vector<uint8_t>& bytes) {
        inbuf_.insert(inbuf_.end(), bytes.begin(), bytes.end());
        size_t off = 0;
        while (off < inbuf_.size()) {
            Frame f;
            size_t consumed = 0;
            auto st = decode_frame(inbuf_.data() + off, inbuf_.size() - off, f, consumed);
            if (st == DecodeStatus::NeedMore)
                break;
            off += consumed;
            if (st == DecodeStatus::Ok)
                on_frame(std::move(f));
        }
        inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
    }

    void on_frame(Frame&& f) {
        if (f.type == FrameType::Ack)
            return;
        if (drop && drop(f))
            return;
        if (f.seq < expected) {
            duplicates++;
        } else if (f.seq == expected) {
            expected++;
            deliver(f);
        }
        if (auto_ack)
            send_ack(expected - 1);
    }

    void deliver(const Frame& f) {
        if (f.type == FrameType::Control) {
            ControlMessage m;
            if (decode_control(f.payload, m)) {
                if (m.type == ControlType::SESSION_OFFER && received.empty())
                    base_offset = m.offset;
                controls.push_back(std::move(m));
            }
            return;
        }
        uint64_t offset = 0;
        std::vector<uint8_t> bytes;
        if (!decode_data_chunk(f.payload, offset, bytes))
            return;
        chunk_offsets.push_back(offset);
        uint64_t end = base_offset + received.size();
        if (offset > end) {
            gap = true;
            return;
        }
        size_t skip = (size_t)(end - offset);
        if (skip < bytes.size())
            received.insert(received.end(), bytes.begin() + skip, bytes.end());
    }

    void send_ack(uint32_t n) {
        Frame ack;
        ack.type = FrameType::Ack;
        ack.payload = {(uint8_t)(n >> 24), (uint8_t)(n >> 16), (uint8_t)(n >> 8), (uint8_t)n};
        conn_->inject(encode_frame(ack));
    }

    std::shared_ptr<MemoryConnection> conn_;
    uint32_t next_seq_{1};
    std::vector<uint8_t> inbuf_;
};

inline std::vector<uint8_t> pattern(size_t n, uint8_t seed = 0) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; i++)
        v[i] = (uint8_t)((i * 31 + seed) ^ (i >> 8));
    return v;
}

} // namespace testing
} // namespace shotlink
