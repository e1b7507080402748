
#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include "transport.hpp"

namespace shotlink {

class TcpConnection : public Connection,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    using tcp = asio::ip::tcp;
    explicit TcpConnection(tcp::socket sock);

    ConnectionType type() const override { return ConnectionType::WiFi; }
    std::string peer() const override { return peer_; }
    size_t max_frame_size() const override { return 64 * 1024; }
    bool is_open() const override { return open_; }
    void send(std::vector<uint8_t> bytes, SendHandler done) override;
    void receive(ChunkHandler on_chunk, CloseHandler on_closed) override;
    void close() override;

private:
    struct Pending {
        std::vector<uint8_t> bytes;
        SendHandler done;
    };

    void do_read();
    void do_write();
    void fail(std::error_code ec);

    tcp::socket sock_;
    std::string peer_;
    bool open_{true};
    bool receiving_{false};
    std::vector<uint8_t> read_buf_;
    std::deque<Pending> write_q_;
    ChunkHandler on_chunk_;
    CloseHandler on_closed_;
};

// Wi-Fi listen mode: accepts one client at a time.
class TcpTransport : public Transport {
public:
    using tcp = asio::ip::tcp;
    TcpTransport(asio::io_context& io, const std::string& host, uint16_t port);

    bool open(AcceptHandler on_connection) override;
    void shutdown() override;
    uint16_t local_port() const;

private:
    void do_accept();

    asio::io_context& io_;
    std::string host_;
    uint16_t port_;
    tcp::acceptor acceptor_;
    AcceptHandler on_connection_;
    std::weak_ptr<TcpConnection> active_;
};

} // namespace shotlink
