
#pragma once
#include <asio.hpp>
#include <memory>
#include "transport.hpp"

namespace shotlink {

class BleConnection : public Connection,
                      public std::enable_shared_from_this<BleConnection> {
public:
    BleConnection(asio::io_context& io, GattPeripheral& gatt, uint16_t handle, uint16_t mtu);

    ConnectionType type() const override { return ConnectionType::Bluetooth; }
    std::string peer() const override;
    size_t max_frame_size() const override { return 16 * 1024; }
    bool is_open() const override { return open_; }
    void send(std::vector<uint8_t> bytes, SendHandler done) override;
    void receive(ChunkHandler on_chunk, CloseHandler on_closed) override;
    void close() override;

    uint16_t handle() const { return handle_; }
    size_t notify_size() const;
    void on_write(std::vector<uint8_t> bytes);
    void on_disconnected();

private:
    void finish(std::error_code ec, bool drop_radio);

    asio::io_context& io_;
    GattPeripheral& gatt_;
    uint16_t handle_;
    uint16_t mtu_;
    bool open_{true};
    ChunkHandler on_chunk_;
    CloseHandler on_closed_;
};

// Bluetooth peripheral-advertise mode over a GATT characteristic pair.
class BleTransport : public Transport {
public:
    BleTransport(asio::io_context& io, GattPeripheral& gatt, std::string device_name);
    ~BleTransport() override;

    bool open(AcceptHandler on_connection) override;
    void shutdown() override;

private:
    void handle_connect(uint16_t handle, uint16_t mtu);
    void handle_disconnect(uint16_t handle);
    void handle_write(uint16_t handle, std::vector<uint8_t> bytes);

    asio::io_context& io_;
    GattPeripheral& gatt_;
    std::string device_name_;
    AcceptHandler on_connection_;
    std::shared_ptr<BleConnection> active_;
    std::shared_ptr<bool> alive_;
};

} // namespace shotlink
