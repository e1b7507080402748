
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "config.hpp"

namespace shotlink {

// One client link. All handlers run on the owning io_context.
class Connection {
public:
    using ChunkHandler = std::function<void(const uint8_t* data, size_t len)>;
    using CloseHandler = std::function<void(std::error_code)>;
    using SendHandler = std::function<void(std::error_code)>;

    virtual ~Connection() = default;
    virtual ConnectionType type() const = 0;
    virtual std::string peer() const = 0;
    // Largest frame the link carries in one piece, overhead included.
    virtual size_t max_frame_size() const = 0;
    virtual bool is_open() const = 0;
    virtual void send(std::vector<uint8_t> bytes, SendHandler done = {}) = 0;
    // Received chunks flow into on_chunk until the link ends; on_closed is
    // called exactly once afterwards.
    virtual void receive(ChunkHandler on_chunk, CloseHandler on_closed) = 0;
    virtual void close() = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

class Transport {
public:
    // ec is TransportErrc::busy when a second client is turned away.
    using AcceptHandler = std::function<void(std::error_code ec, ConnectionPtr conn)>;

    virtual ~Transport() = default;
    virtual bool open(AcceptHandler on_connection) = 0;
    virtual void shutdown() = 0;
};

// Radio collaborator for the Bluetooth peripheral role. Callbacks may fire
// on any thread.
class GattPeripheral {
public:
    struct Callbacks {
        std::function<void(uint16_t conn_handle, uint16_t mtu)> on_connect;
        std::function<void(uint16_t conn_handle)> on_disconnect;
        std::function<void(uint16_t conn_handle, const uint8_t* data, size_t len)> on_write;
    };

    virtual ~GattPeripheral() = default;
    virtual bool advertise(const std::string& name, Callbacks cb) = 0;
    virtual void stop_advertising() = 0;
    virtual bool notify(uint16_t conn_handle, const uint8_t* data, size_t len) = 0;
    virtual void disconnect(uint16_t conn_handle) = 0;
};

} // namespace shotlink
