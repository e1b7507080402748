
#include "ble_transport.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace shotlink {

// ATT notification header
static constexpr uint16_t kAttOverhead = 3;
static constexpr uint16_t kMinMtu = 23;

BleConnection::BleConnection(asio::io_context &io, GattPeripheral &gatt,
                             uint16_t handle, uint16_t mtu)
    : io_(io), gatt_(gatt), handle_(handle),
      mtu_(std::max(mtu, kMinMtu)) {}

std::string BleConnection::peer() const {
  return "ble#" + std::to_string(handle_);
}

size_t BleConnection::notify_size() const { return mtu_ - kAttOverhead; }

void BleConnection::send(std::vector<uint8_t> bytes, SendHandler done) {
  auto self = shared_from_this();
  if (!open_) {
    if (done)
      asio::post(io_, [done]() {
        done(make_error_code(TransportErrc::link_lost));
      });
    return;
  }
  size_t step = notify_size();
  for (size_t off = 0; off < bytes.size(); off += step) {
    size_t n = std::min(step, bytes.size() - off);
    if (!gatt_.notify(handle_, bytes.data() + off, n)) {
      Logger::instance().log(LogLevel::WARN, "ble",
                             "notify failed on %s, dropping link",
                             peer().c_str());
      if (done)
        asio::post(io_, [done]() {
          done(make_error_code(TransportErrc::link_lost));
        });
      asio::post(io_, [this, self]() {
        finish(make_error_code(TransportErrc::link_lost), true);
      });
      return;
    }
  }
  if (done)
    asio::post(io_, [done]() { done(std::error_code()); });
}

void BleConnection::receive(ChunkHandler on_chunk, CloseHandler on_closed) {
  on_chunk_ = std::move(on_chunk);
  on_closed_ = std::move(on_closed);
}

void BleConnection::on_write(std::vector<uint8_t> bytes) {
  if (open_ && on_chunk_)
    on_chunk_(bytes.data(), bytes.size());
}

void BleConnection::on_disconnected() {
  finish(make_error_code(TransportErrc::link_lost), false);
}

void BleConnection::close() {
  finish(make_error_code(TransportErrc::link_lost), true);
}

void BleConnection::finish(std::error_code ec, bool drop_radio) {
  if (!open_)
    return;
  open_ = false;
  Logger::instance().log(LogLevel::INFO, "ble", "link %s closed",
                         peer().c_str());
  if (drop_radio)
    gatt_.disconnect(handle_);
  auto closed = std::move(on_closed_);
  on_chunk_ = nullptr;
  if (closed)
    closed(ec);
}

BleTransport::BleTransport(asio::io_context &io, GattPeripheral &gatt,
                           std::string device_name)
    : io_(io), gatt_(gatt), device_name_(std::move(device_name)),
      alive_(std::make_shared<bool>(true)) {}

BleTransport::~BleTransport() { *alive_ = false; }

bool BleTransport::open(AcceptHandler on_connection) {
  on_connection_ = std::move(on_connection);
  std::weak_ptr<bool> alive = alive_;
  GattPeripheral::Callbacks cb;
  cb.on_connect = [this, alive](uint16_t h, uint16_t mtu) {
    asio::post(io_, [this, alive, h, mtu]() {
      if (alive.lock())
        handle_connect(h, mtu);
    });
  };
  cb.on_disconnect = [this, alive](uint16_t h) {
    asio::post(io_, [this, alive, h]() {
      if (alive.lock())
        handle_disconnect(h);
    });
  };
  cb.on_write = [this, alive](uint16_t h, const uint8_t *data, size_t len) {
    std::vector<uint8_t> bytes(data, data + len);
    asio::post(io_, [this, alive, h, bytes = std::move(bytes)]() mutable {
      if (alive.lock())
        handle_write(h, std::move(bytes));
    });
  };
  if (!gatt_.advertise(device_name_, std::move(cb))) {
    Logger::instance().log(LogLevel::ERROR, "ble", "advertising as %s failed",
                           device_name_.c_str());
    return false;
  }
  Logger::instance().log(LogLevel::INFO, "ble", "advertising as %s",
                         device_name_.c_str());
  return true;
}

void BleTransport::handle_connect(uint16_t handle, uint16_t mtu) {
  if (active_ && active_->is_open()) {
    Logger::instance().log(LogLevel::WARN, "ble",
                           "rejecting central #%u, link busy",
                           (unsigned)handle);
    gatt_.disconnect(handle);
    if (on_connection_)
      on_connection_(make_error_code(TransportErrc::busy), nullptr);
    return;
  }
  active_ = std::make_shared<BleConnection>(io_, gatt_, handle, mtu);
  Logger::instance().log(LogLevel::INFO, "ble", "central #%u connected mtu=%u",
                         (unsigned)handle, (unsigned)mtu);
  if (on_connection_)
    on_connection_(std::error_code(), active_);
}

void BleTransport::handle_disconnect(uint16_t handle) {
  if (active_ && active_->handle() == handle) {
    auto conn = std::move(active_);
    active_.reset();
    conn->on_disconnected();
  }
}

void BleTransport::handle_write(uint16_t handle, std::vector<uint8_t> bytes) {
  if (active_ && active_->handle() == handle)
    active_->on_write(std::move(bytes));
}

void BleTransport::shutdown() {
  gatt_.stop_advertising();
  if (active_) {
    auto conn = std::move(active_);
    active_.reset();
    conn->close();
  }
}

} // namespace shotlink
