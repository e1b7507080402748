#include "ble_transport.hpp"
#include "errors.hpp"
#include "framing.hpp"
#include "tcp_transport.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace shotlink;
using namespace shotlink::testing;

namespace {

template <typename Pred>
bool run_until(asio::io_context &io, Pred pred,
               std::chrono::milliseconds limit = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred() && std::chrono::steady_clock::now() < deadline) {
    io.restart();
    io.run_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class FakeGatt : public GattPeripheral {
public:
  bool advertise(const std::string &name, Callbacks cb) override {
    advertised = name;
    callbacks = std::move(cb);
    return true;
  }
  void stop_advertising() override { advertising_stopped = true; }
  bool notify(uint16_t handle, const uint8_t *data, size_t len) override {
    if (fail_notify)
      return false;
    notified.emplace_back(handle, std::vector<uint8_t>(data, data + len));
    return true;
  }
  void disconnect(uint16_t handle) override { disconnected.push_back(handle); }

  std::string advertised;
  Callbacks callbacks;
  bool advertising_stopped{false};
  bool fail_notify{false};
  std::vector<std::pair<uint16_t, std::vector<uint8_t>>> notified;
  std::vector<uint16_t> disconnected;
};

struct Accepted {
  std::vector<ConnectionPtr> conns;
  std::vector<std::error_code> errors;
  Transport::AcceptHandler handler() {
    return [this](std::error_code ec, ConnectionPtr c) {
      if (ec)
        errors.push_back(ec);
      else
        conns.push_back(std::move(c));
    };
  }
};

} // namespace

TEST(TcpTransport, AcceptsOneClientAndRejectsSecondAsBusy) {
  asio::io_context io;
  TcpTransport transport(io, "127.0.0.1", 0);
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  uint16_t port = transport.local_port();
  ASSERT_NE(port, 0);

  asio::ip::tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), port);
  asio::ip::tcp::socket first(io), second(io);
  first.connect(ep);
  ASSERT_TRUE(run_until(io, [&] { return acc.conns.size() == 1; }));
  EXPECT_EQ(acc.conns[0]->type(), ConnectionType::WiFi);

  second.connect(ep);
  ASSERT_TRUE(run_until(io, [&] { return acc.errors.size() == 1; }));
  EXPECT_EQ(acc.errors[0], TransportErrc::busy);

  // The rejected socket sees end of stream.
  std::error_code ec;
  uint8_t byte;
  second.read_some(asio::buffer(&byte, 1), ec);
  EXPECT_TRUE(ec);
  transport.shutdown();
}

TEST(TcpTransport, ChunksFlowBothWaysAndCloseFiresOnce) {
  asio::io_context io;
  TcpTransport transport(io, "127.0.0.1", 0);
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  asio::ip::tcp::socket client(io);
  client.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                                         transport.local_port()));
  ASSERT_TRUE(run_until(io, [&] { return acc.conns.size() == 1; }));
  auto conn = acc.conns[0];

  std::vector<uint8_t> inbound;
  int closed = 0;
  std::error_code close_ec;
  conn->receive(
      [&](const uint8_t *d, size_t n) { inbound.insert(inbound.end(), d, d + n); },
      [&](std::error_code ec) {
        closed++;
        close_ec = ec;
      });

  std::string hello = "hello bridge";
  asio::write(client, asio::buffer(hello));
  ASSERT_TRUE(run_until(io, [&] { return inbound.size() == hello.size(); }));
  EXPECT_EQ(std::string(inbound.begin(), inbound.end()), hello);

  bool sent = false;
  conn->send(std::vector<uint8_t>{'o', 'k'}, [&](std::error_code ec) {
    EXPECT_FALSE(ec);
    sent = true;
  });
  ASSERT_TRUE(run_until(io, [&] { return sent; }));
  char reply[2];
  asio::read(client, asio::buffer(reply));
  EXPECT_EQ(reply[0], 'o');

  client.close();
  ASSERT_TRUE(run_until(io, [&] { return closed > 0; }));
  run_until(io, [] { return false; }, std::chrono::milliseconds(20));
  EXPECT_EQ(closed, 1);
  EXPECT_TRUE(close_ec);
  EXPECT_FALSE(conn->is_open());

  bool failed = false;
  conn->send(std::vector<uint8_t>{1}, [&](std::error_code ec) {
    failed = ec == TransportErrc::link_lost;
  });
  ASSERT_TRUE(run_until(io, [&] { return failed; }));

  // A new client may connect once the first is gone.
  asio::ip::tcp::socket again(io);
  again.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                                        transport.local_port()));
  ASSERT_TRUE(run_until(io, [&] { return acc.conns.size() == 2; }));
  EXPECT_TRUE(acc.errors.empty());
  transport.shutdown();
}

TEST(TcpTransport, OpenFailsOnUnusableAddress) {
  asio::io_context io;
  TcpTransport transport(io, "not-an-address", 0);
  Accepted acc;
  EXPECT_FALSE(transport.open(acc.handler()));
}

TEST(BleTransport, NotificationsAreSplitByMtu) {
  asio::io_context io;
  FakeGatt gatt;
  BleTransport transport(io, gatt, "shotlink-cam");
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  EXPECT_EQ(gatt.advertised, "shotlink-cam");

  gatt.callbacks.on_connect(1, 23);
  drain(io);
  ASSERT_EQ(acc.conns.size(), 1u);
  auto conn = acc.conns[0];
  EXPECT_EQ(conn->type(), ConnectionType::Bluetooth);

  conn->send(pattern(50), {});
  ASSERT_EQ(gatt.notified.size(), 3u);
  EXPECT_EQ(gatt.notified[0].second.size(), 20u);
  EXPECT_EQ(gatt.notified[1].second.size(), 20u);
  EXPECT_EQ(gatt.notified[2].second.size(), 10u);
  std::vector<uint8_t> joined;
  for (auto &n : gatt.notified)
    joined.insert(joined.end(), n.second.begin(), n.second.end());
  EXPECT_EQ(joined, pattern(50));
}

TEST(BleTransport, WritesFromRadioThreadBecomeChunks) {
  asio::io_context io;
  FakeGatt gatt;
  BleTransport transport(io, gatt, "cam");
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  gatt.callbacks.on_connect(7, 185);
  drain(io);
  ASSERT_EQ(acc.conns.size(), 1u);
  std::vector<uint8_t> got;
  acc.conns[0]->receive(
      [&](const uint8_t *d, size_t n) { got.insert(got.end(), d, d + n); },
      [](std::error_code) {});

  std::thread radio([&] {
    uint8_t a[] = {1, 2, 3};
    uint8_t b[] = {4, 5};
    gatt.callbacks.on_write(7, a, sizeof(a));
    gatt.callbacks.on_write(9, b, sizeof(b)); // unknown handle
    gatt.callbacks.on_write(7, b, sizeof(b));
  });
  radio.join();
  drain(io);
  EXPECT_EQ(got, (std::vector<uint8_t>{1, 2, 3, 4, 5}));
}

TEST(BleTransport, SecondCentralIsBusyAndDisconnectCloses) {
  asio::io_context io;
  FakeGatt gatt;
  BleTransport transport(io, gatt, "cam");
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  gatt.callbacks.on_connect(1, 64);
  gatt.callbacks.on_connect(2, 64);
  drain(io);
  ASSERT_EQ(acc.conns.size(), 1u);
  ASSERT_EQ(acc.errors.size(), 1u);
  EXPECT_EQ(acc.errors[0], TransportErrc::busy);
  EXPECT_EQ(gatt.disconnected, std::vector<uint16_t>{2});

  int closed = 0;
  acc.conns[0]->receive([](const uint8_t *, size_t) {},
                        [&](std::error_code ec) {
                          closed++;
                          EXPECT_EQ(ec, TransportErrc::link_lost);
                        });
  gatt.callbacks.on_disconnect(1);
  drain(io);
  EXPECT_EQ(closed, 1);
  EXPECT_FALSE(acc.conns[0]->is_open());

  gatt.callbacks.on_connect(3, 64);
  drain(io);
  EXPECT_EQ(acc.conns.size(), 2u);
  transport.shutdown();
  EXPECT_TRUE(gatt.advertising_stopped);
  EXPECT_EQ(gatt.disconnected.back(), 3);
}

TEST(BleTransport, NotifyFailureDropsTheLink) {
  asio::io_context io;
  FakeGatt gatt;
  BleTransport transport(io, gatt, "cam");
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  gatt.callbacks.on_connect(1, 23);
  drain(io);
  ASSERT_EQ(acc.conns.size(), 1u);
  auto conn = acc.conns[0];
  int closed = 0;
  conn->receive([](const uint8_t *, size_t) {},
                [&](std::error_code) { closed++; });
  gatt.fail_notify = true;
  std::error_code send_ec;
  conn->send(pattern(10), [&](std::error_code ec) { send_ec = ec; });
  drain(io);
  EXPECT_EQ(send_ec, TransportErrc::link_lost);
  EXPECT_EQ(closed, 1);
  EXPECT_FALSE(conn->is_open());
}

TEST(BleTransport, FramingNegotiatesPayloadFromBleFrameSize) {
  asio::io_context io;
  FakeGatt gatt;
  BleTransport transport(io, gatt, "cam");
  Accepted acc;
  ASSERT_TRUE(transport.open(acc.handler()));
  gatt.callbacks.on_connect(1, 247);
  drain(io);
  ASSERT_EQ(acc.conns.size(), 1u);
  FramingConfig cfg;
  cfg.max_payload = 0xFFFF;
  auto framing = std::make_shared<FramingLayer>(io, acc.conns[0], cfg);
  EXPECT_EQ(framing->max_payload(),
            acc.conns[0]->max_frame_size() - kFrameOverhead);
  EXPECT_EQ(framing->state().transport, ConnectionType::Bluetooth);
}
