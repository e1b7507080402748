
#include "tcp_transport.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace shotlink {

TcpConnection::TcpConnection(tcp::socket sock)
    : sock_(std::move(sock)), read_buf_(16 * 1024) {
  std::error_code ec;
  auto ep = sock_.remote_endpoint(ec);
  if (!ec)
    peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
  sock_.set_option(tcp::no_delay(true), ec);
}

void TcpConnection::receive(ChunkHandler on_chunk, CloseHandler on_closed) {
  on_chunk_ = std::move(on_chunk);
  on_closed_ = std::move(on_closed);
  if (!receiving_ && open_) {
    receiving_ = true;
    do_read();
  }
}

void TcpConnection::do_read() {
  auto self = shared_from_this();
  sock_.async_read_some(asio::buffer(read_buf_),
                        [this, self](std::error_code ec, std::size_t n) {
                          if (ec) {
                            fail(ec);
                            return;
                          }
                          if (on_chunk_)
                            on_chunk_(read_buf_.data(), n);
                          if (open_)
                            do_read();
                        });
}

void TcpConnection::send(std::vector<uint8_t> bytes, SendHandler done) {
  if (!open_) {
    if (done)
      asio::post(sock_.get_executor(), [done]() {
        done(make_error_code(TransportErrc::link_lost));
      });
    return;
  }
  write_q_.push_back(Pending{std::move(bytes), std::move(done)});
  if (write_q_.size() == 1)
    do_write();
}

void TcpConnection::do_write() {
  if (write_q_.empty())
    return;
  auto self = shared_from_this();
  asio::async_write(sock_, asio::buffer(write_q_.front().bytes),
                    [this, self](std::error_code ec, std::size_t) {
                      if (ec) {
                        fail(ec);
                        return;
                      }
                      auto done = std::move(write_q_.front().done);
                      write_q_.pop_front();
                      if (done)
                        done(std::error_code());
                      if (!write_q_.empty())
                        do_write();
                    });
}

void TcpConnection::fail(std::error_code ec) {
  if (!open_)
    return;
  open_ = false;
  if (ec != asio::error::operation_aborted && ec != asio::error::eof)
    Logger::instance().log(LogLevel::WARN, "tcp", "link %s lost: %s",
                           peer_.c_str(), ec.message().c_str());
  else
    Logger::instance().log(LogLevel::INFO, "tcp", "link %s closed",
                           peer_.c_str());
  std::error_code ignored;
  sock_.close(ignored);
  auto pending = std::move(write_q_);
  write_q_.clear();
  for (auto &p : pending)
    if (p.done)
      p.done(make_error_code(TransportErrc::link_lost));
  auto closed = std::move(on_closed_);
  on_chunk_ = nullptr;
  if (closed)
    closed(make_error_code(TransportErrc::link_lost));
}

void TcpConnection::close() { fail(asio::error::operation_aborted); }

TcpTransport::TcpTransport(asio::io_context &io, const std::string &host,
                           uint16_t port)
    : io_(io), host_(host), port_(port), acceptor_(io) {}

bool TcpTransport::open(AcceptHandler on_connection) {
  on_connection_ = std::move(on_connection);
  std::error_code ec;
  auto addr = asio::ip::make_address(host_, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "tcp", "bad listen address %s",
                           host_.c_str());
    return false;
  }
  tcp::endpoint ep(addr, port_);
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "tcp", "listen %s:%u failed: %s",
                           host_.c_str(), (unsigned)port_,
                           ec.message().c_str());
    return false;
  }
  Logger::instance().log(LogLevel::INFO, "tcp", "listening on %s:%u",
                         host_.c_str(), (unsigned)local_port());
  do_accept();
  return true;
}

uint16_t TcpTransport::local_port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? port_ : ep.port();
}

void TcpTransport::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, tcp::socket sock) {
    if (ec) {
      if (ec == asio::error::operation_aborted)
        return;
      Logger::instance().log(LogLevel::ERROR, "tcp", "accept failed: %s",
                             ec.message().c_str());
      do_accept();
      return;
    }
    auto current = active_.lock();
    if (current && current->is_open()) {
      Logger::instance().log(LogLevel::WARN, "tcp",
                             "rejecting second client, link busy");
      std::error_code ignored;
      sock.close(ignored);
      if (on_connection_)
        on_connection_(make_error_code(TransportErrc::busy), nullptr);
    } else {
      auto conn = std::make_shared<TcpConnection>(std::move(sock));
      active_ = conn;
      Logger::instance().log(LogLevel::INFO, "tcp", "client %s connected",
                             conn->peer().c_str());
      if (on_connection_)
        on_connection_(std::error_code(), conn);
    }
    do_accept();
  });
}

void TcpTransport::shutdown() {
  std::error_code ignored;
  acceptor_.close(ignored);
  if (auto current = active_.lock())
    current->close();
}

} // namespace shotlink
