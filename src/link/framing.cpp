
#include "framing.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace shotlink {

FramingConfig FramingConfig::from(const BridgeConfig &cfg) {
  FramingConfig f;
  f.window_size = cfg.window_size;
  f.retry_limit = cfg.retry_limit;
  f.rto = cfg.retransmit_timeout;
  f.rto_max = cfg.retransmit_timeout_max;
  f.max_payload = cfg.max_frame_payload;
  return f;
}

FramingLayer::FramingLayer(asio::io_context &io, ConnectionPtr conn,
                           const FramingConfig &cfg)
    : io_(io), conn_(std::move(conn)), cfg_(cfg), timer_(io) {
  if (cfg_.window_size == 0)
    cfg_.window_size = 1;
  state_.transport = conn_->type();
  size_t link_max = conn_->max_frame_size() > kFrameOverhead
                        ? conn_->max_frame_size() - kFrameOverhead
                        : 0;
  size_t want = std::max<size_t>(cfg_.max_payload, kMinFramePayload);
  if (want != cfg_.max_payload)
    Logger::instance().log(LogLevel::WARN, "framing",
                           "payload %u too small for control messages, using %zu",
                           (unsigned)cfg_.max_payload, want);
  if (link_max < kMinFramePayload)
    Logger::instance().log(LogLevel::ERROR, "framing",
                           "%s frames of %zu bytes cannot carry control messages",
                           to_string(state_.transport), conn_->max_frame_size());
  state_.max_frame_payload = (uint16_t)std::min<size_t>(
      std::min<size_t>(want, link_max), kMaxFramePayload);
}

FramingLayer::~FramingLayer() {
  std::error_code ignored;
  timer_.cancel(ignored);
}

void FramingLayer::start(DeliverHandler on_deliver, AckHandler on_ack,
                         ErrorHandler on_error) {
  on_deliver_ = std::move(on_deliver);
  on_ack_ = std::move(on_ack);
  on_error_ = std::move(on_error);
  state_.status = LinkStatus::Connecting;
  std::weak_ptr<FramingLayer> weak = shared_from_this();
  conn_->receive(
      [weak](const uint8_t *data, size_t len) {
        if (auto self = weak.lock())
          self->on_bytes(data, len);
      },
      [weak](std::error_code ec) {
        if (auto self = weak.lock())
          self->fail(ec ? ec : make_error_code(TransportErrc::link_lost));
      });
  if (!conn_->is_open()) {
    fail(make_error_code(TransportErrc::link_lost));
    return;
  }
  state_.status = LinkStatus::Connected;
  Logger::instance().log(LogLevel::INFO, "framing",
                         "%s link %s up, window=%u payload=%u",
                         to_string(state_.transport), conn_->peer().c_str(),
                         (unsigned)cfg_.window_size,
                         (unsigned)state_.max_frame_payload);
}

uint32_t FramingLayer::submit(FrameType type, std::vector<uint8_t> payload) {
  if (state_.status != LinkStatus::Connected || type == FrameType::Ack)
    return 0;
  if (payload.size() > state_.max_frame_payload) {
    Logger::instance().log(LogLevel::ERROR, "framing",
                           "payload of %zu bytes exceeds frame limit %u",
                           payload.size(), (unsigned)state_.max_frame_payload);
    return 0;
  }
  Frame f;
  f.seq = next_seq_++;
  f.type = type;
  f.payload = std::move(payload);
  Outbound o;
  o.seq = f.seq;
  o.wire = encode_frame(f);
  o.rto = cfg_.rto;
  backlog_.push_back(std::move(o));
  pump();
  return f.seq;
}

size_t FramingLayer::window_available() const {
  if (state_.status != LinkStatus::Connected)
    return 0;
  size_t used = in_flight_.size() + backlog_.size();
  return used >= cfg_.window_size ? 0 : cfg_.window_size - used;
}

void FramingLayer::pump() {
  bool sent = false;
  while (in_flight_.size() < cfg_.window_size && !backlog_.empty()) {
    in_flight_.push_back(std::move(backlog_.front()));
    backlog_.pop_front();
    transmit(in_flight_.back());
    sent = true;
  }
  state_.in_flight = in_flight_.size();
  if (sent)
    arm_timer();
}

void FramingLayer::transmit(Outbound &o) {
  o.deadline = clock::now() + o.rto;
  conn_->send(o.wire);
}

void FramingLayer::arm_timer() {
  if (in_flight_.empty()) {
    if (timer_armed_) {
      std::error_code ignored;
      timer_.cancel(ignored);
      timer_armed_ = false;
    }
    return;
  }
  auto earliest = in_flight_.front().deadline;
  for (const auto &o : in_flight_)
    earliest = std::min(earliest, o.deadline);
  timer_.expires_at(earliest);
  timer_armed_ = true;
  auto self = shared_from_this();
  timer_.async_wait([this, self](std::error_code ec) {
    if (ec == asio::error::operation_aborted)
      return;
    on_timer();
  });
}

void FramingLayer::on_timer() {
  timer_armed_ = false;
  if (state_.status != LinkStatus::Connected)
    return;
  auto now = clock::now();
  for (auto &o : in_flight_) {
    if (o.deadline > now)
      continue;
    if (o.retries >= cfg_.retry_limit) {
      Logger::instance().log(LogLevel::WARN, "framing",
                             "seq %u unacknowledged after %u retries",
                             o.seq, (unsigned)o.retries);
      fail(make_error_code(FramingErrc::peer_unresponsive));
      return;
    }
    o.retries++;
    o.rto = std::min(o.rto * 2, cfg_.rto_max);
    Logger::instance().log(LogLevel::DEBUG, "framing",
                           "retransmit seq %u attempt %u rto=%lldms", o.seq,
                           (unsigned)o.retries, (long long)o.rto.count());
    transmit(o);
  }
  arm_timer();
}

void FramingLayer::on_bytes(const uint8_t *data, size_t len) {
  if (state_.status != LinkStatus::Connected)
    return;
  inbuf_.insert(inbuf_.end(), data, data + len);
  size_t off = 0;
  bool resyncing = false;
  while (off < inbuf_.size()) {
    Frame f;
    size_t consumed = 0;
    auto st = decode_frame(inbuf_.data() + off, inbuf_.size() - off, f,
                           consumed, state_.max_frame_payload);
    if (st == DecodeStatus::NeedMore)
      break;
    off += consumed;
    if (st == DecodeStatus::Corrupt) {
      if (!resyncing)
        Logger::instance().log(LogLevel::DEBUG, "framing",
                               "corrupt input, resynchronizing");
      resyncing = true;
      continue;
    }
    resyncing = false;
    handle_frame(std::move(f));
    if (state_.status != LinkStatus::Connected)
      return;
  }
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
}

void FramingLayer::handle_frame(Frame &&f) {
  if (f.type == FrameType::Ack) {
    handle_ack(f);
    return;
  }
  if (f.seq == 0)
    return;
  std::vector<Frame> ready;
  if (f.seq == expected_seq_) {
    expected_seq_++;
    ready.push_back(std::move(f));
    for (auto it = reorder_.begin();
         it != reorder_.end() && it->first == expected_seq_;
         it = reorder_.erase(it)) {
      ready.push_back(std::move(it->second));
      expected_seq_++;
    }
  } else if (f.seq > expected_seq_ &&
             f.seq - expected_seq_ < cfg_.window_size) {
    reorder_.emplace(f.seq, std::move(f));
  } else {
    Logger::instance().log(LogLevel::TRACE, "framing",
                           "drop seq %u, expecting %u", f.seq, expected_seq_);
  }
  send_ack();
  for (auto &r : ready) {
    if (state_.status != LinkStatus::Connected)
      return;
    if (on_deliver_)
      on_deliver_(r.type, std::move(r.payload));
  }
}

void FramingLayer::handle_ack(const Frame &f) {
  if (f.payload.size() != 4)
    return;
  const uint8_t *p = f.payload.data();
  uint32_t n = ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
               ((uint32_t)p[2] << 8) | (uint32_t)p[3];
  uint32_t highest_sent =
      in_flight_.empty() ? last_acked_ : in_flight_.back().seq;
  if (n <= last_acked_ || n > highest_sent)
    return;
  while (!in_flight_.empty() && in_flight_.front().seq <= n)
    in_flight_.pop_front();
  last_acked_ = n;
  pump();
  state_.in_flight = in_flight_.size();
  arm_timer();
  if (on_ack_)
    on_ack_(n);
}

void FramingLayer::send_ack() {
  uint32_t n = expected_seq_ - 1;
  Frame ack;
  ack.type = FrameType::Ack;
  ack.payload = {(uint8_t)(n >> 24), (uint8_t)(n >> 16), (uint8_t)(n >> 8),
                 (uint8_t)n};
  conn_->send(encode_frame(ack));
}

void FramingLayer::teardown() {
  state_.status = LinkStatus::Disconnected;
  in_flight_.clear();
  backlog_.clear();
  reorder_.clear();
  inbuf_.clear();
  state_.in_flight = 0;
  std::error_code ignored;
  timer_.cancel(ignored);
  timer_armed_ = false;
  conn_->close();
}

void FramingLayer::fail(std::error_code ec) {
  if (state_.status == LinkStatus::Disconnected)
    return;
  Logger::instance().log(LogLevel::WARN, "framing", "link %s down: %s",
                         conn_->peer().c_str(), ec.message().c_str());
  teardown();
  auto handler = on_error_;
  if (handler)
    handler(ec);
}

void FramingLayer::close() {
  if (state_.status == LinkStatus::Disconnected)
    return;
  Logger::instance().log(LogLevel::INFO, "framing", "closing link %s",
                         conn_->peer().c_str());
  teardown();
}

} // namespace shotlink
