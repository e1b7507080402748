
#include "session.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>

namespace shotlink {

const char *to_string(SessionState s) {
  switch (s) {
  case SessionState::Queued:
    return "Queued";
  case SessionState::Streaming:
    return "Streaming";
  case SessionState::Paused:
    return "Paused";
  case SessionState::Interrupted:
    return "Interrupted";
  case SessionState::Completed:
    return "Completed";
  case SessionState::Aborted:
    return "Aborted";
  }
  return "?";
}

const char *to_string(AbortReason r) {
  switch (r) {
  case AbortReason::None:
    return "none";
  case AbortReason::CameraDetached:
    return "camera detached";
  case AbortReason::CameraError:
    return "camera error";
  case AbortReason::TtlExpired:
    return "ttl expired";
  case AbortReason::Cancelled:
    return "cancelled";
  case AbortReason::ObjectRemoved:
    return "object removed";
  case AbortReason::PeerUnresponsive:
    return "peer unresponsive";
  case AbortReason::NotFound:
    return "not found";
  case AbortReason::UnknownSession:
    return "unknown session";
  }
  return "?";
}

SessionController::SessionController(asio::io_context &io,
                                     std::shared_ptr<FramingLayer> framing,
                                     const BridgeConfig &cfg)
    : io_(io), framing_(std::move(framing)), heartbeat_(cfg.credit_heartbeat),
      heartbeat_timer_(io), bank_(cfg.initial_credit) {}

size_t SessionController::chunk_size() const {
  size_t p = framing_->max_payload();
  return p > kDataChunkHeaderSize ? p - kDataChunkHeaderSize : 0;
}

void SessionController::begin(const TransferSession &s) {
  if (active_)
    end();
  active_ = true;
  id_ = s.id;
  object_id_ = s.object_id;
  total_ = s.total_size;
  next_offset_ = s.acked_offset;
  acked_offset_ = s.acked_offset;
  credit_ = bank_;
  bank_ = 0;
  pending_.clear();

  ControlMessage offer;
  offer.type = ControlType::SESSION_OFFER;
  offer.session_id = id_;
  offer.object_id = object_id_;
  offer.offset = acked_offset_;
  offer.size = total_ ? *total_ : kUnknownSize;
  offer.text = s.filename;
  size_t payload = framing_->max_payload();
  truncate_utf8(offer.text, payload > kSessionOfferHeaderSize
                                ? payload - kSessionOfferHeaderSize
                                : 0);
  framing_->submit(FrameType::Control, encode_control(offer));

  Logger::instance().log(LogLevel::INFO, "session",
                         "%s begin object %u at %llu credit %llu",
                         to_string(id_).c_str(), object_id_,
                         (unsigned long long)acked_offset_,
                         (unsigned long long)credit_);

  state_ = SessionState::Queued;
  set_state(credit_ > 0 ? SessionState::Streaming : SessionState::Paused);
  if (total_ && acked_offset_ >= *total_) {
    auto self = shared_from_this();
    SessionId id = id_;
    asio::post(io_, [this, self, id] {
      if (active_ && id_ == id)
        check_complete();
    });
  }
}

void SessionController::end() {
  if (!active_)
    return;
  std::error_code ignored;
  heartbeat_timer_.cancel(ignored);
  bank_ += credit_;
  credit_ = 0;
  pending_.clear();
  active_ = false;
}

void SessionController::stop() {
  end();
  bank_ = 0;
  cb_ = Callbacks{};
}

void SessionController::grant(uint64_t bytes) {
  if (!active_) {
    bank_ += bytes;
    Logger::instance().log(LogLevel::DEBUG, "session",
                           "banked %llu bytes of credit (bank %llu)",
                           (unsigned long long)bytes,
                           (unsigned long long)bank_);
    return;
  }
  credit_ += bytes;
  Logger::instance().log(LogLevel::DEBUG, "session",
                         "%s granted %llu bytes (credit %llu)",
                         to_string(id_).c_str(), (unsigned long long)bytes,
                         (unsigned long long)credit_);
  if (state_ == SessionState::Paused && credit_ > 0)
    set_state(SessionState::Streaming);
  else if (state_ == SessionState::Paused)
    arm_heartbeat();
  if (active_ && state_ == SessionState::Streaming && cb_.on_ready)
    cb_.on_ready();
}

void SessionController::set_total(uint64_t size) {
  if (!active_)
    return;
  total_ = size;
  check_complete();
}

uint64_t SessionController::wanted() const {
  if (!active_ || state_ != SessionState::Streaming)
    return 0;
  uint64_t room = (uint64_t)framing_->window_available() * chunk_size();
  uint64_t n = std::min(credit_, room);
  if (total_)
    n = std::min(n, *total_ > next_offset_ ? *total_ - next_offset_ : 0);
  return n;
}

size_t SessionController::push(uint64_t offset, const uint8_t *data,
                               size_t len) {
  if (!active_ || state_ != SessionState::Streaming)
    return 0;
  if (offset > next_offset_) {
    Logger::instance().log(LogLevel::WARN, "session",
                           "%s dropped read at %llu, next offset is %llu",
                           to_string(id_).c_str(), (unsigned long long)offset,
                           (unsigned long long)next_offset_);
    return 0;
  }
  uint64_t skip = next_offset_ - offset;
  if (skip >= len)
    return 0;
  data += skip;
  len -= (size_t)skip;
  if (total_ && next_offset_ + len > *total_)
    len = (size_t)(*total_ - next_offset_);

  size_t chunk = chunk_size();
  size_t sent = 0;
  while (sent < len && credit_ > 0 && framing_->window_available() > 0 &&
         chunk > 0) {
    size_t n = (size_t)std::min<uint64_t>(
        std::min<uint64_t>(len - sent, chunk), credit_);
    uint32_t seq = framing_->submit(
        FrameType::Data, encode_data_chunk(next_offset_, data + sent, n));
    if (seq == 0)
      break;
    next_offset_ += n;
    credit_ -= n;
    sent += n;
    pending_.push_back(Pending{seq, next_offset_});
  }
  if (credit_ == 0 && !(total_ && next_offset_ >= *total_))
    set_state(SessionState::Paused);
  return sent;
}

void SessionController::on_acked(uint32_t highest_seq) {
  if (!active_)
    return;
  bool advanced = false;
  while (!pending_.empty() && pending_.front().seq <= highest_seq) {
    acked_offset_ = pending_.front().end_offset;
    pending_.pop_front();
    advanced = true;
  }
  if (advanced && cb_.on_progress)
    cb_.on_progress(acked_offset_);
  if (!active_)
    return;
  check_complete();
  if (active_ && state_ == SessionState::Streaming && cb_.on_ready)
    cb_.on_ready();
}

void SessionController::set_state(SessionState s) {
  if (s == state_)
    return;
  state_ = s;
  Logger::instance().log(LogLevel::INFO, "session", "%s %s at %llu",
                         to_string(id_).c_str(), to_string(s),
                         (unsigned long long)acked_offset_);
  if (s == SessionState::Paused) {
    arm_heartbeat();
  } else {
    std::error_code ignored;
    heartbeat_timer_.cancel(ignored);
  }
  if (cb_.on_state)
    cb_.on_state(s);
}

void SessionController::check_complete() {
  if (!active_ || !total_ || acked_offset_ < *total_)
    return;
  Logger::instance().log(LogLevel::INFO, "session", "%s completed, %llu bytes",
                         to_string(id_).c_str(), (unsigned long long)*total_);
  state_ = SessionState::Completed;
  end();
  if (cb_.on_complete)
    cb_.on_complete();
}

void SessionController::arm_heartbeat() {
  heartbeat_timer_.expires_after(heartbeat_);
  auto self = shared_from_this();
  heartbeat_timer_.async_wait([this, self](std::error_code ec) {
    if (ec || !active_ || state_ != SessionState::Paused)
      return;
    send_credit_request();
    arm_heartbeat();
  });
}

void SessionController::send_credit_request() {
  if (!framing_->connected())
    return;
  ControlMessage req;
  req.type = ControlType::CREDIT_REQUEST;
  req.session_id = id_;
  req.offset = acked_offset_;
  framing_->submit(FrameType::Control, encode_control(req));
  Logger::instance().log(LogLevel::DEBUG, "session",
                         "%s paused, requesting credit at %llu",
                         to_string(id_).c_str(),
                         (unsigned long long)acked_offset_);
}

} // namespace shotlink
