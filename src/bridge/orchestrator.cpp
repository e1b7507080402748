
#include "orchestrator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>

namespace shotlink {

namespace {

uint64_t session_tag(const SessionId &id) {
  uint64_t t = 0;
  for (int i = 0; i < 8; i++)
    t = (t << 8) | id[i];
  return t | 1;
}

} // namespace

Orchestrator::Orchestrator(asio::io_context &io, const BridgeConfig &cfg)
    : io_(io), cfg_(cfg) {}

void Orchestrator::set_camera(std::shared_ptr<CameraClient> camera) {
  camera_ = std::move(camera);
  std::weak_ptr<Orchestrator> weak = shared_from_this();
  camera_->set_event_handler([weak](const CameraEvent &ev) {
    if (auto self = weak.lock())
      self->on_camera_event(ev);
  });
  Logger::instance().log(LogLevel::INFO, "bridge",
                         "camera %s ready, %zu objects", camera_->quirks().name,
                         camera_->catalog()->size());
  promote();
}

void Orchestrator::on_connection(std::error_code ec, ConnectionPtr conn) {
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "bridge", "client rejected: %s",
                           ec.message().c_str());
    return;
  }
  if (link_) {
    Logger::instance().log(LogLevel::WARN, "bridge",
                           "already serving %s, dropping %s",
                           link_->conn->peer().c_str(), conn->peer().c_str());
    conn->close();
    return;
  }
  auto link = std::make_unique<Link>();
  link->id = next_link_id_++;
  link->conn = conn;
  link->framing =
      std::make_shared<FramingLayer>(io_, conn, FramingConfig::from(cfg_));
  link->ctl = std::make_shared<SessionController>(io_, link->framing, cfg_);
  uint64_t lid = link->id;
  std::weak_ptr<Orchestrator> weak = shared_from_this();

  SessionController::Callbacks cb;
  cb.on_progress = [weak](uint64_t acked) {
    auto self = weak.lock();
    if (!self || !self->active_)
      return;
    if (auto *s = self->live(*self->active_)) {
      s->acked_offset = acked;
      s->updated = TransferSession::clock::now();
    }
  };
  cb.on_state = [weak](SessionState st) {
    auto self = weak.lock();
    if (!self || !self->active_)
      return;
    if (auto *s = self->live(*self->active_)) {
      s->state = st;
      s->updated = TransferSession::clock::now();
    }
    if (st == SessionState::Streaming)
      self->pump();
  };
  cb.on_complete = [weak] {
    auto self = weak.lock();
    if (!self || !self->active_)
      return;
    SessionId id = *self->active_;
    self->active_.reset();
    self->read_gen_++;
    self->reading_ = false;
    if (auto *s = self->live(id)) {
      s->acked_offset = self->link_->ctl->acked_offset();
      if (!s->total_size)
        s->total_size = s->acked_offset;
      if (self->camera_)
        self->camera_->release(s->object_id);
    }
    self->finish(id, SessionState::Completed, AbortReason::None, 0);
    self->promote();
  };
  cb.on_ready = [weak] {
    if (auto self = weak.lock())
      self->pump();
  };
  link->ctl->set_callbacks(std::move(cb));

  Logger::instance().log(LogLevel::INFO, "bridge", "client %s connected over %s",
                         conn->peer().c_str(), to_string(conn->type()));
  link_ = std::move(link);
  auto framing = link_->framing;
  framing->start(
      [weak, lid](FrameType type, std::vector<uint8_t> &&payload) {
        auto self = weak.lock();
        if (!self || !self->link_ || self->link_->id != lid)
          return;
        if (type != FrameType::Control) {
          Logger::instance().log(LogLevel::DEBUG, "bridge",
                                 "ignoring %zu byte data frame from client",
                                 payload.size());
          return;
        }
        ControlMessage m;
        if (!decode_control(payload, m)) {
          Logger::instance().log(LogLevel::WARN, "bridge",
                                 "malformed control message (%zu bytes)",
                                 payload.size());
          return;
        }
        self->on_control(m);
      },
      [weak, lid](uint32_t highest) {
        auto self = weak.lock();
        if (!self || !self->link_ || self->link_->id != lid)
          return;
        auto ctl = self->link_->ctl;
        ctl->on_acked(highest);
      },
      [weak, lid](std::error_code ec) {
        if (auto self = weak.lock())
          self->on_link_error(lid, ec);
      });
}

void Orchestrator::shutdown() {
  Logger::instance().log(LogLevel::INFO, "bridge", "shutting down");
  if (link_) {
    link_->hello = false;
    if (active_)
      interrupt_active(AbortReason::None, 0);
    link_->ctl->stop();
    link_->framing->close();
    link_.reset();
  }
  ttl_timers_.clear();
  if (camera_)
    camera_->detach();
}

const std::string &Orchestrator::client_id() const {
  static const std::string none;
  return link_ ? link_->client_id : none;
}

const TransferSession *Orchestrator::find(const SessionId &id) const {
  auto it = sessions_.find(id);
  if (it != sessions_.end())
    return &it->second;
  for (auto h = history_.rbegin(); h != history_.rend(); ++h)
    if (h->id == id)
      return &*h;
  return nullptr;
}

const TransferSession *Orchestrator::find_by_object(uint32_t object_id) const {
  for (auto &kv : sessions_)
    if (kv.second.object_id == object_id)
      return &kv.second;
  for (auto h = history_.rbegin(); h != history_.rend(); ++h)
    if (h->object_id == object_id)
      return &*h;
  return nullptr;
}

std::vector<TransferSession> Orchestrator::sessions() const {
  std::vector<TransferSession> out;
  for (auto &kv : sessions_)
    out.push_back(kv.second);
  return out;
}

size_t Orchestrator::held_notices(const std::string &client_id) const {
  auto it = held_.find(client_id);
  return it == held_.end() ? 0 : it->second.size();
}

void Orchestrator::on_camera_event(const CameraEvent &ev) {
  switch (ev.kind) {
  case CameraEventKind::ObjectAdded:
    on_object_added(ev.id);
    break;
  case CameraEventKind::ObjectRemoved: {
    std::vector<SessionId> ids;
    for (auto &kv : sessions_)
      if (kv.second.object_id == ev.id)
        ids.push_back(kv.first);
    for (auto &id : ids)
      abort(id, AbortReason::ObjectRemoved);
    break;
  }
  case CameraEventKind::DeviceGone:
    on_device_gone();
    break;
  case CameraEventKind::StoreAdded:
  case CameraEventKind::StoreRemoved:
    break;
  }
}

void Orchestrator::on_object_added(uint32_t handle) {
  if (live_for_object(handle)) {
    Logger::instance().log(LogLevel::DEBUG, "bridge",
                           "object %u already has a session", handle);
    return;
  }
  create(handle, std::string());
  promote();
}

void Orchestrator::on_device_gone() {
  if (!camera_)
    return;
  Logger::instance().log(LogLevel::WARN, "bridge",
                         "camera detached, aborting %zu sessions",
                         sessions_.size());
  stop_reading();
  if (active_ && link_)
    link_->ctl->end();
  active_.reset();
  queue_.clear();
  std::vector<SessionId> ids;
  for (auto &kv : sessions_)
    ids.push_back(kv.first);
  for (auto &id : ids)
    finish(id, SessionState::Aborted, AbortReason::CameraDetached, 0);
  // The client may still be inside the call that reported the loss.
  auto dead = std::move(camera_);
  asio::post(io_, [dead] {});
}

void Orchestrator::on_link_error(uint64_t link_id, std::error_code ec) {
  if (!link_ || link_->id != link_id)
    return;
  Logger::instance().log(LogLevel::WARN, "bridge", "client %s lost: %s",
                         link_->client_id.c_str(), ec.message().c_str());
  link_->hello = false;
  if (active_)
    interrupt_active(ec == FramingErrc::peer_unresponsive
                         ? AbortReason::PeerUnresponsive
                         : AbortReason::None,
                     0);
  link_->ctl->stop();
  // The framing layer is still on the stack.
  std::shared_ptr<Link> dead(std::move(link_));
  asio::post(io_, [dead] {});
}

void Orchestrator::on_control(const ControlMessage &m) {
  switch (m.type) {
  case ControlType::HELLO:
    on_hello(m.text);
    break;
  case ControlType::CREDIT_GRANT:
    link_->ctl->grant(m.size);
    break;
  case ControlType::SESSION_RESUME:
    on_resume(m.session_id, m.offset);
    break;
  case ControlType::DELETE_REQUEST:
    on_delete(m.object_id);
    break;
  case ControlType::PULL_REQUEST:
    on_pull(m.object_id);
    break;
  case ControlType::CANCEL:
    on_cancel(m.session_id);
    break;
  case ControlType::LIST_REQUEST:
    on_list();
    break;
  default:
    Logger::instance().log(LogLevel::WARN, "bridge",
                           "unexpected control type %u from client",
                           (unsigned)m.type);
    break;
  }
}

void Orchestrator::on_hello(const std::string &client) {
  link_->client_id = client;
  link_->hello = true;
  Logger::instance().log(LogLevel::INFO, "bridge", "hello from '%s'",
                         client.c_str());
  std::vector<std::string> keys{client};
  if (!client.empty())
    keys.push_back(std::string());
  for (auto &key : keys) {
    auto it = held_.find(key);
    if (it == held_.end())
      continue;
    auto notices = std::move(it->second);
    held_.erase(it);
    for (auto &n : notices)
      send(n);
  }
  for (auto &kv : sessions_)
    if (kv.second.state == SessionState::Interrupted &&
        kv.second.client_id == client)
      send(status_message(kv.second));
  promote();
}

void Orchestrator::on_resume(const SessionId &id, uint64_t offset) {
  TransferSession *s = live(id);
  if (!s || !link_->hello || s->client_id != link_->client_id) {
    const TransferSession *past = s ? nullptr : find(id);
    ControlMessage m;
    if (past && past->client_id == link_->client_id) {
      m = status_message(*past);
    } else {
      m.type = ControlType::SESSION_STATUS;
      m.session_id = id;
      m.status = (uint8_t)SessionState::Aborted;
      m.reason = (uint8_t)AbortReason::UnknownSession;
      m.size = kUnknownSize;
    }
    Logger::instance().log(LogLevel::WARN, "bridge",
                           "resume of unknown session %s",
                           to_string(id).c_str());
    send(m);
    return;
  }
  if (s->state != SessionState::Interrupted) {
    Logger::instance().log(LogLevel::DEBUG, "bridge",
                           "session %s is %s, nothing to resume",
                           to_string(id).c_str(), to_string(s->state));
    return;
  }
  if (offset != s->acked_offset)
    Logger::instance().log(LogLevel::WARN, "bridge",
                           "session %s: client asked for %llu, resuming at "
                           "acknowledged offset %llu",
                           to_string(id).c_str(), (unsigned long long)offset,
                           (unsigned long long)s->acked_offset);
  stop_ttl(id);
  s->state = SessionState::Queued;
  s->reason = AbortReason::None;
  s->camera_code = 0;
  queue_.push_front(id);
  promote();
}

void Orchestrator::on_delete(uint32_t object_id) {
  ControlMessage ack;
  ack.type = ControlType::DELETE_ACK;
  ack.object_id = object_id;
  if (!camera_ || camera_->gone()) {
    ack.status = (uint8_t)DeleteStatus::NoCamera;
    send(ack);
    return;
  }
  for (auto &kv : sessions_) {
    const auto &s = kv.second;
    if (s.object_id == object_id &&
        (s.state == SessionState::Streaming ||
         s.state == SessionState::Paused ||
         s.state == SessionState::Interrupted)) {
      Logger::instance().log(LogLevel::INFO, "bridge",
                             "delete of object %u refused, session %s is %s",
                             object_id, to_string(s.id).c_str(),
                             to_string(s.state));
      ack.status = (uint8_t)DeleteStatus::InUse;
      send(ack);
      return;
    }
  }
  uint64_t lid = link_->id;
  std::weak_ptr<Orchestrator> weak = shared_from_this();
  camera_->delete_object(object_id, 0, [weak, lid, ack](CameraError err) mutable {
    auto self = weak.lock();
    if (!self)
      return;
    if (!err) {
      ack.status = (uint8_t)DeleteStatus::Success;
      std::vector<SessionId> ids;
      for (auto &kv : self->sessions_)
        if (kv.second.object_id == ack.object_id)
          ids.push_back(kv.first);
      for (auto &id : ids)
        self->abort(id, AbortReason::ObjectRemoved);
    } else if (err.kind == CameraErrorKind::DeviceGone) {
      ack.status = (uint8_t)DeleteStatus::NoCamera;
    } else if (err.code == ptp::rc::InvalidObjectHandle) {
      ack.status = (uint8_t)DeleteStatus::NotFound;
    } else {
      ack.status = (uint8_t)DeleteStatus::Failed;
    }
    if (err)
      Logger::instance().log(LogLevel::WARN, "bridge",
                             "delete of object %u failed: %s", ack.object_id,
                             err.message().c_str());
    if (self->link_ && self->link_->id == lid)
      self->send(ack);
  });
}

void Orchestrator::on_pull(uint32_t object_id) {
  if (TransferSession *s = live_for_object(object_id)) {
    send(status_message(*s));
    return;
  }
  if (!camera_ || !camera_->catalog()->count(object_id)) {
    ControlMessage m;
    m.type = ControlType::SESSION_STATUS;
    m.object_id = object_id;
    m.status = (uint8_t)SessionState::Aborted;
    m.reason = (uint8_t)AbortReason::NotFound;
    m.size = kUnknownSize;
    send(m);
    return;
  }
  TransferSession &s = create(object_id, link_->client_id);
  send(status_message(s));
  promote();
}

void Orchestrator::on_cancel(const SessionId &id) {
  if (live(id)) {
    abort(id, AbortReason::Cancelled);
    return;
  }
  ControlMessage m;
  m.type = ControlType::SESSION_STATUS;
  m.session_id = id;
  m.status = (uint8_t)SessionState::Aborted;
  m.reason = (uint8_t)AbortReason::UnknownSession;
  m.size = kUnknownSize;
  send(m);
}

void Orchestrator::on_list() {
  ControlMessage m;
  m.type = ControlType::LIST_RESPONSE;
  size_t payload = link_->framing->max_payload();
  size_t budget = payload > kListHeaderSize ? payload - kListHeaderSize : 0;
  size_t used = 0;
  if (camera_) {
    auto catalog = camera_->catalog();
    for (auto &kv : *catalog) {
      ListEntry e;
      e.object_id = kv.first;
      e.size = kv.second.size_known ? kv.second.size : kUnknownSize;
      e.name = kv.second.filename;
      size_t n = encoded_list_entry_size(e);
      if (n > budget) {
        size_t fixed = n - e.name.size();
        truncate_utf8(e.name, budget > fixed ? budget - fixed : 0);
        n = encoded_list_entry_size(e);
      }
      if (used + n > budget) {
        m.status = 0;
        send(m);
        m.entries.clear();
        used = 0;
      }
      m.entries.push_back(std::move(e));
      used += n;
    }
  }
  m.status = 1;
  send(m);
}

void Orchestrator::send(const ControlMessage &m) {
  if (!link_ || !link_->framing->connected())
    return;
  link_->framing->submit(FrameType::Control, encode_control(m));
}

TransferSession &Orchestrator::create(uint32_t object_id,
                                      const std::string &client) {
  TransferSession s;
  s.id = generate_session_id();
  s.object_id = object_id;
  s.client_id = client;
  if (camera_) {
    auto catalog = camera_->catalog();
    auto it = catalog->find(object_id);
    if (it != catalog->end()) {
      s.filename = it->second.filename;
      if (it->second.size_known)
        s.total_size = it->second.size;
    }
  }
  Logger::instance().log(LogLevel::INFO, "bridge",
                         "session %s queued for object %u (%s)",
                         to_string(s.id).c_str(), object_id,
                         s.filename.c_str());
  SessionId id = s.id;
  queue_.push_back(id);
  return sessions_[id] = std::move(s);
}

void Orchestrator::promote() {
  if (active_ || !link_ || !link_->hello || !camera_ || !camera_->attached())
    return;
  for (auto it = queue_.begin(); it != queue_.end();) {
    TransferSession *s = live(*it);
    if (!s || s->state != SessionState::Queued) {
      it = queue_.erase(it);
      continue;
    }
    if (!s->client_id.empty() && s->client_id != link_->client_id) {
      ++it;
      continue;
    }
    queue_.erase(it);
    active_ = s->id;
    s->client_id = link_->client_id;
    s->state = SessionState::Streaming;
    s->updated = TransferSession::clock::now();
    auto ctl = link_->ctl;
    ctl->begin(*s);
    pump();
    return;
  }
}

void Orchestrator::pump() {
  if (!active_ || reading_ || !link_ || !camera_)
    return;
  TransferSession *s = live(*active_);
  if (!s)
    return;
  uint64_t want = link_->ctl->wanted();
  if (want == 0)
    return;
  uint32_t n = (uint32_t)std::min<uint64_t>(want, cfg_.camera_read_chunk);
  uint64_t offset = link_->ctl->next_offset();
  uint64_t gen = read_gen_;
  reading_ = true;
  std::weak_ptr<Orchestrator> weak = shared_from_this();
  camera_->read_object(
      s->object_id, offset, n, session_tag(s->id),
      [weak, gen, offset](CameraError err, std::vector<uint8_t> &&data) {
        auto self = weak.lock();
        if (!self || gen != self->read_gen_)
          return;
        self->reading_ = false;
        self->on_read(offset, err, std::move(data));
      });
}

void Orchestrator::on_read(uint64_t offset, CameraError err,
                           std::vector<uint8_t> &&data) {
  if (!active_ || !link_)
    return;
  if (err) {
    camera_failure(err);
    return;
  }
  TransferSession *s = live(*active_);
  auto ctl = link_->ctl;
  if (data.empty()) {
    if (!s->total_size) {
      s->total_size = ctl->next_offset();
      Logger::instance().log(LogLevel::INFO, "bridge",
                             "session %s: object %u ends at %llu",
                             to_string(s->id).c_str(), s->object_id,
                             (unsigned long long)*s->total_size);
      ctl->set_total(*s->total_size);
    } else if (ctl->next_offset() < *s->total_size) {
      camera_failure(CameraError::fatal(ptp::rc::IncompleteTransfer));
    }
    return;
  }
  ctl->push(offset, data.data(), data.size());
  pump();
}

void Orchestrator::camera_failure(CameraError err) {
  if (err.kind == CameraErrorKind::DeviceGone) {
    on_device_gone();
    return;
  }
  if (!active_ || !link_)
    return;
  Logger::instance().log(LogLevel::WARN, "bridge",
                         "session %s: camera read failed: %s",
                         to_string(*active_).c_str(), err.message().c_str());
  if (link_->ctl->acked_offset() > 0)
    interrupt_active(AbortReason::CameraError, err.code);
  else
    abort(*active_, AbortReason::CameraError, err.code);
}

void Orchestrator::interrupt_active(AbortReason reason, uint16_t code) {
  if (!active_)
    return;
  SessionId id = *active_;
  TransferSession *s = live(id);
  stop_reading();
  if (link_) {
    if (s)
      s->acked_offset = link_->ctl->acked_offset();
    link_->ctl->end();
  }
  active_.reset();
  if (!s)
    return;
  s->state = SessionState::Interrupted;
  s->reason = reason;
  s->camera_code = code;
  s->updated = TransferSession::clock::now();
  Logger::instance().log(LogLevel::INFO, "bridge",
                         "session %s interrupted at %llu (%s)",
                         to_string(id).c_str(),
                         (unsigned long long)s->acked_offset,
                         to_string(reason));
  start_ttl(id);
  notify(*s);
  promote();
}

void Orchestrator::abort(const SessionId &id, AbortReason reason,
                         uint16_t code) {
  TransferSession *s = live(id);
  if (!s)
    return;
  bool was_active = active_ && *active_ == id;
  if (was_active) {
    stop_reading();
    if (link_) {
      s->acked_offset = link_->ctl->acked_offset();
      link_->ctl->end();
    }
    active_.reset();
  }
  if (camera_) {
    camera_->cancel(session_tag(id));
    camera_->release(s->object_id);
  }
  finish(id, SessionState::Aborted, reason, code);
  if (was_active)
    promote();
}

void Orchestrator::finish(const SessionId &id, SessionState state,
                          AbortReason reason, uint16_t code) {
  auto it = sessions_.find(id);
  if (it == sessions_.end())
    return;
  TransferSession s = std::move(it->second);
  sessions_.erase(it);
  queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
  stop_ttl(id);
  s.state = state;
  s.reason = reason;
  s.camera_code = code;
  s.updated = TransferSession::clock::now();
  Logger::instance().log(LogLevel::INFO, "bridge",
                         "session %s %s at %llu (%s)", to_string(id).c_str(),
                         to_string(state), (unsigned long long)s.acked_offset,
                         to_string(reason));
  notify(s);
  history_.push_back(std::move(s));
  while (history_.size() > cfg_.history_limit)
    history_.pop_front();
}

void Orchestrator::start_ttl(const SessionId &id) {
  auto timer = std::make_unique<asio::steady_timer>(io_);
  timer->expires_after(cfg_.session_ttl);
  std::weak_ptr<Orchestrator> weak = shared_from_this();
  timer->async_wait([weak, id](std::error_code ec) {
    auto self = weak.lock();
    if (ec || !self)
      return;
    TransferSession *s = self->live(id);
    if (!s || s->state != SessionState::Interrupted)
      return;
    Logger::instance().log(LogLevel::WARN, "bridge",
                           "session %s not resumed in time",
                           to_string(id).c_str());
    self->abort(id, AbortReason::TtlExpired);
  });
  ttl_timers_[id] = std::move(timer);
}

void Orchestrator::stop_ttl(const SessionId &id) {
  auto it = ttl_timers_.find(id);
  if (it == ttl_timers_.end())
    return;
  std::error_code ignored;
  it->second->cancel(ignored);
  ttl_timers_.erase(it);
}

void Orchestrator::notify(const TransferSession &s) {
  ControlMessage msg = status_message(s);
  if (link_ && link_->hello &&
      (s.client_id.empty() || s.client_id == link_->client_id)) {
    send(msg);
    return;
  }
  // Interrupted sessions are reported on the owner's next HELLO.
  if (s.state == SessionState::Interrupted)
    return;
  auto &held = held_[s.client_id];
  held.push_back(std::move(msg));
  if (held.size() > cfg_.history_limit)
    held.erase(held.begin());
}

ControlMessage Orchestrator::status_message(const TransferSession &s) const {
  ControlMessage m;
  m.type = ControlType::SESSION_STATUS;
  m.session_id = s.id;
  m.object_id = s.object_id;
  m.status = (uint8_t)s.state;
  m.reason = (uint8_t)s.reason;
  m.code = s.camera_code;
  m.offset = s.acked_offset;
  m.size = s.total_size ? *s.total_size : kUnknownSize;
  return m;
}

TransferSession *Orchestrator::live(const SessionId &id) {
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : &it->second;
}

TransferSession *Orchestrator::live_for_object(uint32_t object_id) {
  for (auto &kv : sessions_)
    if (kv.second.object_id == object_id)
      return &kv.second;
  return nullptr;
}

void Orchestrator::stop_reading() {
  read_gen_++;
  reading_ = false;
  if (camera_ && active_)
    camera_->cancel(session_tag(*active_));
}

} // namespace shotlink
