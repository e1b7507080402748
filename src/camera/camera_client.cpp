
#include "camera_client.hpp"
#include "logging.hpp"
#include <algorithm>

namespace shotlink {

namespace {
constexpr size_t kBulkReadSize = 256 * 1024;
constexpr size_t kEventReadSize = 64;
} // namespace

const char *to_string(CameraEventKind k) {
  switch (k) {
  case CameraEventKind::ObjectAdded:
    return "ObjectAdded";
  case CameraEventKind::ObjectRemoved:
    return "ObjectRemoved";
  case CameraEventKind::StoreAdded:
    return "StoreAdded";
  case CameraEventKind::StoreRemoved:
    return "StoreRemoved";
  case CameraEventKind::DeviceGone:
    return "DeviceGone";
  }
  return "?";
}

CameraClient::CameraClient(asio::io_context &io, UsbDevicePtr dev,
                           const BridgeConfig &cfg)
    : io_(io), dev_(std::move(dev)), timeout_(cfg.camera_timeout),
      retry_limit_(cfg.camera_retry_limit), backoff_(cfg.camera_retry_backoff),
      poll_interval_(cfg.camera_poll_interval), quirks_(&default_quirks()),
      catalog_(std::make_shared<const Catalog>()), retry_timer_(io),
      poll_timer_(io) {}

bool CameraClient::partial_reads() const {
  if (!quirks_->partial_read)
    return false;
  return info_.supports(quirks_->partial_read_op) ||
         info_.supports(ptp::op::GetPartialObject);
}

void CameraClient::attach(DoneHandler done) {
  const auto &d = dev_->descriptor();
  quirks_ = &lookup_quirks(d.vendor_id, d.product_id);
  Logger::instance().log(LogLevel::INFO, "camera",
                         "attaching %04x:%04x %s (%s quirks)", d.vendor_id,
                         d.product_id, d.product.c_str(), quirks_->name);
  auto self = shared_from_this();
  enqueue(ptp::op::GetDeviceInfo, {}, 0,
          [this, self, done](CameraError err, std::vector<uint32_t> &&,
                             std::vector<uint8_t> &&data) {
            if (err) {
              done(err);
              return;
            }
            if (!ptp::DeviceInfo::decode(data, info_)) {
              Logger::instance().log(LogLevel::ERROR, "camera",
                                     "malformed DeviceInfo (%zu bytes)",
                                     data.size());
              done(CameraError::fatal(ptp::rc::GeneralError));
              return;
            }
            Logger::instance().log(
                LogLevel::INFO, "camera", "%s %s, %zu operations, partial=%d",
                info_.manufacturer.c_str(), info_.model.c_str(),
                info_.operations_supported.size(), (int)partial_reads());
            enqueue(ptp::op::OpenSession, {quirks_->ptp_session_id}, 0,
                    [this, self, done](CameraError err,
                                       std::vector<uint32_t> &&,
                                       std::vector<uint8_t> &&) {
                      if (err && err.code != ptp::rc::SessionAlreadyOpen) {
                        done(err);
                        return;
                      }
                      scan([this, self, done](CameraError err,
                                              StorageScan &&stores) {
                        if (err) {
                          done(err);
                          return;
                        }
                        auto pending = std::make_shared<size_t>(1);
                        auto loaded = [this, self, done, pending] {
                          if (--*pending > 0)
                            return;
                          attached_ = !gone_ && !stopped_;
                          if (!attached_) {
                            done(gone_ ? CameraError::device_gone()
                                       : CameraError::fatal(
                                             ptp::rc::TransactionCancelled));
                            return;
                          }
                          Logger::instance().log(
                              LogLevel::INFO, "camera",
                              "attached, %zu storages, %zu objects",
                              storages_.size(), catalog_->size());
                          start_events();
                          done(CameraError{});
                        };
                        for (auto &kv : stores) {
                          storages_.insert(kv.first);
                          for (uint32_t h : kv.second) {
                            ++*pending;
                            fetch_info(h, false, loaded);
                          }
                        }
                        loaded();
                      });
                    });
          });
}

void CameraClient::detach() {
  if (stopped_)
    return;
  stopped_ = true;
  attached_ = false;
  Logger::instance().log(LogLevel::INFO, "camera", "detaching");
  std::error_code ignored;
  poll_timer_.cancel(ignored);
  dev_->cancel();
  fail_all(CameraError::fatal(ptp::rc::TransactionCancelled));
  cache_.clear();
}

void CameraClient::read_object(uint32_t handle, uint64_t offset,
                               uint32_t length, uint64_t tag,
                               ReadHandler done) {
  if (partial_reads()) {
    uint16_t code = quirks_->partial_read_op;
    if (!info_.supports(code))
      code = ptp::op::GetPartialObject;
    if (quirks_->max_chunk > 0)
      length = std::min(length, quirks_->max_chunk);
    std::vector<uint32_t> params;
    if (code == ptp::op::GetPartialObject64) {
      params = {handle, (uint32_t)offset, (uint32_t)(offset >> 32), length};
    } else if (offset > 0xFFFFFFFFull) {
      asio::post(io_, [done] {
        done(CameraError::fatal(ptp::rc::ParameterNotSupported), {});
      });
      return;
    } else {
      params = {handle, (uint32_t)offset, length};
    }
    enqueue(code, std::move(params), tag,
            [done](CameraError err, std::vector<uint32_t> &&,
                   std::vector<uint8_t> &&data) { done(err, std::move(data)); });
    return;
  }

  Waiter w{offset, length, tag, std::move(done)};
  auto it = cache_.find(handle);
  if (it != cache_.end()) {
    auto self = shared_from_this();
    auto object = it->second;
    asio::post(io_, [this, self, w, object] { serve(w, *object); });
    return;
  }
  bool in_flight = fetching_.count(handle) != 0;
  fetching_[handle].push_back(std::move(w));
  if (!in_flight)
    fetch_whole(handle);
}

void CameraClient::delete_object(uint32_t handle, uint64_t tag,
                                 DoneHandler done) {
  auto self = shared_from_this();
  enqueue(ptp::op::DeleteObject, {handle, 0}, tag,
          [this, self, handle, done](CameraError err, std::vector<uint32_t> &&,
                                     std::vector<uint8_t> &&) {
            if (!err) {
              Logger::instance().log(LogLevel::INFO, "camera",
                                     "deleted object %u", handle);
              update_catalog([handle](Catalog &c) { c.erase(handle); });
              release(handle);
            }
            done(err);
          });
}

void CameraClient::cancel(uint64_t tag) {
  if (tag == 0)
    return;
  std::vector<ResultHandler> cancelled;
  for (auto it = queue_.begin(); it != queue_.end();) {
    if (it->tag == tag) {
      cancelled.push_back(std::move(it->done));
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }
  std::vector<ReadHandler> readers;
  for (auto &kv : fetching_) {
    auto &ws = kv.second;
    for (auto it = ws.begin(); it != ws.end();) {
      if (it->tag == tag) {
        readers.push_back(std::move(it->done));
        it = ws.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (cancelled.empty() && readers.empty())
    return;
  Logger::instance().log(LogLevel::DEBUG, "camera",
                         "cancelled %zu queued requests",
                         cancelled.size() + readers.size());
  auto err = CameraError::fatal(ptp::rc::TransactionCancelled);
  for (auto &h : cancelled)
    asio::post(io_, [h, err] {
      if (h)
        h(err, std::vector<uint32_t>{}, std::vector<uint8_t>{});
    });
  for (auto &h : readers)
    asio::post(io_, [h, err] { h(err, std::vector<uint8_t>{}); });
}

void CameraClient::release(uint32_t handle) {
  if (cache_.erase(handle))
    Logger::instance().log(LogLevel::DEBUG, "camera",
                           "released cached object %u", handle);
}

void CameraClient::enqueue(uint16_t code, std::vector<uint32_t> params,
                           uint64_t tag, ResultHandler done) {
  if (gone_ || stopped_) {
    auto err = gone_ ? CameraError::device_gone()
                     : CameraError::fatal(ptp::rc::TransactionCancelled);
    asio::post(io_, [done, err] {
      done(err, std::vector<uint32_t>{}, std::vector<uint8_t>{});
    });
    return;
  }
  Request r;
  r.code = code;
  r.params = std::move(params);
  r.tag = tag;
  r.done = std::move(done);
  queue_.push_back(std::move(r));
  next();
}

void CameraClient::next() {
  if (busy_ || queue_.empty() || gone_ || stopped_)
    return;
  busy_ = true;
  current_ = std::move(queue_.front());
  queue_.pop_front();
  issue();
}

void CameraClient::issue() {
  uint64_t txn = ++txn_;
  // OpenSession always runs as transaction 0.
  if (current_.code == ptp::op::OpenSession) {
    current_tid_ = 0;
    next_tid_ = 1;
  } else {
    current_tid_ = next_tid_++;
  }
  rx_.clear();
  data_.clear();
  Logger::instance().log(LogLevel::TRACE, "camera", "-> %s tid=%u",
                         ptp::operation_name(current_.code), current_tid_);
  auto self = shared_from_this();
  dev_->bulk_write(ptp::encode_container(ptp::ContainerType::Command,
                                         current_.code, current_tid_,
                                         current_.params),
                   timeout_, [this, self, txn](std::error_code ec) {
                     if (txn != txn_ || !busy_)
                       return;
                     if (ec) {
                       transfer_failed(ec);
                       return;
                     }
                     read_response();
                   });
}

void CameraClient::read_response() {
  uint64_t txn = txn_;
  auto self = shared_from_this();
  dev_->bulk_read(kBulkReadSize, timeout_,
                  [this, self, txn](std::error_code ec,
                                    std::vector<uint8_t> &&bytes) {
                    if (txn != txn_ || !busy_)
                      return;
                    if (ec) {
                      transfer_failed(ec);
                      return;
                    }
                    rx_.insert(rx_.end(), bytes.begin(), bytes.end());
                    process_rx();
                  });
}

void CameraClient::process_rx() {
  while (rx_.size() >= ptp::kContainerHeaderSize) {
    ptp::Container c;
    uint32_t length = 0;
    if (!ptp::parse_header(rx_.data(), rx_.size(), length, c)) {
      Logger::instance().log(LogLevel::WARN, "camera",
                             "malformed container during %s",
                             ptp::operation_name(current_.code));
      rx_.clear();
      finish(CameraError::fatal(ptp::rc::IncompleteTransfer), {});
      return;
    }
    if (rx_.size() < length)
      break;
    c.payload.assign(rx_.begin() + ptp::kContainerHeaderSize,
                     rx_.begin() + length);
    rx_.erase(rx_.begin(), rx_.begin() + length);
    if (c.tid != current_tid_ || c.type == ptp::ContainerType::Command ||
        c.type == ptp::ContainerType::Event) {
      Logger::instance().log(LogLevel::DEBUG, "camera",
                             "skipping container type %u tid %u",
                             (unsigned)c.type, c.tid);
      continue;
    }
    if (c.type == ptp::ContainerType::Data) {
      data_ = std::move(c.payload);
      continue;
    }
    Logger::instance().log(LogLevel::TRACE, "camera", "<- %s for %s",
                           ptp::response_name(c.code),
                           ptp::operation_name(current_.code));
    if (c.code == ptp::rc::Ok)
      finish(CameraError{}, c.params());
    else if (c.code == ptp::rc::DeviceBusy)
      retry_or_finish(CameraError::retryable(c.code));
    else
      finish(CameraError::fatal(c.code), c.params());
    return;
  }
  read_response();
}

void CameraClient::transfer_failed(std::error_code ec) {
  rx_.clear();
  if (ec == UsbErrc::no_device) {
    device_gone();
    return;
  }
  if (ec == UsbErrc::timeout) {
    retry_or_finish(CameraError::retryable(0));
    return;
  }
  Logger::instance().log(LogLevel::WARN, "camera", "%s failed: %s",
                         ptp::operation_name(current_.code),
                         ec.message().c_str());
  finish(CameraError::fatal(ec == asio::error::operation_aborted
                                ? ptp::rc::TransactionCancelled
                                : 0),
         {});
}

void CameraClient::retry_or_finish(CameraError err) {
  if (err.kind == CameraErrorKind::Retryable &&
      current_.attempt < retry_limit_) {
    auto delay = backoff_ * (1u << current_.attempt);
    current_.attempt++;
    Logger::instance().log(LogLevel::WARN, "camera",
                           "%s: %s, retry %u/%u in %lldms",
                           ptp::operation_name(current_.code),
                           err.message().c_str(), current_.attempt,
                           retry_limit_, (long long)delay.count());
    uint64_t txn = txn_;
    auto self = shared_from_this();
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([this, self, txn](std::error_code ec) {
      if (ec || txn != txn_ || !busy_)
        return;
      issue();
    });
    return;
  }
  if (err.kind == CameraErrorKind::Retryable)
    Logger::instance().log(LogLevel::WARN, "camera",
                           "%s: giving up after %u retries",
                           ptp::operation_name(current_.code),
                           current_.attempt);
  finish(err, {});
}

void CameraClient::finish(CameraError err, std::vector<uint32_t> &&params) {
  Request r = std::move(current_);
  current_ = Request{};
  busy_ = false;
  auto data = std::move(data_);
  data_.clear();
  if (r.done)
    r.done(err, std::move(params), std::move(data));
  next();
}

void CameraClient::fail_all(CameraError err) {
  ++txn_;
  std::error_code ignored;
  retry_timer_.cancel(ignored);
  std::vector<ResultHandler> handlers;
  if (busy_)
    handlers.push_back(std::move(current_.done));
  busy_ = false;
  current_ = Request{};
  for (auto &r : queue_)
    handlers.push_back(std::move(r.done));
  queue_.clear();
  rx_.clear();
  data_.clear();
  for (auto &h : handlers)
    asio::post(io_, [h, err] {
      if (h)
        h(err, std::vector<uint32_t>{}, std::vector<uint8_t>{});
    });
}

void CameraClient::device_gone() {
  if (gone_)
    return;
  gone_ = true;
  attached_ = false;
  Logger::instance().log(LogLevel::WARN, "camera", "device %04x:%04x gone",
                         dev_->descriptor().vendor_id,
                         dev_->descriptor().product_id);
  std::error_code ignored;
  poll_timer_.cancel(ignored);
  dev_->cancel();
  fail_all(CameraError::device_gone());
  cache_.clear();
  emit(CameraEventKind::DeviceGone, 0);
}

void CameraClient::scan(std::function<void(CameraError, StorageScan &&)> done) {
  auto self = shared_from_this();
  enqueue(ptp::op::GetStorageIDs, {}, 0,
          [this, self, done](CameraError err, std::vector<uint32_t> &&,
                             std::vector<uint8_t> &&data) {
            if (err) {
              done(err, StorageScan{});
              return;
            }
            ptp::Reader r(data);
            auto ids = r.u32_array();
            if (!r.ok()) {
              done(CameraError::fatal(ptp::rc::GeneralError), StorageScan{});
              return;
            }
            if (ids.empty()) {
              done(CameraError{}, StorageScan{});
              return;
            }
            auto result = std::make_shared<StorageScan>();
            auto pending = std::make_shared<size_t>(ids.size());
            auto failure = std::make_shared<CameraError>();
            for (uint32_t id : ids) {
              enqueue(ptp::op::GetObjectHandles, {id, 0, 0}, 0,
                      [done, id, result, pending,
                       failure](CameraError err, std::vector<uint32_t> &&,
                                std::vector<uint8_t> &&data) {
                        if (!err) {
                          ptp::Reader r(data);
                          (*result)[id] = r.u32_array();
                        } else if (err.code != ptp::rc::StoreNotAvailable &&
                                   !*failure) {
                          *failure = err;
                        }
                        if (--*pending > 0)
                          return;
                        if (*failure)
                          done(*failure, StorageScan{});
                        else
                          done(CameraError{}, std::move(*result));
                      });
            }
          });
}

void CameraClient::fetch_info(uint32_t handle, bool emit_added,
                              std::function<void()> done) {
  auto self = shared_from_this();
  enqueue(ptp::op::GetObjectInfo, {handle}, 0,
          [this, self, handle, emit_added,
           done](CameraError err, std::vector<uint32_t> &&,
                 std::vector<uint8_t> &&data) {
            ptp::ObjectInfo oi;
            if (err) {
              if (err.kind != CameraErrorKind::DeviceGone)
                Logger::instance().log(LogLevel::WARN, "camera",
                                       "object %u info: %s", handle,
                                       err.message().c_str());
            } else if (!ptp::ObjectInfo::decode(data, oi)) {
              Logger::instance().log(LogLevel::WARN, "camera",
                                     "object %u: malformed ObjectInfo",
                                     handle);
            } else if (oi.is_association()) {
              folders_.insert(handle);
            } else {
              CatalogEntry e;
              e.handle = handle;
              e.storage_id = oi.storage_id;
              e.format = oi.object_format;
              e.size = oi.compressed_size;
              e.size_known = oi.compressed_size != 0xFFFFFFFFu;
              e.filename = oi.filename;
              bool added = catalog_->count(handle) == 0;
              update_catalog([&e](Catalog &c) { c[e.handle] = e; });
              if (emit_added && added)
                emit(CameraEventKind::ObjectAdded, handle);
            }
            if (done)
              done();
          });
}

void CameraClient::fetch_whole(uint32_t handle) {
  auto self = shared_from_this();
  enqueue(ptp::op::GetObject, {handle}, 0,
          [this, self, handle](CameraError err, std::vector<uint32_t> &&,
                               std::vector<uint8_t> &&data) {
            std::vector<Waiter> waiters = std::move(fetching_[handle]);
            fetching_.erase(handle);
            if (err) {
              for (auto &w : waiters)
                w.done(err, std::vector<uint8_t>{});
              return;
            }
            // Every reader was cancelled, nobody will release it.
            if (waiters.empty()) {
              Logger::instance().log(LogLevel::DEBUG, "camera",
                                     "dropping object %u, no readers left",
                                     handle);
              return;
            }
            auto object =
                std::make_shared<const std::vector<uint8_t>>(std::move(data));
            if (!gone_ && !stopped_)
              cache_[handle] = object;
            Logger::instance().log(LogLevel::DEBUG, "camera",
                                   "cached object %u, %zu bytes", handle,
                                   object->size());
            for (auto &w : waiters)
              serve(w, *object);
          });
}

void CameraClient::serve(const Waiter &w, const std::vector<uint8_t> &object) {
  size_t begin = (size_t)std::min<uint64_t>(w.offset, object.size());
  size_t end = (size_t)std::min<uint64_t>(begin + (uint64_t)w.length,
                                          object.size());
  w.done(CameraError{},
         std::vector<uint8_t>(object.begin() + begin, object.begin() + end));
}

void CameraClient::start_events() {
  if (dev_->has_interrupt_endpoint() && !quirks_->poll_events) {
    Logger::instance().log(LogLevel::DEBUG, "camera",
                           "listening for interrupt events");
    arm_interrupt();
  } else {
    Logger::instance().log(LogLevel::DEBUG, "camera",
                           "polling catalog every %lldms",
                           (long long)poll_interval_.count());
    arm_poll();
  }
}

void CameraClient::arm_interrupt() {
  auto self = shared_from_this();
  dev_->interrupt_read(kEventReadSize, [this, self](std::error_code ec,
                                                    std::vector<uint8_t> &&data) {
    if (gone_ || stopped_ || ec == asio::error::operation_aborted)
      return;
    if (ec == UsbErrc::no_device) {
      device_gone();
      return;
    }
    if (ec && ec != UsbErrc::timeout) {
      Logger::instance().log(LogLevel::WARN, "camera",
                             "interrupt endpoint: %s, falling back to polling",
                             ec.message().c_str());
      arm_poll();
      return;
    }
    if (!ec) {
      ptp::Container c;
      if (ptp::parse_container(data.data(), data.size(), c) &&
          c.type == ptp::ContainerType::Event) {
        auto p = c.params();
        handle_event(c.code, p.empty() ? 0 : p[0]);
      } else {
        Logger::instance().log(LogLevel::DEBUG, "camera",
                               "ignoring %zu byte interrupt packet",
                               data.size());
      }
    }
    if (!gone_ && !stopped_)
      arm_interrupt();
  });
}

void CameraClient::arm_poll() {
  poll_timer_.expires_after(poll_interval_);
  auto self = shared_from_this();
  poll_timer_.async_wait([this, self](std::error_code ec) {
    if (ec || gone_ || stopped_)
      return;
    poll();
  });
}

void CameraClient::poll() {
  if (polling_) {
    arm_poll();
    return;
  }
  polling_ = true;
  auto self = shared_from_this();
  scan([this, self](CameraError err, StorageScan &&stores) {
    polling_ = false;
    if (gone_ || stopped_)
      return;
    if (err) {
      Logger::instance().log(LogLevel::WARN, "camera", "catalog poll: %s",
                             err.message().c_str());
      arm_poll();
      return;
    }
    std::vector<uint32_t> lost_stores;
    for (uint32_t s : storages_)
      if (!stores.count(s))
        lost_stores.push_back(s);
    for (uint32_t s : lost_stores)
      remove_store(s);
    std::set<uint32_t> present;
    for (auto &kv : stores) {
      if (storages_.insert(kv.first).second)
        emit(CameraEventKind::StoreAdded, kv.first);
      present.insert(kv.second.begin(), kv.second.end());
    }
    std::vector<uint32_t> removed;
    for (auto &kv : *catalog_)
      if (!present.count(kv.first))
        removed.push_back(kv.first);
    for (uint32_t h : removed)
      remove_object(h);
    for (uint32_t h : present)
      if (!catalog_->count(h) && !folders_.count(h))
        fetch_info(h, true, {});
    arm_poll();
  });
}

void CameraClient::handle_event(uint16_t code, uint32_t param) {
  uint16_t std_code = quirks_->translate_event(code);
  Logger::instance().log(LogLevel::DEBUG, "camera", "event %s (0x%04x) %u",
                         ptp::event_name(std_code), code, param);
  switch (std_code) {
  case ptp::ev::ObjectAdded:
    if (!catalog_->count(param) && !folders_.count(param))
      fetch_info(param, true, {});
    break;
  case ptp::ev::ObjectInfoChanged:
    if (catalog_->count(param))
      fetch_info(param, false, {});
    break;
  case ptp::ev::ObjectRemoved:
    remove_object(param);
    break;
  case ptp::ev::StoreAdded:
    if (storages_.insert(param).second) {
      emit(CameraEventKind::StoreAdded, param);
      auto self = shared_from_this();
      enqueue(ptp::op::GetObjectHandles, {param, 0, 0}, 0,
              [this, self](CameraError err, std::vector<uint32_t> &&,
                           std::vector<uint8_t> &&data) {
                if (err)
                  return;
                ptp::Reader r(data);
                for (uint32_t h : r.u32_array())
                  if (!catalog_->count(h) && !folders_.count(h))
                    fetch_info(h, true, {});
              });
    }
    break;
  case ptp::ev::StoreRemoved:
    remove_store(param);
    break;
  default:
    break;
  }
}

void CameraClient::remove_object(uint32_t handle) {
  folders_.erase(handle);
  if (!catalog_->count(handle))
    return;
  update_catalog([handle](Catalog &c) { c.erase(handle); });
  release(handle);
  emit(CameraEventKind::ObjectRemoved, handle);
}

void CameraClient::remove_store(uint32_t storage_id) {
  if (!storages_.count(storage_id))
    return;
  std::vector<uint32_t> handles;
  for (auto &kv : *catalog_)
    if (kv.second.storage_id == storage_id)
      handles.push_back(kv.first);
  for (uint32_t h : handles)
    remove_object(h);
  storages_.erase(storage_id);
  emit(CameraEventKind::StoreRemoved, storage_id);
}

void CameraClient::emit(CameraEventKind kind, uint32_t id) {
  Logger::instance().log(LogLevel::INFO, "camera", "%s %u", to_string(kind),
                         id);
  if (on_event_)
    on_event_(CameraEvent{kind, id});
}

void CameraClient::update_catalog(const std::function<void(Catalog &)> &fn) {
  auto next = std::make_shared<Catalog>(*catalog_);
  fn(*next);
  catalog_ = std::move(next);
}

} // namespace shotlink
