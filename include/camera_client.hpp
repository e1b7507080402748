
#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "camera_quirks.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ptp.hpp"
#include "usb_device.hpp"

namespace shotlink {

struct CatalogEntry {
    uint32_t handle{0};
    uint32_t storage_id{0};
    uint16_t format{0};
    uint64_t size{0};
    bool size_known{true}; // false when the 32-bit ObjectInfo size saturated
    std::string filename;
};

using Catalog = std::map<uint32_t, CatalogEntry>;
using CatalogPtr = std::shared_ptr<const Catalog>;

enum class CameraEventKind { ObjectAdded, ObjectRemoved, StoreAdded, StoreRemoved, DeviceGone };

struct CameraEvent {
    CameraEventKind kind;
    uint32_t id{0}; // object handle or storage id
};

const char* to_string(CameraEventKind k);

// PTP initiator for one camera. Transactions run one at a time in FIFO order;
// busy responses and USB timeouts are retried with exponential backoff.
class CameraClient : public std::enable_shared_from_this<CameraClient> {
public:
    using DoneHandler = std::function<void(CameraError)>;
    using ReadHandler = std::function<void(CameraError, std::vector<uint8_t>&&)>;
    using EventHandler = std::function<void(const CameraEvent&)>;

    CameraClient(asio::io_context& io, UsbDevicePtr dev, const BridgeConfig& cfg);

    void set_event_handler(EventHandler h) { on_event_ = std::move(h); }

    // Opens the PTP session and loads the initial catalog.
    void attach(DoneHandler done);
    // Local shutdown: fails outstanding requests, emits no DeviceGone.
    void detach();

    bool attached() const { return attached_; }
    bool gone() const { return gone_; }
    const UsbDescriptor& descriptor() const { return dev_->descriptor(); }
    const CameraQuirks& quirks() const { return *quirks_; }
    const ptp::DeviceInfo& device_info() const { return info_; }
    bool partial_reads() const;
    CatalogPtr catalog() const { return catalog_; }

    // Reads up to length bytes at offset. An empty result means offset is at
    // or past the end of the object.
    void read_object(uint32_t handle, uint64_t offset, uint32_t length, uint64_t tag,
                     ReadHandler done);
    void delete_object(uint32_t handle, uint64_t tag, DoneHandler done);
    // Resolves queued requests carrying tag with TransactionCancelled.
    void cancel(uint64_t tag);
    // Drops cached object data.
    void release(uint32_t handle);

private:
    using ResultHandler =
        std::function<void(CameraError, std::vector<uint32_t>&&, std::vector<uint8_t>&&)>;

    struct Request {
        uint16_t code{0};
        std::vector<uint32_t> params;
        uint64_t tag{0};
        unsigned attempt{0};
        ResultHandler done;
    };

    struct Waiter {
        uint64_t offset;
        uint32_t length;
        uint64_t tag;
        ReadHandler done;
    };

    using StorageScan = std::map<uint32_t, std::vector<uint32_t>>;

    void enqueue(uint16_t code, std::vector<uint32_t> params, uint64_t tag, ResultHandler done);
    void next();
    void issue();
    void read_response();
    void process_rx();
    void transfer_failed(std::error_code ec);
    void retry_or_finish(CameraError err);
    void finish(CameraError err, std::vector<uint32_t>&& params);
    void fail_all(CameraError err);
    void device_gone();

    void scan(std::function<void(CameraError, StorageScan&&)> done);
    void fetch_info(uint32_t handle, bool emit, std::function<void()> done);
    void fetch_whole(uint32_t handle);
    void serve(const Waiter& w, const std::vector<uint8_t>& object);

    void start_events();
    void arm_interrupt();
    void arm_poll();
    void poll();
    void handle_event(uint16_t code, uint32_t param);
    void remove_object(uint32_t handle);
    void remove_store(uint32_t storage_id);
    void emit(CameraEventKind kind, uint32_t id);
    void update_catalog(const std::function<void(Catalog&)>& fn);

    asio::io_context& io_;
    UsbDevicePtr dev_;
    std::chrono::milliseconds timeout_;
    unsigned retry_limit_;
    std::chrono::milliseconds backoff_;
    std::chrono::milliseconds poll_interval_;
    const CameraQuirks* quirks_;
    EventHandler on_event_;

    bool attached_{false};
    bool gone_{false};
    bool stopped_{false};
    ptp::DeviceInfo info_;
    CatalogPtr catalog_;
    std::set<uint32_t> storages_;
    std::set<uint32_t> folders_;

    std::deque<Request> queue_;
    Request current_;
    bool busy_{false};
    uint32_t next_tid_{1};
    uint32_t current_tid_{0};
    uint64_t txn_{0};
    std::vector<uint8_t> rx_;
    std::vector<uint8_t> data_;
    asio::steady_timer retry_timer_;

    asio::steady_timer poll_timer_;
    bool polling_{false};

    std::map<uint32_t, std::shared_ptr<const std::vector<uint8_t>>> cache_;
    std::map<uint32_t, std::vector<Waiter>> fetching_;
};

} // namespace shotlink
