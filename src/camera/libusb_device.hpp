
#pragma once
#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include "usb_device.hpp"

struct libusb_context;
struct libusb_device_handle;

namespace shotlink {

// UsbDevice over libusb-1.0 synchronous transfers. Bulk and interrupt
// transfers each run on their own worker thread; results are posted back to
// the io_context.
class LibusbDevice : public UsbDevice, public std::enable_shared_from_this<LibusbDevice> {
public:
    // Opens the first still-image class interface on the bus, optionally
    // restricted to vendor_id (0 = any).
    static std::shared_ptr<LibusbDevice> open_first(asio::io_context& io, uint16_t vendor_id,
                                                    std::string& err);
    ~LibusbDevice() override;

    const UsbDescriptor& descriptor() const override { return desc_; }
    bool has_interrupt_endpoint() const override { return ep_int_ != 0; }
    void bulk_write(std::vector<uint8_t> data, std::chrono::milliseconds timeout,
                    WriteHandler done) override;
    void bulk_read(size_t max_len, std::chrono::milliseconds timeout,
                   ReadHandler done) override;
    void interrupt_read(size_t max_len, ReadHandler done) override;
    void cancel() override;

private:
    using Job = std::function<void()>;

    struct Worker {
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<Job> jobs;
        bool stop{false};
        std::thread thread;
    };

    explicit LibusbDevice(asio::io_context& io);
    void start_workers();
    void stop_worker(Worker& w);
    void submit(Worker& w, Job job);
    static void run(Worker& w);

    asio::io_context& io_;
    libusb_context* ctx_{nullptr};
    libusb_device_handle* handle_{nullptr};
    int interface_{-1};
    uint8_t ep_in_{0};
    uint8_t ep_out_{0};
    uint8_t ep_int_{0};
    UsbDescriptor desc_;

    std::atomic<uint64_t> generation_{0};
    Worker bulk_;
    Worker events_;
};

} // namespace shotlink
