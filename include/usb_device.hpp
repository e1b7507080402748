
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace shotlink {

struct UsbDescriptor {
    uint16_t vendor_id{0};
    uint16_t product_id{0};
    uint8_t bus{0};
    uint8_t address{0};
    std::string manufacturer;
    std::string product;
    std::string serial;
};

// Still-image class interface of one attached camera. Completions are posted
// to the owning io_context and never run inside the initiating call. Errors
// are UsbErrc values; cancelled transfers complete with operation_aborted.
class UsbDevice {
public:
    using WriteHandler = std::function<void(std::error_code)>;
    using ReadHandler = std::function<void(std::error_code, std::vector<uint8_t>&&)>;

    virtual ~UsbDevice() = default;
    virtual const UsbDescriptor& descriptor() const = 0;
    virtual bool has_interrupt_endpoint() const = 0;
    virtual void bulk_write(std::vector<uint8_t> data, std::chrono::milliseconds timeout,
                            WriteHandler done) = 0;
    virtual void bulk_read(size_t max_len, std::chrono::milliseconds timeout,
                           ReadHandler done) = 0;
    // Waits for the next event container until cancelled.
    virtual void interrupt_read(size_t max_len, ReadHandler done) = 0;
    virtual void cancel() = 0;
};

using UsbDevicePtr = std::shared_ptr<UsbDevice>;

} // namespace shotlink
