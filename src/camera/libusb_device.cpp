
#include "libusb_device.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <libusb.h>

namespace shotlink {

namespace {

constexpr unsigned kInterruptPollMs = 250;

std::error_code map_error(int rc) {
  switch (rc) {
  case LIBUSB_ERROR_TIMEOUT:
    return make_error_code(UsbErrc::timeout);
  case LIBUSB_ERROR_PIPE:
    return make_error_code(UsbErrc::stall);
  case LIBUSB_ERROR_NO_DEVICE:
    return make_error_code(UsbErrc::no_device);
  default:
    return make_error_code(UsbErrc::io);
  }
}

std::string read_string(libusb_device_handle *h, uint8_t index) {
  if (index == 0)
    return std::string();
  unsigned char buf[256];
  int n = libusb_get_string_descriptor_ascii(h, index, buf, sizeof(buf));
  if (n <= 0)
    return std::string();
  return std::string((const char *)buf, (size_t)n);
}

struct ImageInterface {
  int number{-1};
  uint8_t ep_in{0};
  uint8_t ep_out{0};
  uint8_t ep_int{0};
};

// Still-image class (6), subclass 1, PTP protocol 1.
bool find_image_interface(libusb_device *dev, ImageInterface &out) {
  libusb_config_descriptor *cfg = nullptr;
  if (libusb_get_active_config_descriptor(dev, &cfg) != 0 || !cfg)
    return false;
  bool found = false;
  for (uint8_t i = 0; i < cfg->bNumInterfaces && !found; i++) {
    const libusb_interface &itf = cfg->interface[i];
    if (itf.num_altsetting < 1)
      continue;
    const libusb_interface_descriptor &alt = itf.altsetting[0];
    if (alt.bInterfaceClass != LIBUSB_CLASS_IMAGE)
      continue;
    ImageInterface ii;
    ii.number = alt.bInterfaceNumber;
    for (uint8_t e = 0; e < alt.bNumEndpoints; e++) {
      const libusb_endpoint_descriptor &ep = alt.endpoint[e];
      uint8_t kind = ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK;
      bool in = (ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) != 0;
      if (kind == LIBUSB_TRANSFER_TYPE_BULK && in)
        ii.ep_in = ep.bEndpointAddress;
      else if (kind == LIBUSB_TRANSFER_TYPE_BULK)
        ii.ep_out = ep.bEndpointAddress;
      else if (kind == LIBUSB_TRANSFER_TYPE_INTERRUPT && in)
        ii.ep_int = ep.bEndpointAddress;
    }
    if (ii.ep_in && ii.ep_out) {
      out = ii;
      found = true;
    }
  }
  libusb_free_config_descriptor(cfg);
  return found;
}

} // namespace

LibusbDevice::LibusbDevice(asio::io_context &io) : io_(io) {}

std::shared_ptr<LibusbDevice> LibusbDevice::open_first(asio::io_context &io,
                                                       uint16_t vendor_id,
                                                       std::string &err) {
  std::shared_ptr<LibusbDevice> d(new LibusbDevice(io));
  int rc = libusb_init(&d->ctx_);
  if (rc != 0) {
    err = std::string("libusb_init: ") + libusb_error_name(rc);
    return nullptr;
  }
  libusb_device **list = nullptr;
  ssize_t n = libusb_get_device_list(d->ctx_, &list);
  if (n < 0) {
    err = std::string("device list: ") + libusb_error_name((int)n);
    return nullptr;
  }
  err = "no PTP camera found";
  for (ssize_t i = 0; i < n && !d->handle_; i++) {
    libusb_device *dev = list[i];
    libusb_device_descriptor dd;
    if (libusb_get_device_descriptor(dev, &dd) != 0)
      continue;
    if (vendor_id != 0 && dd.idVendor != vendor_id)
      continue;
    ImageInterface ii;
    if (!find_image_interface(dev, ii))
      continue;
    libusb_device_handle *h = nullptr;
    rc = libusb_open(dev, &h);
    if (rc != 0) {
      err = std::string("open: ") + libusb_error_name(rc);
      continue;
    }
    libusb_set_auto_detach_kernel_driver(h, 1);
    rc = libusb_claim_interface(h, ii.number);
    if (rc != 0) {
      err = std::string("claim interface: ") + libusb_error_name(rc);
      libusb_close(h);
      continue;
    }
    d->handle_ = h;
    d->interface_ = ii.number;
    d->ep_in_ = ii.ep_in;
    d->ep_out_ = ii.ep_out;
    d->ep_int_ = ii.ep_int;
    d->desc_.vendor_id = dd.idVendor;
    d->desc_.product_id = dd.idProduct;
    d->desc_.bus = libusb_get_bus_number(dev);
    d->desc_.address = libusb_get_device_address(dev);
    d->desc_.manufacturer = read_string(h, dd.iManufacturer);
    d->desc_.product = read_string(h, dd.iProduct);
    d->desc_.serial = read_string(h, dd.iSerialNumber);
  }
  libusb_free_device_list(list, 1);
  if (!d->handle_)
    return nullptr;
  err.clear();
  Logger::instance().log(LogLevel::INFO, "usb",
                         "opened %04x:%04x on bus %u address %u (%s %s)",
                         d->desc_.vendor_id, d->desc_.product_id,
                         (unsigned)d->desc_.bus, (unsigned)d->desc_.address,
                         d->desc_.manufacturer.c_str(),
                         d->desc_.product.c_str());
  d->start_workers();
  return d;
}

LibusbDevice::~LibusbDevice() {
  generation_++;
  stop_worker(bulk_);
  stop_worker(events_);
  if (handle_) {
    libusb_release_interface(handle_, interface_);
    libusb_close(handle_);
  }
  if (ctx_)
    libusb_exit(ctx_);
}

void LibusbDevice::start_workers() {
  bulk_.thread = std::thread([this] { run(bulk_); });
  events_.thread = std::thread([this] { run(events_); });
}

void LibusbDevice::stop_worker(Worker &w) {
  {
    std::lock_guard<std::mutex> lk(w.mtx);
    w.stop = true;
  }
  w.cv.notify_all();
  if (w.thread.joinable())
    w.thread.join();
}

void LibusbDevice::submit(Worker &w, Job job) {
  {
    std::lock_guard<std::mutex> lk(w.mtx);
    w.jobs.push_back(std::move(job));
  }
  w.cv.notify_one();
}

void LibusbDevice::run(Worker &w) {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(w.mtx);
      w.cv.wait(lk, [&w] { return w.stop || !w.jobs.empty(); });
      if (w.stop)
        return;
      job = std::move(w.jobs.front());
      w.jobs.pop_front();
    }
    job();
  }
}

void LibusbDevice::bulk_write(std::vector<uint8_t> data,
                              std::chrono::milliseconds timeout,
                              WriteHandler done) {
  uint64_t gen = generation_;
  auto buf = std::make_shared<std::vector<uint8_t>>(std::move(data));
  submit(bulk_, [this, gen, buf, timeout, done] {
    std::error_code ec;
    if (gen != generation_) {
      ec = asio::error::operation_aborted;
    } else {
      int transferred = 0;
      int rc = libusb_bulk_transfer(handle_, ep_out_, buf->data(),
                                    (int)buf->size(), &transferred,
                                    (unsigned)timeout.count());
      if (rc == LIBUSB_ERROR_PIPE)
        libusb_clear_halt(handle_, ep_out_);
      if (rc != 0 && !(rc == LIBUSB_ERROR_TIMEOUT &&
                       transferred == (int)buf->size()))
        ec = map_error(rc);
      if (gen != generation_)
        ec = asio::error::operation_aborted;
    }
    asio::post(io_, [done, ec] { done(ec); });
  });
}

void LibusbDevice::bulk_read(size_t max_len, std::chrono::milliseconds timeout,
                             ReadHandler done) {
  uint64_t gen = generation_;
  submit(bulk_, [this, gen, max_len, timeout, done] {
    std::error_code ec;
    std::vector<uint8_t> buf;
    if (gen != generation_) {
      ec = asio::error::operation_aborted;
    } else {
      buf.resize(max_len);
      int transferred = 0;
      int rc = libusb_bulk_transfer(handle_, ep_in_, buf.data(), (int)max_len,
                                    &transferred, (unsigned)timeout.count());
      if (rc == LIBUSB_ERROR_PIPE)
        libusb_clear_halt(handle_, ep_in_);
      if (rc != 0 && !(rc == LIBUSB_ERROR_TIMEOUT && transferred > 0))
        ec = map_error(rc);
      buf.resize(ec ? 0 : (size_t)transferred);
      if (gen != generation_)
        ec = asio::error::operation_aborted;
    }
    asio::post(io_, [done, ec, buf = std::move(buf)]() mutable {
      done(ec, std::move(buf));
    });
  });
}

void LibusbDevice::interrupt_read(size_t max_len, ReadHandler done) {
  uint64_t gen = generation_;
  submit(events_, [this, gen, max_len, done] {
    std::error_code ec;
    std::vector<uint8_t> buf(max_len);
    int transferred = 0;
    for (;;) {
      if (gen != generation_) {
        ec = asio::error::operation_aborted;
        break;
      }
      {
        std::lock_guard<std::mutex> lk(events_.mtx);
        if (events_.stop) {
          ec = asio::error::operation_aborted;
          break;
        }
      }
      int rc = libusb_interrupt_transfer(handle_, ep_int_, buf.data(),
                                         (int)max_len, &transferred,
                                         kInterruptPollMs);
      if (rc == LIBUSB_ERROR_TIMEOUT && transferred == 0)
        continue;
      if (rc != 0 && rc != LIBUSB_ERROR_TIMEOUT)
        ec = map_error(rc);
      break;
    }
    buf.resize(ec ? 0 : (size_t)transferred);
    asio::post(io_, [done, ec, buf = std::move(buf)]() mutable {
      done(ec, std::move(buf));
    });
  });
}

void LibusbDevice::cancel() {
  generation_++;
  Logger::instance().log(LogLevel::DEBUG, "usb", "cancelling transfers");
}

} // namespace shotlink
