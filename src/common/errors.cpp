
#include "errors.hpp"
#include "ptp.hpp"
#include <cstdio>

namespace shotlink {

namespace {

class TransportCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "shotlink.transport"; }
  std::string message(int ev) const override {
    switch ((TransportErrc)ev) {
    case TransportErrc::busy:
      return "transport busy";
    case TransportErrc::link_lost:
      return "link lost";
    case TransportErrc::timeout:
      return "transport timeout";
    }
    return "unknown transport error";
  }
};

class FramingCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "shotlink.framing"; }
  std::string message(int ev) const override {
    switch ((FramingErrc)ev) {
    case FramingErrc::peer_unresponsive:
      return "peer unresponsive";
    }
    return "unknown framing error";
  }
};

class UsbCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "shotlink.usb"; }
  std::string message(int ev) const override {
    switch ((UsbErrc)ev) {
    case UsbErrc::timeout:
      return "usb transfer timed out";
    case UsbErrc::stall:
      return "usb endpoint stalled";
    case UsbErrc::no_device:
      return "usb device gone";
    case UsbErrc::io:
      return "usb i/o error";
    }
    return "unknown usb error";
  }
};

} // namespace

const std::error_category &transport_category() {
  static TransportCategory c;
  return c;
}
const std::error_category &framing_category() {
  static FramingCategory c;
  return c;
}
const std::error_category &usb_category() {
  static UsbCategory c;
  return c;
}

std::error_code make_error_code(TransportErrc e) {
  return {(int)e, transport_category()};
}
std::error_code make_error_code(FramingErrc e) {
  return {(int)e, framing_category()};
}
std::error_code make_error_code(UsbErrc e) { return {(int)e, usb_category()}; }

std::string CameraError::message() const {
  char buf[96];
  switch (kind) {
  case CameraErrorKind::None:
    return "ok";
  case CameraErrorKind::DeviceGone:
    return "camera detached";
  case CameraErrorKind::Retryable:
    std::snprintf(buf, sizeof(buf), "retryable: %s (0x%04x)",
                  ptp::response_name(code), code);
    return buf;
  case CameraErrorKind::Fatal:
    std::snprintf(buf, sizeof(buf), "fatal: %s (0x%04x)",
                  ptp::response_name(code), code);
    return buf;
  }
  return "unknown";
}

} // namespace shotlink
