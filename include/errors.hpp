
#pragma once
#include <cstdint>
#include <string>
#include <system_error>

namespace shotlink {

enum class TransportErrc { busy = 1, link_lost, timeout };
enum class FramingErrc { peer_unresponsive = 1 };
enum class UsbErrc { timeout = 1, stall, no_device, io };

const std::error_category& transport_category();
const std::error_category& framing_category();
const std::error_category& usb_category();

std::error_code make_error_code(TransportErrc e);
std::error_code make_error_code(FramingErrc e);
std::error_code make_error_code(UsbErrc e);

enum class CameraErrorKind { None, Retryable, Fatal, DeviceGone };

// Outcome of a camera operation. code is the PTP response code when the
// camera answered, 0 when the failure came from the USB link.
struct CameraError {
    CameraErrorKind kind{CameraErrorKind::None};
    uint16_t code{0};

    explicit operator bool() const { return kind != CameraErrorKind::None; }
    std::string message() const;

    static CameraError retryable(uint16_t c) { return CameraError{CameraErrorKind::Retryable, c}; }
    static CameraError fatal(uint16_t c) { return CameraError{CameraErrorKind::Fatal, c}; }
    static CameraError device_gone() { return CameraError{CameraErrorKind::DeviceGone, 0}; }
};

} // namespace shotlink

namespace std {
template <> struct is_error_code_enum<shotlink::TransportErrc> : true_type {};
template <> struct is_error_code_enum<shotlink::FramingErrc> : true_type {};
template <> struct is_error_code_enum<shotlink::UsbErrc> : true_type {};
} // namespace std
