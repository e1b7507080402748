
#include "camera_quirks.hpp"
#include "ptp.hpp"

namespace shotlink {

namespace {

uint16_t standard_events(uint16_t code) {
  return (code >= ptp::ev::CancelTransaction &&
          code <= ptp::ev::UnreportedStatus)
             ? code
             : 0;
}

// ObjectAddedInSdram
uint16_t nikon_events(uint16_t code) {
  if (code == 0xC101)
    return ptp::ev::ObjectAdded;
  return standard_events(code);
}

// Sony reports new shots through its own ObjectAdded code.
uint16_t sony_events(uint16_t code) {
  if (code == 0xC201)
    return ptp::ev::ObjectAdded;
  if (code == 0xC202)
    return ptp::ev::ObjectRemoved;
  return standard_events(code);
}

constexpr uint32_t kMiB = 1024 * 1024;

const CameraQuirks kDefault = {"generic", 0, 0, true, ptp::op::GetPartialObject,
                               kMiB, false, 1, standard_events};

const CameraQuirks kTable[] = {
    {"Canon", 0x04A9, 0, true, ptp::op::GetPartialObject, kMiB, true, 1,
     standard_events},
    {"Nikon", 0x04B0, 0, true, ptp::op::GetPartialObject, kMiB, false, 1,
     nikon_events},
    {"Sony", 0x054C, 0, false, ptp::op::GetPartialObject, 0, false, 1,
     sony_events},
    {"Fujifilm", 0x04CB, 0, true, ptp::op::GetPartialObject, 256 * 1024, false,
     1, standard_events},
    {"Olympus", 0x07B4, 0, true, ptp::op::GetPartialObject, kMiB, true, 1,
     standard_events},
    {"Panasonic", 0x04DA, 0, true, ptp::op::GetPartialObject64, kMiB, false,
     1, standard_events},
};

} // namespace

const CameraQuirks &default_quirks() { return kDefault; }

const CameraQuirks &lookup_quirks(uint16_t vendor_id, uint16_t product_id) {
  const CameraQuirks *vendor_match = nullptr;
  for (const auto &q : kTable) {
    if (q.vendor_id != vendor_id)
      continue;
    if (q.product_id == product_id)
      return q;
    if (q.product_id == 0 && !vendor_match)
      vendor_match = &q;
  }
  return vendor_match ? *vendor_match : kDefault;
}

} // namespace shotlink
