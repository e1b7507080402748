
#pragma once
#include <cstdint>

namespace shotlink {

// Per-vendor behaviour of PTP cameras. Looked up once at attach time.
struct CameraQuirks {
    const char* name;
    uint16_t vendor_id;
    uint16_t product_id;        // 0 matches every product of the vendor
    bool partial_read;          // ranged reads allowed at all
    uint16_t partial_read_op;   // GetPartialObject or GetPartialObject64
    uint32_t max_chunk;         // largest ranged read the body accepts
    bool poll_events;           // interrupt events unreliable, poll the catalog
    uint32_t ptp_session_id;
    // Maps a vendor event code onto a standard one, 0 to ignore it.
    uint16_t (*translate_event)(uint16_t code);
};

const CameraQuirks& lookup_quirks(uint16_t vendor_id, uint16_t product_id);
const CameraQuirks& default_quirks();

} // namespace shotlink
