
#include "ptp.hpp"
#include <algorithm>

namespace shotlink {
namespace ptp {

const char *operation_name(uint16_t code) {
  switch (code) {
  case op::GetDeviceInfo:
    return "GetDeviceInfo";
  case op::OpenSession:
    return "OpenSession";
  case op::CloseSession:
    return "CloseSession";
  case op::GetStorageIDs:
    return "GetStorageIDs";
  case op::GetStorageInfo:
    return "GetStorageInfo";
  case op::GetNumObjects:
    return "GetNumObjects";
  case op::GetObjectHandles:
    return "GetObjectHandles";
  case op::GetObjectInfo:
    return "GetObjectInfo";
  case op::GetObject:
    return "GetObject";
  case op::GetThumb:
    return "GetThumb";
  case op::DeleteObject:
    return "DeleteObject";
  case op::GetPartialObject:
    return "GetPartialObject";
  case op::GetPartialObject64:
    return "GetPartialObject64";
  }
  return "UnknownOperation";
}

const char *response_name(uint16_t code) {
  switch (code) {
  case 0:
    return "no response";
  case rc::Undefined:
    return "Undefined";
  case rc::Ok:
    return "OK";
  case rc::GeneralError:
    return "GeneralError";
  case rc::SessionNotOpen:
    return "SessionNotOpen";
  case rc::InvalidTransactionId:
    return "InvalidTransactionID";
  case rc::OperationNotSupported:
    return "OperationNotSupported";
  case rc::ParameterNotSupported:
    return "ParameterNotSupported";
  case rc::IncompleteTransfer:
    return "IncompleteTransfer";
  case rc::InvalidStorageId:
    return "InvalidStorageID";
  case rc::InvalidObjectHandle:
    return "InvalidObjectHandle";
  case rc::StoreFull:
    return "StoreFull";
  case rc::ObjectWriteProtected:
    return "ObjectWriteProtected";
  case rc::StoreReadOnly:
    return "StoreReadOnly";
  case rc::AccessDenied:
    return "AccessDenied";
  case rc::PartialDeletion:
    return "PartialDeletion";
  case rc::StoreNotAvailable:
    return "StoreNotAvailable";
  case rc::DeviceBusy:
    return "DeviceBusy";
  case rc::InvalidParentObject:
    return "InvalidParentObject";
  case rc::InvalidParameter:
    return "InvalidParameter";
  case rc::SessionAlreadyOpen:
    return "SessionAlreadyOpen";
  case rc::TransactionCancelled:
    return "TransactionCancelled";
  }
  return "UnknownResponse";
}

const char *event_name(uint16_t code) {
  switch (code) {
  case ev::CancelTransaction:
    return "CancelTransaction";
  case ev::ObjectAdded:
    return "ObjectAdded";
  case ev::ObjectRemoved:
    return "ObjectRemoved";
  case ev::StoreAdded:
    return "StoreAdded";
  case ev::StoreRemoved:
    return "StoreRemoved";
  case ev::DevicePropChanged:
    return "DevicePropChanged";
  case ev::ObjectInfoChanged:
    return "ObjectInfoChanged";
  case ev::DeviceInfoChanged:
    return "DeviceInfoChanged";
  case ev::RequestObjectTransfer:
    return "RequestObjectTransfer";
  case ev::StoreFull:
    return "StoreFull";
  case ev::DeviceReset:
    return "DeviceReset";
  case ev::StorageInfoChanged:
    return "StorageInfoChanged";
  case ev::CaptureComplete:
    return "CaptureComplete";
  case ev::UnreportedStatus:
    return "UnreportedStatus";
  }
  return "VendorEvent";
}

namespace {

void put_le(std::vector<uint8_t> &out, uint64_t v, int bytes) {
  for (int i = 0; i < bytes; i++)
    out.push_back((uint8_t)(v >> (8 * i)));
}

uint64_t get_le(const uint8_t *p, int bytes) {
  uint64_t v = 0;
  for (int i = bytes - 1; i >= 0; i--)
    v = (v << 8) | p[i];
  return v;
}

void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back((char)cp);
  } else if (cp < 0x800) {
    out.push_back((char)(0xC0 | (cp >> 6)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back((char)(0xE0 | (cp >> 12)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else {
    out.push_back((char)(0xF0 | (cp >> 18)));
    out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  }
}

std::vector<uint16_t> utf8_to_utf16(const std::string &s) {
  std::vector<uint16_t> out;
  size_t i = 0;
  while (i < s.size()) {
    uint8_t c = (uint8_t)s[i];
    uint32_t cp;
    size_t n;
    if (c < 0x80) {
      cp = c;
      n = 1;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      n = 2;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      n = 3;
    } else {
      cp = c & 0x07;
      n = 4;
    }
    if (i + n > s.size())
      break;
    for (size_t k = 1; k < n; k++)
      cp = (cp << 6) | ((uint8_t)s[i + k] & 0x3F);
    i += n;
    if (cp >= 0x10000) {
      cp -= 0x10000;
      out.push_back((uint16_t)(0xD800 | (cp >> 10)));
      out.push_back((uint16_t)(0xDC00 | (cp & 0x3FF)));
    } else {
      out.push_back((uint16_t)cp);
    }
  }
  return out;
}

} // namespace

std::vector<uint32_t> Container::params() const {
  std::vector<uint32_t> out;
  for (size_t i = 0; i + 4 <= payload.size() && out.size() < kMaxParams; i += 4)
    out.push_back((uint32_t)get_le(payload.data() + i, 4));
  return out;
}

std::vector<uint8_t> encode_container(ContainerType type, uint16_t code,
                                      uint32_t tid,
                                      const std::vector<uint32_t> &params) {
  size_t n = std::min(params.size(), kMaxParams);
  std::vector<uint8_t> out;
  out.reserve(kContainerHeaderSize + 4 * n);
  put_le(out, kContainerHeaderSize + 4 * n, 4);
  put_le(out, (uint16_t)type, 2);
  put_le(out, code, 2);
  put_le(out, tid, 4);
  for (size_t i = 0; i < n; i++)
    put_le(out, params[i], 4);
  return out;
}

std::vector<uint8_t> encode_data_container(uint16_t code, uint32_t tid,
                                           const std::vector<uint8_t> &data) {
  std::vector<uint8_t> out;
  out.reserve(kContainerHeaderSize + data.size());
  put_le(out, kContainerHeaderSize + data.size(), 4);
  put_le(out, (uint16_t)ContainerType::Data, 2);
  put_le(out, code, 2);
  put_le(out, tid, 4);
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

bool parse_header(const uint8_t *data, size_t len, uint32_t &length,
                  Container &out) {
  if (len < kContainerHeaderSize)
    return false;
  length = (uint32_t)get_le(data, 4);
  uint16_t type = (uint16_t)get_le(data + 4, 2);
  if (length < kContainerHeaderSize || type < (uint16_t)ContainerType::Command ||
      type > (uint16_t)ContainerType::Event)
    return false;
  out.type = (ContainerType)type;
  out.code = (uint16_t)get_le(data + 6, 2);
  out.tid = (uint32_t)get_le(data + 8, 4);
  return true;
}

bool parse_container(const uint8_t *data, size_t len, Container &out) {
  uint32_t length = 0;
  if (!parse_header(data, len, length, out) || length != len)
    return false;
  out.payload.assign(data + kContainerHeaderSize, data + len);
  return true;
}

bool Reader::need(size_t n) {
  if (!ok_ || len_ - pos_ < n) {
    ok_ = false;
    return false;
  }
  return true;
}

uint8_t Reader::u8() {
  if (!need(1))
    return 0;
  return data_[pos_++];
}

uint16_t Reader::u16() {
  if (!need(2))
    return 0;
  uint16_t v = (uint16_t)get_le(data_ + pos_, 2);
  pos_ += 2;
  return v;
}

uint32_t Reader::u32() {
  if (!need(4))
    return 0;
  uint32_t v = (uint32_t)get_le(data_ + pos_, 4);
  pos_ += 4;
  return v;
}

uint64_t Reader::u64() {
  if (!need(8))
    return 0;
  uint64_t v = get_le(data_ + pos_, 8);
  pos_ += 8;
  return v;
}

// Length-prefixed UTF-16LE; the count includes the terminating NUL.
std::string Reader::str() {
  uint8_t n = u8();
  std::string out;
  if (n == 0 || !need((size_t)n * 2))
    return out;
  for (uint8_t i = 0; i + 1 < n; i++) {
    uint32_t cp = u16();
    if (cp >= 0xD800 && cp < 0xDC00) {
      uint16_t lo = i + 2 < n ? (uint16_t)get_le(data_ + pos_, 2) : 0;
      if (lo >= 0xDC00 && lo < 0xE000) {
        u16();
        i++;
        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
      } else {
        cp = 0xFFFD; // unpaired high surrogate
      }
    } else if (cp >= 0xDC00 && cp < 0xE000) {
      cp = 0xFFFD;
    }
    append_utf8(out, cp);
  }
  u16();
  return out;
}

std::vector<uint16_t> Reader::u16_array() {
  uint32_t n = u32();
  std::vector<uint16_t> out;
  if (!need((size_t)n * 2))
    return out;
  out.reserve(n);
  for (uint32_t i = 0; i < n; i++)
    out.push_back(u16());
  return out;
}

std::vector<uint32_t> Reader::u32_array() {
  uint32_t n = u32();
  std::vector<uint32_t> out;
  if (!need((size_t)n * 4))
    return out;
  out.reserve(n);
  for (uint32_t i = 0; i < n; i++)
    out.push_back(u32());
  return out;
}

void Writer::u8(uint8_t v) { out_.push_back(v); }
void Writer::u16(uint16_t v) { put_le(out_, v, 2); }
void Writer::u32(uint32_t v) { put_le(out_, v, 4); }
void Writer::u64(uint64_t v) { put_le(out_, v, 8); }

void Writer::str(const std::string &s) {
  if (s.empty()) {
    u8(0);
    return;
  }
  auto units = utf8_to_utf16(s);
  if (units.size() > 254)
    units.resize(254);
  u8((uint8_t)(units.size() + 1));
  for (uint16_t c : units)
    u16(c);
  u16(0);
}

void Writer::u16_array(const std::vector<uint16_t> &v) {
  u32((uint32_t)v.size());
  for (uint16_t x : v)
    u16(x);
}

void Writer::u32_array(const std::vector<uint32_t> &v) {
  u32((uint32_t)v.size());
  for (uint32_t x : v)
    u32(x);
}

bool DeviceInfo::supports(uint16_t op) const {
  return std::find(operations_supported.begin(), operations_supported.end(),
                   op) != operations_supported.end();
}

bool DeviceInfo::decode(const std::vector<uint8_t> &buf, DeviceInfo &out) {
  Reader r(buf);
  out.standard_version = r.u16();
  out.vendor_extension_id = r.u32();
  out.vendor_extension_version = r.u16();
  out.vendor_extension_desc = r.str();
  out.functional_mode = r.u16();
  out.operations_supported = r.u16_array();
  out.events_supported = r.u16_array();
  out.device_properties_supported = r.u16_array();
  out.capture_formats = r.u16_array();
  out.image_formats = r.u16_array();
  out.manufacturer = r.str();
  out.model = r.str();
  out.device_version = r.str();
  out.serial_number = r.str();
  return r.ok();
}

std::vector<uint8_t> DeviceInfo::encode() const {
  Writer w;
  w.u16(standard_version);
  w.u32(vendor_extension_id);
  w.u16(vendor_extension_version);
  w.str(vendor_extension_desc);
  w.u16(functional_mode);
  w.u16_array(operations_supported);
  w.u16_array(events_supported);
  w.u16_array(device_properties_supported);
  w.u16_array(capture_formats);
  w.u16_array(image_formats);
  w.str(manufacturer);
  w.str(model);
  w.str(device_version);
  w.str(serial_number);
  return std::move(w.bytes());
}

bool ObjectInfo::decode(const std::vector<uint8_t> &buf, ObjectInfo &out) {
  Reader r(buf);
  out.storage_id = r.u32();
  out.object_format = r.u16();
  out.protection_status = r.u16();
  out.compressed_size = r.u32();
  out.thumb_format = r.u16();
  out.thumb_compressed_size = r.u32();
  out.thumb_pix_width = r.u32();
  out.thumb_pix_height = r.u32();
  out.image_pix_width = r.u32();
  out.image_pix_height = r.u32();
  out.image_bit_depth = r.u32();
  out.parent_object = r.u32();
  out.association_type = r.u16();
  out.association_desc = r.u32();
  out.sequence_number = r.u32();
  out.filename = r.str();
  out.capture_date = r.str();
  out.modification_date = r.str();
  out.keywords = r.str();
  return r.ok();
}

std::vector<uint8_t> ObjectInfo::encode() const {
  Writer w;
  w.u32(storage_id);
  w.u16(object_format);
  w.u16(protection_status);
  w.u32(compressed_size);
  w.u16(thumb_format);
  w.u32(thumb_compressed_size);
  w.u32(thumb_pix_width);
  w.u32(thumb_pix_height);
  w.u32(image_pix_width);
  w.u32(image_pix_height);
  w.u32(image_bit_depth);
  w.u32(parent_object);
  w.u16(association_type);
  w.u32(association_desc);
  w.u32(sequence_number);
  w.str(filename);
  w.str(capture_date);
  w.str(modification_date);
  w.str(keywords);
  return std::move(w.bytes());
}

bool StorageInfo::decode(const std::vector<uint8_t> &buf, StorageInfo &out) {
  Reader r(buf);
  out.storage_type = r.u16();
  out.filesystem_type = r.u16();
  out.access_capability = r.u16();
  out.max_capacity = r.u64();
  out.free_space_bytes = r.u64();
  out.free_space_images = r.u32();
  out.description = r.str();
  out.volume_label = r.str();
  return r.ok();
}

std::vector<uint8_t> StorageInfo::encode() const {
  Writer w;
  w.u16(storage_type);
  w.u16(filesystem_type);
  w.u16(access_capability);
  w.u64(max_capacity);
  w.u64(free_space_bytes);
  w.u32(free_space_images);
  w.str(description);
  w.str(volume_label);
  return std::move(w.bytes());
}

} // namespace ptp
} // namespace shotlink
