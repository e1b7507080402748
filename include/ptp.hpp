
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace shotlink {
namespace ptp {

enum class ContainerType : uint16_t { Command = 1, Data = 2, Response = 3, Event = 4 };

constexpr size_t kContainerHeaderSize = 12; // length, type, code, transaction id
constexpr size_t kMaxParams = 5;
constexpr uint16_t kFormatAssociation = 0x3001;
constexpr uint32_t kAllStorages = 0xFFFFFFFF;
constexpr uint32_t kRootParent = 0xFFFFFFFF;

namespace op {
constexpr uint16_t GetDeviceInfo = 0x1001;
constexpr uint16_t OpenSession = 0x1002;
constexpr uint16_t CloseSession = 0x1003;
constexpr uint16_t GetStorageIDs = 0x1004;
constexpr uint16_t GetStorageInfo = 0x1005;
constexpr uint16_t GetNumObjects = 0x1006;
constexpr uint16_t GetObjectHandles = 0x1007;
constexpr uint16_t GetObjectInfo = 0x1008;
constexpr uint16_t GetObject = 0x1009;
constexpr uint16_t GetThumb = 0x100A;
constexpr uint16_t DeleteObject = 0x100B;
constexpr uint16_t GetPartialObject = 0x101B;
constexpr uint16_t GetPartialObject64 = 0x95C1; // MTP extension
} // namespace op

namespace rc {
constexpr uint16_t Undefined = 0x2000;
constexpr uint16_t Ok = 0x2001;
constexpr uint16_t GeneralError = 0x2002;
constexpr uint16_t SessionNotOpen = 0x2003;
constexpr uint16_t InvalidTransactionId = 0x2004;
constexpr uint16_t OperationNotSupported = 0x2005;
constexpr uint16_t ParameterNotSupported = 0x2006;
constexpr uint16_t IncompleteTransfer = 0x2007;
constexpr uint16_t InvalidStorageId = 0x2008;
constexpr uint16_t InvalidObjectHandle = 0x2009;
constexpr uint16_t StoreFull = 0x200C;
constexpr uint16_t ObjectWriteProtected = 0x200D;
constexpr uint16_t StoreReadOnly = 0x200E;
constexpr uint16_t AccessDenied = 0x200F;
constexpr uint16_t PartialDeletion = 0x2012;
constexpr uint16_t StoreNotAvailable = 0x2013;
constexpr uint16_t DeviceBusy = 0x2019;
constexpr uint16_t InvalidParentObject = 0x201A;
constexpr uint16_t InvalidParameter = 0x201D;
constexpr uint16_t SessionAlreadyOpen = 0x201E;
constexpr uint16_t TransactionCancelled = 0x201F;
} // namespace rc

namespace ev {
constexpr uint16_t CancelTransaction = 0x4001;
constexpr uint16_t ObjectAdded = 0x4002;
constexpr uint16_t ObjectRemoved = 0x4003;
constexpr uint16_t StoreAdded = 0x4004;
constexpr uint16_t StoreRemoved = 0x4005;
constexpr uint16_t DevicePropChanged = 0x4006;
constexpr uint16_t ObjectInfoChanged = 0x4007;
constexpr uint16_t DeviceInfoChanged = 0x4008;
constexpr uint16_t RequestObjectTransfer = 0x4009;
constexpr uint16_t StoreFull = 0x400A;
constexpr uint16_t DeviceReset = 0x400B;
constexpr uint16_t StorageInfoChanged = 0x400C;
constexpr uint16_t CaptureComplete = 0x400D;
constexpr uint16_t UnreportedStatus = 0x400E;
} // namespace ev

const char* operation_name(uint16_t code);
const char* response_name(uint16_t code);
const char* event_name(uint16_t code);

struct Container {
    ContainerType type{ContainerType::Command};
    uint16_t code{0};
    uint32_t tid{0};
    std::vector<uint8_t> payload;

    // Payload of a command, response or event read as 32-bit parameters.
    std::vector<uint32_t> params() const;
};

std::vector<uint8_t> encode_container(ContainerType type, uint16_t code, uint32_t tid,
                                      const std::vector<uint32_t>& params);
std::vector<uint8_t> encode_data_container(uint16_t code, uint32_t tid,
                                           const std::vector<uint8_t>& data);
// Reads the 12-byte header. length is the declared container length.
bool parse_header(const uint8_t* data, size_t len, uint32_t& length, Container& out);
// Parses one complete container; data must hold exactly the declared length.
bool parse_container(const uint8_t* data, size_t len, Container& out);

// Little-endian dataset cursor. Any overrun latches ok() to false.
class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit Reader(const std::vector<uint8_t>& buf) : Reader(buf.data(), buf.size()) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    uint64_t u64();
    std::string str();
    std::vector<uint16_t> u16_array();
    std::vector<uint32_t> u32_array();

    bool ok() const { return ok_; }
    size_t remaining() const { return ok_ ? len_ - pos_ : 0; }

private:
    bool need(size_t n);

    const uint8_t* data_;
    size_t len_;
    size_t pos_{0};
    bool ok_{true};
};

class Writer {
public:
    void u8(uint8_t v);
    void u16(uint16_t v);
    void u32(uint32_t v);
    void u64(uint64_t v);
    void str(const std::string& s);
    void u16_array(const std::vector<uint16_t>& v);
    void u32_array(const std::vector<uint32_t>& v);

    std::vector<uint8_t>& bytes() { return out_; }

private:
    std::vector<uint8_t> out_;
};

struct DeviceInfo {
    uint16_t standard_version{100};
    uint32_t vendor_extension_id{0};
    uint16_t vendor_extension_version{0};
    std::string vendor_extension_desc;
    uint16_t functional_mode{0};
    std::vector<uint16_t> operations_supported;
    std::vector<uint16_t> events_supported;
    std::vector<uint16_t> device_properties_supported;
    std::vector<uint16_t> capture_formats;
    std::vector<uint16_t> image_formats;
    std::string manufacturer;
    std::string model;
    std::string device_version;
    std::string serial_number;

    bool supports(uint16_t op) const;
    static bool decode(const std::vector<uint8_t>& buf, DeviceInfo& out);
    std::vector<uint8_t> encode() const;
};

struct ObjectInfo {
    uint32_t storage_id{0};
    uint16_t object_format{0};
    uint16_t protection_status{0};
    uint32_t compressed_size{0};
    uint16_t thumb_format{0};
    uint32_t thumb_compressed_size{0};
    uint32_t thumb_pix_width{0};
    uint32_t thumb_pix_height{0};
    uint32_t image_pix_width{0};
    uint32_t image_pix_height{0};
    uint32_t image_bit_depth{0};
    uint32_t parent_object{0};
    uint16_t association_type{0};
    uint32_t association_desc{0};
    uint32_t sequence_number{0};
    std::string filename;
    std::string capture_date;
    std::string modification_date;
    std::string keywords;

    bool is_association() const { return object_format == kFormatAssociation; }
    static bool decode(const std::vector<uint8_t>& buf, ObjectInfo& out);
    std::vector<uint8_t> encode() const;
};

struct StorageInfo {
    uint16_t storage_type{0};
    uint16_t filesystem_type{0};
    uint16_t access_capability{0};
    uint64_t max_capacity{0};
    uint64_t free_space_bytes{0};
    uint32_t free_space_images{0};
    std::string description;
    std::string volume_label;

    static bool decode(const std::vector<uint8_t>& buf, StorageInfo& out);
    std::vector<uint8_t> encode() const;
};

} // namespace ptp
} // namespace shotlink
