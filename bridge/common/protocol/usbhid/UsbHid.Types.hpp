#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace usbhid {

/** 应用层帧：一个完整的 KNX 负载（不含任何 USB HID 头） */
using Frame = std::vector<uint8_t>;

// ==================== 协议常量 ====================

/**
 * @brief KNX USB HID 报文固定字段
 *
 * 报文布局（除半字节打包外均为大端序）:
 *   [ReportID(1)=0x01][PacketInfo(1)=seq<<4|type][DataLength(1)]
 *   [Version(1)=0x00][HeaderLength(1)=0x08][BodyLength(2)][ProtocolID(1)][Reserved(3)]
 *   [EmiID(1)][Reserved(2)]
 *   [Payload...]
 */
struct ProtocolConst {
    static constexpr uint8_t KNX_DATA_EXCHANGE = 0x01;                  // 报告标识
    static constexpr uint8_t TRANSFER_PROTOCOL_VERSION = 0x00;          // USB 传输协议版本
    static constexpr uint8_t TRANSFER_PROTOCOL_HEADER_LENGTH = 0x08;    // USB 协议头长度

    static constexpr size_t REPORT_HEADER_SIZE = 3;
    static constexpr size_t PROTOCOL_HEADER_SIZE = 8;
    static constexpr size_t PROTOCOL_HEADER_FIELDS_SIZE = 5;            // Version..ProtocolID
    static constexpr size_t PROTOCOL_HEADER_RESERVED_SIZE = 3;
    static constexpr size_t EMI_HEADER_SIZE = 3;
    static constexpr size_t FRAMING_OVERHEAD =
        REPORT_HEADER_SIZE + PROTOCOL_HEADER_SIZE + EMI_HEADER_SIZE;

    static constexpr uint8_t DEFAULT_SEQUENCE_NUMBER = 1;
    static constexpr uint8_t DEFAULT_EMI_ID = 0x03;                     // commonEmi
};

// ==================== 枚举类型 ====================

/** 包类型（PacketInfo 低半字节），多包重组不在本层处理 */
enum class PacketType : uint8_t {
    Reserved = 0x00,
    AllInOne = 0x03,    // 单包
    Partial  = 0x04,    // 中间包
    Start    = 0x05,    // 首包
    End      = 0x06     // 末包
};

/** 协议标识（Body 承载的子协议） */
enum class ProtocolId : uint8_t {
    Reserved                      = 0x00,
    KnxTunnel                     = 0x01,
    MBusTunnel                    = 0x02,
    BatiBusTunnel                 = 0x03,
    BusAccessServerFeatureService = 0x0F
};

/** 设备特性服务标识 */
enum class ServiceId : uint8_t {
    Reserved              = 0x00,
    DeviceFeatureGet      = 0x01,
    DeviceFeatureResponse = 0x02,
    DeviceFeatureSet      = 0x03,
    DeviceFeatureInfo     = 0x04
};

/** 设备特性标识 */
enum class FeatureId : uint8_t {
    SupportedEmiType         = 0x01,
    HostDeviceDescriptorType = 0x02,
    BusConnectionStatus      = 0x03,
    KnxManufacturerCode      = 0x04,
    ActiveEmiType            = 0x05
};

/** 解码错误（作为返回值传递，不抛异常） */
enum class DecodeError {
    None,
    InvalidReportIdentifier,
    InsufficientData,
    UnknownPacketType,
    UnknownProtocolId,
    UnknownServiceId,
    UnknownFeatureId
};

// ==================== 结果类型 ====================

/**
 * @brief 解码结果：成功时持有值，失败时持有错误类型
 */
template<typename T>
struct DecodeResult {
    std::optional<T> value;
    DecodeError error = DecodeError::None;

    bool ok() const { return value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }

    static DecodeResult success(T v) {
        return DecodeResult{std::optional<T>(std::move(v)), DecodeError::None};
    }

    static DecodeResult failure(DecodeError e) {
        return DecodeResult{std::nullopt, e};
    }
};

// ==================== 报文结构 ====================

/** 编码选项（各字段均有默认值） */
struct EncodeOptions {
    uint8_t sequenceNumber = ProtocolConst::DEFAULT_SEQUENCE_NUMBER;  // 仅取低 4 位
    PacketType packetType = PacketType::AllInOne;
    ProtocolId protocolId = ProtocolId::KnxTunnel;
    uint8_t emiId = ProtocolConst::DEFAULT_EMI_ID;
};

/** 报告头中的 PacketInfo + DataLength */
struct PacketInfo {
    uint8_t sequenceNumber = 0;
    PacketType packetType = PacketType::Reserved;
    uint8_t dataLength = 0;
};

/** USB 协议头（保留字节不保存） */
struct ProtocolHeader {
    uint8_t version = 0;
    uint8_t headerLength = 0;
    uint16_t bodyLength = 0;
    ProtocolId protocolId = ProtocolId::Reserved;
};

/** EMI 头 + 负载 */
struct EmiBody {
    uint8_t emiId = 0;
    Frame payload;
};

/**
 * @brief 单个 HID 报告的完整解码结果
 *
 * 编码器保证: bodyLength == 3 + payload.size(), dataLength == 8 + bodyLength
 */
struct DecodedMessage {
    uint8_t reportId = 0;
    uint8_t sequenceNumber = 0;
    PacketType packetType = PacketType::Reserved;
    uint8_t dataLength = 0;
    uint8_t protocolVersion = 0;
    uint8_t headerLength = 0;
    uint16_t bodyLength = 0;
    ProtocolId protocolId = ProtocolId::Reserved;
    uint8_t emiId = 0;
    Frame payload;
};

}  // namespace usbhid
