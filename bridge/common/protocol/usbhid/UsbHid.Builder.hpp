#pragma once

#include "UsbHid.Types.hpp"
#include "UsbHid.Utils.hpp"

namespace usbhid {

/**
 * @brief KNX USB HID 报文构建器
 *
 * 由内向外逐层封装: 负载 → EMI 头 → USB 协议头 → 报告头
 */
class UsbHidBuilder {
public:
    /**
     * @brief 构建完整的 HID 报告
     *
     * 输出长度恒为 3 + 8 + 3 + payload.size()。
     * DataLength 字段只有 1 字节，超过 255 时仅保留低 8 位。
     */
    static Frame encode(const Frame& payload, const EncodeOptions& options = {}) {
        auto emiData = encodeEmiHeader(payload, options.emiId);
        auto body = encodeProtocolHeader(emiData, options.protocolId);
        return encodeReportHeader(body, options.sequenceNumber, options.packetType);
    }

    /**
     * @brief EMI 头
     *   XX      - EMI ID
     *   00 00   - 保留
     *   [负载]
     */
    static Frame encodeEmiHeader(const Frame& payload, uint8_t emiId) {
        Frame out;
        out.reserve(ProtocolConst::EMI_HEADER_SIZE + payload.size());
        out.push_back(emiId);
        out.push_back(0x00);
        out.push_back(0x00);
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    /**
     * @brief USB 协议头
     *   00        - 协议版本
     *   08        - 头长度
     *   XX XX     - Body 长度（EMI 头 + 负载，Big-Endian）
     *   XX        - 协议 ID
     *   00 00 00  - 保留
     *   [EMI 数据]
     */
    static Frame encodeProtocolHeader(const Frame& emiData, ProtocolId protocolId) {
        Frame out;
        out.reserve(ProtocolConst::PROTOCOL_HEADER_SIZE + emiData.size());
        out.push_back(ProtocolConst::TRANSFER_PROTOCOL_VERSION);
        out.push_back(ProtocolConst::TRANSFER_PROTOCOL_HEADER_LENGTH);
        UsbHidUtils::writeUInt16BE(out, static_cast<uint16_t>(emiData.size()));
        out.push_back(UsbHidUtils::toByte(protocolId));
        out.insert(out.end(), ProtocolConst::PROTOCOL_HEADER_RESERVED_SIZE, 0x00);
        out.insert(out.end(), emiData.begin(), emiData.end());
        return out;
    }

    /**
     * @brief 报告头（最外层）
     *   01  - 报告标识 KNX_DATA_EXCHANGE
     *   XX  - 序号(高 4 位) | 包类型(低 4 位)
     *   XX  - 后续数据长度
     *   [Body]
     */
    static Frame encodeReportHeader(const Frame& body, uint8_t sequenceNumber, PacketType packetType) {
        Frame out;
        out.reserve(ProtocolConst::REPORT_HEADER_SIZE + body.size());
        out.push_back(ProtocolConst::KNX_DATA_EXCHANGE);
        out.push_back(encodePacketInfo(sequenceNumber, packetType));
        out.push_back(static_cast<uint8_t>(body.size() & 0xFF));
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    static uint8_t encodePacketInfo(uint8_t sequenceNumber, PacketType packetType) {
        return UsbHidUtils::packPacketInfo(sequenceNumber, packetType);
    }
};

}  // namespace usbhid
