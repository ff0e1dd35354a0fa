#pragma once

#include "UsbHid.Types.hpp"
#include "UsbHid.Utils.hpp"

namespace usbhid {

/**
 * @brief KNX USB HID 报文解析器
 *
 * 逐层按固定偏移切片，每一层独立失败并返回具体错误类型。
 * 每个 HID 报告单独解码，不做多包重组。
 */
class UsbHidParser {
public:
    /** 报告头起始偏移 */
    static constexpr size_t REPORT_ID_OFFSET = 0;
    static constexpr size_t PACKET_INFO_OFFSET = 1;
    static constexpr size_t PROTOCOL_HEADER_OFFSET = ProtocolConst::REPORT_HEADER_SIZE;
    static constexpr size_t EMI_HEADER_OFFSET =
        ProtocolConst::REPORT_HEADER_SIZE + ProtocolConst::PROTOCOL_HEADER_SIZE;

    /**
     * @brief 解码完整 HID 报告
     */
    static DecodeResult<DecodedMessage> decode(const Frame& data) {
        using R = DecodeResult<DecodedMessage>;

        auto reportId = decodeReportIdentifier(data, REPORT_ID_OFFSET);
        if (!reportId) return R::failure(reportId.error);

        auto info = decodePacketInfo(data, PACKET_INFO_OFFSET);
        if (!info) return R::failure(info.error);

        auto header = decodeProtocolHeader(data, PROTOCOL_HEADER_OFFSET);
        if (!header) return R::failure(header.error);

        auto emi = decodeEmiHeader(data, EMI_HEADER_OFFSET);
        if (!emi) return R::failure(emi.error);

        DecodedMessage msg;
        msg.reportId = *reportId;
        msg.sequenceNumber = info->sequenceNumber;
        msg.packetType = info->packetType;
        msg.dataLength = info->dataLength;
        msg.protocolVersion = header->version;
        msg.headerLength = header->headerLength;
        msg.bodyLength = header->bodyLength;
        msg.protocolId = header->protocolId;
        msg.emiId = emi->emiId;
        msg.payload = std::move(emi.value->payload);
        return R::success(std::move(msg));
    }

    /**
     * @brief 只取负载，错误原样传递
     */
    static DecodeResult<Frame> extractPayload(const Frame& data) {
        auto decoded = decode(data);
        if (!decoded) return DecodeResult<Frame>::failure(decoded.error);
        return DecodeResult<Frame>::success(std::move(decoded.value->payload));
    }

    // ==================== 分层解析 ====================

    /**
     * @brief 报告标识（1 字节，必须为 0x01）
     */
    static DecodeResult<uint8_t> decodeReportIdentifier(const Frame& data, size_t offset = 0) {
        using R = DecodeResult<uint8_t>;
        if (remaining(data, offset) < 1) return R::failure(DecodeError::InsufficientData);

        uint8_t reportId = data[offset];
        if (reportId != ProtocolConst::KNX_DATA_EXCHANGE) {
            return R::failure(DecodeError::InvalidReportIdentifier);
        }
        return R::success(reportId);
    }

    /**
     * @brief PacketInfo + DataLength（2 字节）
     *   高半字节 = 序号，低半字节 = 包类型
     */
    static DecodeResult<PacketInfo> decodePacketInfo(const Frame& data, size_t offset = 0) {
        using R = DecodeResult<PacketInfo>;
        if (remaining(data, offset) < 2) return R::failure(DecodeError::InsufficientData);

        uint8_t packetInfoByte = data[offset];
        auto type = UsbHidUtils::packetTypeFromByte(UsbHidUtils::packetTypeCodeOf(packetInfoByte));
        if (!type) return R::failure(type.error);

        PacketInfo info;
        info.sequenceNumber = UsbHidUtils::sequenceOf(packetInfoByte);
        info.packetType = *type;
        info.dataLength = data[offset + 1];
        return R::success(info);
    }

    /**
     * @brief USB 协议头（5 字节字段 + 3 字节保留）
     *   [Version(1)][HeaderLength(1)][BodyLength(2, BE)][ProtocolID(1)][Reserved(3)]
     */
    static DecodeResult<ProtocolHeader> decodeProtocolHeader(const Frame& data, size_t offset = 0) {
        using R = DecodeResult<ProtocolHeader>;
        if (remaining(data, offset) < ProtocolConst::PROTOCOL_HEADER_FIELDS_SIZE) {
            return R::failure(DecodeError::InsufficientData);
        }

        auto protocolId = UsbHidUtils::protocolIdFromByte(data[offset + 4]);
        if (!protocolId) return R::failure(protocolId.error);

        // 保留字节随协议头一起消费
        if (remaining(data, offset) < ProtocolConst::PROTOCOL_HEADER_SIZE) {
            return R::failure(DecodeError::InsufficientData);
        }

        ProtocolHeader header;
        header.version = data[offset];
        header.headerLength = data[offset + 1];
        header.bodyLength = UsbHidUtils::readUInt16BE(data, offset + 2);
        header.protocolId = *protocolId;
        return R::success(header);
    }

    /**
     * @brief EMI 头（3 字节），其后全部为负载
     */
    static DecodeResult<EmiBody> decodeEmiHeader(const Frame& data, size_t offset = 0) {
        using R = DecodeResult<EmiBody>;
        if (remaining(data, offset) < ProtocolConst::EMI_HEADER_SIZE) {
            return R::failure(DecodeError::InsufficientData);
        }

        EmiBody body;
        body.emiId = data[offset];
        body.payload.assign(data.begin() + static_cast<std::ptrdiff_t>(offset + ProtocolConst::EMI_HEADER_SIZE),
                            data.end());
        return R::success(std::move(body));
    }

private:
    static size_t remaining(const Frame& data, size_t offset) {
        return offset < data.size() ? data.size() - offset : 0;
    }
};

}  // namespace usbhid
