#pragma once

#include "UsbHid.Types.hpp"
#include "common/utils/ErrorCodes.hpp"

#include <string>

namespace usbhid {

/**
 * @brief KNX USB HID 工具函数
 * 大端读写、半字节打包、枚举 <-> 字节映射表、HEX 日志格式化
 */
class UsbHidUtils {
private:
    /**
     * @brief 预生成的 HEX 查找表（O(1) 查表替代格式化）
     */
    struct HexTable {
        char table[256][2]{};
        HexTable() {
            const char* hex = "0123456789ABCDEF";
            for (int i = 0; i < 256; ++i) {
                table[i][0] = hex[(i >> 4) & 0x0F];
                table[i][1] = hex[i & 0x0F];
            }
        }
    };
    static inline const HexTable hexTable_{};

public:
    // ==================== 字节读写 ====================

    /**
     * @brief 读取 Big-Endian 16位整数
     */
    static uint16_t readUInt16BE(const std::vector<uint8_t>& data, size_t offset) {
        return static_cast<uint16_t>((static_cast<uint16_t>(data[offset]) << 8) | data[offset + 1]);
    }

    /**
     * @brief 写入 Big-Endian 16位整数
     */
    static void writeUInt16BE(std::vector<uint8_t>& data, uint16_t value) {
        data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    // ==================== PacketInfo 半字节 ====================

    /** 高半字节 = 序号（超出 4 位的部分被截断），低半字节 = 包类型 */
    static uint8_t packPacketInfo(uint8_t sequenceNumber, PacketType type) {
        return static_cast<uint8_t>(((sequenceNumber & 0x0F) << 4) | (toByte(type) & 0x0F));
    }

    static uint8_t sequenceOf(uint8_t packetInfo) {
        return static_cast<uint8_t>((packetInfo >> 4) & 0x0F);
    }

    static uint8_t packetTypeCodeOf(uint8_t packetInfo) {
        return static_cast<uint8_t>(packetInfo & 0x0F);
    }

    // ==================== 枚举 -> 字节 ====================

    static uint8_t toByte(PacketType v) { return static_cast<uint8_t>(v); }
    static uint8_t toByte(ProtocolId v) { return static_cast<uint8_t>(v); }
    static uint8_t toByte(ServiceId v) { return static_cast<uint8_t>(v); }
    static uint8_t toByte(FeatureId v) { return static_cast<uint8_t>(v); }

    // ==================== 字节 -> 枚举 ====================

    static DecodeResult<PacketType> packetTypeFromByte(uint8_t b) {
        using R = DecodeResult<PacketType>;
        switch (b) {
            case 0x00: return R::success(PacketType::Reserved);
            case 0x03: return R::success(PacketType::AllInOne);
            case 0x04: return R::success(PacketType::Partial);
            case 0x05: return R::success(PacketType::Start);
            case 0x06: return R::success(PacketType::End);
            default:   return R::failure(DecodeError::UnknownPacketType);
        }
    }

    static DecodeResult<ProtocolId> protocolIdFromByte(uint8_t b) {
        using R = DecodeResult<ProtocolId>;
        switch (b) {
            case 0x00: return R::success(ProtocolId::Reserved);
            case 0x01: return R::success(ProtocolId::KnxTunnel);
            case 0x02: return R::success(ProtocolId::MBusTunnel);
            case 0x03: return R::success(ProtocolId::BatiBusTunnel);
            case 0x0F: return R::success(ProtocolId::BusAccessServerFeatureService);
            default:   return R::failure(DecodeError::UnknownProtocolId);
        }
    }

    static DecodeResult<ServiceId> serviceIdFromByte(uint8_t b) {
        using R = DecodeResult<ServiceId>;
        switch (b) {
            case 0x00: return R::success(ServiceId::Reserved);
            case 0x01: return R::success(ServiceId::DeviceFeatureGet);
            case 0x02: return R::success(ServiceId::DeviceFeatureResponse);
            case 0x03: return R::success(ServiceId::DeviceFeatureSet);
            case 0x04: return R::success(ServiceId::DeviceFeatureInfo);
            default:   return R::failure(DecodeError::UnknownServiceId);
        }
    }

    static DecodeResult<FeatureId> featureIdFromByte(uint8_t b) {
        using R = DecodeResult<FeatureId>;
        switch (b) {
            case 0x01: return R::success(FeatureId::SupportedEmiType);
            case 0x02: return R::success(FeatureId::HostDeviceDescriptorType);
            case 0x03: return R::success(FeatureId::BusConnectionStatus);
            case 0x04: return R::success(FeatureId::KnxManufacturerCode);
            case 0x05: return R::success(FeatureId::ActiveEmiType);
            default:   return R::failure(DecodeError::UnknownFeatureId);
        }
    }

    // ==================== 日志用名称 ====================

    static const char* toString(PacketType v) {
        switch (v) {
            case PacketType::Reserved: return "reserved";
            case PacketType::AllInOne: return "all_in_one";
            case PacketType::Partial:  return "partial";
            case PacketType::Start:    return "start";
            case PacketType::End:      return "end";
        }
        return "unknown";
    }

    static const char* toString(ProtocolId v) {
        switch (v) {
            case ProtocolId::Reserved:                      return "reserved";
            case ProtocolId::KnxTunnel:                     return "knx_tunnel";
            case ProtocolId::MBusTunnel:                    return "mbus_tunnel";
            case ProtocolId::BatiBusTunnel:                 return "batibus_tunnel";
            case ProtocolId::BusAccessServerFeatureService: return "bus_access_server_feature_service";
        }
        return "unknown";
    }

    static const char* toString(ServiceId v) {
        switch (v) {
            case ServiceId::Reserved:              return "reserved";
            case ServiceId::DeviceFeatureGet:      return "device_feature_get";
            case ServiceId::DeviceFeatureResponse: return "device_feature_response";
            case ServiceId::DeviceFeatureSet:      return "device_feature_set";
            case ServiceId::DeviceFeatureInfo:     return "device_feature_info";
        }
        return "unknown";
    }

    static const char* toString(FeatureId v) {
        switch (v) {
            case FeatureId::SupportedEmiType:         return "supported_emi_type";
            case FeatureId::HostDeviceDescriptorType: return "host_device_descriptor_type";
            case FeatureId::BusConnectionStatus:      return "bus_connection_status";
            case FeatureId::KnxManufacturerCode:      return "knx_manufacturer_code";
            case FeatureId::ActiveEmiType:            return "active_emi_type";
        }
        return "unknown";
    }

    static const char* toString(DecodeError e) {
        switch (e) {
            case DecodeError::None:                    return "none";
            case DecodeError::InvalidReportIdentifier: return "invalid_report_identifier";
            case DecodeError::InsufficientData:        return "insufficient_data";
            case DecodeError::UnknownPacketType:       return "unknown_packet_type";
            case DecodeError::UnknownProtocolId:       return "unknown_protocol_id";
            case DecodeError::UnknownServiceId:        return "unknown_service_id";
            case DecodeError::UnknownFeatureId:        return "unknown_feature_id";
        }
        return "unknown";
    }

    /** 解码错误 -> 1xxx 错误码（日志用） */
    static int toErrorCode(DecodeError e) {
        switch (e) {
            case DecodeError::None:                    return ErrorCodes::SUCCESS;
            case DecodeError::InvalidReportIdentifier: return ErrorCodes::INVALID_REPORT_IDENTIFIER;
            case DecodeError::InsufficientData:        return ErrorCodes::INSUFFICIENT_DATA;
            case DecodeError::UnknownPacketType:       return ErrorCodes::UNKNOWN_PACKET_TYPE;
            case DecodeError::UnknownProtocolId:       return ErrorCodes::UNKNOWN_PROTOCOL_ID;
            case DecodeError::UnknownServiceId:        return ErrorCodes::UNKNOWN_SERVICE_ID;
            case DecodeError::UnknownFeatureId:        return ErrorCodes::UNKNOWN_FEATURE_ID;
        }
        return ErrorCodes::SUCCESS;
    }

    // ==================== HEX ====================

    /** 批量字节转 HEX 字符串（查表） */
    static std::string bufferToHex(const std::vector<uint8_t>& data) {
        std::string result;
        result.reserve(data.size() * 2);
        for (uint8_t b : data) {
            result.append(hexTable_.table[b], 2);
        }
        return result;
    }

    /**
     * @brief 字节数组转带空格的 HEX 字符串，如 "29 00 BC"
     */
    static std::string bufferToHexWithSpaces(const std::vector<uint8_t>& data) {
        if (data.empty()) return {};
        std::string result;
        result.reserve(data.size() * 3 - 1);
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) result += ' ';
            result.append(hexTable_.table[data[i]], 2);
        }
        return result;
    }
};

}  // namespace usbhid
