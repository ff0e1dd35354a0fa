#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief 设备信息（handleConnected 时传给 Handler）
 */
struct DeviceInfo {
    std::string path;
    std::optional<uint16_t> vendorId;   // 未知时为 nullopt
    std::optional<uint16_t> productId;
};

/**
 * @brief 设备 I/O 结果
 *
 * 所有设备错误都以值返回，调用方必须检查 status
 */
struct DeviceIoResult {
    enum class Status {
        Ok,
        EndOfStream,    // 设备拔出 / 文件结束
        Interrupted,    // interruptRead() 唤醒
        Error
    };

    Status status = Status::Ok;
    std::vector<uint8_t> data;
    std::string error;

    bool ok() const { return status == Status::Ok; }

    static DeviceIoResult success(std::vector<uint8_t> bytes = {}) {
        return {Status::Ok, std::move(bytes), {}};
    }
    static DeviceIoResult endOfStream() { return {Status::EndOfStream, {}, {}}; }
    static DeviceIoResult interrupted() { return {Status::Interrupted, {}, {}}; }
    static DeviceIoResult failure(std::string message) {
        return {Status::Error, {}, std::move(message)};
    }
};

/**
 * @brief HID 字符设备抽象
 *
 * 线程约定：
 * - read() 只由读取线程调用，阻塞且无超时
 * - write() / open() / close() 只由连接的事件循环线程调用
 * - interruptRead() 可在任意线程调用，使阻塞中的 read() 返回 Interrupted
 */
class HidDevice {
public:
    virtual ~HidDevice() = default;

    virtual DeviceIoResult open() = 0;
    virtual DeviceIoResult read(size_t maxBytes) = 0;
    virtual DeviceIoResult write(const std::vector<uint8_t>& data) = 0;
    virtual void interruptRead() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual DeviceInfo info() const = 0;
};
