#pragma once

#include "common/utils/ErrorCodes.hpp"

#include <string>
#include <utility>

/**
 * @brief 连接断开 / 终止原因
 *
 * 生命周期错误以值传递（不抛异常），由 Handler 的
 * handleDisconnected / terminate 回调接收。
 */
struct ConnectionReason {
    enum class Kind {
        Normal,             // 正常结束
        Shutdown,           // 外部请求停止
        HandlerStop,        // Handler 返回 Stop
        HandlerInitFailed,  // init 拒绝启动
        DeviceOpenFailed,
        DeviceWriteFailed,
        ReaderIoError,
        ReaderEndOfStream,
        ReaderTaskDied
    };

    Kind kind = Kind::Normal;
    std::string detail;

    static ConnectionReason normal() { return {Kind::Normal, {}}; }
    static ConnectionReason shutdown() { return {Kind::Shutdown, {}}; }
    static ConnectionReason handlerStop(std::string detail) { return {Kind::HandlerStop, std::move(detail)}; }
    static ConnectionReason handlerInitFailed(std::string detail) { return {Kind::HandlerInitFailed, std::move(detail)}; }
    static ConnectionReason deviceOpenFailed(std::string detail) { return {Kind::DeviceOpenFailed, std::move(detail)}; }
    static ConnectionReason deviceWriteFailed(std::string detail) { return {Kind::DeviceWriteFailed, std::move(detail)}; }
    static ConnectionReason readerIoError(std::string detail) { return {Kind::ReaderIoError, std::move(detail)}; }
    static ConnectionReason readerEndOfStream() { return {Kind::ReaderEndOfStream, "eof"}; }
    static ConnectionReason readerTaskDied(std::string detail) { return {Kind::ReaderTaskDied, std::move(detail)}; }

    /** Normal / Shutdown / HandlerStop 以外均视为异常终止 */
    bool isAbnormal() const {
        return kind != Kind::Normal && kind != Kind::Shutdown && kind != Kind::HandlerStop;
    }

    int code() const {
        switch (kind) {
            case Kind::Normal:
            case Kind::Shutdown:          return ErrorCodes::SUCCESS;
            case Kind::HandlerStop:       return ErrorCodes::HANDLER_STOP;
            case Kind::HandlerInitFailed: return ErrorCodes::HANDLER_INIT_FAILED;
            case Kind::DeviceOpenFailed:  return ErrorCodes::DEVICE_OPEN_FAILED;
            case Kind::DeviceWriteFailed: return ErrorCodes::DEVICE_WRITE_FAILED;
            case Kind::ReaderIoError:     return ErrorCodes::READER_IO_ERROR;
            case Kind::ReaderEndOfStream: return ErrorCodes::READER_END_OF_STREAM;
            case Kind::ReaderTaskDied:    return ErrorCodes::READER_TASK_DIED;
        }
        return ErrorCodes::SUCCESS;
    }

    static const char* kindToString(Kind k) {
        switch (k) {
            case Kind::Normal:            return "normal";
            case Kind::Shutdown:          return "shutdown";
            case Kind::HandlerStop:       return "handler_stop";
            case Kind::HandlerInitFailed: return "handler_init_failed";
            case Kind::DeviceOpenFailed:  return "device_open_failed";
            case Kind::DeviceWriteFailed: return "device_write_failed";
            case Kind::ReaderIoError:     return "reader_io_error";
            case Kind::ReaderEndOfStream: return "reader_end_of_stream";
            case Kind::ReaderTaskDied:    return "reader_task_died";
        }
        return "unknown";
    }

    /** 日志格式: "reader_io_error(2004): Input/output error" */
    std::string toString() const {
        std::string s = kindToString(kind);
        if (code() != ErrorCodes::SUCCESS) {
            s += "(" + std::to_string(code()) + ")";
        }
        if (!detail.empty()) {
            s += ": " + detail;
        }
        return s;
    }
};
