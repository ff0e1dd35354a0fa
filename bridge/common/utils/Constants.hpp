#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 版本 ====================

inline constexpr const char* BRIDGE_VERSION = "0.1.0";

// ==================== 日志相关 ====================

/** 日志文件名前缀 */
inline constexpr const char* LOG_FILE_PREFIX = "knx-hid-bridge_";

/** 默认日志目录 */
inline constexpr const char* DEFAULT_LOG_DIR = "./logs";

/** 单个日志文件上限 - 100MB */
inline constexpr uint64_t LOG_FILE_SIZE_LIMIT = 100 * 1024 * 1024;

// ==================== 设备相关 ====================

/** 每次读取的字节数（一个 HID 报告） */
inline constexpr size_t DEFAULT_READ_SIZE = 64;

/** 读取块大小上限 */
inline constexpr size_t MAX_READ_SIZE = 4096;

// ==================== Handler 类型 ====================

inline constexpr const char* HANDLER_LISTENER = "listener";
inline constexpr const char* HANDLER_ECHO = "echo";

// ==================== 主循环 ====================

/** 主线程等待信号的轮询间隔（毫秒） */
inline constexpr int SIGNAL_POLL_INTERVAL_MS = 200;

}  // namespace Constants
