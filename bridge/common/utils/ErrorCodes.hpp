#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 报文解码错误（可恢复，丢弃该报告）
 * - 2xxx: 连接生命周期错误（致命，连接终止）
 * - 5xxx: 启动/配置错误
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 解码错误 (1xxx) ====================

/** 报告标识不是 0x01 */
inline constexpr int INVALID_REPORT_IDENTIFIER = 1001;

/** 数据不足 */
inline constexpr int INSUFFICIENT_DATA = 1002;

/** 未知包类型 */
inline constexpr int UNKNOWN_PACKET_TYPE = 1003;

/** 未知协议 ID */
inline constexpr int UNKNOWN_PROTOCOL_ID = 1004;

/** 未知服务 ID */
inline constexpr int UNKNOWN_SERVICE_ID = 1005;

/** 未知特性 ID */
inline constexpr int UNKNOWN_FEATURE_ID = 1006;

// ==================== 生命周期错误 (2xxx) ====================

/** Handler 初始化失败 */
inline constexpr int HANDLER_INIT_FAILED = 2001;

/** 设备打开失败 */
inline constexpr int DEVICE_OPEN_FAILED = 2002;

/** 设备写入失败 */
inline constexpr int DEVICE_WRITE_FAILED = 2003;

/** 读取线程 I/O 错误 */
inline constexpr int READER_IO_ERROR = 2004;

/** 读取线程遇到流结束 */
inline constexpr int READER_END_OF_STREAM = 2005;

/** 读取线程异常退出 */
inline constexpr int READER_TASK_DIED = 2006;

/** Handler 主动停止 */
inline constexpr int HANDLER_STOP = 2007;

// ==================== 启动错误 (5xxx) ====================

/** 配置文件错误 */
inline constexpr int CONFIG_ERROR = 5001;

}  // namespace ErrorCodes
