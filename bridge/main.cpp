// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/Constants.hpp"
#include "common/utils/ErrorCodes.hpp"
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"

// Network
#include "common/network/UsbHidConnection.hpp"

// Handlers
#include "modules/listener/FrameListener.Handler.hpp"
#include "modules/echo/Echo.Handler.hpp"

#include <csignal>
#include <ctime>

// ─── 启动错误输出 ──────────────────────────────────────────

/**
 * @brief 输出启动阶段错误到控制台和日志
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 根据终止原因返回排查提示
 */
std::vector<std::string> getReasonHints(const ConnectionReason& reason) {
    switch (reason.kind) {
        case ConnectionReason::Kind::DeviceOpenFailed:
            return {
                "device.path 是否指向 KNX USB 接口对应的 /dev/hidrawN",
                "当前用户是否有该设备的读写权限（udev 规则）",
                "是否有其他进程占用该设备",
            };
        case ConnectionReason::Kind::HandlerInitFailed:
            return {
                "config 中 handler.options 是否正确",
            };
        case ConnectionReason::Kind::ReaderIoError:
        case ConnectionReason::Kind::ReaderEndOfStream:
        case ConnectionReason::Kind::DeviceWriteFailed:
            return {
                "USB 线缆是否松动，设备是否被拔出",
            };
        default:
            return {};
    }
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [--config <path>] [--version]\n"
              << "  --config <path>  指定配置文件（默认按 ./config/config.local.json 等位置查找）\n"
              << "  --version        输出版本号\n";
}

// ─── 运行连接 ──────────────────────────────────────────────

/**
 * @brief 运行一个连接，直到终止或收到 SIGINT/SIGTERM
 * @return 最终原因
 */
template <typename State>
ConnectionReason runBridge(UsbHidConnection<State>& conn, const sigset_t& signals) {
    if (!conn.start()) {
        return conn.waitForTermination();
    }

    const timespec interval{0, Constants::SIGNAL_POLL_INTERVAL_MS * 1000000L};
    while (conn.phase() != ConnectionPhase::Terminated) {
        int sig = sigtimedwait(&signals, nullptr, &interval);
        if (sig == SIGINT || sig == SIGTERM) {
            LOG_INFO << "Received signal " << sig << ", shutting down";
            conn.stop(ConnectionReason::shutdown());
            break;
        }
    }

    auto reason = conn.waitForTermination();
    LOG_INFO << "Connection stats: " << conn.stats().toJson().toStyledString();
    return reason;
}

ConnectionOptions buildConnectionOptions() {
    ConnectionOptions options;
    options.devicePath = ConfigManager::getDevicePath();
    options.readSize = ConfigManager::getReadSize();
    options.handlerOptions = ConfigManager::getHandlerOptions();
    options.name = ConfigManager::getConnectionName();
    return options;
}

int main(int argc, char* argv[]) {
    std::optional<std::string> configPath;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "knx-hid-bridge " << Constants::BRIDGE_VERSION << std::endl;
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 信号在启动任何线程之前屏蔽，由主线程 sigtimedwait 统一接收
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    if (!ConfigManager::load(configPath)) {
        std::cerr << "Bridge startup aborted due to configuration errors (code "
                  << ErrorCodes::CONFIG_ERROR << ")." << std::endl;
        return 1;
    }

    // 3. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    try {
        LoggerManager::initialize(ConfigManager::getLogDir());
    } catch (const std::exception& e) {
        printStartupError("日志目录初始化失败", e.what(), {"log_dir 是否可写"});
        return 1;
    }
    LoggerManager::setLogLevel(ConfigManager::getLogLevel());
    LoggerManager::setConsoleEcho(ConfigManager::isConsoleLogEnabled());

    LOG_INFO << "knx-hid-bridge " << Constants::BRIDGE_VERSION << " starting, device="
             << ConfigManager::getDevicePath() << ", handler=" << ConfigManager::getHandlerType();
    std::cout << "Logs: " << ConfigManager::getLogDir() << "/" << Constants::LOG_FILE_PREFIX
              << "*.log" << std::endl;

    // 4. 按配置构建 Handler 并运行连接
    ConnectionReason reason;
    auto options = buildConnectionOptions();
    if (ConfigManager::getHandlerType() == Constants::HANDLER_ECHO) {
        auto handler = std::make_shared<EchoHandler>();
        UsbHidConnection<EchoState> conn(handler, options);
        handler->setSender([&conn](usbhid::Frame payload) { conn.sendFrame(std::move(payload)); });
        reason = runBridge(conn, signals);
    } else {
        auto handler = std::make_shared<FrameListenerHandler>();
        UsbHidConnection<FrameListenerState> conn(handler, options);
        reason = runBridge(conn, signals);
    }

    // 5. 退出码
    int exitCode = 0;
    if (reason.isAbnormal()) {
        printStartupError("连接异常终止", reason.toString(), getReasonHints(reason));
        exitCode = 1;
    } else {
        LOG_INFO << "Bridge stopped: " << reason.toString();
    }

    LoggerManager::close();
    return exitCode;
}
