#pragma once

#include <trantor/utils/Logger.h>

#include <atomic>
#include <string>

/**
 * @brief 连接生命周期阶段
 */
enum class ConnectionPhase {
    Init,           // 等待 Handler init
    Connecting,     // 打开设备 / handleConnected
    Connected,      // 读取线程运行中
    Disconnecting,  // 停止读取线程、关闭设备、handleDisconnected
    Terminated      // terminate 已调用，不再处理任何消息
};

inline std::string connectionPhaseToString(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Init:          return "init";
        case ConnectionPhase::Connecting:    return "connecting";
        case ConnectionPhase::Connected:     return "connected";
        case ConnectionPhase::Disconnecting: return "disconnecting";
        case ConnectionPhase::Terminated:    return "terminated";
    }
    return "terminated";
}

/**
 * @brief 连接状态机
 *
 * 每个 UsbHidConnection 持有一个实例，所有阶段转换集中在此。
 * 只在连接的事件循环线程上转换，phase() 可在任意线程读取。
 *
 * 状态转换表：
 *   Init →[initOk]→ Connecting →[opened]→ Connected
 *   Connected →[disconnect]→ Disconnecting →[terminate]→ Terminated
 *   Init →[initStop]→ Terminated
 *   Any →[terminate]→ Terminated
 */
class ConnectionStateMachine {
public:
    ConnectionPhase phase() const { return phase_.load(std::memory_order_acquire); }
    std::string phaseString() const { return connectionPhaseToString(phase()); }

    bool is(ConnectionPhase p) const { return phase() == p; }
    bool isTerminated() const { return is(ConnectionPhase::Terminated); }

    // ==================== 状态事件 ====================

    void onInitOk() {
        transition(ConnectionPhase::Connecting, "initOk");
    }

    void onInitStop() {
        transition(ConnectionPhase::Terminated, "initStop");
    }

    void onOpened() {
        transition(ConnectionPhase::Connected, "opened");
    }

    void onDisconnect() {
        transition(ConnectionPhase::Disconnecting, "disconnect");
    }

    void onTerminate() {
        transition(ConnectionPhase::Terminated, "terminate");
    }

private:
    std::atomic<ConnectionPhase> phase_{ConnectionPhase::Init};

    void transition(ConnectionPhase newPhase, const char* event) {
        ConnectionPhase old = phase();
        if (old != newPhase) {
            LOG_DEBUG << "ConnFSM: " << connectionPhaseToString(old)
                      << " →[" << event << "]→ " << connectionPhaseToString(newPhase);
            phase_.store(newPhase, std::memory_order_release);
        }
    }
};
