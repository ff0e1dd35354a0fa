#pragma once

#include "common/handler/FrameHandler.hpp"
#include "common/protocol/usbhid/UsbHid.Utils.hpp"

#include <trantor/utils/Logger.h>

#include <functional>

/**
 * @brief 回显模式
 * - Callback: 通过 Reply 动作同步回写
 * - Api:      通过连接的 sendFrame 异步回写
 */
enum class EchoMode { Callback, Api };

struct EchoState {
    EchoMode mode = EchoMode::Callback;
    uint64_t echoCount = 0;
};

/**
 * @brief 回显处理器 - 把收到的每一帧原样发回总线
 *
 * options:
 *   echo_mode  "callback"（默认）或 "api"
 */
class EchoHandler : public FrameHandler<EchoState> {
public:
    using Sender = std::function<void(usbhid::Frame)>;

    /** api 模式下使用的发送函数，一般绑定到 UsbHidConnection::sendFrame */
    void setSender(Sender sender) { sender_ = std::move(sender); }

    InitResult<EchoState> init(const Json::Value& options) override {
        EchoState state;
        const auto mode = options.get("echo_mode", "callback").asString();
        if (mode == "callback") {
            state.mode = EchoMode::Callback;
        } else if (mode == "api") {
            if (!sender_) {
                return InitResult<EchoState>::stop("echo_mode api requires a sender");
            }
            state.mode = EchoMode::Api;
        } else {
            return InitResult<EchoState>::stop("unknown echo_mode: " + mode);
        }
        LOG_INFO << "[Echo] Initialized with mode: " << mode;
        return InitResult<EchoState>::ok(state);
    }

    ActionType handleConnected(const DeviceInfo& device, EchoState state) override {
        LOG_INFO << "[Echo] Connected to KNX device: " << device.path;
        return ActionType::continueWith(state);
    }

    ActionType handleFrame(const usbhid::Frame& payload, EchoState state) override {
        ++state.echoCount;
        LOG_INFO << "[Echo #" << state.echoCount << "] Received frame: "
                 << usbhid::UsbHidUtils::bufferToHexWithSpaces(payload);

        if (state.mode == EchoMode::Callback) {
            LOG_DEBUG << "[Echo #" << state.echoCount << "] Echoing via reply";
            return ActionType::reply(payload, state);
        }

        LOG_DEBUG << "[Echo #" << state.echoCount << "] Echoing via sendFrame";
        sender_(payload);
        return ActionType::continueWith(state);
    }

    ActionType handleDisconnected(const ConnectionReason& reason, EchoState state) override {
        LOG_WARN << "[Echo] Disconnected from KNX device: " << reason.toString();
        LOG_INFO << "[Echo] Total frames echoed: " << state.echoCount;
        return ActionType::continueWith(state);
    }

    void terminate(const ConnectionReason& reason, const EchoState& state) override {
        LOG_INFO << "[Echo] Terminating: " << reason.toString()
                 << ", final echo count: " << state.echoCount;
    }

private:
    Sender sender_;
};
