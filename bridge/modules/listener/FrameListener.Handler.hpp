#pragma once

#include "common/handler/FrameHandler.hpp"
#include "common/protocol/usbhid/UsbHid.Utils.hpp"

#include <trantor/utils/Logger.h>

/**
 * @brief 帧监听器状态
 */
struct FrameListenerState {
    uint64_t frameCount = 0;
    uint64_t maxFrames = 0;     // 0 = 不限制
};

/**
 * @brief 帧监听器 - 记录总线上收到的每一帧
 *
 * options:
 *   max_frames  收到 N 帧后主动停止（0 或缺省表示一直运行）
 */
class FrameListenerHandler : public FrameHandler<FrameListenerState> {
public:
    InitResult<FrameListenerState> init(const Json::Value& options) override {
        FrameListenerState state;
        if (options.isMember("max_frames")) {
            if (!options["max_frames"].isUInt64()) {
                return InitResult<FrameListenerState>::stop("max_frames must be a non-negative integer");
            }
            state.maxFrames = options["max_frames"].asUInt64();
        }
        LOG_INFO << "[Listener] Initialized"
                 << (state.maxFrames ? " (max_frames=" + std::to_string(state.maxFrames) + ")" : "");
        return InitResult<FrameListenerState>::ok(state);
    }

    ActionType handleConnected(const DeviceInfo& device, FrameListenerState state) override {
        LOG_INFO << "[Listener] Connected to KNX device: " << device.path;
        return ActionType::continueWith(state);
    }

    ActionType handleFrame(const usbhid::Frame& payload, FrameListenerState state) override {
        ++state.frameCount;
        LOG_INFO << "[Listener] Frame #" << state.frameCount << " received (" << payload.size()
                 << " bytes): " << usbhid::UsbHidUtils::bufferToHexWithSpaces(payload);

        if (state.maxFrames != 0 && state.frameCount >= state.maxFrames) {
            return ActionType::stop(ConnectionReason::handlerStop("max_frames reached"), state);
        }
        return ActionType::continueWith(state);
    }

    ActionType handleDisconnected(const ConnectionReason& reason, FrameListenerState state) override {
        LOG_WARN << "[Listener] Disconnected from KNX device: " << reason.toString();
        LOG_INFO << "[Listener] Total frames received: " << state.frameCount;
        return ActionType::continueWith(state);
    }

    void terminate(const ConnectionReason& reason, const FrameListenerState& state) override {
        LOG_INFO << "[Listener] Terminating: " << reason.toString()
                 << ", final frame count: " << state.frameCount;
    }
};
