#pragma once

#include "common/device/HidDevice.hpp"
#include "common/network/ConnectionReason.hpp"
#include "common/protocol/usbhid/UsbHid.Types.hpp"

#include <json/json.h>

#include <string>
#include <utility>

/**
 * @brief Handler 回调的返回动作
 *
 * - Continue: 仅更新状态
 * - Reply:    编码 payload 写回设备，并更新状态
 * - Stop:     以 reason 终止连接
 */
template <typename State>
struct Action {
    enum class Kind { Continue, Reply, Stop };

    Kind kind = Kind::Continue;
    State state{};
    usbhid::Frame payload;      // 仅 Reply
    ConnectionReason reason;    // 仅 Stop

    static Action continueWith(State s) {
        Action a;
        a.kind = Kind::Continue;
        a.state = std::move(s);
        return a;
    }

    static Action reply(usbhid::Frame data, State s) {
        Action a;
        a.kind = Kind::Reply;
        a.payload = std::move(data);
        a.state = std::move(s);
        return a;
    }

    static Action stop(ConnectionReason r, State s) {
        Action a;
        a.kind = Kind::Stop;
        a.reason = std::move(r);
        a.state = std::move(s);
        return a;
    }

    bool isContinue() const { return kind == Kind::Continue; }
    bool isReply() const { return kind == Kind::Reply; }
    bool isStop() const { return kind == Kind::Stop; }
};

/**
 * @brief init 结果：成功时携带初始状态，失败时携带原因
 */
template <typename State>
struct InitResult {
    bool success = true;
    State state{};
    std::string reason;

    static InitResult ok(State s) { return {true, std::move(s), {}}; }
    static InitResult stop(std::string r) { return {false, State{}, std::move(r)}; }
};

/**
 * @brief 帧处理器接口
 *
 * 所有回调都在连接的事件循环线程上串行调用。
 * 状态按值传入，回调返回的 Action 携带新的状态。
 * 未覆盖的回调使用默认实现：init 返回默认构造的状态，
 * handle* 返回 Continue(state)，terminate 不做任何事。
 *
 * @tparam State Handler 私有状态，要求可默认构造、可移动
 */
template <typename State>
class FrameHandler {
public:
    using StateType = State;
    using ActionType = Action<State>;

    virtual ~FrameHandler() = default;

    /**
     * @brief 连接启动时调用一次，早于任何设备 I/O
     * @param options 来自配置 handler.options
     */
    virtual InitResult<State> init(const Json::Value& /*options*/) {
        return InitResult<State>::ok(State{});
    }

    /** 设备打开成功后调用一次 */
    virtual ActionType handleConnected(const DeviceInfo& /*device*/, State state) {
        return ActionType::continueWith(std::move(state));
    }

    /** 每个成功解码的报告调用一次，payload 为 EMI 头之后的数据 */
    virtual ActionType handleFrame(const usbhid::Frame& /*payload*/, State state) {
        return ActionType::continueWith(std::move(state));
    }

    /**
     * @brief 连接断开后调用（设备已关闭）
     * 返回 Stop 时以其 reason 作为最终原因；Reply 的 payload 会被丢弃
     */
    virtual ActionType handleDisconnected(const ConnectionReason& /*reason*/, State state) {
        return ActionType::continueWith(std::move(state));
    }

    /** init 成功后的每条路径上，最后且仅调用一次 */
    virtual void terminate(const ConnectionReason& /*reason*/, const State& /*state*/) {}
};
