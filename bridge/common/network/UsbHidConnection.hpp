#pragma once

#include "ConnectionReason.hpp"
#include "ConnectionState.hpp"
#include "ReaderTask.hpp"
#include "common/device/HidDevice.hpp"
#include "common/device/HidrawDevice.hpp"
#include "common/handler/FrameHandler.hpp"
#include "common/protocol/usbhid/UsbHid.hpp"
#include "common/utils/Constants.hpp"

#include <json/json.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief 连接参数
 */
struct ConnectionOptions {
    std::string devicePath;
    size_t readSize = Constants::DEFAULT_READ_SIZE;
    Json::Value handlerOptions{Json::objectValue};    // 原样传给 Handler::init
    std::string name = "knx";                           // 日志标识
};

/**
 * @brief 连接流量统计快照
 */
struct ConnectionStats {
    uint64_t reportsRx = 0;
    uint64_t reportsTx = 0;
    uint64_t bytesRx = 0;
    uint64_t bytesTx = 0;
    uint64_t decodeErrors = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["reports_rx"] = static_cast<Json::UInt64>(reportsRx);
        json["reports_tx"] = static_cast<Json::UInt64>(reportsTx);
        json["bytes_rx"] = static_cast<Json::UInt64>(bytesRx);
        json["bytes_tx"] = static_cast<Json::UInt64>(bytesTx);
        json["decode_errors"] = static_cast<Json::UInt64>(decodeErrors);
        return json;
    }
};

/**
 * @brief KNX USB HID 连接
 *
 * 每个实例独占一个设备和一个 Handler 状态：
 * - 事件循环线程 (trantor::EventLoopThread) 作为邮箱，所有消息按到达顺序串行处理
 * - 读取线程 (ReaderTask) 阻塞读取设备，把数据块投递到事件循环
 * - 只有事件循环线程写设备、调用 Handler、转换状态
 *
 * 生命周期:
 *   Init →[init ok]→ Connecting →[open ok]→ Connected →[断开]→ Disconnecting → Terminated
 * init 成功后的每条路径都以一次 Handler::terminate 结束。
 *
 * @tparam State Handler 状态类型
 */
template <typename State>
class UsbHidConnection {
public:
    using Handler = FrameHandler<State>;
    using ActionType = Action<State>;
    using EventLoop = trantor::EventLoop;

    UsbHidConnection(std::shared_ptr<Handler> handler,
                     std::shared_ptr<HidDevice> device,
                     ConnectionOptions options)
        : handler_(std::move(handler)),
          device_(std::move(device)),
          options_(std::move(options)),
          tag_("[Conn " + options_.name + "] "),
          loopThread_("UsbHidConn_" + options_.name) {
        if (options_.readSize == 0) {
            options_.readSize = Constants::DEFAULT_READ_SIZE;
        }
    }

    /** 使用 Linux hidraw 设备 */
    UsbHidConnection(std::shared_ptr<Handler> handler, ConnectionOptions options)
        : UsbHidConnection(std::move(handler),
                           std::make_shared<HidrawDevice>(options.devicePath),
                           options) {}

    ~UsbHidConnection() {
        if (started_.load(std::memory_order_acquire)) {
            stop(ConnectionReason::shutdown());
            waitForTermination();
        }
    }

    UsbHidConnection(const UsbHidConnection&) = delete;
    UsbHidConnection& operator=(const UsbHidConnection&) = delete;

    /**
     * @brief 启动连接：在事件循环上同步执行 Handler::init，成功后异步打开设备
     * @return init 是否成功；失败时连接直接进入 Terminated，不调用 terminate
     */
    bool start() {
        if (started_.exchange(true)) {
            LOG_WARN << tag_ << "Already started";
            return false;
        }

        std::promise<bool> initDone;
        auto initFuture = initDone.get_future();
        loop()->queueInLoop([this, &initDone]() {
            bool ok = onInit();
            if (ok) {
                loop()->queueInLoop([this]() { onConnect(); });
            }
            initDone.set_value(ok);
        });
        loopThread_.run();
        return initFuture.get();
    }

    /**
     * @brief 异步发送一帧（任意线程，立即返回）
     * 写入失败只会体现为随后的断开 (DeviceWriteFailed)
     */
    void sendFrame(usbhid::Frame payload, usbhid::EncodeOptions options = {}) {
        loop()->queueInLoop([this, payload = std::move(payload), options]() {
            onSendFrame(payload, options);
        });
    }

    /**
     * @brief 请求终止（任意线程，任意阶段）
     */
    void stop(ConnectionReason reason = ConnectionReason::shutdown()) {
        if (!started_.load(std::memory_order_acquire)) {
            LOG_WARN << tag_ << "Stop ignored: not started";
            return;
        }
        loop()->queueInLoop([this, reason = std::move(reason)]() {
            if (fsm_.isTerminated()) return;
            LOG_INFO << tag_ << "Stop requested: " << reason.toString();
            terminateWith(reason);
        });
    }

    ConnectionPhase phase() const { return fsm_.phase(); }

    /**
     * @brief 阻塞等待终止，返回最终原因（未启动时立即返回 Shutdown）
     */
    ConnectionReason waitForTermination() {
        if (!started_.load(std::memory_order_acquire)) {
            return ConnectionReason::shutdown();
        }
        std::unique_lock<std::mutex> lock(finalMutex_);
        finalCv_.wait(lock, [this]() { return finalReason_.has_value(); });
        return *finalReason_;
    }

    std::optional<ConnectionReason> waitForTermination(std::chrono::milliseconds timeout) {
        if (!started_.load(std::memory_order_acquire)) {
            return ConnectionReason::shutdown();
        }
        std::unique_lock<std::mutex> lock(finalMutex_);
        if (!finalCv_.wait_for(lock, timeout, [this]() { return finalReason_.has_value(); })) {
            return std::nullopt;
        }
        return finalReason_;
    }

    ConnectionStats stats() const {
        ConnectionStats s;
        s.reportsRx = reportsRx_.load(std::memory_order_relaxed);
        s.reportsTx = reportsTx_.load(std::memory_order_relaxed);
        s.bytesRx = bytesRx_.load(std::memory_order_relaxed);
        s.bytesTx = bytesTx_.load(std::memory_order_relaxed);
        s.decodeErrors = decodeErrors_.load(std::memory_order_relaxed);
        return s;
    }

private:
    std::shared_ptr<Handler> handler_;
    std::shared_ptr<HidDevice> device_;
    ConnectionOptions options_;
    std::string tag_;

    // 以下仅在事件循环线程访问
    State state_{};
    bool initialized_ = false;
    std::unique_ptr<ReaderTask> reader_;

    ConnectionStateMachine fsm_;
    std::atomic<bool> started_{false};

    std::atomic<uint64_t> reportsRx_{0};
    std::atomic<uint64_t> reportsTx_{0};
    std::atomic<uint64_t> bytesRx_{0};
    std::atomic<uint64_t> bytesTx_{0};
    std::atomic<uint64_t> decodeErrors_{0};

    std::mutex finalMutex_;
    std::condition_variable finalCv_;
    std::optional<ConnectionReason> finalReason_;

    // 必须最后声明：最先析构，保证排队中的回调不会访问已销毁的成员
    trantor::EventLoopThread loopThread_;

    EventLoop* loop() { return loopThread_.getLoop(); }

    // ==================== 生命周期 ====================

    bool onInit() {
        InitResult<State> result;
        try {
            result = handler_->init(options_.handlerOptions);
        } catch (const std::exception& e) {
            LOG_ERROR << tag_ << "init threw: " << e.what();
            result = InitResult<State>::stop(e.what());
        } catch (...) {
            LOG_ERROR << tag_ << "init threw unknown exception";
            result = InitResult<State>::stop("init threw unknown exception");
        }

        if (!result.success) {
            LOG_ERROR << tag_ << "Handler init failed: " << result.reason;
            fsm_.onInitStop();
            finish(ConnectionReason::handlerInitFailed(result.reason));
            return false;
        }

        state_ = std::move(result.state);
        initialized_ = true;
        fsm_.onInitOk();
        return true;
    }

    void onConnect() {
        if (!fsm_.is(ConnectionPhase::Connecting)) return;

        auto opened = device_->open();
        if (!opened.ok()) {
            LOG_ERROR << tag_ << "Failed to open " << options_.devicePath << ": " << opened.error;
            terminateWith(ConnectionReason::deviceOpenFailed(opened.error));
            return;
        }

        auto info = device_->info();
        LOG_INFO << tag_ << "Connected to " << info.path
                 << " (vendor=" << (info.vendorId ? std::to_string(*info.vendorId) : "?")
                 << ", product=" << (info.productId ? std::to_string(*info.productId) : "?") << ")";

        auto action = invokeHandler("handleConnected", [&]() {
            return handler_->handleConnected(info, state_);
        });
        state_ = std::move(action.state);
        if (action.isStop()) {
            terminateWith(action.reason);
            return;
        }

        startReader();
        fsm_.onOpened();

        if (action.isReply()) {
            writeFrame(action.payload, {});
        }
    }

    void startReader() {
        reader_ = std::make_unique<ReaderTask>(
            device_, options_.readSize,
            [this](std::vector<uint8_t> chunk) {
                loop()->queueInLoop([this, chunk = std::move(chunk)]() { onFrameData(chunk); });
            },
            [this](ConnectionReason reason) {
                loop()->queueInLoop([this, reason = std::move(reason)]() { onReaderFailure(reason); });
            });
        reader_->start();
    }

    void stopReader() {
        if (reader_) {
            reader_->stop();
            reader_.reset();
        }
    }

    void closeDevice() {
        if (device_->isOpen()) {
            device_->close();
        }
    }

    /**
     * @brief 断开：停止读取线程、关闭设备、通知 Handler，随后终止
     */
    void disconnect(const ConnectionReason& reason) {
        if (!fsm_.is(ConnectionPhase::Connected) && !fsm_.is(ConnectionPhase::Connecting)) return;

        fsm_.onDisconnect();
        LOG_WARN << tag_ << "Disconnected: " << reason.toString();

        stopReader();
        closeDevice();

        auto action = invokeHandler("handleDisconnected", [&]() {
            return handler_->handleDisconnected(reason, state_);
        });
        state_ = std::move(action.state);

        if (action.isStop()) {
            terminateWith(action.reason);
            return;
        }
        if (action.isReply()) {
            LOG_WARN << tag_ << "Reply after disconnect discarded ("
                     << action.payload.size() << "B): device closed";
        }
        terminateWith(reason);
    }

    /**
     * @brief 终止：任何路径最终都经过这里，terminate 只调用一次
     */
    void terminateWith(const ConnectionReason& reason) {
        if (fsm_.isTerminated()) return;

        stopReader();
        closeDevice();
        fsm_.onTerminate();

        if (reason.isAbnormal()) {
            LOG_ERROR << tag_ << "Terminated: " << reason.toString();
        } else {
            LOG_INFO << tag_ << "Terminated: " << reason.toString();
        }

        if (initialized_) {
            try {
                handler_->terminate(reason, state_);
            } catch (const std::exception& e) {
                LOG_ERROR << tag_ << "terminate threw: " << e.what();
            } catch (...) {
                LOG_ERROR << tag_ << "terminate threw unknown exception";
            }
        }
        finish(reason);
    }

    void finish(const ConnectionReason& reason) {
        {
            std::lock_guard<std::mutex> lock(finalMutex_);
            finalReason_ = reason;
        }
        finalCv_.notify_all();
    }

    // ==================== 邮箱消息 ====================

    void onFrameData(const std::vector<uint8_t>& raw) {
        if (!fsm_.is(ConnectionPhase::Connected)) {
            LOG_TRACE << tag_ << "Drop " << raw.size() << "B: " << fsm_.phaseString();
            return;
        }

        reportsRx_.fetch_add(1, std::memory_order_relaxed);
        bytesRx_.fetch_add(raw.size(), std::memory_order_relaxed);

        auto decoded = usbhid::UsbHidParser::decode(raw);
        if (!decoded) {
            decodeErrors_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN << tag_ << "Drop report: " << usbhid::UsbHidUtils::toString(decoded.error)
                     << "(" << usbhid::UsbHidUtils::toErrorCode(decoded.error) << ") ["
                     << usbhid::UsbHidUtils::bufferToHexWithSpaces(raw) << "]";
            return;
        }

        LOG_DEBUG << tag_ << "RX seq=" << static_cast<int>(decoded->sequenceNumber)
                  << " " << usbhid::UsbHidUtils::toString(decoded->packetType)
                  << " " << usbhid::UsbHidUtils::toString(decoded->protocolId)
                  << " emi=" << static_cast<int>(decoded->emiId)
                  << " [" << usbhid::UsbHidUtils::bufferToHexWithSpaces(decoded->payload) << "]";

        auto action = invokeHandler("handleFrame", [&]() {
            return handler_->handleFrame(decoded->payload, state_);
        });
        applyAction(std::move(action));
    }

    void onReaderFailure(const ConnectionReason& reason) {
        if (!fsm_.is(ConnectionPhase::Connected)) return;
        disconnect(reason);
    }

    void onSendFrame(const usbhid::Frame& payload, const usbhid::EncodeOptions& options) {
        if (!fsm_.is(ConnectionPhase::Connected)) {
            LOG_WARN << tag_ << "Drop outgoing frame (" << payload.size() << "B): "
                     << fsm_.phaseString();
            return;
        }
        writeFrame(payload, options);
    }

    // ==================== 工具方法 ====================

    void applyAction(ActionType action) {
        state_ = std::move(action.state);
        switch (action.kind) {
            case ActionType::Kind::Continue:
                break;
            case ActionType::Kind::Reply:
                writeFrame(action.payload, {});
                break;
            case ActionType::Kind::Stop:
                terminateWith(action.reason);
                break;
        }
    }

    /**
     * @brief 编码并写入设备，失败时进入断开流程
     */
    bool writeFrame(const usbhid::Frame& payload, const usbhid::EncodeOptions& options) {
        auto report = usbhid::UsbHidBuilder::encode(payload, options);
        auto result = device_->write(report);
        if (!result.ok()) {
            LOG_ERROR << tag_ << "Write failed: " << result.error;
            disconnect(ConnectionReason::deviceWriteFailed(result.error));
            return false;
        }

        reportsTx_.fetch_add(1, std::memory_order_relaxed);
        bytesTx_.fetch_add(report.size(), std::memory_order_relaxed);
        LOG_DEBUG << tag_ << "TX [" << usbhid::UsbHidUtils::bufferToHexWithSpaces(report) << "]";
        return true;
    }

    /**
     * @brief 调用 Handler 回调；异常视为 Stop(HandlerStop)，保留上一次的状态
     */
    template <typename Fn>
    ActionType invokeHandler(const char* callback, Fn&& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            LOG_ERROR << tag_ << callback << " threw: " << e.what();
            return ActionType::stop(
                ConnectionReason::handlerStop(std::string(callback) + " threw: " + e.what()), state_);
        } catch (...) {
            LOG_ERROR << tag_ << callback << " threw unknown exception";
            return ActionType::stop(
                ConnectionReason::handlerStop(std::string(callback) + " threw"), state_);
        }
    }
};
