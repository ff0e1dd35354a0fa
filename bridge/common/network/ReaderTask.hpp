#pragma once

#include "ConnectionReason.hpp"
#include "common/device/HidDevice.hpp"

#include <trantor/utils/Logger.h>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <thread>

/**
 * @brief 设备读取线程
 *
 * 循环阻塞读取设备，每个数据块 / 错误 / 流结束都通过回调投递给连接。
 * 只读不写；回调由连接负责转发到自己的事件循环。
 */
class ReaderTask {
public:
    using ChunkCallback = std::function<void(std::vector<uint8_t>)>;
    using FailureCallback = std::function<void(ConnectionReason)>;

    ReaderTask(std::shared_ptr<HidDevice> device, size_t readSize,
               ChunkCallback onChunk, FailureCallback onFailure)
        : device_(std::move(device)),
          readSize_(readSize),
          onChunk_(std::move(onChunk)),
          onFailure_(std::move(onFailure)) {}

    ~ReaderTask() {
        stop();
    }

    ReaderTask(const ReaderTask&) = delete;
    ReaderTask& operator=(const ReaderTask&) = delete;

    void start() {
        thread_ = std::thread([this]() { run(); });
    }

    /**
     * @brief 中断阻塞读取并等待线程退出（可重复调用）
     * 不可在读取线程自身（回调内）调用
     */
    void stop() {
        stopRequested_.store(true, std::memory_order_release);
        if (thread_.joinable()) {
            device_->interruptRead();
            thread_.join();
        }
    }

private:
    std::shared_ptr<HidDevice> device_;
    size_t readSize_;
    ChunkCallback onChunk_;
    FailureCallback onFailure_;
    std::thread thread_;
    std::atomic<bool> stopRequested_{false};

    void run() {
        try {
            while (!stopRequested_.load(std::memory_order_acquire)) {
                auto result = device_->read(readSize_);
                switch (result.status) {
                    case DeviceIoResult::Status::Ok:
                        LOG_TRACE << "[Reader] Read " << result.data.size() << "B";
                        onChunk_(std::move(result.data));
                        break;
                    case DeviceIoResult::Status::EndOfStream:
                        LOG_INFO << "[Reader] End of stream";
                        onFailure_(ConnectionReason::readerEndOfStream());
                        return;
                    case DeviceIoResult::Status::Error:
                        LOG_ERROR << "[Reader] Read error: " << result.error;
                        onFailure_(ConnectionReason::readerIoError(result.error));
                        return;
                    case DeviceIoResult::Status::Interrupted:
                        LOG_DEBUG << "[Reader] Interrupted";
                        return;
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[Reader] Task died: " << e.what();
            onFailure_(ConnectionReason::readerTaskDied(e.what()));
        } catch (...) {
            LOG_ERROR << "[Reader] Task died: unknown exception";
            onFailure_(ConnectionReason::readerTaskDied("unknown exception"));
        }
    }
};
