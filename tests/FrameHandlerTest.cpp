#include "common/handler/FrameHandler.hpp"

#include <gtest/gtest.h>

namespace {

struct CounterState {
    int value = 0;
};

/** 不覆盖任何回调，全部使用默认实现 */
class DefaultHandler : public FrameHandler<CounterState> {};

}  // namespace

TEST(FrameHandlerTest, DefaultInitReturnsDefaultState) {
    DefaultHandler handler;
    auto result = handler.init(Json::Value(Json::objectValue));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.state.value, 0);
}

TEST(FrameHandlerTest, DefaultCallbacksContinueWithSameState) {
    DefaultHandler handler;
    CounterState state{42};

    auto connected = handler.handleConnected(DeviceInfo{"/dev/hidraw0", std::nullopt, std::nullopt}, state);
    EXPECT_TRUE(connected.isContinue());
    EXPECT_EQ(connected.state.value, 42);

    auto frame = handler.handleFrame({0x29, 0x00}, state);
    EXPECT_TRUE(frame.isContinue());
    EXPECT_EQ(frame.state.value, 42);

    auto disconnected = handler.handleDisconnected(ConnectionReason::readerEndOfStream(), state);
    EXPECT_TRUE(disconnected.isContinue());
    EXPECT_EQ(disconnected.state.value, 42);

    handler.terminate(ConnectionReason::shutdown(), state);
}

TEST(FrameHandlerTest, ActionFactories) {
    auto reply = Action<CounterState>::reply({0x01, 0x02}, CounterState{1});
    EXPECT_TRUE(reply.isReply());
    EXPECT_EQ(reply.payload, (usbhid::Frame{0x01, 0x02}));
    EXPECT_EQ(reply.state.value, 1);

    auto stop = Action<CounterState>::stop(ConnectionReason::handlerStop("done"), CounterState{2});
    EXPECT_TRUE(stop.isStop());
    EXPECT_EQ(stop.reason.kind, ConnectionReason::Kind::HandlerStop);
    EXPECT_EQ(stop.reason.detail, "done");
    EXPECT_EQ(stop.state.value, 2);

    auto failed = InitResult<CounterState>::stop("bad options");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.reason, "bad options");
}

TEST(ConnectionReasonTest, FormatsKindCodeAndDetail) {
    EXPECT_EQ(ConnectionReason::readerIoError("Input/output error").toString(),
              "reader_io_error(2004): Input/output error");
    EXPECT_EQ(ConnectionReason::shutdown().toString(), "shutdown");
    EXPECT_EQ(ConnectionReason::readerEndOfStream().toString(), "reader_end_of_stream(2005): eof");
}

TEST(ConnectionReasonTest, ClassifiesAbnormalTermination) {
    EXPECT_FALSE(ConnectionReason::normal().isAbnormal());
    EXPECT_FALSE(ConnectionReason::shutdown().isAbnormal());
    EXPECT_FALSE(ConnectionReason::handlerStop("x").isAbnormal());
    EXPECT_TRUE(ConnectionReason::deviceOpenFailed("x").isAbnormal());
    EXPECT_TRUE(ConnectionReason::deviceWriteFailed("x").isAbnormal());
    EXPECT_TRUE(ConnectionReason::readerTaskDied("x").isAbnormal());
    EXPECT_TRUE(ConnectionReason::handlerInitFailed("x").isAbnormal());
}
