/**
 * @file test_message_dispatcher.cpp
 * @brief Unit tests for MessageDispatcher routing
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "digistream/wire/serialization/MessageDispatcher.hpp"
#include "digistream/wire/serialization/ProtocolConstants.hpp"
#include "unit/wire/test_helpers.hpp"

using namespace DIGISTREAM::Wire;
using ::testing::_;
using ::testing::MockFunction;
using ::testing::Truly;

class MessageDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto events = dispatcher.eventListCodec().encode(TestHelpers::MakeEventList(6));
        auto trace = dispatcher.analogTraceCodec().encode(TestHelpers::MakeAnalogTrace(3, 16));
        ASSERT_TRUE(isOk(events));
        ASSERT_TRUE(isOk(trace));
        event_buffer = getValue(events);
        trace_buffer = getValue(trace);

        dispatcher.onEventList(event_handler.AsStdFunction());
        dispatcher.onAnalogTrace(trace_handler.AsStdFunction());
    }

    MessageDispatcher dispatcher;
    MockFunction<void(const EventListView&)> event_handler;
    MockFunction<void(const AnalogTraceView&)> trace_handler;
    std::vector<uint8_t> event_buffer;
    std::vector<uint8_t> trace_buffer;
};

TEST_F(MessageDispatcherTest, RoutesEventList)
{
    EXPECT_CALL(event_handler, Call(Truly([](const EventListView& view) {
        return view.eventCount() == 6 && view.digitizer_id == 3;
    }))).Times(1);
    EXPECT_CALL(trace_handler, Call(_)).Times(0);

    EXPECT_TRUE(isOk(dispatcher.dispatch(event_buffer)));
}

TEST_F(MessageDispatcherTest, RoutesAnalogTrace)
{
    EXPECT_CALL(trace_handler, Call(Truly([](const AnalogTraceView& view) {
        return view.channels.size() == 3 && view.digitizer_id == 5;
    }))).Times(1);
    EXPECT_CALL(event_handler, Call(_)).Times(0);

    EXPECT_TRUE(isOk(dispatcher.dispatch(trace_buffer)));
}

/**
 * Foreign buffers reach the unknown handler and report BAD_IDENTIFIER
 */
TEST_F(MessageDispatcherTest, UnknownBufferGoesToUnknownHandler)
{
    MockFunction<void(const uint8_t*, size_t)> unknown_handler;
    dispatcher.onUnknown(unknown_handler.AsStdFunction());

    std::vector<uint8_t> foreign{'f', '1', '4', '2', 1, 2, 3};
    EXPECT_CALL(unknown_handler, Call(static_cast<const uint8_t*>(foreign.data()), foreign.size())).Times(1);
    EXPECT_CALL(event_handler, Call(_)).Times(0);
    EXPECT_CALL(trace_handler, Call(_)).Times(0);

    auto status = dispatcher.dispatch(foreign);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::BAD_IDENTIFIER);
    EXPECT_TRUE(getError(status).isForeignBuffer());
}

TEST_F(MessageDispatcherTest, UnknownBufferWithoutHandler)
{
    std::vector<uint8_t> foreign{'x', 'y'};
    auto status = dispatcher.dispatch(foreign);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::BAD_IDENTIFIER);
}

/**
 * Malformed buffers are reported and never reach a handler
 */
TEST_F(MessageDispatcherTest, DecodeErrorSkipsHandler)
{
    EXPECT_CALL(event_handler, Call(_)).Times(0);

    event_buffer.resize(event_buffer.size() - 1);
    auto status = dispatcher.dispatch(event_buffer);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::TRUNCATED_BUFFER);
    EXPECT_FALSE(getError(status).isForeignBuffer());
}

TEST_F(MessageDispatcherTest, MissingHandlerStillValidates)
{
    MessageDispatcher bare;
    EXPECT_TRUE(isOk(bare.dispatch(trace_buffer)));

    TestHelpers::PatchBuffer<uint64_t>(trace_buffer, CANONICAL_BODY_OFFSET + 1, 0);
    auto status = bare.dispatch(trace_buffer);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::ZERO_SAMPLE_RATE);
}

TEST_F(MessageDispatcherTest, StrictConfigurationReachesTraceCodec)
{
    CodecConfig config;
    config.strict_channels = true;
    MessageDispatcher strict(config);
    EXPECT_TRUE(strict.analogTraceCodec().isStrict());
    EXPECT_FALSE(dispatcher.analogTraceCodec().isStrict());
}

/**
 * Received buffers are counted by kind and failures by error code
 */
TEST_F(MessageDispatcherTest, StatisticsCountKindsAndFailures)
{
    EXPECT_CALL(event_handler, Call(_)).Times(2);
    EXPECT_CALL(trace_handler, Call(_)).Times(1);

    DispatchStatistics initial = dispatcher.getStatistics();
    EXPECT_EQ(initial.totalReceived(), 0u);
    EXPECT_EQ(initial.totalFailures(), 0u);
    EXPECT_EQ(initial.last_dispatch_ns, 0u);

    std::vector<uint8_t> truncated(event_buffer.begin(), event_buffer.end() - 1);
    std::vector<uint8_t> foreign{'f', '1', '4', '2'};

    EXPECT_TRUE(isOk(dispatcher.dispatch(event_buffer)));
    EXPECT_TRUE(isOk(dispatcher.dispatch(event_buffer)));
    EXPECT_TRUE(isOk(dispatcher.dispatch(trace_buffer)));
    EXPECT_FALSE(isOk(dispatcher.dispatch(truncated)));
    EXPECT_FALSE(isOk(dispatcher.dispatch(foreign)));
    EXPECT_FALSE(isOk(dispatcher.dispatch(foreign)));

    DispatchStatistics stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.event_lists, 3u);
    EXPECT_EQ(stats.analog_traces, 1u);
    EXPECT_EQ(stats.unknown, 2u);
    EXPECT_EQ(stats.received(MessageKind::EventList), 3u);
    EXPECT_EQ(stats.totalReceived(), 6u);
    EXPECT_EQ(stats.bytes_received,
              3 * event_buffer.size() - 1 + trace_buffer.size() + 2 * foreign.size());
    EXPECT_GT(stats.last_dispatch_ns, 0u);

    EXPECT_EQ(stats.failureCount(Error::TRUNCATED_BUFFER), 1u);
    EXPECT_EQ(stats.failureCount(Error::BAD_IDENTIFIER), 2u);
    EXPECT_EQ(stats.failureCount(Error::ZERO_SAMPLE_RATE), 0u);
    EXPECT_EQ(stats.failures.size(), 2u);
    EXPECT_EQ(stats.totalFailures(), 3u);

    dispatcher.resetStatistics();
    stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.totalReceived(), 0u);
    EXPECT_TRUE(stats.failures.empty());
    EXPECT_EQ(stats.bytes_received, 0u);
}
