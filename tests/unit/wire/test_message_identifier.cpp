/**
 * @file test_message_identifier.cpp
 * @brief Unit tests for identifier inspection
 */

#include <gtest/gtest.h>

#include <vector>

#include "digistream/wire/serialization/AnalogTraceCodec.hpp"
#include "digistream/wire/serialization/EventListCodec.hpp"
#include "digistream/wire/serialization/MessageIdentifier.hpp"
#include "unit/wire/test_helpers.hpp"

using namespace DIGISTREAM::Wire;

TEST(MessageIdentifierTest, KindValues)
{
    EXPECT_EQ(static_cast<uint8_t>(MessageKind::EventList), 0);
    EXPECT_EQ(static_cast<uint8_t>(MessageKind::AnalogTrace), 1);
    EXPECT_EQ(static_cast<uint8_t>(MessageKind::Unknown), 2);
}

TEST(MessageIdentifierTest, IdentifyEncodedMessages)
{
    EventListCodec event_codec;
    AnalogTraceCodec trace_codec;

    auto events = event_codec.encode(TestHelpers::MakeEventList(2));
    auto trace = trace_codec.encode(TestHelpers::MakeAnalogTrace(1, 8));
    ASSERT_TRUE(isOk(events));
    ASSERT_TRUE(isOk(trace));

    const auto& event_bytes = getValue(events);
    const auto& trace_bytes = getValue(trace);
    EXPECT_EQ(identify(event_bytes.data(), event_bytes.size()), MessageKind::EventList);
    EXPECT_EQ(identify(trace_bytes.data(), trace_bytes.size()), MessageKind::AnalogTrace);
}

/**
 * Only the first four bytes matter
 */
TEST(MessageIdentifierTest, IdentifyBareTags)
{
    std::vector<uint8_t> dev2{'d', 'e', 'v', '2'};
    std::vector<uint8_t> dat2{'d', 'a', 't', '2', 0xFF};
    EXPECT_EQ(identify(dev2.data(), dev2.size()), MessageKind::EventList);
    EXPECT_EQ(identify(dat2.data(), dat2.size()), MessageKind::AnalogTrace);
}

TEST(MessageIdentifierTest, UnknownTags)
{
    std::vector<uint8_t> other{'f', '1', '4', '2', 0, 0};
    std::vector<uint8_t> upper{'D', 'E', 'V', '2'};
    std::vector<uint8_t> short_tag{'d', 'e', 'v'};

    EXPECT_EQ(identify(other.data(), other.size()), MessageKind::Unknown);
    EXPECT_EQ(identify(upper.data(), upper.size()), MessageKind::Unknown);
    EXPECT_EQ(identify(short_tag.data(), short_tag.size()), MessageKind::Unknown);
    EXPECT_EQ(identify(nullptr, 0), MessageKind::Unknown);
}

TEST(MessageIdentifierTest, IdentifierFor)
{
    EXPECT_STREQ(identifierFor(MessageKind::EventList), "dev2");
    EXPECT_STREQ(identifierFor(MessageKind::AnalogTrace), "dat2");
    EXPECT_EQ(identifierFor(MessageKind::Unknown), nullptr);
}

TEST(MessageIdentifierTest, MessageKindToString)
{
    EXPECT_EQ(messageKindToString(MessageKind::EventList), "EventList");
    EXPECT_EQ(messageKindToString(MessageKind::AnalogTrace), "AnalogTrace");
    EXPECT_EQ(messageKindToString(MessageKind::Unknown), "Unknown");
}

TEST(MessageIdentifierTest, DescribeIdentifier)
{
    std::vector<uint8_t> printable{'d', 'e', 'v', '2', 'x'};
    std::vector<uint8_t> binary{0x00, 0x01, 'a', 0x7F};
    std::vector<uint8_t> short_tag{'d', 'a'};

    EXPECT_EQ(describeIdentifier(printable.data(), printable.size()), "dev2");
    EXPECT_EQ(describeIdentifier(binary.data(), binary.size()), "\\x00\\x01a\\x7f");
    EXPECT_EQ(describeIdentifier(short_tag.data(), short_tag.size()), "da..");
    EXPECT_EQ(describeIdentifier(nullptr, 0), "<null>");
}
