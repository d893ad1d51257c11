#include <gtest/gtest.h>
#include "message_parser.hpp"
#include "payload_reader.hpp"
#include "payload.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace driveprof;

namespace {

std::vector<uint8_t> make_frame(const uint8_t type, const uint8_t channel,
    const std::vector<uint8_t>& body)
{
    payload p;
    p.u32(uint32_t(2 + body.size())).u8(type).u8(channel).buffer(body);
    return p.data;
}

void feed(message_parser& parser, const std::vector<uint8_t>& bytes)
{
    auto buffer = parser.get_receive_buffer(int(bytes.size()));
    std::copy(bytes.begin(), bytes.end(), buffer.begin());
    parser.record_received_bytes(int(bytes.size()));
}

} // namespace

TEST(MessageParserTest, EmptyParserHasNoMessage)
{
    message_parser parser;
    EXPECT_TRUE(parser.is_empty());
    EXPECT_FALSE(parser.has_message());
    EXPECT_EQ(parser.current_message_length(), -1);
    EXPECT_EQ(parser.num_bytes_left_till_completion(), -1);
    EXPECT_THROW(parser.extract_message(), std::logic_error);
}

TEST(MessageParserTest, ExtractsCompleteFrame)
{
    message_parser parser;
    feed(parser, make_frame(3, 1, {0xde, 0xad}));
    ASSERT_TRUE(parser.has_message());
    const auto msg = parser.extract_message();
    EXPECT_EQ(msg.type, 3);
    EXPECT_EQ(msg.channel, 1);
    ASSERT_EQ(msg.data.size(), 2u);
    EXPECT_EQ(msg.data[0], 0xde);
    EXPECT_EQ(msg.data[1], 0xad);
    EXPECT_FALSE(parser.has_message());
}

TEST(MessageParserTest, FrameArrivingInPieces)
{
    message_parser parser;
    const auto frame = make_frame(0, 0, {1, 2, 3, 4, 5});
    feed(parser, std::vector<uint8_t>(frame.begin(), frame.begin() + 3));
    EXPECT_FALSE(parser.has_message());
    EXPECT_EQ(parser.num_bytes_left_till_completion(), -1);

    feed(parser, std::vector<uint8_t>(frame.begin() + 3, frame.begin() + 8));
    EXPECT_FALSE(parser.has_message());
    EXPECT_EQ(parser.current_message_length(), 7);
    EXPECT_EQ(parser.num_bytes_left_till_completion(), 3);

    feed(parser, std::vector<uint8_t>(frame.begin() + 8, frame.end()));
    ASSERT_TRUE(parser.has_message());
    EXPECT_EQ(parser.num_bytes_left_till_completion(), 0);
    EXPECT_EQ(parser.extract_message().data.size(), 5u);
}

TEST(MessageParserTest, SeveralFramesInOneRead)
{
    message_parser parser;
    auto bytes = make_frame(1, 0, {9});
    const auto second = make_frame(2, 4, {});
    bytes.insert(bytes.end(), second.begin(), second.end());
    feed(parser, bytes);

    ASSERT_TRUE(parser.has_message());
    EXPECT_EQ(parser.extract_message().type, 1);
    ASSERT_TRUE(parser.has_message());
    const auto msg = parser.extract_message();
    EXPECT_EQ(msg.type, 2);
    EXPECT_EQ(msg.channel, 4);
    EXPECT_TRUE(msg.data.empty());
    EXPECT_FALSE(parser.has_message());

    parser.optimize_receive_space();
    EXPECT_TRUE(parser.is_empty());
}

TEST(MessageParserTest, OptimizeKeepsIncompleteTail)
{
    message_parser parser;
    auto bytes = make_frame(1, 0, {9});
    const auto second = make_frame(5, 2, {7, 7, 7});
    bytes.insert(bytes.end(), second.begin(), second.begin() + 6);
    feed(parser, bytes);
    parser.extract_message();
    parser.optimize_receive_space();
    EXPECT_EQ(parser.size(), 6);

    feed(parser, std::vector<uint8_t>(second.begin() + 6, second.end()));
    ASSERT_TRUE(parser.has_message());
    const auto msg = parser.extract_message();
    EXPECT_EQ(msg.type, 5);
    EXPECT_EQ(msg.channel, 2);
    EXPECT_EQ(msg.data.size(), 3u);
}

TEST(MessageParserTest, TooShortFrameIsRejected)
{
    message_parser parser;
    payload p;
    p.u32(1).u8(0);
    feed(parser, p.data);
    ASSERT_TRUE(parser.has_message());
    EXPECT_THROW(parser.extract_message(), std::invalid_argument);
}

TEST(PayloadReaderTest, ReadsBigEndianFields)
{
    payload p;
    p.u8(1).u16(0x0203).u32(0x04050607).u64(8).u8(0xaa).u8(0xbb);
    payload_reader reader(p.data);
    EXPECT_EQ(reader.read<uint8_t>(), 1);
    EXPECT_EQ(reader.read<uint16_t>(), 0x0203);
    EXPECT_EQ(reader.read<uint32_t>(), 0x04050607u);
    EXPECT_EQ(reader.read_int64(), 8);
    const auto rest = reader.read_bytes(2);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[1], 0xbb);
    EXPECT_TRUE(reader.is_exhausted());
    EXPECT_TRUE(reader.is_valid());
}

TEST(PayloadReaderTest, OverrunInvalidates)
{
    payload p;
    p.u16(5);
    payload_reader reader(p.data);
    EXPECT_EQ(reader.read<uint32_t>(), 0u);
    EXPECT_FALSE(reader.is_valid());
    EXPECT_EQ(reader.read<uint8_t>(), 0);
}

TEST(PayloadReaderTest, RejectsNegativeLengths)
{
    payload p;
    p.u64(0x8000000000000000ull);
    payload_reader reader(p.data);
    EXPECT_EQ(reader.read_int64(), 0);
    EXPECT_FALSE(reader.is_valid());
}
