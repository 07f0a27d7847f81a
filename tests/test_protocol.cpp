#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <vector>

#include "speedtest_protocol.h"

TEST(ProtocolTest, OfferRoundTrip) {
    OfferPacket in;
    in.udp_port = 13118;
    in.tcp_port = 13119;

    auto bytes = speedtest_encode(in);
    ASSERT_EQ(bytes.size(), SPEEDTEST_OFFER_SIZE);

    Packet p = speedtest_decode(bytes.data(), bytes.size());
    ASSERT_TRUE(std::holds_alternative<OfferPacket>(p));
    EXPECT_EQ(std::get<OfferPacket>(p), in);
}

TEST(ProtocolTest, OfferWireLayoutIsBigEndian) {
    OfferPacket in;
    in.udp_port = 0x1234;
    in.tcp_port = 0xABCD;

    std::vector<uint8_t> expected = {0xab, 0xcd, 0xdc, 0xba, 0x02, 0x12, 0x34, 0xAB, 0xCD};
    EXPECT_EQ(speedtest_encode(in), expected);
}

TEST(ProtocolTest, RequestWireLayout) {
    RequestPacket in;
    in.file_size = 0x0102030405060708ULL;

    std::vector<uint8_t> expected = {0xab, 0xcd, 0xdc, 0xba, 0x03,
                                     0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    auto bytes = speedtest_encode(in);
    EXPECT_EQ(bytes, expected);

    auto back = speedtest_decode_request(bytes.data(), bytes.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->file_size, in.file_size);
}

TEST(ProtocolTest, PayloadDecodesVariableLengthData) {
    PayloadSegment in;
    in.total_segments = 7;
    in.current_segment = 7;
    in.data = {'Y', 'Y', 'Y'};

    auto bytes = speedtest_encode(in);
    ASSERT_EQ(bytes.size(), SPEEDTEST_PAYLOAD_HEADER + 3);
    EXPECT_EQ(bytes[4], MSG_PAYLOAD);

    auto seg = speedtest_decode_payload(bytes.data(), bytes.size());
    ASSERT_TRUE(seg.has_value());
    EXPECT_EQ(seg->total_segments, 7u);
    EXPECT_EQ(seg->current_segment, 7u);
    EXPECT_EQ(seg->data, in.data);

    // Header alone is a valid, empty segment
    auto empty = speedtest_decode_payload(bytes.data(), SPEEDTEST_PAYLOAD_HEADER);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->data.empty());
}

TEST(ProtocolTest, ShortBuffersAreMalformed) {
    OfferPacket o;
    o.udp_port = 1;
    o.tcp_port = 2;
    auto offer = speedtest_encode(o);

    for (size_t len = 0; len < offer.size(); ++len) {
        EXPECT_THROW(speedtest_decode(offer.data(), len), MalformedPacket) << "len=" << len;
        EXPECT_FALSE(speedtest_decode_offer(offer.data(), len).has_value());
    }

    auto req = speedtest_encode(RequestPacket{42});
    EXPECT_THROW(speedtest_decode(req.data(), req.size() - 1), MalformedPacket);

    PayloadSegment s;
    s.total_segments = 1;
    s.current_segment = 1;
    auto pay = speedtest_encode(s);
    EXPECT_THROW(speedtest_decode(pay.data(), SPEEDTEST_PAYLOAD_HEADER - 1), MalformedPacket);
    EXPECT_THROW(speedtest_decode(nullptr, 0), MalformedPacket);
}

TEST(ProtocolTest, WrongCookieIsMalformed) {
    auto bytes = speedtest_encode(OfferPacket{13118, 13119});
    bytes[0] ^= 0xFF;
    EXPECT_THROW(speedtest_decode(bytes.data(), bytes.size()), MalformedPacket);
    EXPECT_FALSE(speedtest_decode_offer(bytes.data(), bytes.size()).has_value());
}

TEST(ProtocolTest, UnknownTypeIsMalformed) {
    auto bytes = speedtest_encode(OfferPacket{13118, 13119});
    bytes[4] = 0x9;
    EXPECT_THROW(speedtest_decode(bytes.data(), bytes.size()), MalformedPacket);
}

TEST(ProtocolTest, TypedDecoderRejectsOtherTypes) {
    auto req = speedtest_encode(RequestPacket{1000});
    EXPECT_FALSE(speedtest_decode_offer(req.data(), req.size()).has_value());
    EXPECT_FALSE(speedtest_decode_payload(req.data(), req.size()).has_value());
    EXPECT_TRUE(speedtest_decode_request(req.data(), req.size()).has_value());
}

TEST(ProtocolTest, SegmentCountIsCeiling) {
    EXPECT_EQ(speedtest_segment_count(0, 1024), 0u);
    EXPECT_EQ(speedtest_segment_count(1, 1024), 1u);
    EXPECT_EQ(speedtest_segment_count(1024, 1024), 1u);
    EXPECT_EQ(speedtest_segment_count(1025, 1024), 2u);
    EXPECT_EQ(speedtest_segment_count(1000000, 1024), 977u);
    EXPECT_EQ(speedtest_segment_count(1000000, 1), 1000000u);
}

TEST(ProtocolTest, SegmentSizesSumToFileSize) {
    const uint64_t sizes[] = {1, 7, 1023, 1024, 1025, 65536, 1000000};
    const size_t payloads[] = {1, 100, 1024, 1472};

    for (uint64_t file_size : sizes) {
        for (size_t payload : payloads) {
            uint64_t total = speedtest_segment_count(file_size, payload);
            uint64_t sum = 0;
            for (uint64_t i = 1; i <= total; ++i) {
                size_t n = speedtest_segment_data_size(i, file_size, payload);
                if (i < total) ASSERT_EQ(n, payload);
                ASSERT_GT(n, 0u);
                sum += n;
            }
            EXPECT_EQ(sum, file_size) << "file_size=" << file_size << " payload=" << payload;
            EXPECT_EQ(speedtest_segment_data_size(total + 1, file_size, payload), 0u);
        }
    }
    EXPECT_EQ(speedtest_segment_data_size(0, 100, 10), 0u);
}

TEST(ProtocolTest, TcpRequestLine) {
    EXPECT_EQ(speedtest_format_tcp_request(1000000), "1000000\n");

    EXPECT_EQ(speedtest_parse_tcp_request("1000000\n"), std::optional<uint64_t>(1000000));
    EXPECT_EQ(speedtest_parse_tcp_request("0\n"), std::optional<uint64_t>(0));
    EXPECT_EQ(speedtest_parse_tcp_request("42\r\n"), std::optional<uint64_t>(42));
    EXPECT_EQ(speedtest_parse_tcp_request("18446744073709551615\n"),
              std::optional<uint64_t>(18446744073709551615ULL));

    EXPECT_FALSE(speedtest_parse_tcp_request("\n").has_value());
    EXPECT_FALSE(speedtest_parse_tcp_request("-5\n").has_value());
    EXPECT_FALSE(speedtest_parse_tcp_request("12a\n").has_value());
    EXPECT_FALSE(speedtest_parse_tcp_request("18446744073709551616\n").has_value());
}
