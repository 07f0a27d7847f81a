#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Magic cookie and message types (identical across all implementations)
constexpr uint32_t SPEEDTEST_MAGIC_COOKIE = 0xabcddcbaU;

enum : uint8_t {
    MSG_OFFER   = 0x2,
    MSG_REQUEST = 0x3,
    MSG_PAYLOAD = 0x4,
};

// Wire sizes. Every multi-byte field is big-endian.
//   common:  cookie(4) type(1)
//   offer:   + udp_port(2) tcp_port(2)
//   request: + file_size(8)
//   payload: + total_segments(8) current_segment(8) + data
constexpr size_t SPEEDTEST_COMMON_HEADER = 5;
constexpr size_t SPEEDTEST_OFFER_SIZE = SPEEDTEST_COMMON_HEADER + 4;
constexpr size_t SPEEDTEST_REQUEST_SIZE = SPEEDTEST_COMMON_HEADER + 8;
constexpr size_t SPEEDTEST_PAYLOAD_HEADER = SPEEDTEST_COMMON_HEADER + 16;

constexpr uint16_t SPEEDTEST_OFFER_PORT = 13117;
constexpr const char* SPEEDTEST_BROADCAST_IP = "255.255.255.255";
constexpr size_t SPEEDTEST_UDP_PAYLOAD = 1024;   // data bytes per segment
constexpr size_t SPEEDTEST_TCP_CHUNK = 4096;     // send/recv chunk on TCP
constexpr size_t SPEEDTEST_MAX_DATAGRAM = 65507; // max IPv4 UDP payload

struct OfferPacket {
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;

    bool operator==(const OfferPacket& o) const {
        return udp_port == o.udp_port && tcp_port == o.tcp_port;
    }
};

struct RequestPacket {
    uint64_t file_size = 0;

    bool operator==(const RequestPacket& o) const { return file_size == o.file_size; }
};

struct PayloadSegment {
    uint64_t total_segments = 0;
    uint64_t current_segment = 0; // 1-based
    std::vector<uint8_t> data;
};

using Packet = std::variant<OfferPacket, RequestPacket, PayloadSegment>;

// Thrown by decode_packet for short buffers, wrong cookie or unknown type.
class MalformedPacket : public std::runtime_error {
public:
    explicit MalformedPacket(const std::string& what) : std::runtime_error(what) {}
};

std::vector<uint8_t> speedtest_encode(const OfferPacket& p);
std::vector<uint8_t> speedtest_encode(const RequestPacket& p);
std::vector<uint8_t> speedtest_encode(const PayloadSegment& p);

// Writes the 21-byte payload header into out; data follows at out + SPEEDTEST_PAYLOAD_HEADER.
void speedtest_write_payload_header(uint64_t total_segments, uint64_t current_segment, uint8_t* out);

Packet speedtest_decode(const uint8_t* buf, size_t len);

// Typed decoders: empty on any malformed buffer or a different message type.
std::optional<OfferPacket> speedtest_decode_offer(const uint8_t* buf, size_t len);
std::optional<RequestPacket> speedtest_decode_request(const uint8_t* buf, size_t len);
std::optional<PayloadSegment> speedtest_decode_payload(const uint8_t* buf, size_t len);

// Segment arithmetic (payload_size > 0)
uint64_t speedtest_segment_count(uint64_t file_size, size_t payload_size);
size_t speedtest_segment_data_size(uint64_t index, uint64_t file_size, size_t payload_size);

// TCP request line: decimal byte count terminated by '\n'
std::string speedtest_format_tcp_request(uint64_t file_size);
std::optional<uint64_t> speedtest_parse_tcp_request(const std::string& line);
