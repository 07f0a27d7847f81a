#include "speedtest_protocol.h"

#include <algorithm>
#include <limits>

namespace {

void put_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

void put_u32(uint8_t* p, uint32_t v) {
    for (int i = 3; i >= 0; --i) { p[i] = static_cast<uint8_t>(v); v >>= 8; }
}

void put_u64(uint8_t* p, uint64_t v) {
    for (int i = 7; i >= 0; --i) { p[i] = static_cast<uint8_t>(v); v >>= 8; }
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | p[i];
    return v;
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

void put_common(uint8_t* p, uint8_t type) {
    put_u32(p, SPEEDTEST_MAGIC_COOKIE);
    p[4] = type;
}

} // namespace

std::vector<uint8_t> speedtest_encode(const OfferPacket& p) {
    std::vector<uint8_t> out(SPEEDTEST_OFFER_SIZE);
    put_common(out.data(), MSG_OFFER);
    put_u16(out.data() + 5, p.udp_port);
    put_u16(out.data() + 7, p.tcp_port);
    return out;
}

std::vector<uint8_t> speedtest_encode(const RequestPacket& p) {
    std::vector<uint8_t> out(SPEEDTEST_REQUEST_SIZE);
    put_common(out.data(), MSG_REQUEST);
    put_u64(out.data() + 5, p.file_size);
    return out;
}

std::vector<uint8_t> speedtest_encode(const PayloadSegment& p) {
    std::vector<uint8_t> out(SPEEDTEST_PAYLOAD_HEADER + p.data.size());
    speedtest_write_payload_header(p.total_segments, p.current_segment, out.data());
    if (!p.data.empty()) {
        std::copy(p.data.begin(), p.data.end(), out.begin() + SPEEDTEST_PAYLOAD_HEADER);
    }
    return out;
}

void speedtest_write_payload_header(uint64_t total_segments, uint64_t current_segment, uint8_t* out) {
    put_common(out, MSG_PAYLOAD);
    put_u64(out + 5, total_segments);
    put_u64(out + 13, current_segment);
}

Packet speedtest_decode(const uint8_t* buf, size_t len) {
    if (buf == nullptr || len < SPEEDTEST_COMMON_HEADER) {
        throw MalformedPacket("packet shorter than common header");
    }
    if (get_u32(buf) != SPEEDTEST_MAGIC_COOKIE) {
        throw MalformedPacket("bad magic cookie");
    }

    switch (buf[4]) {
    case MSG_OFFER: {
        if (len < SPEEDTEST_OFFER_SIZE) throw MalformedPacket("truncated offer");
        OfferPacket o;
        o.udp_port = get_u16(buf + 5);
        o.tcp_port = get_u16(buf + 7);
        return o;
    }
    case MSG_REQUEST: {
        if (len < SPEEDTEST_REQUEST_SIZE) throw MalformedPacket("truncated request");
        RequestPacket r;
        r.file_size = get_u64(buf + 5);
        return r;
    }
    case MSG_PAYLOAD: {
        if (len < SPEEDTEST_PAYLOAD_HEADER) throw MalformedPacket("truncated payload header");
        PayloadSegment s;
        s.total_segments = get_u64(buf + 5);
        s.current_segment = get_u64(buf + 13);
        s.data.assign(buf + SPEEDTEST_PAYLOAD_HEADER, buf + len);
        return s;
    }
    default:
        throw MalformedPacket("unknown message type " + std::to_string(buf[4]));
    }
}

namespace {

template <typename T>
std::optional<T> decode_as(const uint8_t* buf, size_t len) {
    try {
        Packet p = speedtest_decode(buf, len);
        if (auto* v = std::get_if<T>(&p)) return std::move(*v);
    } catch (const MalformedPacket&) {
        // discarded by every receiver
    }
    return std::nullopt;
}

} // namespace

std::optional<OfferPacket> speedtest_decode_offer(const uint8_t* buf, size_t len) {
    return decode_as<OfferPacket>(buf, len);
}

std::optional<RequestPacket> speedtest_decode_request(const uint8_t* buf, size_t len) {
    return decode_as<RequestPacket>(buf, len);
}

std::optional<PayloadSegment> speedtest_decode_payload(const uint8_t* buf, size_t len) {
    return decode_as<PayloadSegment>(buf, len);
}

uint64_t speedtest_segment_count(uint64_t file_size, size_t payload_size) {
    return file_size / payload_size + (file_size % payload_size ? 1 : 0);
}

size_t speedtest_segment_data_size(uint64_t index, uint64_t file_size, size_t payload_size) {
    uint64_t offset = (index - 1) * payload_size;
    if (index == 0 || offset >= file_size) return 0;
    uint64_t left = file_size - offset;
    return left < payload_size ? static_cast<size_t>(left) : payload_size;
}

std::string speedtest_format_tcp_request(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

std::optional<uint64_t> speedtest_parse_tcp_request(const std::string& line_in) {
    std::string line = line_in;
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) return std::nullopt;

    uint64_t v = 0;
    for (char c : line) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}
