#include "wire_codec.h"
#include <arpa/inet.h>
#include <endian.h>
#include <cctype>
#include <cstring>
#include <limits>

namespace netspeed::wire {

namespace {

void put_u16(uint8_t* out, uint16_t v) {
    v = htons(v);
    std::memcpy(out, &v, sizeof(v));
}

void put_u32(uint8_t* out, uint32_t v) {
    v = htonl(v);
    std::memcpy(out, &v, sizeof(v));
}

void put_u64(uint8_t* out, uint64_t v) {
    v = htobe64(v);
    std::memcpy(out, &v, sizeof(v));
}

uint16_t get_u16(const uint8_t* in) {
    uint16_t v;
    std::memcpy(&v, in, sizeof(v));
    return ntohs(v);
}

uint32_t get_u32(const uint8_t* in) {
    uint32_t v;
    std::memcpy(&v, in, sizeof(v));
    return ntohl(v);
}

uint64_t get_u64(const uint8_t* in) {
    uint64_t v;
    std::memcpy(&v, in, sizeof(v));
    return be64toh(v);
}

void put_prefix(uint8_t* out, MsgType type) {
    put_u32(out, MAGIC_COOKIE);
    out[4] = static_cast<uint8_t>(type);
}

// Magic and type check shared by every decoder
bool has_prefix(const uint8_t* data, size_t len, MsgType type) {
    if (!data || len < 5) {
        return false;
    }
    return get_u32(data) == MAGIC_COOKIE && data[4] == static_cast<uint8_t>(type);
}

} // namespace

std::vector<uint8_t> encode_offer(uint16_t udp_port, uint16_t tcp_port) {
    std::vector<uint8_t> out(OFFER_SIZE);
    put_prefix(out.data(), MsgType::OFFER);
    put_u16(out.data() + 5, udp_port);
    put_u16(out.data() + 7, tcp_port);
    return out;
}

std::optional<OfferMessage> decode_offer(const uint8_t* data, size_t len) {
    if (len != OFFER_SIZE || !has_prefix(data, len, MsgType::OFFER)) {
        return std::nullopt;
    }
    OfferMessage msg;
    msg.udp_port = get_u16(data + 5);
    msg.tcp_port = get_u16(data + 7);
    return msg;
}

std::vector<uint8_t> encode_udp_request(uint64_t file_size) {
    std::vector<uint8_t> out(UDP_REQUEST_SIZE);
    put_prefix(out.data(), MsgType::UDP_REQUEST);
    put_u64(out.data() + 5, file_size);
    return out;
}

std::optional<UdpRequestMessage> decode_udp_request(const uint8_t* data, size_t len) {
    if (len != UDP_REQUEST_SIZE || !has_prefix(data, len, MsgType::UDP_REQUEST)) {
        return std::nullopt;
    }
    UdpRequestMessage msg;
    msg.file_size = get_u64(data + 5);
    return msg;
}

std::vector<uint8_t> encode_udp_payload(uint64_t total_segments, uint64_t segment_index,
                                        const uint8_t* payload, size_t payload_len) {
    std::vector<uint8_t> out(UDP_PAYLOAD_HEADER_SIZE + payload_len);
    put_prefix(out.data(), MsgType::UDP_PAYLOAD);
    put_u64(out.data() + 5, total_segments);
    put_u64(out.data() + 13, segment_index);
    if (payload && payload_len > 0) {
        std::memcpy(out.data() + UDP_PAYLOAD_HEADER_SIZE, payload, payload_len);
    }
    return out;
}

std::optional<UdpPayloadHeader> decode_udp_payload_header(const uint8_t* data, size_t len) {
    if (len < UDP_PAYLOAD_HEADER_SIZE || !has_prefix(data, len, MsgType::UDP_PAYLOAD)) {
        return std::nullopt;
    }
    UdpPayloadHeader hdr;
    hdr.total_segments = get_u64(data + 5);
    hdr.segment_index = get_u64(data + 13);
    return hdr;
}

std::string encode_tcp_request(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

std::optional<uint64_t> parse_tcp_request(const std::string& line) {
    size_t first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t last = line.find_last_not_of(" \t\r\n");

    uint64_t value = 0;
    constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
    for (size_t i = first; i <= last; ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return std::nullopt; // overflow
        }
        value = value * 10 + digit;
    }
    return value;
}

uint64_t segment_count(uint64_t file_size, size_t segment_size) {
    if (segment_size == 0) {
        return 0;
    }
    return file_size / segment_size + (file_size % segment_size != 0 ? 1 : 0);
}

} // namespace netspeed::wire
