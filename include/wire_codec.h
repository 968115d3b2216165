#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netspeed::wire {

// Message types carried in byte 4 of every datagram
enum class MsgType : uint8_t {
    OFFER = 0x2,        // Server -> broadcast, advertises service ports
    UDP_REQUEST = 0x3,  // Client -> server UDP port, requests file_size bytes
    UDP_PAYLOAD = 0x4   // Server -> client, one segment of a UDP transfer
};

constexpr uint32_t MAGIC_COOKIE = 0xABCDDCBA;

// Exact wire sizes. Changing any of these is a protocol break.
constexpr size_t OFFER_SIZE = 9;               // magic(4) type(1) udp_port(2) tcp_port(2)
constexpr size_t UDP_REQUEST_SIZE = 13;        // magic(4) type(1) file_size(8)
constexpr size_t UDP_PAYLOAD_HEADER_SIZE = 21; // magic(4) type(1) total(8) index(8)

constexpr size_t SEGMENT_SIZE = 1024;

struct OfferMessage {
    uint16_t udp_port;
    uint16_t tcp_port;
};

struct UdpRequestMessage {
    uint64_t file_size;
};

struct UdpPayloadHeader {
    uint64_t total_segments;
    uint64_t segment_index;
};

std::vector<uint8_t> encode_offer(uint16_t udp_port, uint16_t tcp_port);
std::optional<OfferMessage> decode_offer(const uint8_t* data, size_t len);

std::vector<uint8_t> encode_udp_request(uint64_t file_size);
std::optional<UdpRequestMessage> decode_udp_request(const uint8_t* data, size_t len);

// Header followed by payload_len bytes copied from payload
std::vector<uint8_t> encode_udp_payload(uint64_t total_segments, uint64_t segment_index,
                                        const uint8_t* payload, size_t payload_len);
// Only the first UDP_PAYLOAD_HEADER_SIZE bytes are inspected
std::optional<UdpPayloadHeader> decode_udp_payload_header(const uint8_t* data, size_t len);

// TCP request line: decimal file size terminated by '\n'
std::string encode_tcp_request(uint64_t file_size);
std::optional<uint64_t> parse_tcp_request(const std::string& line);

// ceil(file_size / segment_size); 0 for an empty file
uint64_t segment_count(uint64_t file_size, size_t segment_size = SEGMENT_SIZE);

} // namespace netspeed::wire
