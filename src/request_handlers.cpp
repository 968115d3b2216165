#include "request_handlers.h"
#include "socket_util.h"
#include "udp_socket.h"
#include "wire_codec.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace netspeed {

namespace {

constexpr uint8_t FILLER_BYTE = 'X';
constexpr size_t MAX_REQUEST_LINE = 32;  // 20 digits of uint64 plus slack for "\r\n"

} // namespace

std::chrono::microseconds pacing_delay(uint64_t file_size, const HandlerOptions& options) {
    if (options.pacing_scale_bytes == 0) {
        return std::chrono::microseconds(options.pacing_cap_us);
    }
    double scaled_us = static_cast<double>(file_size) * 1e6
                       / static_cast<double>(options.pacing_scale_bytes);
    double capped_us = std::min(static_cast<double>(options.pacing_cap_us), scaled_us);
    return std::chrono::microseconds(static_cast<int64_t>(capped_us));
}

uint64_t serve_udp_request(const sockaddr_in& client, uint64_t file_size,
                           const HandlerOptions& options, const std::atomic<bool>& running) {
    const std::string peer = address_to_string(client);
    const uint64_t total_segments = wire::segment_count(file_size);
    std::cout << "[UDP Handler] UDP test request from " << peer << ", size: "
              << file_size << " bytes (" << total_segments << " segments)" << std::endl;

    UDPSocket socket;
    if (!socket.open()) {
        std::cerr << "[UDP Handler] No socket for " << peer << ", request dropped" << std::endl;
        return 0;
    }

    const auto delay = pacing_delay(file_size, options);
    const std::vector<uint8_t> filler(wire::SEGMENT_SIZE, FILLER_BYTE);
    uint64_t sent_segments = 0;

    for (uint64_t i = 0; i < total_segments; ++i) {
        if (!running.load(std::memory_order_relaxed)) {
            std::cout << "[UDP Handler] Shutdown, stopping stream to " << peer << " at segment "
                      << i << "/" << total_segments << std::endl;
            break;
        }

        uint64_t offset = i * wire::SEGMENT_SIZE;
        size_t len = static_cast<size_t>(std::min<uint64_t>(wire::SEGMENT_SIZE, file_size - offset));
        auto datagram = wire::encode_udp_payload(total_segments, i, filler.data(), len);

        ssize_t n = socket.send_to(datagram.data(), datagram.size(), client);
        if (n < 0) {
            // A full device queue is transient; the segment simply counts as lost
            if (errno == ENOBUFS || errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
            } else {
                std::cerr << "[UDP Handler] sendto " << peer << " failed: " << strerror(errno) << std::endl;
                break;
            }
        } else {
            sent_segments++;
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

    if (options.verbose) {
        std::cout << "[UDP Handler] Sent " << sent_segments << "/" << total_segments
                  << " segments to " << peer << std::endl;
    }
    return sent_segments;
}

uint64_t serve_tcp_connection(TCPStream stream, const sockaddr_in& peer_addr,
                              const HandlerOptions& options, const std::atomic<bool>& running) {
    const std::string peer = address_to_string(peer_addr);

    if (!running.load(std::memory_order_relaxed)) {
        return 0;
    }
    std::string line;
    if (!stream.read_line(line, MAX_REQUEST_LINE, options.tcp_timeout_ms, &running)) {
        if (running.load(std::memory_order_relaxed)) {
            std::cerr << "[TCP Handler] No request line from " << peer << std::endl;
        }
        return 0;
    }
    auto file_size = wire::parse_tcp_request(line);
    if (!file_size) {
        std::cerr << "[TCP Handler] Invalid request from " << peer << ": \"" << line << "\"" << std::endl;
        return 0;
    }

    std::cout << "[TCP Handler] TCP test request from " << peer << ", size: "
              << *file_size << " bytes" << std::endl;

    // A reader that stalls must not pin this worker past shutdown
    if (!stream.set_send_timeout(options.tcp_timeout_ms)) {
        std::cerr << "[TCP Handler] Writes to " << peer << " are unbounded" << std::endl;
    }

    const std::vector<uint8_t> chunk(options.tcp_chunk_bytes, FILLER_BYTE);
    uint64_t sent = 0;
    while (sent < *file_size) {
        if (!running.load(std::memory_order_relaxed)) {
            std::cout << "[TCP Handler] Shutdown, closing " << peer << " after "
                      << sent << " bytes" << std::endl;
            break;
        }
        size_t len = static_cast<size_t>(std::min<uint64_t>(chunk.size(), *file_size - sent));
        if (!stream.send_all(chunk.data(), len)) {
            std::cerr << "[TCP Handler] Write to " << peer << " failed after " << sent
                      << " bytes: " << strerror(errno) << std::endl;
            break;
        }
        sent += len;
    }

    if (options.verbose) {
        std::cout << "[TCP Handler] Sent " << sent << "/" << *file_size << " bytes to " << peer << std::endl;
    }
    return sent;
}

} // namespace netspeed
