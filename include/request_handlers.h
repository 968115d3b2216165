#pragma once

#include "netspeed_config.h"
#include "tcp_control.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <netinet/in.h>

namespace netspeed {

// Delay between two UDP segments: min(pacing_cap_us, file_size / pacing_scale_bytes seconds).
// Best-effort flow pacing to keep the send buffer from overflowing; it is
// not congestion control and does not prevent loss.
std::chrono::microseconds pacing_delay(uint64_t file_size, const HandlerOptions& options);

// Streams ceil(file_size / SEGMENT_SIZE) payload datagrams to client from a
// socket owned by this call. Checks running before every segment.
// Returns the number of segments handed to the kernel.
uint64_t serve_udp_request(const sockaddr_in& client, uint64_t file_size,
                           const HandlerOptions& options, const std::atomic<bool>& running);

// Reads the size line, then writes exactly that many filler bytes in
// tcp_chunk_bytes pieces. A write error or shutdown ends only this handler.
// Returns the number of bytes written.
uint64_t serve_tcp_connection(TCPStream stream, const sockaddr_in& peer,
                              const HandlerOptions& options, const std::atomic<bool>& running);

} // namespace netspeed
