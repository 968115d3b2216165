#pragma once

#include "config_parser.h"
#include <cstdint>
#include <string>

namespace netspeed {

constexpr uint16_t DEFAULT_OFFER_PORT = 13117;

// Client-side transfer tuning (Transfer Engine)
struct TransferOptions {
    uint32_t udp_timeout_ms{5000};          // Per-datagram wait; expiry ends the transfer
    uint32_t tcp_timeout_ms{5000};          // Per-read wait; expiry is a TIMEOUT failure
    uint32_t tcp_connect_timeout_ms{5000};
    uint64_t max_tracked_segments{1ull << 26}; // Larger announced totals are discarded
    bool verbose{false};
};

// Server-side handler tuning (Request Dispatcher)
struct HandlerOptions {
    uint32_t tcp_chunk_bytes{64 * 1024};
    uint32_t tcp_timeout_ms{5000};          // Wait for the request line
    uint32_t pacing_cap_us{1000};           // Upper bound of the per-segment delay
    uint64_t pacing_scale_bytes{100ull * 1024 * 1024};
    bool verbose{false};
};

struct ClientConfig {
    uint16_t offer_port{DEFAULT_OFFER_PORT};
    uint32_t discovery_wait_ms{1000};
    TransferOptions transfer;

    // Optional unattended rounds; prompts are used when has_round_defaults is false
    bool has_round_defaults{false};
    uint64_t file_size{0};
    uint32_t tcp_connections{0};
    uint32_t udp_connections{0};
    uint32_t rounds{0};                     // 0 = until stopped

    bool verbose{false};
};

struct ServerConfig {
    uint16_t offer_port{DEFAULT_OFFER_PORT};
    std::string broadcast_address{"255.255.255.255"};

    uint16_t udp_port{0};                   // 0 = random in [port_range_min, port_range_max)
    uint16_t tcp_port{0};
    uint16_t port_range_min{20000};
    uint16_t port_range_max{65000};
    uint32_t bind_attempts{16};

    uint32_t broadcast_interval_ms{1000};
    uint32_t broadcast_backoff_ms{5000};
    uint32_t dispatch_wait_ms{1000};

    HandlerOptions handler;
    uint32_t worker_threads{32};
    uint32_t max_pending_tasks{256};

    bool verbose{false};
};

ClientConfig load_client_config(const ConfigParser& config);

ServerConfig load_server_config(const ConfigParser& config);

} // namespace netspeed
