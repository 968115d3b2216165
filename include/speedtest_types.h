#pragma once

#include <cstdint>
#include <string>

namespace netspeed {

// What the operator asked for in one round
struct RoundRequest {
    uint64_t file_size{0};
    uint32_t tcp_connections{0};
    uint32_t udp_connections{0};
};

// First valid offer seen by the discovery listener
struct DiscoveredServer {
    std::string ip;
    uint16_t udp_port{0};
    uint16_t tcp_port{0};
};

} // namespace netspeed
