#pragma once

#include "speedtest_types.h"
#include "udp_socket.h"
#include <atomic>
#include <cstdint>
#include <optional>

namespace netspeed {

// Client side of discovery. Binds the offer port (SO_REUSEADDR, non-blocking)
// and waits for the first datagram that decodes as a valid offer.
class DiscoveryListener {
public:
    DiscoveryListener();
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    bool open(uint16_t port);

    void close();

    // One wake cycle: wait up to wait_ms, then attempt a single receive
    std::optional<DiscoveredServer> poll_once(uint32_t wait_ms);

    // Repeats poll_once until an offer arrives or running turns false
    std::optional<DiscoveredServer> wait_for_offer(const std::atomic<bool>& running, uint32_t wait_ms);

    bool is_open() const { return socket_.is_open(); }
    uint16_t local_port() const { return socket_.local_port(); }
    uint64_t ignored_datagrams() const { return ignored_; }

private:
    UDPSocket socket_;
    uint64_t ignored_;
};

} // namespace netspeed
