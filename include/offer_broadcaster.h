#pragma once

#include "udp_socket.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <netinet/in.h>

namespace netspeed {

// Background thread that sends the server's offer to
// broadcast_address:offer_port every interval. A failed send is logged and
// followed by a longer backoff; it never stops the server.
class OfferBroadcaster {
public:
    OfferBroadcaster(const std::string& broadcast_address, uint16_t offer_port,
                     uint32_t interval_ms, uint32_t backoff_ms);
    ~OfferBroadcaster();

    OfferBroadcaster(const OfferBroadcaster&) = delete;
    OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;

    bool start(uint16_t udp_port, uint16_t tcp_port);

    void stop();

    bool is_running() const { return is_running_.load(); }
    uint64_t offers_sent() const { return offers_sent_.load(); }

private:
    void broadcast_loop();

    // Returns false when stop() interrupted the wait
    bool wait_for(uint32_t ms);

    std::string broadcast_address_;
    uint16_t offer_port_;
    uint32_t interval_ms_;
    uint32_t backoff_ms_;

    UDPSocket socket_;
    sockaddr_in dest_{};
    std::vector<uint8_t> offer_;

    std::thread thread_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool should_stop_{false};
    std::atomic<bool> is_running_{false};
    std::atomic<uint64_t> offers_sent_{0};
};

} // namespace netspeed
