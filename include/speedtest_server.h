#pragma once

#include "netspeed_config.h"
#include "offer_broadcaster.h"
#include "request_dispatcher.h"
#include "task_pool.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace netspeed {

// Owns every server-side resource: the service sockets (inside the
// dispatcher), the offer broadcaster and the handler pool.
class SpeedTestServer {
public:
    SpeedTestServer(const ServerConfig& config, std::atomic<bool>& running);
    ~SpeedTestServer();

    SpeedTestServer(const SpeedTestServer&) = delete;
    SpeedTestServer& operator=(const SpeedTestServer&) = delete;

    // Binds the UDP and TCP service ports and starts broadcasting offers.
    // On failure nothing stays open.
    bool start();

    // Dispatcher loop; blocks until the running flag drops, then shuts down
    void run();

    // Safe to call from another thread
    void stop();

    // Idempotent; joins the broadcaster and the pool, closes the sockets
    void shutdown();

    uint16_t udp_port() const;
    uint16_t tcp_port() const;

    const RequestDispatcher& dispatcher() const { return *dispatcher_; }
    const OfferBroadcaster& broadcaster() const { return broadcaster_; }

private:
    bool bind_service_ports();
    uint16_t pick_port(uint16_t configured);

    ServerConfig config_;
    std::atomic<bool>& running_;

    std::unique_ptr<TaskPool> pool_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    OfferBroadcaster broadcaster_;
    bool started_;
};

// First IPv4 address the host name resolves to, "0.0.0.0" when unknown
std::string local_ip_address();

} // namespace netspeed
