#pragma once

#include "netspeed_config.h"
#include "task_pool.h"
#include "tcp_control.h"
#include "udp_socket.h"
#include <atomic>
#include <cstdint>

namespace netspeed {

// Single-threaded poll() loop over the non-blocking UDP service socket and the
// non-blocking TCP listener. Every UDP request and accepted connection becomes
// one task on the pool; the loop itself never waits on a client.
class RequestDispatcher {
public:
    RequestDispatcher(TaskPool& pool, const HandlerOptions& options, const std::atomic<bool>& running);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    bool bind_udp(uint16_t port);
    bool bind_tcp(uint16_t port);

    // Returns when running turns false or both sockets have been dropped
    void run(uint32_t wait_ms);

    void close();

    uint16_t udp_port() const { return udp_port_; }
    uint16_t tcp_port() const { return tcp_port_; }

    uint64_t udp_requests() const { return udp_requests_.load(); }
    uint64_t invalid_datagrams() const { return invalid_datagrams_.load(); }
    uint64_t tcp_connections() const { return tcp_connections_.load(); }
    uint64_t rejected_tasks() const { return rejected_tasks_.load(); }

private:
    void handle_udp_readable();
    void handle_tcp_readable();

    TaskPool& pool_;
    HandlerOptions options_;
    const std::atomic<bool>& running_;

    UDPSocket udp_socket_;
    TCPListener tcp_listener_;
    uint16_t udp_port_;
    uint16_t tcp_port_;

    std::atomic<uint64_t> udp_requests_{0};
    std::atomic<uint64_t> invalid_datagrams_{0};
    std::atomic<uint64_t> tcp_connections_{0};
    std::atomic<uint64_t> rejected_tasks_{0};
};

} // namespace netspeed
