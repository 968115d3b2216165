#include "discovery_listener.h"
#include "socket_util.h"
#include "wire_codec.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace netspeed {

DiscoveryListener::DiscoveryListener() : ignored_(0) {
}

DiscoveryListener::~DiscoveryListener() {
    close();
}

bool DiscoveryListener::open(uint16_t port) {
    if (!socket_.open()) {
        return false;
    }
    if (!socket_.bind_socket(port, true) || !socket_.set_nonblocking(true)) {
        std::cerr << "[Discovery] Could not listen for offers on port " << port << std::endl;
        socket_.close_socket();
        return false;
    }
    return true;
}

void DiscoveryListener::close() {
    socket_.close_socket();
}

std::optional<DiscoveredServer> DiscoveryListener::poll_once(uint32_t wait_ms) {
    WaitResult ready = wait_readable(socket_.fd(), wait_ms);
    if (ready != WaitResult::READY) {
        return std::nullopt;
    }

    // Larger than any offer so oversized datagrams are seen as such
    uint8_t buffer[64];
    sockaddr_in src;
    ssize_t n = socket_.recv_from(buffer, sizeof(buffer), src);
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::cerr << "[Discovery] recvfrom failed: " << strerror(errno) << std::endl;
        }
        return std::nullopt;
    }

    auto offer = wire::decode_offer(buffer, static_cast<size_t>(n));
    if (!offer) {
        ignored_++;
        return std::nullopt;
    }

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));

    DiscoveredServer server;
    server.ip = ip;
    server.udp_port = offer->udp_port;
    server.tcp_port = offer->tcp_port;
    return server;
}

std::optional<DiscoveredServer> DiscoveryListener::wait_for_offer(const std::atomic<bool>& running,
                                                                  uint32_t wait_ms) {
    while (running.load(std::memory_order_acquire) && socket_.is_open()) {
        if (auto server = poll_once(wait_ms)) {
            return server;
        }
    }
    return std::nullopt;
}

} // namespace netspeed
