#include "speedtest_server.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cstring>
#include <iostream>
#include <memory>
#include <random>

namespace netspeed {

std::string local_ip_address() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return "0.0.0.0";
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    addrinfo* result = nullptr;
    if (getaddrinfo(hostname, nullptr, &hints, &result) != 0 || !result) {
        return "0.0.0.0";
    }

    char ip[INET_ADDRSTRLEN] = {0};
    auto* addr = reinterpret_cast<sockaddr_in*>(result->ai_addr);
    const char* text = inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip));
    freeaddrinfo(result);
    return text ? ip : "0.0.0.0";
}

SpeedTestServer::SpeedTestServer(const ServerConfig& config, std::atomic<bool>& running)
    : config_(config), running_(running),
      pool_(std::make_unique<TaskPool>(config.worker_threads, config.max_pending_tasks)),
      dispatcher_(std::make_unique<RequestDispatcher>(*pool_, config.handler, running)),
      broadcaster_(config.broadcast_address, config.offer_port,
                   config.broadcast_interval_ms, config.broadcast_backoff_ms),
      started_(false) {
}

SpeedTestServer::~SpeedTestServer() {
    shutdown();
}

uint16_t SpeedTestServer::pick_port(uint16_t configured) {
    if (configured != 0) {
        return configured;
    }
    static thread_local std::mt19937 rng(std::random_device{}());
    uint16_t lo = config_.port_range_min;
    uint16_t hi = config_.port_range_max > lo ? config_.port_range_max : static_cast<uint16_t>(lo + 1);
    std::uniform_int_distribution<uint32_t> dist(lo, hi - 1u);
    return static_cast<uint16_t>(dist(rng));
}

bool SpeedTestServer::bind_service_ports() {
    // A fixed port gets exactly one try, a random one up to bind_attempts
    uint32_t udp_attempts = config_.udp_port != 0 ? 1 : config_.bind_attempts;
    bool udp_ok = false;
    for (uint32_t i = 0; i < udp_attempts && !udp_ok; ++i) {
        udp_ok = dispatcher_->bind_udp(pick_port(config_.udp_port));
    }
    if (!udp_ok) {
        std::cerr << "[Server] Could not bind a UDP service port" << std::endl;
        return false;
    }

    uint32_t tcp_attempts = config_.tcp_port != 0 ? 1 : config_.bind_attempts;
    bool tcp_ok = false;
    for (uint32_t i = 0; i < tcp_attempts && !tcp_ok; ++i) {
        tcp_ok = dispatcher_->bind_tcp(pick_port(config_.tcp_port));
    }
    if (!tcp_ok) {
        std::cerr << "[Server] Could not bind a TCP service port" << std::endl;
        dispatcher_->close();
        return false;
    }
    return true;
}

bool SpeedTestServer::start() {
    if (started_) {
        return false;
    }
    if (!bind_service_ports()) {
        return false;
    }
    if (!broadcaster_.start(dispatcher_->udp_port(), dispatcher_->tcp_port())) {
        std::cerr << "[Server] Could not start the offer broadcaster" << std::endl;
        dispatcher_->close();
        return false;
    }

    started_ = true;
    std::cout << "[Server] Started, listening on IP address " << local_ip_address()
              << " (UDP " << dispatcher_->udp_port() << ", TCP " << dispatcher_->tcp_port()
              << ", " << pool_->worker_count() << " workers)" << std::endl;
    return true;
}

void SpeedTestServer::run() {
    if (!started_) {
        std::cerr << "[Server] run() called before a successful start()" << std::endl;
        return;
    }
    dispatcher_->run(config_.dispatch_wait_ms);
    shutdown();
}

void SpeedTestServer::stop() {
    running_.store(false, std::memory_order_release);
}

void SpeedTestServer::shutdown() {
    if (!started_) {
        dispatcher_->close();
        return;
    }
    started_ = false;
    running_.store(false, std::memory_order_release);

    std::cout << "[Server] Shutting down..." << std::endl;
    broadcaster_.stop();
    pool_->shutdown();
    dispatcher_->close();

    std::cout << "[Server] Stopped. UDP requests: " << dispatcher_->udp_requests()
              << ", TCP connections: " << dispatcher_->tcp_connections()
              << ", invalid datagrams: " << dispatcher_->invalid_datagrams()
              << ", rejected: " << dispatcher_->rejected_tasks()
              << ", offers sent: " << broadcaster_.offers_sent() << std::endl;
}

uint16_t SpeedTestServer::udp_port() const {
    return dispatcher_->udp_port();
}

uint16_t SpeedTestServer::tcp_port() const {
    return dispatcher_->tcp_port();
}

} // namespace netspeed
