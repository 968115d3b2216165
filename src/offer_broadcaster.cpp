#include "offer_broadcaster.h"
#include "socket_util.h"
#include "wire_codec.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

namespace netspeed {

OfferBroadcaster::OfferBroadcaster(const std::string& broadcast_address, uint16_t offer_port,
                                   uint32_t interval_ms, uint32_t backoff_ms)
    : broadcast_address_(broadcast_address), offer_port_(offer_port),
      interval_ms_(interval_ms), backoff_ms_(backoff_ms) {
}

OfferBroadcaster::~OfferBroadcaster() {
    stop();
}

bool OfferBroadcaster::start(uint16_t udp_port, uint16_t tcp_port) {
    if (is_running_.load()) {
        return false;
    }

    if (!make_address(broadcast_address_, offer_port_, dest_)) {
        std::cerr << "[Broadcaster] Invalid broadcast address: " << broadcast_address_ << std::endl;
        return false;
    }

    if (!socket_.open()) {
        return false;
    }
    // Unicast destinations still work without SO_BROADCAST
    if (!socket_.enable_broadcast()) {
        std::cerr << "[Broadcaster] Warning: broadcast not enabled on offer socket" << std::endl;
    }

    // Ports never change for the server lifetime, so the offer is built once
    offer_ = wire::encode_offer(udp_port, tcp_port);

    {
        std::lock_guard<std::mutex> lock(mu_);
        should_stop_ = false;
    }
    is_running_.store(true);
    thread_ = std::thread(&OfferBroadcaster::broadcast_loop, this);

    std::cout << "[Broadcaster] Offering UDP " << udp_port << " / TCP " << tcp_port
              << " to " << broadcast_address_ << ":" << offer_port_
              << " every " << interval_ms_ << " ms" << std::endl;
    return true;
}

void OfferBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        should_stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    socket_.close_socket();
    is_running_.store(false);
}

bool OfferBroadcaster::wait_for(uint32_t ms) {
    std::unique_lock<std::mutex> lock(mu_);
    return !cv_.wait_for(lock, std::chrono::milliseconds(ms), [&]{ return should_stop_; });
}

void OfferBroadcaster::broadcast_loop() {
    while (true) {
        ssize_t sent = socket_.send_to(offer_.data(), offer_.size(), dest_);
        uint32_t next_wait = interval_ms_;
        if (sent != static_cast<ssize_t>(offer_.size())) {
            std::cerr << "[Broadcaster] Error broadcasting offer: " << strerror(errno)
                      << ", retrying in " << backoff_ms_ << " ms" << std::endl;
            next_wait = backoff_ms_;
        } else {
            offers_sent_.fetch_add(1, std::memory_order_relaxed);
        }

        if (!wait_for(next_wait)) {
            break;
        }
    }
}

} // namespace netspeed
