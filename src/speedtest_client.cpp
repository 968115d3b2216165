#include "speedtest_client.h"
#include "discovery_listener.h"
#include "transfer_engine.h"
#include <iostream>

namespace netspeed {

SpeedTestClient::SpeedTestClient(const ClientConfig& config, std::atomic<bool>& running)
    : config_(config), running_(running), state_(state::Startup{}) {
}

std::optional<DiscoveredServer> SpeedTestClient::find_server() {
    DiscoveryListener listener;
    if (!listener.open(config_.offer_port)) {
        return std::nullopt;
    }
    std::cout << "[Client] Listening for offer requests on port " << config_.offer_port << "..." << std::endl;

    auto server = listener.wait_for_offer(running_, config_.discovery_wait_ms);
    if (config_.verbose && listener.ignored_datagrams() > 0) {
        std::cout << "[Client] Ignored " << listener.ignored_datagrams()
                  << " datagram(s) that were not offers" << std::endl;
    }
    // listener closes here so offers during the test are not queued
    return server;
}

bool SpeedTestClient::run_single_round(const RoundRequest& request) {
    state_ = begin_search(state_, request);

    auto server = find_server();
    if (!server) {
        return false;
    }
    state_ = accept_offer(state_, *server);
    std::cout << "[Client] Received offer from " << server->ip << " (UDP " << server->udp_port
              << ", TCP " << server->tcp_port << ")" << std::endl;

    statistics_.reset(request.file_size);
    records_ = run_round(*server, request, config_.transfer, running_);
    statistics_.add_records(records_);
    statistics_.print_summary(std::cout);

    state_ = finish_round(state_);
    std::cout << "[Client] All transfers complete, listening to offer requests" << std::endl;
    return true;
}

uint32_t SpeedTestClient::run(const RoundSource& next_round) {
    uint32_t completed = 0;
    std::cout << "[Client] Started (" << state_name(state_) << ")" << std::endl;

    while (running_.load(std::memory_order_acquire)) {
        auto request = next_round();
        if (!request) {
            break;
        }
        if (!run_single_round(*request)) {
            break;
        }
        completed++;
    }

    std::cout << "[Client] Stopped after " << completed << " round(s)" << std::endl;
    return completed;
}

} // namespace netspeed
