#include "config_parser.h"
#include "netspeed_config.h"
#include "speedtest_client.h"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <signal.h>
#include <stdexcept>
#include <string>

using namespace netspeed;

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running.store(false);
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

// Re-asks until a non-negative integer is entered; empty on EOF
std::optional<uint64_t> prompt_number(const std::string& question) {
    std::string line;
    while (g_running.load()) {
        std::cout << question << std::flush;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        size_t start = line.find_first_not_of(" \t\r");
        size_t end = line.find_last_not_of(" \t\r");
        if (start != std::string::npos && line[start] != '-') {
            std::string digits = line.substr(start, end - start + 1);
            try {
                size_t consumed = 0;
                uint64_t value = std::stoull(digits, &consumed);
                if (consumed == digits.size()) {
                    return value;
                }
            } catch (const std::exception& e) {
                std::cerr << "Not a usable number (" << e.what() << ")" << std::endl;
                continue;
            }
        }
        std::cerr << "Please enter a non-negative whole number" << std::endl;
    }
    return std::nullopt;
}

std::optional<RoundRequest> prompt_round() {
    RoundRequest request;
    auto size = prompt_number("Enter file size for speed test (in bytes): ");
    if (!size) return std::nullopt;
    request.file_size = *size;

    while (true) {
        auto tcp = prompt_number("Enter number of TCP connections: ");
        if (!tcp) return std::nullopt;
        auto udp = prompt_number("Enter number of UDP connections: ");
        if (!udp) return std::nullopt;
        if (*tcp > UINT32_MAX || *udp > UINT32_MAX) {
            std::cerr << "Connection counts must fit in 32 bits" << std::endl;
            continue;
        }
        request.tcp_connections = static_cast<uint32_t>(*tcp);
        request.udp_connections = static_cast<uint32_t>(*udp);
        return request;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config_file]" << std::endl;
        return 1;
    }

    ConfigParser config;
    if (argc == 2) {
        if (!config.load_from_file(argv[1])) {
            std::cout << "[Client] Warning: Could not load config file, using defaults" << std::endl;
        } else {
            config.print_all();
        }
    }

    ClientConfig client_config = load_client_config(config);

    install_signal_handlers();

    SpeedTestClient::RoundSource source;
    if (client_config.has_round_defaults) {
        RoundRequest fixed;
        fixed.file_size = client_config.file_size;
        fixed.tcp_connections = client_config.tcp_connections;
        fixed.udp_connections = client_config.udp_connections;
        uint32_t remaining = client_config.rounds;
        bool unlimited = (remaining == 0);
        source = [fixed, remaining, unlimited]() mutable -> std::optional<RoundRequest> {
            if (!unlimited) {
                if (remaining == 0) return std::nullopt;
                remaining--;
            }
            return fixed;
        };
    } else {
        source = prompt_round;
    }

    SpeedTestClient client(client_config, g_running);
    client.run(source);
    return 0;
}
