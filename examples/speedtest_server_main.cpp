#include "config_parser.h"
#include "netspeed_config.h"
#include "speedtest_server.h"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <signal.h>

using namespace netspeed;

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running.store(false);
}

// No SA_RESTART, so a blocked poll() returns EINTR and the loop re-checks the flag
void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
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
            std::cout << "[Server] Warning: Could not load config file, using defaults" << std::endl;
        } else {
            config.print_all();
        }
    }

    ServerConfig server_config = load_server_config(config);

    install_signal_handlers();

    SpeedTestServer server(server_config, g_running);
    if (!server.start()) {
        std::cerr << "[Server] Failed to start" << std::endl;
        return 1;
    }

    server.run();
    return 0;
}
