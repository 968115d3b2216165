#include "request_dispatcher.h"
#include "request_handlers.h"
#include "socket_util.h"
#include "wire_codec.h"
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>

namespace netspeed {

namespace {

constexpr int LISTEN_BACKLOG = 64;
constexpr size_t UDP_RECV_BUFFER = 2048;

} // namespace

RequestDispatcher::RequestDispatcher(TaskPool& pool, const HandlerOptions& options,
                                     const std::atomic<bool>& running)
    : pool_(pool), options_(options), running_(running), udp_port_(0), tcp_port_(0) {
}

RequestDispatcher::~RequestDispatcher() {
    close();
}

bool RequestDispatcher::bind_udp(uint16_t port) {
    if (!udp_socket_.open()) {
        return false;
    }
    if (!udp_socket_.bind_socket(port, false) || !udp_socket_.set_nonblocking(true)) {
        udp_socket_.close_socket();
        return false;
    }
    udp_port_ = udp_socket_.local_port();
    return true;
}

bool RequestDispatcher::bind_tcp(uint16_t port) {
    if (!tcp_listener_.start_listening(port, LISTEN_BACKLOG)) {
        return false;
    }
    tcp_port_ = tcp_listener_.get_listen_port();
    return true;
}

void RequestDispatcher::close() {
    udp_socket_.close_socket();
    tcp_listener_.stop();
}

void RequestDispatcher::run(uint32_t wait_ms) {
    while (running_.load(std::memory_order_acquire)) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (udp_socket_.is_open()) {
            fds[nfds++] = pollfd{udp_socket_.fd(), POLLIN, 0};
        }
        if (tcp_listener_.is_listening()) {
            fds[nfds++] = pollfd{tcp_listener_.fd(), POLLIN, 0};
        }
        if (nfds == 0) {
            std::cerr << "[Dispatcher] No listening sockets left, stopping" << std::endl;
            break;
        }

        int rc = ::poll(fds, nfds, static_cast<int>(wait_ms));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[Dispatcher] poll failed: " << strerror(errno) << std::endl;
            break;
        }
        if (rc == 0) {
            continue;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            const bool is_udp = udp_socket_.is_open() && fds[i].fd == udp_socket_.fd();
            if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                // Exceptional condition: drop this socket, keep serving on the other
                if (is_udp) {
                    std::cerr << "[Dispatcher] Exception condition on UDP port " << udp_port_
                              << ", closing it" << std::endl;
                    udp_socket_.close_socket();
                } else {
                    std::cerr << "[Dispatcher] Exception condition on TCP port " << tcp_port_
                              << ", closing it" << std::endl;
                    tcp_listener_.stop();
                }
                continue;
            }
            if (fds[i].revents & POLLIN) {
                if (is_udp) {
                    handle_udp_readable();
                } else {
                    handle_tcp_readable();
                }
            }
        }
    }
}

void RequestDispatcher::handle_udp_readable() {
    uint8_t buffer[UDP_RECV_BUFFER];
    sockaddr_in client;
    ssize_t n = udp_socket_.recv_from(buffer, sizeof(buffer), client);
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::cerr << "[Dispatcher] Error handling UDP request: " << strerror(errno) << std::endl;
        }
        return;
    }

    auto request = wire::decode_udp_request(buffer, static_cast<size_t>(n));
    if (!request) {
        invalid_datagrams_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[Dispatcher] Invalid UDP request from " << address_to_string(client)
                  << " (" << n << " bytes), discarded" << std::endl;
        return;
    }

    udp_requests_.fetch_add(1, std::memory_order_relaxed);
    const uint64_t file_size = request->file_size;
    const HandlerOptions options = options_;
    const std::atomic<bool>* running = &running_;
    bool queued = pool_.submit([client, file_size, options, running] {
        serve_udp_request(client, file_size, options, *running);
    });
    if (!queued) {
        rejected_tasks_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[Dispatcher] Busy, dropping UDP request from " << address_to_string(client) << std::endl;
    }
}

void RequestDispatcher::handle_tcp_readable() {
    sockaddr_in peer;
    TCPStream stream = tcp_listener_.accept_connection(peer);
    if (!stream.is_connected()) {
        return;
    }

    tcp_connections_.fetch_add(1, std::memory_order_relaxed);
    if (options_.verbose) {
        std::cout << "[Dispatcher] Accepted TCP connection from " << address_to_string(peer) << std::endl;
    }

    // std::function needs a copyable callable; the stream rides in a shared_ptr
    auto owned = std::make_shared<TCPStream>(std::move(stream));
    const HandlerOptions options = options_;
    const std::atomic<bool>* running = &running_;
    bool queued = pool_.submit([owned, peer, options, running] {
        serve_tcp_connection(std::move(*owned), peer, options, *running);
    });
    if (!queued) {
        rejected_tasks_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[Dispatcher] Busy, closing TCP connection from " << address_to_string(peer) << std::endl;
        owned->disconnect();
    }
}

} // namespace netspeed
