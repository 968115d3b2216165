#include "tcp_control.h"
#include "socket_util.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

namespace netspeed {

// TCPStream implementation
TCPStream::TCPStream() : socket_fd_(-1) {
}

TCPStream::TCPStream(int fd) : socket_fd_(fd) {
}

TCPStream::~TCPStream() {
    disconnect();
}

TCPStream::TCPStream(TCPStream&& other) noexcept : socket_fd_(other.socket_fd_) {
    other.socket_fd_ = -1;
}

TCPStream& TCPStream::operator=(TCPStream&& other) noexcept {
    if (this != &other) {
        disconnect();
        socket_fd_ = std::exchange(other.socket_fd_, -1);
    }
    return *this;
}

bool TCPStream::connect_to_server(const std::string& server_ip, uint16_t server_port, uint32_t timeout_ms) {
    disconnect();

    struct sockaddr_in server_addr;
    if (!make_address(server_ip, server_port, server_addr)) {
        std::cerr << "[TCP Client] Invalid server IP address: " << server_ip << std::endl;
        return false;
    }

    socket_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        std::cerr << "[TCP Client] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    if (!set_nonblocking(socket_fd_, true)) {
        std::cerr << "[TCP Client] fcntl O_NONBLOCK failed: " << strerror(errno) << std::endl;
        disconnect();
        return false;
    }

    if (connect(socket_fd_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        if (errno != EINPROGRESS) {
            std::cerr << "[TCP Client] Connect to " << server_ip << ":" << server_port
                      << " failed: " << strerror(errno) << std::endl;
            disconnect();
            return false;
        }

        WaitResult ready = wait_writable(socket_fd_, timeout_ms);
        if (ready != WaitResult::READY) {
            std::cerr << "[TCP Client] Connect to " << server_ip << ":" << server_port
                      << (ready == WaitResult::TIMEOUT ? " timed out" : " failed") << std::endl;
            disconnect();
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket_fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            std::cerr << "[TCP Client] Connect to " << server_ip << ":" << server_port
                      << " failed: " << strerror(so_error != 0 ? so_error : errno) << std::endl;
            disconnect();
            return false;
        }
    }

    if (!set_nonblocking(socket_fd_, false)) {
        std::cerr << "[TCP Client] fcntl failed: " << strerror(errno) << std::endl;
        disconnect();
        return false;
    }
    return true;
}

bool TCPStream::send_all(const void* buf, size_t len) {
    if (socket_fd_ < 0) {
        return false;
    }

    const uint8_t* data = static_cast<const uint8_t*>(buf);
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = send(socket_fd_, data + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

bool TCPStream::set_send_timeout(uint32_t timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        std::cerr << "[TCP Server] setsockopt SO_SNDTIMEO failed: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

ReadStatus TCPStream::receive_some(void* buf, size_t len, uint32_t timeout_ms, size_t& received) {
    received = 0;
    WaitResult ready = wait_readable(socket_fd_, timeout_ms);
    if (ready == WaitResult::TIMEOUT) {
        return ReadStatus::TIMEOUT;
    }
    if (ready == WaitResult::ERROR) {
        return ReadStatus::ERROR;
    }

    ssize_t n;
    do {
        n = recv(socket_fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadStatus::TIMEOUT;
        }
        return ReadStatus::ERROR;
    }
    if (n == 0) {
        return ReadStatus::CLOSED;
    }
    received = static_cast<size_t>(n);
    return ReadStatus::DATA;
}

bool TCPStream::read_line(std::string& line, size_t max_len, uint32_t timeout_ms,
                          const std::atomic<bool>* running) {
    line.clear();
    char buffer[64];
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (line.size() <= max_len) {
        if (running && !running->load(std::memory_order_relaxed)) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            return false;
        }
        uint32_t wait_ms = static_cast<uint32_t>(left);
        if (running) {
            wait_ms = std::min(wait_ms, STOP_CHECK_MS);
        }

        size_t n = 0;
        ReadStatus status = receive_some(buffer, sizeof(buffer), wait_ms, n);
        if (status == ReadStatus::TIMEOUT) {
            continue;
        }
        if (status == ReadStatus::CLOSED) {
            return !line.empty();
        }
        if (status != ReadStatus::DATA) {
            return false;
        }

        for (size_t i = 0; i < n; ++i) {
            if (buffer[i] == '\n') {
                return true;
            }
            line.push_back(buffer[i]);
        }
    }
    return false;
}

void TCPStream::disconnect() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

// TCPListener implementation
TCPListener::TCPListener()
    : listen_fd_(-1), listen_port_(0) {
}

TCPListener::~TCPListener() {
    stop();
}

bool TCPListener::start_listening(uint16_t port, int backlog) {
    if (listen_fd_ >= 0) {
        return false;
    }

    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        std::cerr << "[TCP Server] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[TCP Server] setsockopt failed: " << strerror(errno) << std::endl;
        stop();
        return false;
    }

    struct sockaddr_in server_addr;
    std::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(port);

    if (bind(listen_fd_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        std::cerr << "[TCP Server] Bind failed on port " << port << ": " << strerror(errno) << std::endl;
        stop();
        return false;
    }

    if (listen(listen_fd_, backlog) < 0) {
        std::cerr << "[TCP Server] Listen failed: " << strerror(errno) << std::endl;
        stop();
        return false;
    }

    if (!set_nonblocking(listen_fd_, true)) {
        std::cerr << "[TCP Server] fcntl O_NONBLOCK failed: " << strerror(errno) << std::endl;
        stop();
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, (struct sockaddr*)&bound, &len) == 0) {
        listen_port_ = ntohs(bound.sin_port);
    } else {
        listen_port_ = port;
    }
    return true;
}

TCPStream TCPListener::accept_connection(sockaddr_in& peer) {
    if (listen_fd_ < 0) {
        return TCPStream();
    }

    socklen_t peer_len = sizeof(peer);
    int client_fd = accept(listen_fd_, (struct sockaddr*)&peer, &peer_len);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::cerr << "[TCP Server] Accept failed: " << strerror(errno) << std::endl;
        }
        return TCPStream();
    }

    // Accepted sockets inherit O_NONBLOCK on some platforms; handlers block
    TCPStream stream(client_fd);
    if (!set_nonblocking(client_fd, false)) {
        std::cerr << "[TCP Server] fcntl failed on accepted socket: " << strerror(errno) << std::endl;
        return TCPStream();
    }
    return stream;
}

void TCPListener::stop() {
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    listen_port_ = 0;
}

} // namespace netspeed
