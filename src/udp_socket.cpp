#include "udp_socket.h"
#include "socket_util.h"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace netspeed {

UDPSocket::UDPSocket() : sockfd_(-1) {
}

UDPSocket::~UDPSocket() {
    close_socket();
}

UDPSocket::UDPSocket(UDPSocket&& other) noexcept : sockfd_(other.sockfd_) {
    other.sockfd_ = -1;
}

UDPSocket& UDPSocket::operator=(UDPSocket&& other) noexcept {
    if (this != &other) {
        close_socket();
        sockfd_ = std::exchange(other.sockfd_, -1);
    }
    return *this;
}

bool UDPSocket::open() {
    close_socket();
    sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) {
        std::cerr << "[UDP Socket] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool UDPSocket::bind_socket(uint16_t port, bool reuse_addr) {
    if (sockfd_ < 0) {
        return false;
    }

    if (reuse_addr) {
        int opt = 1;
        if (setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            std::cerr << "[UDP Socket] setsockopt SO_REUSEADDR failed: " << strerror(errno) << std::endl;
            return false;
        }
    }

    struct sockaddr_in bind_addr;
    std::memset(&bind_addr, 0, sizeof(bind_addr));
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = INADDR_ANY;
    bind_addr.sin_port = htons(port);

    if (::bind(sockfd_, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        std::cerr << "[UDP Socket] Bind failed on port " << port << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool UDPSocket::enable_broadcast() {
    int opt = 1;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        std::cerr << "[UDP Socket] setsockopt SO_BROADCAST failed: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool UDPSocket::set_nonblocking(bool enable) {
    if (!netspeed::set_nonblocking(sockfd_, enable)) {
        std::cerr << "[UDP Socket] fcntl O_NONBLOCK failed: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool UDPSocket::set_receive_buffer(int bytes) {
    if (setsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &bytes, sizeof(bytes)) < 0) {
        std::cerr << "[UDP Socket] Warning: Failed to set SO_RCVBUF: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

ssize_t UDPSocket::send_to(const void* buf, size_t len, const sockaddr_in& dest) {
    return ::sendto(sockfd_, buf, len, 0, reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
}

ssize_t UDPSocket::recv_from(void* buf, size_t len, sockaddr_in& src) {
    socklen_t sl = sizeof(src);
    return ::recvfrom(sockfd_, buf, len, 0, reinterpret_cast<sockaddr*>(&src), &sl);
}

void UDPSocket::close_socket() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

uint16_t UDPSocket::local_port() const {
    if (sockfd_ < 0) {
        return 0;
    }
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sockfd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace netspeed
