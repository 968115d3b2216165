#include "socket_util.h"
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace netspeed {

namespace {

WaitResult wait_for(int fd, short events, uint32_t timeout_ms) {
    if (fd < 0) {
        return WaitResult::ERROR;
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;

    int rc;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        rc = ::poll(&pfd, 1, left.count() > 0 ? static_cast<int>(left.count()) : 0);
        if (rc >= 0 || errno != EINTR) {
            break;
        }
    }
    if (rc < 0) {
        return WaitResult::ERROR;
    }
    if (rc == 0) {
        return WaitResult::TIMEOUT;
    }
    // POLLHUP still lets recv() report the orderly close
    if (pfd.revents & (events | POLLHUP)) {
        return WaitResult::READY;
    }
    return WaitResult::ERROR;
}

} // namespace

WaitResult wait_readable(int fd, uint32_t timeout_ms) {
    return wait_for(fd, POLLIN, timeout_ms);
}

WaitResult wait_writable(int fd, uint32_t timeout_ms) {
    return wait_for(fd, POLLOUT, timeout_ms);
}

bool set_nonblocking(int fd, bool enable) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) != -1;
}

bool make_address(const std::string& ip, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

std::string address_to_string(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return "?";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace netspeed
