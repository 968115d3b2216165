#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <netinet/in.h>

namespace netspeed {

// Owns one UDP descriptor; closed on destruction
class UDPSocket {
public:
    UDPSocket();
    ~UDPSocket();

    UDPSocket(const UDPSocket&) = delete;
    UDPSocket& operator=(const UDPSocket&) = delete;
    UDPSocket(UDPSocket&& other) noexcept;
    UDPSocket& operator=(UDPSocket&& other) noexcept;

    bool open();

    // Port 0 binds an ephemeral port, see local_port()
    bool bind_socket(uint16_t port, bool reuse_addr);

    bool enable_broadcast();

    bool set_nonblocking(bool enable);

    // Best effort; the kernel may clamp the size
    bool set_receive_buffer(int bytes);

    ssize_t send_to(const void* buf, size_t len, const sockaddr_in& dest);

    ssize_t recv_from(void* buf, size_t len, sockaddr_in& src);

    void close_socket();

    uint16_t local_port() const;
    int fd() const { return sockfd_; }
    bool is_open() const { return sockfd_ >= 0; }

private:
    int sockfd_;
};

} // namespace netspeed
