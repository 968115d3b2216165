#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <netinet/in.h>

namespace netspeed {

enum class ReadStatus {
    DATA,       // At least one byte read
    CLOSED,     // Orderly shutdown by the peer
    TIMEOUT,    // Nothing readable within the wait
    ERROR       // Reset or other socket fault
};

// Connected stream socket. Created by TCPStream::connect_to_server on the
// client side, or handed out by TCPListener::accept_connection on the server.
class TCPStream {
public:
    TCPStream();
    explicit TCPStream(int fd);
    ~TCPStream();

    TCPStream(const TCPStream&) = delete;
    TCPStream& operator=(const TCPStream&) = delete;
    TCPStream(TCPStream&& other) noexcept;
    TCPStream& operator=(TCPStream&& other) noexcept;

    // Non-blocking connect bounded by timeout_ms; the socket is left blocking
    bool connect_to_server(const std::string& server_ip, uint16_t server_port, uint32_t timeout_ms);

    // Writes the whole buffer unless the peer goes away (no SIGPIPE)
    bool send_all(const void* buf, size_t len);

    // Bounds each blocking send; a peer that stops reading fails send_all
    bool set_send_timeout(uint32_t timeout_ms);

    ReadStatus receive_some(void* buf, size_t len, uint32_t timeout_ms, size_t& received);

    // Reads up to '\n' (excluded). Fails on timeout, error, or a line longer
    // than max_len. A peer that closes after sending digits still yields a line.
    // With running set, also fails soon after the flag drops.
    bool read_line(std::string& line, size_t max_len, uint32_t timeout_ms,
                   const std::atomic<bool>* running = nullptr);

    void disconnect();

    int fd() const { return socket_fd_; }
    bool is_connected() const { return socket_fd_ >= 0; }

private:
    int socket_fd_;
};

// Non-blocking listening socket polled by the dispatcher
class TCPListener {
public:
    TCPListener();
    ~TCPListener();

    TCPListener(const TCPListener&) = delete;
    TCPListener& operator=(const TCPListener&) = delete;

    bool start_listening(uint16_t port, int backlog);

    // Returns an unconnected stream when no connection is pending
    TCPStream accept_connection(sockaddr_in& peer);

    void stop();

    uint16_t get_listen_port() const { return listen_port_; }
    int fd() const { return listen_fd_; }
    bool is_listening() const { return listen_fd_ >= 0; }

private:
    int listen_fd_;
    uint16_t listen_port_;
};

} // namespace netspeed
