#pragma once

#include <cstdint>
#include <string>
#include <netinet/in.h>

namespace netspeed {

// Longest single wait in loops that also watch a running flag
constexpr uint32_t STOP_CHECK_MS = 100;

enum class WaitResult {
    READY,
    TIMEOUT,
    ERROR
};

// poll() for POLLIN on a single descriptor. An interrupted poll() resumes
// with whatever is left of timeout_ms.
WaitResult wait_readable(int fd, uint32_t timeout_ms);

WaitResult wait_writable(int fd, uint32_t timeout_ms);

bool set_nonblocking(int fd, bool enable);

bool make_address(const std::string& ip, uint16_t port, sockaddr_in& out);

std::string address_to_string(const sockaddr_in& addr);

} // namespace netspeed
