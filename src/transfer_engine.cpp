#include "transfer_engine.h"
#include "segment_tracker.h"
#include "socket_util.h"
#include "tcp_control.h"
#include "udp_socket.h"
#include "wire_codec.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <future>
#include <iostream>
#include <system_error>
#include <utility>

namespace netspeed {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t TCP_READ_CHUNK = 64 * 1024;
constexpr size_t UDP_RECV_BUFFER = 4096;
constexpr int UDP_SOCKET_RCVBUF = 4 * 1024 * 1024;

double seconds_between(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<double>(end - start).count();
}

// Per-wait slice so a dropped running flag is seen within STOP_CHECK_MS
uint32_t stop_check_slice(uint32_t timeout_ms) {
    return std::min(timeout_ms, STOP_CHECK_MS);
}

TransferRecord make_record(Protocol protocol, uint32_t transfer_num, uint64_t file_size) {
    TransferRecord record;
    record.protocol = protocol;
    record.transfer_num = transfer_num;
    record.bytes_requested = file_size;
    return record;
}

void report(const TransferRecord& record) {
    if (record.outcome == TransferOutcome::COMPLETE) {
        std::cout << "[Client] " << describe(record) << std::endl;
    } else {
        std::cerr << "[Client] " << describe(record) << std::endl;
    }
}

// Keeps one failed launch from taking down the rest of the round
TransferRecord failed_launch(Protocol protocol, uint32_t transfer_num, uint64_t file_size,
                             const std::system_error& e) {
    std::cerr << "[Client] Could not start " << protocol_name(protocol) << " transfer #"
              << transfer_num << ": " << e.what() << std::endl;
    return make_record(protocol, transfer_num, file_size);
}

} // namespace

TransferRecord run_tcp_transfer(const std::string& server_ip, uint16_t tcp_port,
                                uint64_t file_size, uint32_t transfer_num,
                                const TransferOptions& options, const std::atomic<bool>& running) {
    TransferRecord record = make_record(Protocol::TCP, transfer_num, file_size);

    TCPStream stream;
    if (!stream.connect_to_server(server_ip, tcp_port, options.tcp_connect_timeout_ms)) {
        record.outcome = TransferOutcome::FAILED;
        report(record);
        return record;
    }

    std::string request = wire::encode_tcp_request(file_size);
    if (!stream.send_all(request.data(), request.size())) {
        std::cerr << "[TCP Transfer] #" << transfer_num << " failed to send request: "
                  << strerror(errno) << std::endl;
        record.outcome = TransferOutcome::FAILED;
        report(record);
        return record;
    }

    auto start = Clock::now();
    std::vector<uint8_t> buffer(TCP_READ_CHUNK);
    uint64_t received = 0;
    auto last_arrival = start;
    record.outcome = TransferOutcome::COMPLETE;

    while (received < file_size) {
        if (!running.load(std::memory_order_acquire)) {
            std::cerr << "[TCP Transfer] #" << transfer_num << " interrupted after "
                      << received << "/" << file_size << " bytes" << std::endl;
            record.outcome = received > 0 ? TransferOutcome::PARTIAL : TransferOutcome::NO_DATA;
            break;
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), file_size - received));
        size_t n = 0;
        ReadStatus status = stream.receive_some(buffer.data(), want, stop_check_slice(options.tcp_timeout_ms), n);
        if (status == ReadStatus::DATA) {
            received += n;
            last_arrival = Clock::now();
            continue;
        }

        if (status == ReadStatus::TIMEOUT) {
            if (Clock::now() - last_arrival < std::chrono::milliseconds(options.tcp_timeout_ms)) {
                continue;
            }
            std::cerr << "[TCP Transfer] #" << transfer_num << " timed out after "
                      << received << "/" << file_size << " bytes" << std::endl;
            record.outcome = TransferOutcome::TIMEOUT;
        } else {
            std::cerr << "[TCP Transfer] #" << transfer_num << " connection "
                      << (status == ReadStatus::CLOSED ? "closed" : "reset") << " after "
                      << received << "/" << file_size << " bytes" << std::endl;
            record.outcome = TransferOutcome::PARTIAL;
        }
        break;
    }

    auto end = Clock::now();
    record.bytes_received = received;
    record.duration_sec = seconds_between(start, end);
    report(record);
    return record;
}

TransferRecord run_udp_transfer(const std::string& server_ip, uint16_t udp_port,
                                uint64_t file_size, uint32_t transfer_num,
                                const TransferOptions& options, const std::atomic<bool>& running) {
    TransferRecord record = make_record(Protocol::UDP, transfer_num, file_size);

    sockaddr_in server_addr;
    if (!make_address(server_ip, udp_port, server_addr)) {
        std::cerr << "[UDP Transfer] Invalid server IP address: " << server_ip << std::endl;
        record.outcome = TransferOutcome::FAILED;
        report(record);
        return record;
    }

    UDPSocket socket;
    if (!socket.open()) {
        record.outcome = TransferOutcome::FAILED;
        report(record);
        return record;
    }
    if (!socket.set_receive_buffer(UDP_SOCKET_RCVBUF)) {
        std::cerr << "[UDP Transfer] #" << transfer_num << " using the default receive buffer" << std::endl;
    }

    auto request = wire::encode_udp_request(file_size);
    auto start = Clock::now();
    ssize_t sent = socket.send_to(request.data(), request.size(), server_addr);
    if (sent != static_cast<ssize_t>(request.size())) {
        std::cerr << "[UDP Transfer] #" << transfer_num << " failed to send request: "
                  << strerror(errno) << std::endl;
        record.outcome = TransferOutcome::FAILED;
        report(record);
        return record;
    }

    // Nothing will arrive for an empty file; no point waiting for a timeout
    if (wire::segment_count(file_size) == 0) {
        record.outcome = TransferOutcome::COMPLETE;
        record.duration_sec = seconds_between(start, Clock::now());
        report(record);
        return record;
    }

    SegmentTracker tracker(options.max_tracked_segments);
    std::vector<uint8_t> buffer(UDP_RECV_BUFFER);
    auto last_arrival = start;

    bool interrupted = false;
    while (!tracker.complete()) {
        if (!running.load(std::memory_order_acquire)) {
            interrupted = true;
            break;
        }
        WaitResult ready = wait_readable(socket.fd(), stop_check_slice(options.udp_timeout_ms));
        if (ready == WaitResult::TIMEOUT) {
            if (Clock::now() - last_arrival < std::chrono::milliseconds(options.udp_timeout_ms)) {
                continue;
            }
            break;
        }
        if (ready == WaitResult::ERROR) {
            std::cerr << "[UDP Transfer] #" << transfer_num << " poll failed: "
                      << strerror(errno) << std::endl;
            break;
        }

        sockaddr_in src;
        ssize_t n = socket.recv_from(buffer.data(), buffer.size(), src);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            std::cerr << "[UDP Transfer] #" << transfer_num << " recvfrom failed: "
                      << strerror(errno) << std::endl;
            break;
        }

        auto header = wire::decode_udp_payload_header(buffer.data(), static_cast<size_t>(n));
        if (!header) {
            continue;
        }
        if (tracker.record(header->total_segments, header->segment_index)
                != SegmentTracker::Result::REJECTED) {
            last_arrival = Clock::now();
        }
    }

    if (interrupted) {
        std::cerr << "[UDP Transfer] #" << transfer_num << " interrupted after "
                  << tracker.received() << "/" << tracker.total() << " segments" << std::endl;
    }

    record.segments_total = tracker.total();
    record.segments_received = tracker.received();
    record.duplicate_segments = tracker.duplicates();

    if (tracker.received() == 0) {
        record.outcome = TransferOutcome::NO_DATA;
        record.duration_sec = seconds_between(start, Clock::now());
    } else {
        record.outcome = tracker.complete() ? TransferOutcome::COMPLETE : TransferOutcome::PARTIAL;
        record.duration_sec = seconds_between(start, last_arrival);
    }

    if (options.verbose) {
        std::cout << "[UDP Transfer] #" << transfer_num << " segments " << tracker.received()
                  << "/" << tracker.total() << ", duplicates " << tracker.duplicates() << std::endl;
    }
    report(record);
    return record;
}

std::vector<TransferRecord> run_round(const DiscoveredServer& server,
                                      const RoundRequest& request,
                                      const TransferOptions& options,
                                      const std::atomic<bool>& running) {
    std::vector<std::future<TransferRecord>> tasks;
    std::vector<TransferRecord> records;
    tasks.reserve(request.tcp_connections + request.udp_connections);
    records.reserve(request.tcp_connections + request.udp_connections);

    // Launch failures are recorded in place so ordering stays TCP-then-UDP
    std::vector<std::pair<size_t, TransferRecord>> launch_failures;

    for (uint32_t i = 0; i < request.tcp_connections; ++i) {
        try {
            tasks.push_back(std::async(std::launch::async, run_tcp_transfer, server.ip,
                                       server.tcp_port, request.file_size, i + 1, options,
                                       std::cref(running)));
        } catch (const std::system_error& e) {
            launch_failures.emplace_back(tasks.size() + launch_failures.size(),
                                         failed_launch(Protocol::TCP, i + 1, request.file_size, e));
        }
    }

    for (uint32_t i = 0; i < request.udp_connections; ++i) {
        try {
            tasks.push_back(std::async(std::launch::async, run_udp_transfer, server.ip,
                                       server.udp_port, request.file_size, i + 1, options,
                                       std::cref(running)));
        } catch (const std::system_error& e) {
            launch_failures.emplace_back(tasks.size() + launch_failures.size(),
                                         failed_launch(Protocol::UDP, i + 1, request.file_size, e));
        }
    }

    // Barrier: every task is joined before anything is returned
    auto failure = launch_failures.begin();
    for (auto& task : tasks) {
        while (failure != launch_failures.end() && failure->first == records.size()) {
            records.push_back(failure->second);
            ++failure;
        }
        records.push_back(task.get());
    }
    for (; failure != launch_failures.end(); ++failure) {
        records.push_back(failure->second);
    }
    return records;
}

} // namespace netspeed
