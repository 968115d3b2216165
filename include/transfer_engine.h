#pragma once

#include "netspeed_config.h"
#include "speedtest_types.h"
#include "transfer_record.h"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace netspeed {

// Connects, sends the size line, and reads until file_size bytes arrived,
// the peer closed, nothing arrived for options.tcp_timeout_ms, or running
// dropped. The clock starts after the request line is sent.
TransferRecord run_tcp_transfer(const std::string& server_ip, uint16_t tcp_port,
                                uint64_t file_size, uint32_t transfer_num,
                                const TransferOptions& options, const std::atomic<bool>& running);

// Sends one UDP request and collects payload segments until every distinct
// index arrived, no payload came within options.udp_timeout_ms, or running
// dropped. The end of a UDP transfer is only ever inferred from that timeout,
// so a slow transfer that is still progressing can be reported as lossy.
TransferRecord run_udp_transfer(const std::string& server_ip, uint16_t udp_port,
                                uint64_t file_size, uint32_t transfer_num,
                                const TransferOptions& options, const std::atomic<bool>& running);

// Runs request.tcp_connections TCP and request.udp_connections UDP transfers
// concurrently, one task each, and returns only after all of them finished.
// TCP records come first, each group ordered by transfer number. Every
// transfer watches running; an interrupted one ends PARTIAL, or NO_DATA
// when nothing had arrived.
std::vector<TransferRecord> run_round(const DiscoveredServer& server,
                                      const RoundRequest& request,
                                      const TransferOptions& options,
                                      const std::atomic<bool>& running);

} // namespace netspeed
