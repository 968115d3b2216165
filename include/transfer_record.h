#pragma once

#include <cstdint>
#include <string>

namespace netspeed {

enum class Protocol : uint8_t {
    TCP = 0,
    UDP = 1
};

enum class TransferOutcome : uint8_t {
    COMPLETE = 0,   // Everything requested arrived
    PARTIAL = 1,    // TCP peer closed early, UDP ended with segments missing, or interrupted
    TIMEOUT = 2,    // TCP read stalled past the bounded wait
    NO_DATA = 3,    // Nothing arrived: no valid UDP payload, or interrupted before any byte
    FAILED = 4      // Setup failed: socket, connect or request send
};

// Result of one transfer. Produced by the task that ran it and handed to the
// aggregator by value.
struct TransferRecord {
    Protocol protocol{Protocol::TCP};
    uint32_t transfer_num{0};            // 1-based within its protocol
    TransferOutcome outcome{TransferOutcome::FAILED};
    double duration_sec{0.0};

    uint64_t bytes_requested{0};
    uint64_t bytes_received{0};          // TCP only

    uint64_t segments_received{0};       // UDP only, distinct indices
    uint64_t segments_total{0};          // UDP only
    uint64_t duplicate_segments{0};      // UDP only

    // False for a transfer that finished in no measurable time
    bool has_speed() const { return duration_sec > 0.0; }

    // bits/second; 0 when !has_speed()
    double speed_bps() const;

    uint64_t segments_lost() const {
        return segments_total > segments_received ? segments_total - segments_received : 0;
    }

    // Fraction in [0, 1]; 0 when there were no segments to lose
    double loss_rate() const;

    // Whether the record carries a meaningful duration for the round averages
    bool has_timing() const {
        return outcome != TransferOutcome::FAILED && outcome != TransferOutcome::NO_DATA;
    }
};

const char* protocol_name(Protocol protocol);

const char* outcome_name(TransferOutcome outcome);

// One-line human summary, e.g. "TCP transfer #1 finished, total time: ..."
std::string describe(const TransferRecord& record);

} // namespace netspeed
