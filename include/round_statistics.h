#pragma once

#include "transfer_record.h"
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace netspeed {

// Per-round aggregate. Fed only with the complete record set of a round,
// after every transfer task has been joined.
class RoundStatistics {
public:
    RoundStatistics() = default;

    // Clears everything; called when a new round starts
    void reset(uint64_t file_size);

    void add_records(const std::vector<TransferRecord>& records);

    uint64_t file_size() const { return file_size_; }
    const std::vector<double>& tcp_durations() const { return tcp_durations_; }
    const std::vector<double>& udp_durations() const { return udp_durations_; }
    uint64_t udp_received() const { return udp_received_; }
    uint64_t udp_lost() const { return udp_lost_; }
    uint32_t transfers_without_data() const { return transfers_without_data_; }

    std::optional<double> mean_tcp_duration() const;
    // file_size * 8 / mean duration; empty when the mean is not positive
    std::optional<double> mean_tcp_speed_bps() const;
    std::optional<double> mean_udp_duration() const;
    // lost / (received + lost) over every UDP transfer of the round
    std::optional<double> udp_loss_rate() const;

    void print_summary(std::ostream& out) const;

private:
    uint64_t file_size_{0};
    std::vector<double> tcp_durations_;
    std::vector<double> udp_durations_;
    uint64_t udp_received_{0};
    uint64_t udp_lost_{0};
    uint32_t transfers_without_data_{0};
};

} // namespace netspeed
