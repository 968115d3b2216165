#pragma once

#include "client_state.h"
#include "netspeed_config.h"
#include "round_statistics.h"
#include "speedtest_types.h"
#include "transfer_record.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace netspeed {

class SpeedTestClient {
public:
    // Next round to run, or nothing to stop
    using RoundSource = std::function<std::optional<RoundRequest>()>;

    SpeedTestClient(const ClientConfig& config, std::atomic<bool>& running);

    // Runs rounds until the source is exhausted or the running flag drops.
    // Returns the number of rounds that completed.
    uint32_t run(const RoundSource& next_round);

    // Waits for one offer, runs every transfer of the round against it and
    // aggregates the results. False when interrupted before an offer arrived
    // or the offer port could not be opened.
    bool run_single_round(const RoundRequest& request);

    const ClientState& state() const { return state_; }
    const RoundStatistics& last_statistics() const { return statistics_; }
    const std::vector<TransferRecord>& last_records() const { return records_; }

private:
    std::optional<DiscoveredServer> find_server();

    ClientConfig config_;
    std::atomic<bool>& running_;
    ClientState state_;
    RoundStatistics statistics_;
    std::vector<TransferRecord> records_;
};

} // namespace netspeed
