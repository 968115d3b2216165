#include "transfer_record.h"
#include <iomanip>
#include <sstream>

namespace netspeed {

double TransferRecord::speed_bps() const {
    if (!has_speed()) {
        return 0.0;
    }
    // UDP carries no byte count of its own; the requested size is the payload
    uint64_t bytes = protocol == Protocol::TCP ? bytes_received : bytes_requested;
    return static_cast<double>(bytes) * 8.0 / duration_sec;
}

double TransferRecord::loss_rate() const {
    if (segments_total == 0) {
        return 0.0;
    }
    return static_cast<double>(segments_lost()) / static_cast<double>(segments_total);
}

const char* protocol_name(Protocol protocol) {
    switch (protocol) {
        case Protocol::TCP: return "TCP";
        case Protocol::UDP: return "UDP";
    }
    return "?";
}

const char* outcome_name(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::COMPLETE: return "complete";
        case TransferOutcome::PARTIAL: return "partial";
        case TransferOutcome::TIMEOUT: return "timeout";
        case TransferOutcome::NO_DATA: return "no data";
        case TransferOutcome::FAILED: return "failed";
    }
    return "?";
}

std::string describe(const TransferRecord& record) {
    std::ostringstream out;
    out << protocol_name(record.protocol) << " transfer #" << record.transfer_num;

    if (record.outcome == TransferOutcome::FAILED) {
        out << " failed before any data was exchanged";
        return out.str();
    }
    if (record.outcome == TransferOutcome::NO_DATA) {
        out << (record.protocol == Protocol::UDP ? " finished, but no segments were received"
                                                 : " finished, but no data was received");
        return out.str();
    }

    out << " finished";
    if (record.outcome != TransferOutcome::COMPLETE) {
        out << " (" << outcome_name(record.outcome) << ")";
    }
    out << std::fixed << std::setprecision(3) << ", total time: " << record.duration_sec << " seconds";
    if (record.has_speed()) {
        out << std::setprecision(2) << ", total speed: " << record.speed_bps() << " bits/second";
    } else {
        out << ", finished almost instantly; speed not computed";
    }

    if (record.protocol == Protocol::TCP) {
        out << ", received " << record.bytes_received << "/" << record.bytes_requested << " bytes";
    } else {
        out << std::setprecision(2)
            << ", percentage of packets received successfully: "
            << (100.0 - record.loss_rate() * 100.0) << "%";
        if (record.duplicate_segments > 0) {
            out << " (" << record.duplicate_segments << " duplicates)";
        }
    }
    return out.str();
}

} // namespace netspeed
