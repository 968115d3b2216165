#include "round_statistics.h"
#include <iomanip>
#include <numeric>

namespace netspeed {

namespace {

std::optional<double> mean_of(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

void RoundStatistics::reset(uint64_t file_size) {
    file_size_ = file_size;
    tcp_durations_.clear();
    udp_durations_.clear();
    udp_received_ = 0;
    udp_lost_ = 0;
    transfers_without_data_ = 0;
}

void RoundStatistics::add_records(const std::vector<TransferRecord>& records) {
    for (const auto& record : records) {
        if (!record.has_timing()) {
            transfers_without_data_++;
            continue;
        }
        if (record.protocol == Protocol::TCP) {
            tcp_durations_.push_back(record.duration_sec);
        } else {
            udp_durations_.push_back(record.duration_sec);
            udp_received_ += record.segments_received;
            udp_lost_ += record.segments_lost();
        }
    }
}

std::optional<double> RoundStatistics::mean_tcp_duration() const {
    return mean_of(tcp_durations_);
}

std::optional<double> RoundStatistics::mean_tcp_speed_bps() const {
    auto mean = mean_tcp_duration();
    if (!mean || *mean <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(file_size_) * 8.0 / *mean;
}

std::optional<double> RoundStatistics::mean_udp_duration() const {
    return mean_of(udp_durations_);
}

std::optional<double> RoundStatistics::udp_loss_rate() const {
    uint64_t total = udp_received_ + udp_lost_;
    if (total == 0) {
        return std::nullopt;
    }
    return static_cast<double>(udp_lost_) / static_cast<double>(total);
}

void RoundStatistics::print_summary(std::ostream& out) const {
    out << "\n=== Speed Test Statistics ===" << std::endl;
    out << std::fixed;

    if (auto tcp_mean = mean_tcp_duration()) {
        out << "TCP Average Time: " << std::setprecision(3) << *tcp_mean << "s" << std::endl;
        if (auto speed = mean_tcp_speed_bps()) {
            out << "TCP Average Speed: " << std::setprecision(2) << *speed << " bits/second" << std::endl;
        } else {
            out << "TCP Average Speed: instantaneous (no measurable duration)" << std::endl;
        }
    } else {
        out << "TCP: no data" << std::endl;
    }

    if (auto udp_mean = mean_udp_duration()) {
        out << "UDP Average Time: " << std::setprecision(3) << *udp_mean << "s" << std::endl;
        if (auto loss = udp_loss_rate()) {
            out << "UDP Packet Loss Rate: " << std::setprecision(2) << (*loss * 100.0) << "%" << std::endl;
        } else {
            out << "UDP Packet Loss Rate: no segments expected" << std::endl;
        }
    } else {
        out << "UDP: no data" << std::endl;
    }

    if (transfers_without_data_ > 0) {
        out << transfers_without_data_ << " transfer(s) produced no data" << std::endl;
    }
}

} // namespace netspeed
