#pragma once

#include <cstdint>
#include <vector>

namespace netspeed {

// Distinct-segment bitmap for one UDP transfer. The total is fixed by the
// first accepted payload; later payloads announcing another total, or an
// index outside [0, total), are rejected.
class SegmentTracker {
public:
    enum class Result : uint8_t {
        NEW,
        DUPLICATE,
        REJECTED
    };

    explicit SegmentTracker(uint64_t max_segments)
        : max_segments_(max_segments) {}

    Result record(uint64_t total_segments, uint64_t segment_index);

    bool has_total() const { return has_total_; }
    uint64_t total() const { return total_; }
    uint64_t received() const { return received_; }
    uint64_t duplicates() const { return duplicates_; }
    uint64_t lost() const { return total_ - received_; }
    bool complete() const { return has_total_ && received_ == total_; }

private:
    uint64_t max_segments_;
    bool has_total_{false};
    uint64_t total_{0};
    uint64_t received_{0};
    uint64_t duplicates_{0};
    std::vector<uint64_t> bitmap_;
};

inline SegmentTracker::Result SegmentTracker::record(uint64_t total_segments, uint64_t segment_index) {
    if (!has_total_) {
        // A zero total carries no valid index; a huge one would exhaust memory
        if (total_segments == 0 || total_segments > max_segments_) {
            return Result::REJECTED;
        }
        has_total_ = true;
        total_ = total_segments;
        bitmap_.assign((total_ + 63) / 64, 0);
    }

    if (total_segments != total_ || segment_index >= total_) {
        return Result::REJECTED;
    }

    uint64_t w = segment_index / 64;
    uint64_t bit = 1ULL << (segment_index % 64);
    if (bitmap_[w] & bit) {
        duplicates_++;
        return Result::DUPLICATE;
    }
    bitmap_[w] |= bit;
    received_++;
    return Result::NEW;
}

} // namespace netspeed
