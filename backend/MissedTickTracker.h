#pragma once
#ifndef O2_MISSED_TICK_TRACKER_H
#define O2_MISSED_TICK_TRACKER_H

/* System */
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

namespace o2 {

// Collects indices of ticks without a stored frame and summarizes how they
// are spread. Not thread-safe.
class MissedTickTracker
{
    // Inclusive range of tick indices
    using TickRange = std::pair<uint64_t, uint64_t>;

public:
    // Removes all items added so far
    void Clear();

    void AddItem(uint64_t tickIndex);
    // The range is inclusive, empty ranges are ignored
    void AddRange(uint64_t firstTickIndex, uint64_t lastTickIndex);

    // Total number of missed ticks
    size_t GetCount() const;

    // Average distance between two consecutive missed ticks
    double GetAvgSpacing() const;

    // Length of the longest run of consecutive missed ticks
    size_t GetLargestCluster() const;

private:
    // Sorts ranges and merges those that touch or overlap
    void Normalize() const;

private:
    mutable std::deque<TickRange> m_ranges;
    mutable bool m_normalized = false;
};

} // namespace o2

#endif /* O2_MISSED_TICK_TRACKER_H */
