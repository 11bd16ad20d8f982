#pragma once
#ifndef O2_MODE_RUN_STATE_H
#define O2_MODE_RUN_STATE_H

/* System */
#include <array>
#include <atomic>
#include <cstdint>
#include <string>

/* Local */
#include "Mode.h"

namespace o2 {

// Snapshot of per-mode counters, possibly stale while a run is in progress
struct ModeStats
{
    Mode mode = Mode::Bioluminescence;
    uint64_t framesRouted = 0;
    uint64_t timeouts = 0;
    // Frames of earlier ticks dropped while waiting for this mode
    uint64_t lateFrames = 0;
    uint64_t framesSaved = 0;
    uint64_t framesDropped = 0;
    uint64_t writeErrors = 0;
    double avgIntervalUs = 0.0;
    double achievedRateHz = 0.0;
    size_t longestTimeoutRun = 0;
    bool healthy = true;
    std::string stackFileName;
};

// Counters of one mode, written by the scheduling thread only
struct ModeRunState
{
    std::atomic<uint64_t> framesRouted{ 0 };
    std::atomic<uint64_t> timeouts{ 0 };
    std::atomic<uint64_t> lateFrames{ 0 };
    std::atomic<uint64_t> lastTimestampUs{ 0 };

    void Reset()
    {
        framesRouted = 0;
        timeouts = 0;
        lateFrames = 0;
        lastTimestampUs = 0;
    }
};

using ModeRunStates = std::array<ModeRunState, ModeCount>;

} // namespace o2

#endif /* O2_MODE_RUN_STATE_H */
