#pragma once
#ifndef O2_HEALTH_MONITOR_H
#define O2_HEALTH_MONITOR_H

/* System */
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>

/* Local */
#include "Advisory.h"
#include "MissedTickTracker.h"
#include "Mode.h"

namespace o2 {

struct HealthParams
{
    // Number of trailing inter-frame intervals averaged
    size_t windowSize = 10;
    // Allowed relative deviation of average interval from target
    double tolerance = 0.2;
    // Run of timeouts that makes a mode unhealthy regardless of intervals
    uint32_t maxConsecutiveTimeouts = 3;
};

/* Tracks achieved per-mode frame rate against the target rate.
   Record methods are called from the scheduling thread only and never block,
   getters read published values and can be called from any thread.
   The advisory handler runs on the recording thread, it must not block. */
class HealthMonitor
{
public:
    HealthMonitor(const ModeSet& modes, uint32_t periodUs,
            const HealthParams& params);

    HealthMonitor() = delete;
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Has to be set before recording starts
    void SetAdvisoryHandler(const AdvisoryHandler& handler);

    // Each mode repeats once per cycle through the mode set
    uint32_t GetTargetIntervalUs() const
    { return m_targetIntervalUs; }

    void RecordFrame(Mode mode, uint64_t tickIndex, uint64_t timestampUs);
    void RecordTimeout(Mode mode, uint64_t tickIndex);

    bool IsHealthy(Mode mode) const;
    // Zero until at least one interval is known
    double GetAverageIntervalUs(Mode mode) const;
    double GetAchievedRateHz(Mode mode) const;

    size_t GetTimeoutCount(Mode mode) const;
    size_t GetLongestTimeoutRun(Mode mode) const;
    double GetAvgTimeoutSpacing(Mode mode) const;

private:
    struct ModeHealth
    {
        // Owned by the recording thread
        bool enabled = false;
        std::deque<uint64_t> intervalsUs;
        uint64_t intervalsSumUs = 0;
        uint64_t lastTimestampUs = 0;
        bool hasTimestamp = false;
        uint32_t consecutiveTimeouts = 0;
        // Indices counted in cycles of the mode, not global ticks
        MissedTickTracker timeouts;

        // Published for other threads
        std::atomic<bool> healthy{ true };
        std::atomic<double> avgIntervalUs{ 0.0 };
        std::atomic<size_t> timeoutCount{ 0 };
        std::atomic<size_t> longestTimeoutRun{ 0 };
        std::atomic<double> avgTimeoutSpacing{ 0.0 };
    };

private:
    bool Evaluate(const ModeHealth& health) const;
    // Raises an advisory if health state of the mode flipped
    void UpdateState(Mode mode, ModeHealth& health);

private:
    const size_t m_modeCount;
    const uint32_t m_targetIntervalUs;
    const HealthParams m_params;

    AdvisoryHandler m_advisoryHandler;

    std::array<ModeHealth, ModeCount> m_health;
};

} // namespace o2

#endif /* O2_HEALTH_MONITOR_H */
