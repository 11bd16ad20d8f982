#pragma once
#ifndef O2_TRIGGER_PATTERN_H
#define O2_TRIGGER_PATTERN_H

/* System */
#include <cstdint>
#include <vector>

/* Local */
#include "Mode.h"

namespace o2 {

// Digital line states for one acquisition period.
// Phases follow each other without gaps, starting at offset 0.
class TriggerPattern
{
public:
    struct Phase
    {
        uint8_t lines;
        uint32_t durationUs;
    };

public:
    TriggerPattern();
    TriggerPattern(Mode mode, uint32_t periodUs, uint32_t requestedExposureUs,
            uint32_t exposureUs, const std::vector<Phase>& phases);

    Mode GetMode() const
    { return m_mode; }
    uint32_t GetPeriodUs() const
    { return m_periodUs; }
    // Exposure as asked for by the operator or mode default
    uint32_t GetRequestedExposureUs() const
    { return m_requestedExposureUs; }
    // Exposure actually asserted on the trigger line
    uint32_t GetExposureUs() const
    { return m_exposureUs; }
    bool IsExposureClamped() const
    { return m_exposureUs < m_requestedExposureUs; }

    const std::vector<Phase>& GetPhases() const
    { return m_phases; }

    // Sum of all phase durations
    uint32_t GetTotalDurationUs() const;
    // Line state at given offset from pattern start, zero past the end
    uint8_t GetLinesAt(uint32_t offsetUs) const;

    // Converts phases to per-sample line states for a clocked output,
    // phase boundaries are rounded to the nearest sample
    bool Rasterize(uint32_t sampleRateHz, std::vector<uint8_t>& samples) const;

private:
    Mode m_mode;
    uint32_t m_periodUs;
    uint32_t m_requestedExposureUs;
    uint32_t m_exposureUs;
    std::vector<Phase> m_phases;
};

} // namespace o2

#endif /* O2_TRIGGER_PATTERN_H */
