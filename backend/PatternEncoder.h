#pragma once
#ifndef O2_PATTERN_ENCODER_H
#define O2_PATTERN_ENCODER_H

/* System */
#include <cstdint>
#include <memory>

/* Local */
#include "LineMap.h"
#include "Mode.h"
#include "TriggerPattern.h"

namespace o2 {

// Maps mode, period and exposure to the digital pattern of one tick.
// Stateless apart from configuration, safe to call from any thread.
class PatternEncoder
{
public:
    // One sample of the 1 kHz digital output clock
    static constexpr uint32_t DefaultSettleMarginUs = 1000;

public:
    explicit PatternEncoder(std::shared_ptr<const LineMap> lineMap,
            uint32_t settleMarginUs = DefaultSettleMarginUs);

    PatternEncoder() = delete;

    const LineMap& GetLineMap() const
    { return *m_lineMap; }
    uint32_t GetSettleMarginUs() const
    { return m_settleMarginUs; }

    // Longest exposure that fits the period for given mode
    uint32_t GetMaxExposureUs(Mode mode, uint32_t periodUs) const;

    /* Builds two phases, the exposure window with mode lines and trigger
       asserted followed by all lines low for the rest of the period.
       Exposure of zero selects the mode default. Too long exposure is clamped
       and the pattern reports it via TriggerPattern::IsExposureClamped.
       Returns false if the period leaves no room for any exposure. */
    bool Encode(Mode mode, uint32_t periodUs, uint32_t exposureUs,
            TriggerPattern& pattern) const;

private:
    const std::shared_ptr<const LineMap> m_lineMap;
    const uint32_t m_settleMarginUs;
};

} // namespace o2

#endif /* O2_PATTERN_ENCODER_H */
