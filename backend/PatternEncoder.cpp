#include "PatternEncoder.h"

/* System */
#include <algorithm>
#include <cmath>

constexpr uint32_t o2::PatternEncoder::DefaultSettleMarginUs;

o2::PatternEncoder::PatternEncoder(std::shared_ptr<const LineMap> lineMap,
        uint32_t settleMarginUs)
    : m_lineMap(lineMap),
    m_settleMarginUs(settleMarginUs)
{
}

uint32_t o2::PatternEncoder::GetMaxExposureUs(Mode mode, uint32_t periodUs) const
{
    if (periodUs <= m_settleMarginUs)
        return 0;

    const double fraction = GetModeInfo(mode).maxExposureFraction;
    const uint32_t fractionLimitUs =
        static_cast<uint32_t>(std::floor(periodUs * fraction));
    return std::min(fractionLimitUs, periodUs - m_settleMarginUs);
}

bool o2::PatternEncoder::Encode(Mode mode, uint32_t periodUs,
        uint32_t exposureUs, TriggerPattern& pattern) const
{
    const uint32_t maxExposureUs = GetMaxExposureUs(mode, periodUs);
    if (maxExposureUs == 0)
        return false;

    const uint32_t requestedUs = (exposureUs > 0)
        ? exposureUs
        : GetModeInfo(mode).defaultExposureUs;
    const uint32_t activeUs = std::min(requestedUs, maxExposureUs);

    const uint8_t activeLines = static_cast<uint8_t>(
            m_lineMap->GetModeMask(mode) | m_lineMap->GetExposureTriggerMask());

    const std::vector<TriggerPattern::Phase> phases = {
        { activeLines, activeUs },
        { 0, periodUs - activeUs },
    };

    pattern = TriggerPattern(mode, periodUs, requestedUs, activeUs, phases);
    return true;
}
