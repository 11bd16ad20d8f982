#include "TriggerPattern.h"

/* Local */
#include "Log.h"

o2::TriggerPattern::TriggerPattern()
    : m_mode(Mode::Bioluminescence),
    m_periodUs(0),
    m_requestedExposureUs(0),
    m_exposureUs(0),
    m_phases()
{
}

o2::TriggerPattern::TriggerPattern(Mode mode, uint32_t periodUs,
        uint32_t requestedExposureUs, uint32_t exposureUs,
        const std::vector<Phase>& phases)
    : m_mode(mode),
    m_periodUs(periodUs),
    m_requestedExposureUs(requestedExposureUs),
    m_exposureUs(exposureUs),
    m_phases(phases)
{
}

uint32_t o2::TriggerPattern::GetTotalDurationUs() const
{
    uint32_t total = 0;
    for (const Phase& phase : m_phases)
        total += phase.durationUs;
    return total;
}

uint8_t o2::TriggerPattern::GetLinesAt(uint32_t offsetUs) const
{
    uint32_t phaseStartUs = 0;
    for (const Phase& phase : m_phases)
    {
        if (offsetUs < phaseStartUs + phase.durationUs)
            return phase.lines;
        phaseStartUs += phase.durationUs;
    }
    return 0;
}

bool o2::TriggerPattern::Rasterize(uint32_t sampleRateHz,
        std::vector<uint8_t>& samples) const
{
    if (sampleRateHz == 0 || sampleRateHz > 1000000)
    {
        Log::LogE("Unsupported sample rate %u Hz", sampleRateHz);
        return false;
    }

    // Phase boundaries are rounded to the nearest sample so the rounding
    // error does not accumulate over phases
    auto toSamples = [sampleRateHz](uint64_t offsetUs) {
        return (size_t)((offsetUs * sampleRateHz + 500000) / 1000000);
    };

    samples.clear();
    samples.reserve(toSamples(GetTotalDurationUs()));
    uint64_t phaseStartUs = 0;
    for (const Phase& phase : m_phases)
    {
        const uint64_t phaseEndUs = phaseStartUs + phase.durationUs;
        const size_t count = toSamples(phaseEndUs) - toSamples(phaseStartUs);
        samples.insert(samples.end(), count, phase.lines);
        phaseStartUs = phaseEndUs;
    }
    return true;
}
