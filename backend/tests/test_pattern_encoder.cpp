#include <algorithm>
#include <vector>

#include "gtest/gtest.h"

#include "LineMap.h"
#include "PatternEncoder.h"
#include "TriggerPattern.h"

namespace {

o2::PatternEncoder CreateEncoder(o2::LineMapType type)
{
    return o2::PatternEncoder(o2::LineMap::Create(type));
}

} // namespace

TEST(pattern_encoder, illuminated_mode)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::SharedPort);

    o2::TriggerPattern pattern;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Blue, 1000000, 10000, pattern));

    ASSERT_EQ(pattern.GetMode(), o2::Mode::Blue);
    ASSERT_EQ(pattern.GetExposureUs(), 10000);
    ASSERT_FALSE(pattern.IsExposureClamped());
    ASSERT_EQ(pattern.GetTotalDurationUs(), 1000000);

    const auto& phases = pattern.GetPhases();
    ASSERT_EQ(phases.size(), 2);
    ASSERT_EQ(phases[0].lines, 0x12); // Blue and trigger
    ASSERT_EQ(phases[0].durationUs, 10000);
    ASSERT_EQ(phases[1].lines, 0x00);
    ASSERT_EQ(phases[1].durationUs, 990000);
}

TEST(pattern_encoder, mode_without_illumination_line)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::SharedPort);

    o2::TriggerPattern pattern;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Bioluminescence, 1000000, 0, pattern));

    // Only the exposure trigger is asserted, default exposure used
    ASSERT_EQ(pattern.GetPhases()[0].lines, 0x10);
    ASSERT_EQ(pattern.GetExposureUs(), 700000);
    ASSERT_FALSE(pattern.IsExposureClamped());
}

TEST(pattern_encoder, discrete_lines)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::DiscreteLines);

    o2::TriggerPattern pattern;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Green, 500000, 20000, pattern));
    ASSERT_EQ(pattern.GetPhases()[0].lines, 0x09);
    ASSERT_EQ(pattern.GetPhases()[0].durationUs, 20000);

    ASSERT_TRUE(encoder.Encode(o2::Mode::Bioluminescence, 1000000, 0, pattern));
    ASSERT_EQ(pattern.GetPhases()[0].lines, 0x03);
}

TEST(pattern_encoder, long_exposure_clamped)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::SharedPort);

    // 10 Hz with default 700 ms bioluminescence exposure
    o2::TriggerPattern pattern;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Bioluminescence, 100000, 0, pattern));

    ASSERT_TRUE(pattern.IsExposureClamped());
    ASSERT_EQ(pattern.GetRequestedExposureUs(), 700000);
    ASSERT_EQ(pattern.GetExposureUs(), 90000);
    ASSERT_EQ(pattern.GetTotalDurationUs(), 100000);
    ASSERT_EQ(pattern.GetPhases()[1].durationUs, 10000);
}

TEST(pattern_encoder, settle_margin_limits_exposure)
{
    // Settle margin larger than the fractional headroom
    const o2::PatternEncoder encoder(
            o2::LineMap::Create(o2::LineMapType::SharedPort), 20000);

    ASSERT_EQ(encoder.GetMaxExposureUs(o2::Mode::Blue, 100000), 80000);

    o2::TriggerPattern pattern;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Blue, 100000, 95000, pattern));
    ASSERT_TRUE(pattern.IsExposureClamped());
    ASSERT_EQ(pattern.GetExposureUs(), 80000);
}

TEST(pattern_encoder, period_too_short)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::SharedPort);

    o2::TriggerPattern pattern;
    ASSERT_FALSE(encoder.Encode(o2::Mode::Blue, 1000, 10, pattern));
    ASSERT_FALSE(encoder.Encode(o2::Mode::Blue, 0, 10, pattern));
}

TEST(pattern_encoder, deterministic)
{
    const o2::PatternEncoder encoder = CreateEncoder(o2::LineMapType::SharedPort);

    o2::TriggerPattern first;
    o2::TriggerPattern second;
    ASSERT_TRUE(encoder.Encode(o2::Mode::Green, 250000, 15000, first));
    ASSERT_TRUE(encoder.Encode(o2::Mode::Green, 250000, 15000, second));

    ASSERT_EQ(first.GetPhases().size(), second.GetPhases().size());
    for (size_t n = 0; n < first.GetPhases().size(); n++)
    {
        ASSERT_EQ(first.GetPhases()[n].lines, second.GetPhases()[n].lines);
        ASSERT_EQ(first.GetPhases()[n].durationUs, second.GetPhases()[n].durationUs);
    }
}

TEST(pattern_encoder, all_modes_line_maps_and_periods)
{
    const o2::LineMapType lineMapTypes[] = {
        o2::LineMapType::SharedPort,
        o2::LineMapType::DiscreteLines,
    };
    const uint32_t periodsUs[] = {
        2000, 3333, 10000, 33333, 100000, 142857, 500000, 1000000, 10000000,
    };
    const uint32_t exposuresUs[] = { 0, 1, 999, 5000, 80000, 700000, 20000000 };

    for (o2::LineMapType type : lineMapTypes)
    {
        const o2::PatternEncoder encoder = CreateEncoder(type);
        const o2::LineMap& lineMap = encoder.GetLineMap();
        const uint8_t triggerMask = lineMap.GetExposureTriggerMask();
        const uint8_t modesMask = lineMap.GetAllModesMask();

        for (o2::Mode mode : o2::GetAllModes())
        {
            const uint8_t modeMask = lineMap.GetModeMask(mode);
            const double maxFraction = o2::GetModeInfo(mode).maxExposureFraction;

            for (uint32_t periodUs : periodsUs)
            {
                const uint32_t maxExposureUs = encoder.GetMaxExposureUs(mode, periodUs);
                ASSERT_GT(maxExposureUs, 0u);
                ASSERT_LE(maxExposureUs, periodUs * maxFraction);
                ASSERT_LE(maxExposureUs, periodUs - encoder.GetSettleMarginUs());

                for (uint32_t exposureUs : exposuresUs)
                {
                    o2::TriggerPattern pattern;
                    ASSERT_TRUE(encoder.Encode(mode, periodUs, exposureUs, pattern));

                    const uint32_t requestedUs = (exposureUs > 0)
                        ? exposureUs : o2::GetModeInfo(mode).defaultExposureUs;
                    ASSERT_EQ(pattern.GetRequestedExposureUs(), requestedUs);
                    ASSERT_EQ(pattern.GetExposureUs(),
                            std::min(requestedUs, maxExposureUs));
                    ASSERT_EQ(pattern.IsExposureClamped(),
                            requestedUs > maxExposureUs);

                    uint64_t totalUs = 0;
                    uint32_t triggeredUs = 0;
                    for (const o2::TriggerPattern::Phase& phase : pattern.GetPhases())
                    {
                        totalUs += phase.durationUs;
                        // Only the line of this mode, and only while exposing
                        ASSERT_EQ(phase.lines & modesMask & ~modeMask, 0);
                        if (phase.lines & modesMask)
                            ASSERT_NE(phase.lines & triggerMask, 0);
                        if (phase.lines & triggerMask)
                        {
                            ASSERT_EQ(phase.lines & modesMask, modeMask);
                            triggeredUs += phase.durationUs;
                        }
                    }
                    ASSERT_EQ(totalUs, periodUs);
                    ASSERT_EQ(pattern.GetTotalDurationUs(), periodUs);
                    ASSERT_EQ(triggeredUs, pattern.GetExposureUs());
                    // Pattern ends with all lines low
                    ASSERT_EQ(pattern.GetPhases().back().lines, 0);
                }
            }
        }
    }
}

TEST(trigger_pattern, rasterize)
{
    const o2::TriggerPattern pattern(o2::Mode::Blue, 10000, 2400, 2400,
            { { 0x12, 2400 }, { 0x00, 7600 } });

    std::vector<uint8_t> samples;
    ASSERT_TRUE(pattern.Rasterize(1000, samples));

    // 2.4 ms rounds to 2 samples, total stays at 10 samples
    ASSERT_EQ(samples.size(), 10);
    ASSERT_EQ(samples[0], 0x12);
    ASSERT_EQ(samples[1], 0x12);
    ASSERT_EQ(samples[2], 0x00);
    ASSERT_EQ(samples[9], 0x00);

    ASSERT_EQ(pattern.GetLinesAt(0), 0x12);
    ASSERT_EQ(pattern.GetLinesAt(2399), 0x12);
    ASSERT_EQ(pattern.GetLinesAt(2400), 0x00);
    ASSERT_EQ(pattern.GetLinesAt(10000), 0x00);

    ASSERT_FALSE(pattern.Rasterize(0, samples));
}
