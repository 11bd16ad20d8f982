#include "RunConfig.h"

/* System */
#include <cmath>

/* Local */
#include "PatternEncoder.h"

constexpr double o2::RunConfig::MinFrequencyHz;
constexpr double o2::RunConfig::MaxFrequencyHz;
constexpr size_t o2::RunConfig::DefaultMaxQueuedBytes;

o2::RunConfig::RunConfig()
    : m_frequencyHz(1.0),
    m_modes(),
    m_exposuresUs(),
    m_saveEnabled(false),
    m_saveDir("."),
    m_storageType(StorageType::Tiff),
    m_maxQueuedBytes(DefaultMaxQueuedBytes),
    m_device("IOIFAST"),
    m_lineMapType(LineMapType::SharedPort),
    m_settleMarginUs(PatternEncoder::DefaultSettleMarginUs),
    m_tickCount(0),
    m_frameTimeoutPeriods(2.0),
    m_healthParams(),
    m_ignoreReadiness(false),
    m_liveMaxFps(0.0)
{
    m_exposuresUs.fill(0);
}

o2::RunConfig::~RunConfig()
{
}

uint32_t o2::RunConfig::GetPeriodUs() const
{
    if (m_frequencyHz <= 0.0)
        return 0;
    return (uint32_t)std::llround(1000000.0 / m_frequencyHz);
}

bool o2::RunConfig::Validate(std::string& reason) const
{
    if (!ValidateModeSet(m_modes, reason))
        return false;

    if (!(m_frequencyHz >= MinFrequencyHz && m_frequencyHz <= MaxFrequencyHz))
    {
        reason = "Frequency " + std::to_string(m_frequencyHz)
            + " Hz is out of range";
        return false;
    }

    if (GetPeriodUs() <= m_settleMarginUs)
    {
        reason = "Period leaves no room for exposure";
        return false;
    }

    if (m_device.empty())
    {
        reason = "No trigger device given";
        return false;
    }

    if (m_saveEnabled && m_storageType != StorageType::None && m_saveDir.empty())
    {
        reason = "Saving enabled without save directory";
        return false;
    }

    if (m_frameTimeoutPeriods < 1.0)
    {
        reason = "Frame timeout has to be at least one period";
        return false;
    }

    if (m_healthParams.windowSize == 0)
    {
        reason = "Health window cannot be empty";
        return false;
    }

    return true;
}
