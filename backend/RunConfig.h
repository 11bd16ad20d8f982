#pragma once
#ifndef O2_RUN_CONFIG_H
#define O2_RUN_CONFIG_H

/* System */
#include <array>
#include <cstdint>
#include <string>

/* Local */
#include "HealthMonitor.h"
#include "LineMap.h"
#include "Mode.h"
#include "StackFile.h"

namespace o2 {

// Related to Option::GetId
enum class OptionId : uint32_t
{
    Unknown = 0,
    Help = 1,
    Frequency,
    Modes,
    Exposure,
    BiolumExposure,
    FluoExposure,
    SaveEnabled,
    SaveDir,
    StorageType,
    Device,
    LineMap,
    TickCount,
    FrameTimeout,
    IgnoreReadiness,
    LiveMaxFps,

    // Has to be last one, the app can use CustomBase+N for custom options
    CustomBase = 0x80000
};

// Parameters of one run, read-only once handed over to a session
class RunConfig
{
public:
    static constexpr double MinFrequencyHz = 0.1;
    static constexpr double MaxFrequencyHz = 100.0;
    static constexpr size_t DefaultMaxQueuedBytes = (size_t)512 << 20;

public:
    RunConfig();
    virtual ~RunConfig();

public:
    double GetFrequencyHz() const
    { return m_frequencyHz; }
    // Whole microseconds of one tick
    uint32_t GetPeriodUs() const;

    const ModeSet& GetModes() const
    { return m_modes; }
    // Zero selects the mode default
    uint32_t GetExposureUs(Mode mode) const
    { return m_exposuresUs[GetModeIndex(mode)]; }

    bool GetSaveEnabled() const
    { return m_saveEnabled; }
    const std::string& GetSaveDir() const
    { return m_saveDir; }
    StorageType GetStorageType() const
    { return m_storageType; }
    // True if frames are actually written somewhere
    bool IsStoring() const
    { return m_saveEnabled && m_storageType != StorageType::None; }
    size_t GetMaxQueuedBytes() const
    { return m_maxQueuedBytes; }

    const std::string& GetDevice() const
    { return m_device; }
    LineMapType GetLineMapType() const
    { return m_lineMapType; }
    uint32_t GetSettleMarginUs() const
    { return m_settleMarginUs; }

    // Zero runs until stopped
    uint64_t GetTickCount() const
    { return m_tickCount; }
    double GetFrameTimeoutPeriods() const
    { return m_frameTimeoutPeriods; }
    const HealthParams& GetHealthParams() const
    { return m_healthParams; }

    bool GetIgnoreReadiness() const
    { return m_ignoreReadiness; }
    double GetLiveMaxFps() const
    { return m_liveMaxFps; }

    // Checks cross-field consistency, fills reason on failure
    bool Validate(std::string& reason) const;

protected:
    double m_frequencyHz;
    ModeSet m_modes;
    std::array<uint32_t, ModeCount> m_exposuresUs;

    bool m_saveEnabled;
    std::string m_saveDir;
    StorageType m_storageType;
    size_t m_maxQueuedBytes;

    std::string m_device;
    LineMapType m_lineMapType;
    uint32_t m_settleMarginUs;

    uint64_t m_tickCount;
    double m_frameTimeoutPeriods;
    HealthParams m_healthParams;

    bool m_ignoreReadiness;
    double m_liveMaxFps;
};

} // namespace o2

#endif /* O2_RUN_CONFIG_H */
