#pragma once
#ifndef O2_RUN_SETTINGS_H
#define O2_RUN_SETTINGS_H

/* System */
#include <string>

/* Local */
#include "OptionController.h"
#include "RunConfig.h"

namespace o2 {

// Validating writer of run parameters, filled from CLI options or directly
class RunSettings : public RunConfig
{
public:
    RunSettings();
    virtual ~RunSettings();

public:
    // Registers CLI options bound to setters below
    bool AddOptions(OptionController& controller);

public:
    bool SetFrequencyHz(double value);
    bool SetModes(const ModeSet& value);
    // Zero restores the mode default
    bool SetExposureUs(Mode mode, uint32_t value);

    bool SetSaveEnabled(bool value);
    bool SetSaveDir(const std::string& value);
    bool SetStorageType(StorageType value);
    bool SetMaxQueuedBytes(size_t value);

    bool SetDevice(const std::string& value);
    bool SetLineMapType(LineMapType value);
    bool SetSettleMarginUs(uint32_t value);

    bool SetTickCount(uint64_t value);
    bool SetFrameTimeoutPeriods(double value);
    bool SetHealthParams(const HealthParams& value);

    bool SetIgnoreReadiness(bool value);
    bool SetLiveMaxFps(double value);

private:
    bool HandleFrequency(const std::string& value);
    bool HandleModes(const std::string& value);
    bool HandleExposure(const std::string& value);
    bool HandleBiolumExposure(const std::string& value);
    bool HandleFluoExposure(const std::string& value);
    bool HandleSaveEnabled(const std::string& value);
    bool HandleSaveDir(const std::string& value);
    bool HandleStorageType(const std::string& value);
    bool HandleDevice(const std::string& value);
    bool HandleLineMap(const std::string& value);
    bool HandleTickCount(const std::string& value);
    bool HandleFrameTimeout(const std::string& value);
    bool HandleIgnoreReadiness(const std::string& value);
    bool HandleLiveMaxFps(const std::string& value);

    // Parses milliseconds, fractions allowed
    static bool ParseExposureMs(const std::string& value, uint32_t& exposureUs);
};

} // namespace o2

#endif /* O2_RUN_SETTINGS_H */
