#include "RunSettings.h"

/* System */
#include <cmath>
#include <functional>
#include <limits>

/* Local */
#include "Log.h"
#include "Utils.h"

o2::RunSettings::RunSettings()
    : RunConfig()
{
}

o2::RunSettings::~RunSettings()
{
}

bool o2::RunSettings::AddOptions(OptionController& controller)
{
    using namespace std::placeholders;

    const std::string modeNames =
        std::string(GetModeName(Mode::Bioluminescence)) + ", "
        + GetModeName(Mode::Blue) + ", " + GetModeName(Mode::Green);

    const std::vector<Option> options = {
        { { "--frequency", "-f" }, { "Hz" }, { "1" },
            "Trigger frequency, each enabled mode repeats at frequency divided\n"
            "by the number of modes. Valid range is 0.1 to 100 Hz.",
            (uint32_t)OptionId::Frequency,
            std::bind(&RunSettings::HandleFrequency, this, _1) },
        { { "--modes", "-m" }, { "list" }, { "" },
            "Comma-separated list of modes cycled in given order.\n"
            "Supported modes: " + modeNames + ".",
            (uint32_t)OptionId::Modes,
            std::bind(&RunSettings::HandleModes, this, _1) },
        { { "--exposure" }, { "mode", "ms" }, { "", "0" },
            "Exposure of given mode in milliseconds, zero means mode default.\n"
            "Exposure not fitting the period is shortened.",
            (uint32_t)OptionId::Exposure,
            std::bind(&RunSettings::HandleExposure, this, _1) },
        { { "--biolum-exposure" }, { "ms" }, { "700" },
            "Exposure of bioluminescence mode in milliseconds.",
            (uint32_t)OptionId::BiolumExposure,
            std::bind(&RunSettings::HandleBiolumExposure, this, _1) },
        { { "--fluo-exposure" }, { "ms" }, { "10" },
            "Exposure of all fluorescence modes in milliseconds.",
            (uint32_t)OptionId::FluoExposure,
            std::bind(&RunSettings::HandleFluoExposure, this, _1) },
        { { "--save", "-s" }, { "" }, { "false" },
            "Stores frames of each mode to its own stack file.",
            (uint32_t)OptionId::SaveEnabled,
            std::bind(&RunSettings::HandleSaveEnabled, this, _1) },
        { { "--save-dir" }, { "folder" }, { "." },
            "Folder for stack files, created when missing.",
            (uint32_t)OptionId::SaveDir,
            std::bind(&RunSettings::HandleSaveDir, this, _1) },
        { { "--storage" }, { "type" }, { "tiff" },
            "Stack file format, one of tiff, raw or none.",
            (uint32_t)OptionId::StorageType,
            std::bind(&RunSettings::HandleStorageType, this, _1) },
        { { "--device", "-d" }, { "name" }, { "IOIFAST" },
            "Digital output device driving trigger and illumination lines.",
            (uint32_t)OptionId::Device,
            std::bind(&RunSettings::HandleDevice, this, _1) },
        { { "--line-map" }, { "type" }, { "shared-port" },
            "Digital line assignment, shared-port or discrete-lines.",
            (uint32_t)OptionId::LineMap,
            std::bind(&RunSettings::HandleLineMap, this, _1) },
        { { "--ticks", "-n" }, { "count" }, { "0" },
            "Number of triggers to issue, zero runs until interrupted.",
            (uint32_t)OptionId::TickCount,
            std::bind(&RunSettings::HandleTickCount, this, _1) },
        { { "--frame-timeout" }, { "periods" }, { "2" },
            "How many periods to wait for a frame before the tick is lost.",
            (uint32_t)OptionId::FrameTimeout,
            std::bind(&RunSettings::HandleFrameTimeout, this, _1) },
        { { "--ignore-readiness" }, { "" }, { "false" },
            "Starts even if the camera sensor temperature is not stable.",
            (uint32_t)OptionId::IgnoreReadiness,
            std::bind(&RunSettings::HandleIgnoreReadiness, this, _1) },
        { { "--live-fps" }, { "fps" }, { "0" },
            "Limits rate of live frame updates, zero means no limit.",
            (uint32_t)OptionId::LiveMaxFps,
            std::bind(&RunSettings::HandleLiveMaxFps, this, _1) },
    };

    for (const Option& option : options)
    {
        if (!controller.AddOption(option))
            return false;
    }
    return true;
}

bool o2::RunSettings::SetFrequencyHz(double value)
{
    if (!(value >= MinFrequencyHz && value <= MaxFrequencyHz))
    {
        Log::LogE("Frequency %g Hz out of range <%g, %g>", value,
                MinFrequencyHz, MaxFrequencyHz);
        return false;
    }
    m_frequencyHz = value;
    return true;
}

bool o2::RunSettings::SetModes(const ModeSet& value)
{
    std::string reason;
    if (!ValidateModeSet(value, reason))
    {
        Log::LogE(reason);
        return false;
    }
    m_modes = value;
    return true;
}

bool o2::RunSettings::SetExposureUs(Mode mode, uint32_t value)
{
    m_exposuresUs[GetModeIndex(mode)] = value;
    return true;
}

bool o2::RunSettings::SetSaveEnabled(bool value)
{
    m_saveEnabled = value;
    return true;
}

bool o2::RunSettings::SetSaveDir(const std::string& value)
{
    if (value.empty())
    {
        Log::LogE("Save directory cannot be empty");
        return false;
    }
    m_saveDir = value;
    return true;
}

bool o2::RunSettings::SetStorageType(StorageType value)
{
    m_storageType = value;
    return true;
}

bool o2::RunSettings::SetMaxQueuedBytes(size_t value)
{
    m_maxQueuedBytes = value;
    return true;
}

bool o2::RunSettings::SetDevice(const std::string& value)
{
    if (value.empty())
    {
        Log::LogE("Device name cannot be empty");
        return false;
    }
    m_device = value;
    return true;
}

bool o2::RunSettings::SetLineMapType(LineMapType value)
{
    m_lineMapType = value;
    return true;
}

bool o2::RunSettings::SetSettleMarginUs(uint32_t value)
{
    m_settleMarginUs = value;
    return true;
}

bool o2::RunSettings::SetTickCount(uint64_t value)
{
    m_tickCount = value;
    return true;
}

bool o2::RunSettings::SetFrameTimeoutPeriods(double value)
{
    if (!(value >= 1.0))
    {
        Log::LogE("Frame timeout %g is below one period", value);
        return false;
    }
    m_frameTimeoutPeriods = value;
    return true;
}

bool o2::RunSettings::SetHealthParams(const HealthParams& value)
{
    if (value.windowSize == 0 || value.tolerance <= 0.0
            || value.maxConsecutiveTimeouts == 0)
    {
        Log::LogE("Invalid health monitoring parameters");
        return false;
    }
    m_healthParams = value;
    return true;
}

bool o2::RunSettings::SetIgnoreReadiness(bool value)
{
    m_ignoreReadiness = value;
    return true;
}

bool o2::RunSettings::SetLiveMaxFps(double value)
{
    if (value < 0.0)
        return false;
    m_liveMaxFps = value;
    return true;
}

bool o2::RunSettings::HandleFrequency(const std::string& value)
{
    double frequency;
    if (!StrToDouble(value, frequency))
        return false;
    return SetFrequencyHz(frequency);
}

bool o2::RunSettings::HandleModes(const std::string& value)
{
    ModeSet modes;
    if (!ParseModeSet(value, modes))
        return false;
    return SetModes(modes);
}

bool o2::RunSettings::HandleExposure(const std::string& value)
{
    const std::vector<std::string> values =
        SplitString(value, Option::ValuesSeparator);
    if (values.size() != 2)
    {
        Log::LogE("Exposure requires mode and time separated by '%c'",
                Option::ValuesSeparator);
        return false;
    }

    Mode mode;
    if (!ParseMode(values[0], mode))
        return false;

    uint32_t exposureUs;
    if (!ParseExposureMs(values[1], exposureUs))
        return false;

    return SetExposureUs(mode, exposureUs);
}

bool o2::RunSettings::HandleBiolumExposure(const std::string& value)
{
    uint32_t exposureUs;
    if (!ParseExposureMs(value, exposureUs))
        return false;
    return SetExposureUs(Mode::Bioluminescence, exposureUs);
}

bool o2::RunSettings::HandleFluoExposure(const std::string& value)
{
    uint32_t exposureUs;
    if (!ParseExposureMs(value, exposureUs))
        return false;

    for (Mode mode : GetAllModes())
    {
        if (GetModeInfo(mode).illuminated)
            SetExposureUs(mode, exposureUs);
    }
    return true;
}

bool o2::RunSettings::HandleSaveEnabled(const std::string& value)
{
    bool enabled;
    if (!StrToBool(value, enabled))
        return false;
    return SetSaveEnabled(enabled);
}

bool o2::RunSettings::HandleSaveDir(const std::string& value)
{
    return SetSaveDir(value);
}

bool o2::RunSettings::HandleStorageType(const std::string& value)
{
    StorageType type;
    if (!ParseStorageType(value, type))
        return false;
    return SetStorageType(type);
}

bool o2::RunSettings::HandleDevice(const std::string& value)
{
    return SetDevice(value);
}

bool o2::RunSettings::HandleLineMap(const std::string& value)
{
    LineMapType type;
    if (!ParseLineMapType(value, type))
        return false;
    return SetLineMapType(type);
}

bool o2::RunSettings::HandleTickCount(const std::string& value)
{
    uint64_t count;
    if (!StrToNumber<uint64_t>(value, count))
        return false;
    return SetTickCount(count);
}

bool o2::RunSettings::HandleFrameTimeout(const std::string& value)
{
    double periods;
    if (!StrToDouble(value, periods))
        return false;
    return SetFrameTimeoutPeriods(periods);
}

bool o2::RunSettings::HandleIgnoreReadiness(const std::string& value)
{
    bool ignore;
    if (!StrToBool(value, ignore))
        return false;
    return SetIgnoreReadiness(ignore);
}

bool o2::RunSettings::HandleLiveMaxFps(const std::string& value)
{
    double fps;
    if (!StrToDouble(value, fps))
        return false;
    return SetLiveMaxFps(fps);
}

bool o2::RunSettings::ParseExposureMs(const std::string& value,
        uint32_t& exposureUs)
{
    double ms;
    if (!StrToDouble(value, ms) || ms < 0.0
            || ms * 1000.0 > std::numeric_limits<uint32_t>::max())
    {
        Log::LogE("Invalid exposure time '%s' ms", value.c_str());
        return false;
    }
    exposureUs = (uint32_t)std::llround(ms * 1000.0);
    return true;
}
