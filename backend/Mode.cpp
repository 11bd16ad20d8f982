#include "Mode.h"

/* System */
#include <array>

/* Local */
#include "Utils.h"

namespace {

const std::array<o2::ModeInfo, o2::ModeCount> g_modeInfos = {{
    { "Bioluminescence", false, 700000, 0.9 },
    { "Blue",            true,   10000, 0.9 },
    { "Green",           true,   10000, 0.9 },
}};

} // namespace

const o2::ModeInfo& o2::GetModeInfo(Mode mode)
{
    return g_modeInfos.at(GetModeIndex(mode));
}

const std::vector<o2::Mode>& o2::GetAllModes()
{
    static const std::vector<Mode> modes = {
        Mode::Bioluminescence,
        Mode::Blue,
        Mode::Green,
    };
    return modes;
}

bool o2::ParseMode(const std::string& name, Mode& mode)
{
    const std::string lowerName = ToLower(name);

    if (lowerName == "biolum")
    {
        mode = Mode::Bioluminescence;
        return true;
    }

    for (Mode m : GetAllModes())
    {
        if (lowerName == ToLower(GetModeName(m)))
        {
            mode = m;
            return true;
        }
    }
    return false;
}

bool o2::ParseModeSet(const std::string& names, ModeSet& modes)
{
    ModeSet parsed;
    // Spaces around names are allowed, e.g. "blue, green"
    for (const std::string& name : SplitString(names, ','))
    {
        Mode mode;
        if (!ParseMode(TrimString(name), mode))
            return false;
        parsed.push_back(mode);
    }
    modes = parsed;
    return true;
}

std::string o2::ModeSetToString(const ModeSet& modes)
{
    std::vector<std::string> names;
    for (Mode mode : modes)
        names.push_back(GetModeName(mode));
    return JoinStrings(names, ',');
}

bool o2::ValidateModeSet(const ModeSet& modes, std::string& reason)
{
    if (modes.empty())
    {
        reason = "No mode selected";
        return false;
    }

    std::array<bool, ModeCount> seen{};
    for (Mode mode : modes)
    {
        bool& wasSeen = seen.at(GetModeIndex(mode));
        if (wasSeen)
        {
            reason = std::string("Mode ") + GetModeName(mode) + " selected twice";
            return false;
        }
        wasSeen = true;
    }
    return true;
}
