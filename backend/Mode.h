#pragma once
#ifndef O2_MODE_H
#define O2_MODE_H

/* System */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace o2 {

// Illumination condition a frame is acquired under
enum class Mode : uint8_t
{
    Bioluminescence,
    Blue,
    Green,
};

constexpr size_t ModeCount = 3;

// Ordered set of modes cycled in round-robin during one run
using ModeSet = std::vector<Mode>;

struct ModeInfo
{
    const char* name;
    // False for modes without own illumination line
    bool illuminated;
    uint32_t defaultExposureUs;
    // Upper limit of exposure relative to the acquisition period
    double maxExposureFraction;
};

const ModeInfo& GetModeInfo(Mode mode);

inline const char* GetModeName(Mode mode)
{ return GetModeInfo(mode).name; }

inline size_t GetModeIndex(Mode mode)
{ return static_cast<size_t>(mode); }

// All known modes in declaration order
const std::vector<Mode>& GetAllModes();

// Case-insensitive, accepts "biolum" as alias
bool ParseMode(const std::string& name, Mode& mode);

// Parses comma-separated list of mode names, no validation of the result
bool ParseModeSet(const std::string& names, ModeSet& modes);

std::string ModeSetToString(const ModeSet& modes);

// Checks the set is non-empty and without duplicates
bool ValidateModeSet(const ModeSet& modes, std::string& reason);

} // namespace o2

#endif /* O2_MODE_H */
