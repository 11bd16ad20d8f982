#include "LineMap.h"

/* Local */
#include "Utils.h"

const char* o2::GetLineMapTypeName(LineMapType type)
{
    switch (type)
    {
    case LineMapType::SharedPort:
        return "shared-port";
    case LineMapType::DiscreteLines:
        return "discrete-lines";
    }
    return "<unknown>";
}

bool o2::ParseLineMapType(const std::string& name, LineMapType& type)
{
    const std::string lowerName = ToLower(name);
    for (LineMapType t : { LineMapType::SharedPort, LineMapType::DiscreteLines })
    {
        if (lowerName == GetLineMapTypeName(t))
        {
            type = t;
            return true;
        }
    }
    return false;
}

std::unique_ptr<o2::LineMap> o2::LineMap::Create(LineMapType type)
{
    switch (type)
    {
    case LineMapType::SharedPort:
        return std::make_unique<SharedPortLineMap>();
    case LineMapType::DiscreteLines:
        return std::make_unique<DiscreteLinesLineMap>();
    }
    return nullptr;
}

uint8_t o2::LineMap::GetAllModesMask() const
{
    uint8_t mask = 0;
    for (Mode mode : GetAllModes())
        mask |= GetModeMask(mode);
    return mask;
}

uint8_t o2::SharedPortLineMap::GetExposureTriggerMask() const
{
    return 1 << 4;
}

uint8_t o2::SharedPortLineMap::GetModeMask(Mode mode) const
{
    switch (mode)
    {
    case Mode::Bioluminescence:
        return 0; // bit0 is reserved, nothing is driven
    case Mode::Blue:
        return 1 << 1;
    case Mode::Green:
        return 1 << 2;
    }
    return 0;
}

std::string o2::SharedPortLineMap::GetChannelName(const std::string& device) const
{
    return device + "/port0";
}

uint8_t o2::DiscreteLinesLineMap::GetExposureTriggerMask() const
{
    return 1 << 0;
}

uint8_t o2::DiscreteLinesLineMap::GetModeMask(Mode mode) const
{
    switch (mode)
    {
    case Mode::Bioluminescence:
        return 1 << 1;
    case Mode::Blue:
        return 1 << 2;
    case Mode::Green:
        return 1 << 3;
    }
    return 0;
}

std::string o2::DiscreteLinesLineMap::GetChannelName(const std::string& device) const
{
    return device + "/port0/line0:3";
}
