#pragma once
#ifndef O2_LINE_MAP_H
#define O2_LINE_MAP_H

/* System */
#include <cstdint>
#include <memory>
#include <string>

/* Local */
#include "Mode.h"

namespace o2 {

enum class LineMapType : int32_t
{
    // One 8-bit port, bit0 reserved for bioluminescence, bit1 blue,
    // bit2 green, bit4 exposure trigger
    SharedPort,
    // Four lines, line0 exposure trigger, line1 bioluminescence, line2 blue,
    // line3 green
    DiscreteLines,
};

const char* GetLineMapTypeName(LineMapType type);
bool ParseLineMapType(const std::string& name, LineMapType& type);

// Assignment of modes and exposure trigger to digital output lines.
// Masks are in terms of the samples written to the output channel.
class LineMap
{
public:
    static std::unique_ptr<LineMap> Create(LineMapType type);

public:
    virtual ~LineMap()
    {}

    virtual LineMapType GetType() const = 0;

    virtual uint8_t GetExposureTriggerMask() const = 0;
    // Zero for modes without illumination line
    virtual uint8_t GetModeMask(Mode mode) const = 0;
    // Physical channel on given device, e.g. "Dev1/port0"
    virtual std::string GetChannelName(const std::string& device) const = 0;

    // Union of all mode masks
    uint8_t GetAllModesMask() const;
};

class SharedPortLineMap final : public LineMap
{
public:
    virtual LineMapType GetType() const override
    { return LineMapType::SharedPort; }

    virtual uint8_t GetExposureTriggerMask() const override;
    virtual uint8_t GetModeMask(Mode mode) const override;
    virtual std::string GetChannelName(const std::string& device) const override;
};

class DiscreteLinesLineMap final : public LineMap
{
public:
    virtual LineMapType GetType() const override
    { return LineMapType::DiscreteLines; }

    virtual uint8_t GetExposureTriggerMask() const override;
    virtual uint8_t GetModeMask(Mode mode) const override;
    virtual std::string GetChannelName(const std::string& device) const override;
};

} // namespace o2

#endif /* O2_LINE_MAP_H */
