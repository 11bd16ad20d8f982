#pragma once
#ifndef O2_TRIGGER_DRIVER_H
#define O2_TRIGGER_DRIVER_H

/* System */
#include <cstdint>
#include <memory>
#include <string>

/* Local */
#include "LineMap.h"
#include "TriggerPattern.h"

namespace o2 {

// Digital output device asserting illumination and exposure trigger lines
class TriggerDriver
{
public:
    virtual ~TriggerDriver()
    {}

public:
    // Binds the driver to given device using given line assignment
    virtual bool Open(const std::string& device,
            std::shared_ptr<const LineMap> lineMap) = 0;
    virtual bool IsOpen() const = 0;
    virtual bool Close() = 0;

    /* Queues the pattern to run right after the previously asserted one,
       or immediately if the output is idle. Does not wait for the pattern
       to complete. On success startUs holds the host time (see NowUs) the
       pattern starts at. Failure means the device link is lost. */
    virtual bool AssertPattern(const TriggerPattern& pattern, uint64_t& startUs) = 0;

    // Stops any queued output and drives all lines low
    virtual bool Release() = 0;

    virtual std::string GetErrorMessage() const = 0;
};

} // namespace o2

#endif /* O2_TRIGGER_DRIVER_H */
