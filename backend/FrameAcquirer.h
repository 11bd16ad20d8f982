#pragma once
#ifndef O2_FRAME_ACQUIRER_H
#define O2_FRAME_ACQUIRER_H

/* System */
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/* Local */
#include "Frame.h"

namespace o2 {

enum class PullStatus
{
    Frame,
    Timeout,
    Fault,
};

// Name and value of one device setting
using DeviceSetting = std::pair<std::string, std::string>;

// Camera delivering externally triggered frames.
// Sensor, gain and cooling are configured before it is handed to a session.
class FrameAcquirer
{
public:
    virtual ~FrameAcquirer()
    {}

public:
    // Arms the camera to expose on trigger
    virtual bool Start() = 0;
    virtual bool Stop() = 0;
    virtual bool IsRunning() const = 0;

    // Blocks until a frame arrives, the timeout expires or the device fails
    virtual PullStatus PullFrame(uint32_t timeoutUs, std::unique_ptr<Frame>& frame) = 0;

    // Drops frames already delivered but not pulled, returns their count
    virtual size_t DiscardQueuedFrames() = 0;

    virtual std::string GetErrorMessage() const = 0;

    // Current settings recorded with each run, in display order
    virtual std::vector<DeviceSetting> GetSettings() const = 0;
};

} // namespace o2

#endif /* O2_FRAME_ACQUIRER_H */
