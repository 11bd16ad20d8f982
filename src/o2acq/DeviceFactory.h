#pragma once
#ifndef O2_DEVICE_FACTORY_H
#define O2_DEVICE_FACTORY_H

/* System */
#include <memory>
#include <string>

/* Local */
#include "backend/FrameAcquirer.h"
#include "backend/ModeScheduler.h"
#include "backend/OptionController.h"
#include "backend/TriggerDriver.h"

namespace o2 {

// Option ids of device specific options, see OptionId::CustomBase
enum class DeviceOptionId : uint32_t
{
    Camera = (uint32_t)OptionId::CustomBase + 0x100,
    CameraTemperature,
    EmGain,
    SimSpeedup,
    SimSensorSize,
    AmpGain,
};

// Supplies trigger output and camera for one executable flavor
class DeviceFactory
{
public:
    virtual ~DeviceFactory()
    {}

public:
    virtual const char* GetName() const = 0;

    virtual bool AddOptions(OptionController& controller) = 0;

    // Opens and configures devices, called once options were processed
    virtual bool Open() = 0;
    virtual void Close() = 0;

    virtual std::shared_ptr<TriggerDriver> GetTriggerDriver() const = 0;
    virtual std::shared_ptr<FrameAcquirer> GetFrameAcquirer() const = 0;
    // Empty check means the devices are always ready
    virtual ReadinessCheck GetReadinessCheck() const = 0;
};

// Implemented once per executable
std::unique_ptr<DeviceFactory> CreateDeviceFactory();

} // namespace o2

#endif /* O2_DEVICE_FACTORY_H */
