/* System */
#include <functional>
#include <memory>
#include <string>
#include <vector>

/* Local */
#include "DeviceFactory.h"
#include "backend/FakeCamera.h"
#include "backend/FakeTriggerDriver.h"
#include "backend/Log.h"
#include "backend/Utils.h"

namespace {

class SimulatedDevices final : public o2::DeviceFactory
{
public:
    SimulatedDevices()
        : m_speedup(1.0),
        m_width(512),
        m_height(512)
    {}

    virtual ~SimulatedDevices()
    {
        Close();
    }

public:
    virtual const char* GetName() const override
    { return "Simulated camera and trigger output"; }

    virtual bool AddOptions(o2::OptionController& controller) override
    {
        using namespace std::placeholders;

        const o2::Option speedupOption(
            { "--sim-speedup" },
            { "factor" },
            { "1" },
            "Plays trigger patterns faster than real time by given factor.",
            (uint32_t)o2::DeviceOptionId::SimSpeedup,
            std::bind(&SimulatedDevices::HandleSpeedup, this, _1));
        if (!controller.AddOption(speedupOption))
            return false;

        const o2::Option sizeOption(
            { "--sim-sensor" },
            { "width", "height" },
            { "512", "512" },
            "Size of simulated frames.",
            (uint32_t)o2::DeviceOptionId::SimSensorSize,
            std::bind(&SimulatedDevices::HandleSensorSize, this, _1));
        if (!controller.AddOption(sizeOption))
            return false;

        return true;
    }

    virtual bool Open() override
    {
        m_camera = std::make_shared<o2::FakeCamera>(m_width, m_height);
        m_driver = std::make_shared<o2::FakeTriggerDriver>(m_camera, m_speedup);
        o2::Log::LogI("Simulating %ux%u sensor, speedup %.1fx",
                m_width, m_height, m_speedup);
        return true;
    }

    virtual void Close() override
    {
        m_driver.reset();
        m_camera.reset();
    }

    virtual std::shared_ptr<o2::TriggerDriver> GetTriggerDriver() const override
    { return m_driver; }

    virtual std::shared_ptr<o2::FrameAcquirer> GetFrameAcquirer() const override
    { return m_camera; }

    virtual o2::ReadinessCheck GetReadinessCheck() const override
    { return o2::ReadinessCheck(); }

private:
    bool HandleSpeedup(const std::string& value)
    {
        double speedup;
        if (!o2::StrToDouble(value, speedup) || speedup < 1.0)
            return false;
        m_speedup = speedup;
        return true;
    }

    bool HandleSensorSize(const std::string& value)
    {
        const std::vector<std::string> values =
            o2::SplitString(value, o2::Option::ValuesSeparator);
        if (values.size() != 2)
            return false;
        uint16_t width;
        uint16_t height;
        if (!o2::StrToNumber<uint16_t>(values[0], width) || width == 0)
            return false;
        if (!o2::StrToNumber<uint16_t>(values[1], height) || height == 0)
            return false;
        m_width = width;
        m_height = height;
        return true;
    }

private:
    double m_speedup;
    uint16_t m_width;
    uint16_t m_height;

    std::shared_ptr<o2::FakeCamera> m_camera;
    std::shared_ptr<o2::FakeTriggerDriver> m_driver;
};

} // namespace

std::unique_ptr<o2::DeviceFactory> o2::CreateDeviceFactory()
{
    return std::unique_ptr<DeviceFactory>(new SimulatedDevices());
}
