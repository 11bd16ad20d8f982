/* System */
#include <functional>
#include <memory>
#include <string>

/* Local */
#include "DeviceFactory.h"
#include "backend/Log.h"
#include "backend/NidaqTriggerDriver.h"
#include "backend/PvcamCamera.h"
#include "backend/Utils.h"

namespace {

// Target sensor temperature the camera cools to before a run may start
constexpr double DefaultCameraTemperatureC = -60.0;

class HardwareDevices final : public o2::DeviceFactory
{
public:
    HardwareDevices()
        : m_cameraIndex(0),
        m_temperatureC(DefaultCameraTemperatureC),
        m_emGain(0),
        m_ampGain(0),
        m_isLibInitialized(false)
    {}

    virtual ~HardwareDevices()
    {
        Close();
    }

public:
    virtual const char* GetName() const override
    { return "PVCAM camera with NI-DAQmx trigger output"; }

    virtual bool AddOptions(o2::OptionController& controller) override
    {
        using namespace std::placeholders;

        const o2::Option cameraOption(
            { "--camera", "-c" },
            { "index" },
            { "0" },
            "Zero-based index of the PVCAM camera to use.",
            (uint32_t)o2::DeviceOptionId::Camera,
            std::bind(&HardwareDevices::HandleCamera, this, _1));
        if (!controller.AddOption(cameraOption))
            return false;

        const o2::Option tempOption(
            { "--camera-temp" },
            { "celsius" },
            { "-60" },
            "Sensor temperature setpoint. The run starts only when the sensor\n"
            "reached it, unless readiness is ignored.",
            (uint32_t)o2::DeviceOptionId::CameraTemperature,
            std::bind(&HardwareDevices::HandleTemperature, this, _1));
        if (!controller.AddOption(tempOption))
            return false;

        const o2::Option gainOption(
            { "--em-gain" },
            { "value" },
            { "0" },
            "EM gain multiplication factor, zero keeps the camera setting.",
            (uint32_t)o2::DeviceOptionId::EmGain,
            std::bind(&HardwareDevices::HandleEmGain, this, _1));
        if (!controller.AddOption(gainOption))
            return false;

        const o2::Option ampGainOption(
            { "--amp-gain" },
            { "index" },
            { "0" },
            "One-based analog amplifier gain index, zero keeps the camera\n"
            "setting.",
            (uint32_t)o2::DeviceOptionId::AmpGain,
            std::bind(&HardwareDevices::HandleAmpGain, this, _1));
        if (!controller.AddOption(ampGainOption))
            return false;

        return true;
    }

    virtual bool Open() override
    {
        if (!o2::PvcamCamera::Initialize())
            return false;
        m_isLibInitialized = true;

        auto camera = std::make_shared<o2::PvcamCamera>();

        int16 count = 0;
        if (!camera->GetCameraCount(count))
            return false;
        if (m_cameraIndex >= count)
        {
            o2::Log::LogE("Camera index %d out of range, %d camera(s) found",
                    (int)m_cameraIndex, (int)count);
            return false;
        }

        if (!camera->Open(m_cameraIndex))
            return false;
        if (!camera->SetTemperatureSetpoint(m_temperatureC))
            return false;
        if (m_emGain > 0 && !camera->SetEmGain(m_emGain))
            return false;
        if (m_ampGain > 0 && !camera->SetAmpGain(m_ampGain))
            return false;

        m_camera = camera;
        m_driver = std::make_shared<o2::NidaqTriggerDriver>();
        return true;
    }

    virtual void Close() override
    {
        m_driver.reset();
        if (m_camera)
        {
            m_camera->Close();
            m_camera.reset();
        }
        if (m_isLibInitialized)
        {
            o2::PvcamCamera::Uninitialize();
            m_isLibInitialized = false;
        }
    }

    virtual std::shared_ptr<o2::TriggerDriver> GetTriggerDriver() const override
    { return m_driver; }

    virtual std::shared_ptr<o2::FrameAcquirer> GetFrameAcquirer() const override
    { return m_camera; }

    virtual o2::ReadinessCheck GetReadinessCheck() const override
    {
        std::shared_ptr<o2::PvcamCamera> camera = m_camera;
        return [camera](std::string& reason) {
            if (!camera)
            {
                reason = "Camera not open";
                return false;
            }
            return camera->IsTemperatureStable(reason);
        };
    }

private:
    bool HandleCamera(const std::string& value)
    {
        return o2::StrToNumber<int16>(value, m_cameraIndex) && m_cameraIndex >= 0;
    }

    bool HandleTemperature(const std::string& value)
    {
        return o2::StrToDouble(value, m_temperatureC);
    }

    bool HandleEmGain(const std::string& value)
    {
        return o2::StrToNumber<uint16_t>(value, m_emGain);
    }

    bool HandleAmpGain(const std::string& value)
    {
        return o2::StrToNumber<int16>(value, m_ampGain) && m_ampGain >= 0;
    }

private:
    int16 m_cameraIndex;
    double m_temperatureC;
    uint16_t m_emGain;
    int16 m_ampGain;

    bool m_isLibInitialized;
    std::shared_ptr<o2::PvcamCamera> m_camera;
    std::shared_ptr<o2::NidaqTriggerDriver> m_driver;
};

} // namespace

std::unique_ptr<o2::DeviceFactory> o2::CreateDeviceFactory()
{
    return std::unique_ptr<DeviceFactory>(new HardwareDevices());
}
