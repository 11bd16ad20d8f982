#include "FakeTriggerDriver.h"

/* System */
#include <cmath>

/* Local */
#include "Log.h"
#include "Timer.h"

constexpr size_t o2::FakeTriggerDriver::NoFault;

o2::FakeTriggerDriver::FakeTriggerDriver(
        std::shared_ptr<IExposureListener> listener, double timeScale)
    : m_listener(listener),
    m_timeScale((timeScale > 0.0) ? timeScale : 1.0),
    m_mutex(),
    m_lineMap(),
    m_channel(),
    m_isOpen(false),
    m_released(true),
    m_timeline(0),
    m_faultOnAssert(NoFault),
    m_errorMessage(),
    m_history()
{
}

o2::FakeTriggerDriver::~FakeTriggerDriver()
{
    Close();
}

void o2::FakeTriggerDriver::SetFaultOnAssert(size_t assertIndex)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faultOnAssert = assertIndex;
}

std::vector<o2::FakeTriggerDriver::AssertRecord>
    o2::FakeTriggerDriver::GetHistory() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

size_t o2::FakeTriggerDriver::GetAssertCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

bool o2::FakeTriggerDriver::IsReleased() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_released;
}

uint64_t o2::FakeTriggerDriver::GetStreamStartCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timeline.GetStartCount();
}

bool o2::FakeTriggerDriver::Open(const std::string& device,
        std::shared_ptr<const LineMap> lineMap)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_isOpen)
        return true;

    if (device.empty() || !lineMap)
    {
        m_errorMessage = "No device or line map given";
        Log::LogE("Failure opening fake trigger output (%s)", m_errorMessage.c_str());
        return false;
    }

    m_lineMap = lineMap;
    m_channel = lineMap->GetChannelName(device);
    m_isOpen = true;
    m_released = true;
    m_timeline.Reset();
    m_errorMessage.clear();

    Log::LogI("Using fake trigger output on '%s' (%s line map, time scale %g)",
            m_channel.c_str(), GetLineMapTypeName(lineMap->GetType()), m_timeScale);
    return true;
}

bool o2::FakeTriggerDriver::IsOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_isOpen;
}

bool o2::FakeTriggerDriver::Close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_isOpen = false;
    m_lineMap.reset();
    return true;
}

bool o2::FakeTriggerDriver::AssertPattern(const TriggerPattern& pattern,
        uint64_t& startUs)
{
    uint64_t exposureStartUs = 0;
    uint64_t exposureEndUs = 0;
    uint8_t exposureLines = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_isOpen)
        {
            m_errorMessage = "Output not open";
            Log::LogE("Failure asserting pattern (%s)", m_errorMessage.c_str());
            return false;
        }
        if (m_history.size() >= m_faultOnAssert)
        {
            m_errorMessage = "Simulated device link loss";
            Log::LogE("Failure asserting pattern (%s)", m_errorMessage.c_str());
            return false;
        }

        // Queued right behind the previous pattern unless the output idles
        const uint64_t nowUs = NowUs();
        if (m_timeline.HasRunDry(nowUs))
        {
            Log::LogD("Fake trigger stream played out, restarting it");
            m_timeline.Stop();
        }
        if (!m_timeline.IsRunning())
            m_timeline.Start(nowUs);
        startUs = m_timeline.Append(Scale(pattern.GetTotalDurationUs()));
        m_released = false;

        const uint8_t triggerMask = m_lineMap->GetExposureTriggerMask();
        uint64_t offsetUs = startUs;
        for (const TriggerPattern::Phase& phase : pattern.GetPhases())
        {
            const uint64_t phaseEndUs = offsetUs + Scale(phase.durationUs);
            if ((phase.lines & triggerMask) && exposureEndUs == 0)
            {
                exposureStartUs = offsetUs;
                exposureEndUs = phaseEndUs;
                exposureLines = phase.lines;
            }
            offsetUs = phaseEndUs;
        }

        AssertRecord record;
        record.mode = pattern.GetMode();
        record.exposureUs = pattern.GetExposureUs();
        record.clamped = pattern.IsExposureClamped();
        record.lines = exposureLines;
        record.startUs = startUs;
        m_history.push_back(record);
    }

    if (m_listener && exposureEndUs > 0)
        m_listener->OnExposureScheduled(exposureStartUs, exposureEndUs, exposureLines);

    return true;
}

bool o2::FakeTriggerDriver::Release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    // Queued output is cut short
    m_timeline.Stop();
    m_released = true;
    return true;
}

std::string o2::FakeTriggerDriver::GetErrorMessage() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorMessage;
}

uint64_t o2::FakeTriggerDriver::Scale(uint32_t durationUs) const
{
    return (uint64_t)std::llround(durationUs / m_timeScale);
}
