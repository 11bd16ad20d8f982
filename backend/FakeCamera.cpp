#include "FakeCamera.h"

/* System */
#include <algorithm>
#include <chrono>
#include <thread>

/* Local */
#include "Log.h"
#include "Timer.h"
#include "Utils.h"

constexpr uint64_t o2::FakeCamera::NoFault;

o2::FakeCamera::FakeCamera(uint16_t width, uint16_t height)
    : m_width(width),
    m_height(height),
    m_frameGenThread(nullptr),
    m_mutex(),
    m_exposureCond(),
    m_frameCond(),
    m_isRunning(false),
    m_frameGenStopFlag(true),
    m_fault(false),
    m_errorMessage(),
    m_exposures(),
    m_frames(),
    m_droppedExposures(),
    m_delayedExposures(),
    m_readoutDelayUs(0),
    m_faultAfterFrames(NoFault),
    m_deliveredCount(0),
    m_exposureCount(0),
    m_generatedCount(0)
{
}

o2::FakeCamera::~FakeCamera()
{
    Stop();
}

void o2::FakeCamera::SetDroppedExposures(const std::set<uint64_t>& exposureIndices)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_droppedExposures = exposureIndices;
}

void o2::FakeCamera::SetDelayedExposures(const std::set<uint64_t>& exposureIndices,
        uint32_t delayUs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_delayedExposures = exposureIndices;
    m_readoutDelayUs = delayUs;
}

void o2::FakeCamera::SetFaultAfterFrames(uint64_t frameCount)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faultAfterFrames = frameCount;
}

void o2::FakeCamera::InjectFrame(std::unique_ptr<Frame> frame)
{
    if (!frame)
        return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frames.push_back(std::move(frame));
    }
    m_frameCond.notify_all();
}

uint16_t o2::FakeCamera::GetPixelValue(uint8_t lines, uint32_t frameNr)
{
    return (uint16_t)(((uint16_t)lines << 8) | (frameNr & 0xFF));
}

void o2::FakeCamera::OnExposureScheduled(uint64_t startUs, uint64_t endUs,
        uint8_t lines)
{
    UNUSED(startUs);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_isRunning)
            return;
        const uint64_t index = m_exposureCount++;
        if (m_droppedExposures.count(index) > 0)
        {
            Log::LogD("Fake camera skips exposure %llu", (unsigned long long)index);
            return;
        }
        uint64_t readyUs = endUs;
        if (m_delayedExposures.count(index) > 0)
            readyUs += m_readoutDelayUs;
        m_exposures.push_back(Exposure{ (uint32_t)(index + 1), readyUs, lines });
    }
    m_exposureCond.notify_all();
}

bool o2::FakeCamera::Start()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_isRunning)
        return true;

    m_fault = false;
    m_errorMessage.clear();
    m_exposures.clear();
    m_deliveredCount = 0;
    m_exposureCount = 0;
    m_frameGenStopFlag = false;

    m_frameGenThread =
        new(std::nothrow) std::thread(&FakeCamera::FrameGeneratorLoop, this);
    if (!m_frameGenThread)
    {
        Log::LogE("Failed to start the acquisition");
        return false;
    }

    m_isRunning = true;
    Log::LogI("Using fake camera with %ux%u sensor", m_width, m_height);
    return true;
}

bool o2::FakeCamera::Stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_isRunning)
            return true;
        m_frameGenStopFlag = true;
        m_isRunning = false;
    }
    m_exposureCond.notify_all();
    m_frameCond.notify_all();

    if (m_frameGenThread)
    {
        if (m_frameGenThread->joinable())
            m_frameGenThread->join();
        delete m_frameGenThread;
        m_frameGenThread = nullptr;
    }
    return true;
}

bool o2::FakeCamera::IsRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_isRunning;
}

o2::PullStatus o2::FakeCamera::PullFrame(uint32_t timeoutUs,
        std::unique_ptr<Frame>& frame)
{
    std::unique_lock<std::mutex> lock(m_mutex);

    m_frameCond.wait_for(lock, std::chrono::microseconds(timeoutUs), [this]() {
        return (!m_frames.empty() || m_fault);
    });

    if (!m_frames.empty())
    {
        frame = std::move(m_frames.front());
        m_frames.pop_front();
        return PullStatus::Frame;
    }
    if (m_fault)
    {
        Log::LogE("Failure pulling frame (%s)", m_errorMessage.c_str());
        return PullStatus::Fault;
    }
    return PullStatus::Timeout;
}

size_t o2::FakeCamera::DiscardQueuedFrames()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t count = m_frames.size();
    m_frames.clear();
    m_exposures.clear();
    return count;
}

std::string o2::FakeCamera::GetErrorMessage() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorMessage;
}

std::vector<o2::DeviceSetting> o2::FakeCamera::GetSettings() const
{
    return {
        { "camera", "Fake camera" },
        { "sensor", std::to_string(m_width) + "x" + std::to_string(m_height) },
    };
}

void o2::FakeCamera::FrameGeneratorLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_frameGenStopFlag)
    {
        if (m_exposures.empty())
        {
            m_exposureCond.wait(lock, [this]() {
                return (m_frameGenStopFlag || !m_exposures.empty());
            });
            continue;
        }

        const Exposure exposure = m_exposures.front();
        const uint64_t nowUs = NowUs();
        if (nowUs < exposure.readyUs)
        {
            // Readout is done when the exposure window closes
            m_exposureCond.wait_for(lock,
                    std::chrono::microseconds(exposure.readyUs - nowUs),
                    [this]() { return !!m_frameGenStopFlag; });
            continue;
        }
        m_exposures.pop_front();

        if (m_fault)
            continue;
        if (m_deliveredCount >= m_faultAfterFrames)
        {
            m_fault = true;
            m_errorMessage = "Simulated camera link loss";
            m_frameCond.notify_all();
            continue;
        }

        auto frame = std::make_unique<Frame>(m_width, m_height);
        std::fill(frame->GetData(), frame->GetData() + frame->GetPixelCount(),
                GetPixelValue(exposure.lines, exposure.frameNr));
        frame->SetInfo(Frame::Info(exposure.frameNr, NowUs()));

        m_frames.push_back(std::move(frame));
        m_deliveredCount++;
        m_generatedCount++;
        m_frameCond.notify_all();
    }
}
