#include "LiveFeed.h"

/* System */
#include <chrono>

/* Local */
#include "Log.h"
#include "Timer.h"

o2::LiveFeed::LiveFeed(double maxFps)
    : m_minSpacingUs((maxFps > 0.0) ? (uint32_t)(1000000.0 / maxFps) : 0),
    m_listener(nullptr),
    m_mutex(),
    m_thread(nullptr),
    m_abortFlag(false),
    m_processWaitingFrame(false),
    m_frameMutex(),
    m_frameCond(),
    m_frame(),
    m_deliveredCount(0),
    m_replacedCount(0)
{
}

o2::LiveFeed::~LiveFeed()
{
    Stop();
}

bool o2::LiveFeed::Start(ILiveFeedListener* listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_thread)
        return true;

    if (!listener)
    {
        Log::LogE("Cannot start live feed without listener");
        return false;
    }

    m_listener = listener;
    m_abortFlag = false;
    m_processWaitingFrame = false;
    {
        std::lock_guard<std::mutex> frameLock(m_frameMutex);
        m_frame.reset();
    }

    m_thread = new(std::nothrow) std::thread(&LiveFeed::ThreadLoop, this);
    if (!m_thread)
    {
        Log::LogE("Failed to start live feed thread");
        m_listener = nullptr;
        return false;
    }

    return true;
}

bool o2::LiveFeed::IsRunning() const
{
    return !!m_thread;
}

void o2::LiveFeed::Stop(bool processWaitingFrame)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_thread)
        return;

    {
        std::lock_guard<std::mutex> frameLock(m_frameMutex);
        m_processWaitingFrame = processWaitingFrame;
        m_abortFlag = true;
    }
    m_frameCond.notify_one();

    if (m_thread->joinable())
        m_thread->join();
    delete m_thread;
    m_thread = nullptr;

    m_listener = nullptr;
    std::lock_guard<std::mutex> frameLock(m_frameMutex);
    m_frame.reset();
}

void o2::LiveFeed::InputNewFrame(std::shared_ptr<const Frame> frame)
{
    if (!frame)
        return;

    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        if (m_abortFlag)
            return;
        if (m_frame)
            m_replacedCount++;
        m_frame = std::move(frame);
    }
    m_frameCond.notify_one();
}

void o2::LiveFeed::ThreadLoop()
{
    uint64_t lastDeliveryUs = 0;

    while (true)
    {
        std::shared_ptr<const Frame> frame;
        {
            std::unique_lock<std::mutex> lock(m_frameMutex);
            m_frameCond.wait(lock, [this]() {
                return (m_abortFlag || m_frame);
            });
            if (m_abortFlag)
            {
                if (m_processWaitingFrame && m_frame)
                {
                    frame = std::move(m_frame);
                    m_frame.reset();
                    lock.unlock();
                    m_listener->OnLiveFrame(this, frame);
                    m_deliveredCount++;
                }
                break;
            }

            if (m_minSpacingUs > 0 && lastDeliveryUs > 0)
            {
                const uint64_t nextUs = lastDeliveryUs + m_minSpacingUs;
                const uint64_t waitUs = UsUntil(nextUs);
                if (waitUs > 0)
                {
                    // Newer frames may replace the waiting one meanwhile
                    m_frameCond.wait_for(lock, std::chrono::microseconds(waitUs),
                            [this]() { return !!m_abortFlag; });
                    continue;
                }
            }

            frame = std::move(m_frame);
            m_frame.reset();
        }

        m_listener->OnLiveFrame(this, frame);
        m_deliveredCount++;
        lastDeliveryUs = NowUs();
    }
}
