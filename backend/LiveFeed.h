#pragma once
#ifndef O2_LIVE_FEED_H
#define O2_LIVE_FEED_H

/* System */
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

/* Local */
#include "Frame.h"

namespace o2 {

class LiveFeed;

class ILiveFeedListener
{
public:
    virtual ~ILiveFeedListener()
    {}

    virtual void OnLiveFrame(LiveFeed* sender,
            std::shared_ptr<const Frame> frame) = 0;
};

// Single-slot mailbox handing the newest routed frame to a display consumer.
// A frame arriving before the previous one was taken replaces it.
class LiveFeed final
{
public:
    // Zero max. rate delivers every frame the consumer manages to take
    explicit LiveFeed(double maxFps = 0.0);
    ~LiveFeed();

    LiveFeed(const LiveFeed&) = delete;
    LiveFeed& operator=(const LiveFeed&) = delete;

public:
    bool Start(ILiveFeedListener* listener);
    bool IsRunning() const;
    void Stop(bool processWaitingFrame = false);

    // Never blocks the caller
    void InputNewFrame(std::shared_ptr<const Frame> frame);

    uint64_t GetDeliveredCount() const
    { return m_deliveredCount; }
    uint64_t GetReplacedCount() const
    { return m_replacedCount; }

private:
    void ThreadLoop();

private:
    const uint32_t m_minSpacingUs;
    ILiveFeedListener* m_listener;

    std::mutex m_mutex; // Covers start and stop

    std::thread* m_thread;
    std::atomic<bool> m_abortFlag;
    std::atomic<bool> m_processWaitingFrame;

    std::mutex m_frameMutex; // Covers only m_frame
    std::condition_variable m_frameCond;
    std::shared_ptr<const Frame> m_frame;

    std::atomic<uint64_t> m_deliveredCount;
    std::atomic<uint64_t> m_replacedCount;
};

} // namespace o2

#endif /* O2_LIVE_FEED_H */
