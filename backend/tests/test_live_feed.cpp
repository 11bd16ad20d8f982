#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include "gtest/gtest.h"

#include "LiveFeed.h"
#include "TestUtils.h"

namespace {

class CollectingListener final : public o2::ILiveFeedListener
{
public:
    virtual void OnLiveFrame(o2::LiveFeed* sender,
            std::shared_ptr<const o2::Frame> frame) override
    {
        (void)sender;
        std::unique_lock<std::mutex> lock(m_mutex);
        m_ticks.push_back(frame->GetTickIndex());
        m_cond.notify_all();
        // Simulates slow consumer
        m_cond.wait(lock, [this]() { return !m_blocked; });
    }

    void SetBlocked(bool blocked)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_blocked = blocked;
        }
        m_cond.notify_all();
    }

    bool WaitForCount(size_t count)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cond.wait_for(lock, std::chrono::seconds(2), [&]() {
            return m_ticks.size() >= count;
        });
    }

    std::vector<uint64_t> GetTicks()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_ticks;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_blocked = false;
    std::vector<uint64_t> m_ticks;
};

std::shared_ptr<const o2::Frame> CreateLiveFrame(uint64_t tickIndex)
{
    return o2::test::CreateFrame(4, 4, o2::Mode::Blue, tickIndex, 0);
}

} // namespace

TEST(live_feed, delivers_frames)
{
    CollectingListener listener;
    o2::LiveFeed feed;

    ASSERT_TRUE(feed.Start(&listener));
    ASSERT_TRUE(feed.IsRunning());

    feed.InputNewFrame(CreateLiveFrame(7));
    ASSERT_TRUE(listener.WaitForCount(1));
    feed.InputNewFrame(CreateLiveFrame(8));
    ASSERT_TRUE(listener.WaitForCount(2));

    feed.Stop();
    ASSERT_FALSE(feed.IsRunning());
    ASSERT_EQ(listener.GetTicks(), (std::vector<uint64_t>{ 7, 8 }));
    ASSERT_EQ(feed.GetDeliveredCount(), 2);
    ASSERT_EQ(feed.GetReplacedCount(), 0);
}

TEST(live_feed, newest_frame_wins)
{
    CollectingListener listener;
    o2::LiveFeed feed;
    ASSERT_TRUE(feed.Start(&listener));

    listener.SetBlocked(true);
    feed.InputNewFrame(CreateLiveFrame(1));
    ASSERT_TRUE(listener.WaitForCount(1));

    // Consumer is busy with the first frame
    feed.InputNewFrame(CreateLiveFrame(2));
    feed.InputNewFrame(CreateLiveFrame(3));
    ASSERT_EQ(feed.GetReplacedCount(), 1);

    listener.SetBlocked(false);
    ASSERT_TRUE(listener.WaitForCount(2));

    feed.Stop();
    ASSERT_EQ(listener.GetTicks(), (std::vector<uint64_t>{ 1, 3 }));
}

TEST(live_feed, stop_with_waiting_frame)
{
    for (bool processWaitingFrame : { false, true })
    {
        CollectingListener listener;
        // One frame per 10 seconds, the second one keeps waiting
        o2::LiveFeed feed(0.1);
        ASSERT_TRUE(feed.Start(&listener));

        feed.InputNewFrame(CreateLiveFrame(1));
        ASSERT_TRUE(listener.WaitForCount(1));
        feed.InputNewFrame(CreateLiveFrame(2));

        feed.Stop(processWaitingFrame);
        const size_t expected = (processWaitingFrame) ? 2 : 1;
        ASSERT_EQ(listener.GetTicks().size(), expected);
        ASSERT_EQ(feed.GetDeliveredCount(), expected);
    }
}

TEST(live_feed, start_requires_listener)
{
    o2::LiveFeed feed;
    ASSERT_FALSE(feed.Start(nullptr));
    ASSERT_FALSE(feed.IsRunning());

    // Frames are ignored after stop
    CollectingListener listener;
    ASSERT_TRUE(feed.Start(&listener));
    feed.Stop();
    feed.InputNewFrame(CreateLiveFrame(1));
    ASSERT_EQ(feed.GetDeliveredCount(), 0);
}
