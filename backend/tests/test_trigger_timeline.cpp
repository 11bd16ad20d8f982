#include "gtest/gtest.h"

#include "TriggerTimeline.h"

TEST(trigger_timeline, patterns_queued_back_to_back)
{
    o2::TriggerTimeline timeline(2000);
    ASSERT_FALSE(timeline.IsRunning());
    ASSERT_FALSE(timeline.HasRunDry(0));
    ASSERT_EQ(timeline.GetEndUs(), 0);

    timeline.Start(1000000);
    ASSERT_EQ(timeline.Append(100000), 1000000);
    ASSERT_EQ(timeline.Append(100000), 1100000);
    ASSERT_EQ(timeline.GetEndUs(), 1200000);

    // Next write lands before the queue plays out
    ASSERT_FALSE(timeline.HasRunDry(1150000));
    ASSERT_EQ(timeline.GetStartCount(), 1);
}

TEST(trigger_timeline, played_out_stream_restarted)
{
    o2::TriggerTimeline timeline(2000);

    timeline.Start(0);
    timeline.Append(10000);

    // Within the lead the stream would underflow before the write lands
    ASSERT_TRUE(timeline.HasRunDry(8500));
    // Missed frame, deadline two periods later
    ASSERT_TRUE(timeline.HasRunDry(20000));

    timeline.Stop();
    ASSERT_FALSE(timeline.HasRunDry(20000));
    timeline.Start(20500);
    ASSERT_EQ(timeline.Append(10000), 20500);
    ASSERT_EQ(timeline.GetStartCount(), 2);

    timeline.Reset();
    ASSERT_FALSE(timeline.IsRunning());
    ASSERT_EQ(timeline.GetStartCount(), 0);
}

TEST(trigger_timeline, zero_lead)
{
    o2::TriggerTimeline timeline(0);

    timeline.Start(100);
    timeline.Append(50);
    ASSERT_FALSE(timeline.HasRunDry(150));
    ASSERT_TRUE(timeline.HasRunDry(151));
}
