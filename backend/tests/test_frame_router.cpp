#include <memory>

#include "gtest/gtest.h"

#include "FakeCamera.h"
#include "FrameRouter.h"
#include "HealthMonitor.h"
#include "ModeRunState.h"
#include "StackWriter.h"
#include "TestUtils.h"
#include "Timer.h"

namespace {

constexpr uint32_t PeriodUs = 100000;

std::unique_ptr<o2::Frame> CreateDeliveredFrame(uint32_t frameNr,
        uint64_t timestampUs)
{
    auto frame = std::make_unique<o2::Frame>(8, 8);
    frame->SetInfo(o2::Frame::Info(frameNr, timestampUs));
    return frame;
}

o2::Tick CreateTick(uint64_t index, o2::Mode mode, uint64_t startUs,
        uint32_t timeoutUs)
{
    o2::Tick tick;
    tick.index = index;
    tick.mode = mode;
    tick.periodUs = PeriodUs;
    tick.startUs = startUs;
    tick.deadlineUs = o2::NowUs() + timeoutUs;
    return tick;
}

class FrameRouterTest : public ::testing::Test
{
protected:
    FrameRouterTest()
        : modes({ o2::Mode::Blue, o2::Mode::Green }),
        camera(std::make_shared<o2::FakeCamera>(8, 8)),
        health(modes, PeriodUs, o2::HealthParams()),
        runStates()
    {}

protected:
    const o2::ModeSet modes;
    std::shared_ptr<o2::FakeCamera> camera;
    o2::HealthMonitor health;
    o2::ModeRunStates runStates;
};

} // namespace

TEST_F(FrameRouterTest, frame_bound_to_tick)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    // Fourth frame since camera start answers the fourth trigger
    camera->InjectFrame(CreateDeliveredFrame(4, 5000));
    const o2::Tick tick = CreateTick(3, o2::Mode::Green, 4000, PeriodUs);
    ASSERT_EQ(router.Route(tick), o2::RouteResult::Routed);

    const o2::ModeRunState& state = runStates[o2::GetModeIndex(o2::Mode::Green)];
    ASSERT_EQ(state.framesRouted.load(), 1);
    ASSERT_EQ(state.timeouts.load(), 0);
    ASSERT_EQ(state.lastTimestampUs.load(), 5000);
    ASSERT_EQ(runStates[o2::GetModeIndex(o2::Mode::Blue)].framesRouted.load(), 0);
    ASSERT_EQ(router.GetUnattributedCount(), 0);
}

TEST_F(FrameRouterTest, timeout_recorded)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    const uint64_t beforeUs = o2::NowUs();
    const o2::Tick tick = CreateTick(0, o2::Mode::Blue, beforeUs, 20000);
    ASSERT_EQ(router.Route(tick), o2::RouteResult::Timeout);

    // Route never gives up before the deadline
    ASSERT_GE(o2::NowUs(), tick.deadlineUs);
    ASSERT_EQ(runStates[o2::GetModeIndex(o2::Mode::Blue)].timeouts.load(), 1);
    ASSERT_EQ(health.GetTimeoutCount(o2::Mode::Blue), 1);
    ASSERT_EQ(health.GetTimeoutCount(o2::Mode::Green), 0);
}

TEST_F(FrameRouterTest, late_frame_dropped)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    camera->InjectFrame(CreateDeliveredFrame(1, 100));
    camera->InjectFrame(CreateDeliveredFrame(2, 2000));

    const o2::Tick tick = CreateTick(1, o2::Mode::Green, 1000, PeriodUs);
    ASSERT_EQ(router.Route(tick), o2::RouteResult::Routed);

    const o2::ModeRunState& state = runStates[o2::GetModeIndex(o2::Mode::Green)];
    ASSERT_EQ(state.lateFrames.load(), 1);
    ASSERT_EQ(state.framesRouted.load(), 1);
    ASSERT_EQ(state.lastTimestampUs.load(), 2000);
    ASSERT_EQ(router.GetUnattributedCount(), 1);
}

TEST_F(FrameRouterTest, frame_after_timeout_not_bound_to_next_tick)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    const o2::Tick blueTick = CreateTick(0, o2::Mode::Blue, o2::NowUs(), 10000);
    ASSERT_EQ(router.Route(blueTick), o2::RouteResult::Timeout);

    // Blue frame shows up once Green tick is on, stamped on delivery
    const uint64_t greenStartUs = o2::NowUs();
    const o2::Tick greenTick = CreateTick(1, o2::Mode::Green, greenStartUs, 10000);
    camera->InjectFrame(CreateDeliveredFrame(1, o2::NowUs()));
    ASSERT_EQ(router.Route(greenTick), o2::RouteResult::Timeout);

    const o2::ModeRunState& blue = runStates[o2::GetModeIndex(o2::Mode::Blue)];
    const o2::ModeRunState& green = runStates[o2::GetModeIndex(o2::Mode::Green)];
    ASSERT_EQ(blue.framesRouted.load(), 0);
    ASSERT_EQ(blue.timeouts.load(), 1);
    ASSERT_EQ(green.framesRouted.load(), 0);
    ASSERT_EQ(green.lateFrames.load(), 1);
    ASSERT_EQ(green.timeouts.load(), 1);
    ASSERT_EQ(router.GetUnattributedCount(), 1);

    // Next Blue frame is bound normally
    camera->InjectFrame(CreateDeliveredFrame(3, o2::NowUs()));
    ASSERT_EQ(router.Route(CreateTick(2, o2::Mode::Blue, o2::NowUs(), PeriodUs)),
            o2::RouteResult::Routed);
    ASSERT_EQ(blue.framesRouted.load(), 1);
}

TEST_F(FrameRouterTest, frame_numbered_ahead_dropped)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    camera->InjectFrame(CreateDeliveredFrame(3, 100));
    camera->InjectFrame(CreateDeliveredFrame(0, 200));
    camera->InjectFrame(CreateDeliveredFrame(1, 300));

    ASSERT_EQ(router.Route(CreateTick(0, o2::Mode::Blue, 0, PeriodUs)),
            o2::RouteResult::Routed);

    const o2::ModeRunState& state = runStates[o2::GetModeIndex(o2::Mode::Blue)];
    ASSERT_EQ(state.framesRouted.load(), 1);
    ASSERT_EQ(state.lateFrames.load(), 0);
    ASSERT_EQ(state.lastTimestampUs.load(), 300);
    ASSERT_EQ(router.GetUnattributedCount(), 2);
}

TEST_F(FrameRouterTest, store_rejection_counted)
{
    // Writer for Green only, never started
    o2::StackWriter writer(o2::test::GetTestDir(), o2::StorageType::Raw,
            { o2::Mode::Green }, 0, 1);
    o2::FrameRouter router(camera, health, runStates, &writer, nullptr);

    camera->InjectFrame(CreateDeliveredFrame(1, 5000));
    ASSERT_EQ(router.Route(CreateTick(0, o2::Mode::Blue, 0, PeriodUs)),
            o2::RouteResult::Routed);
    ASSERT_EQ(router.GetStoreRejectedCount(), 1);

    camera->InjectFrame(CreateDeliveredFrame(2, 6000));
    ASSERT_EQ(router.Route(CreateTick(1, o2::Mode::Green, 0, PeriodUs)),
            o2::RouteResult::Routed);
    ASSERT_EQ(router.GetStoreRejectedCount(), 1);
    ASSERT_EQ(writer.GetQueuePeak(o2::Mode::Green), 1);
}

TEST_F(FrameRouterTest, device_fault)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    ASSERT_TRUE(camera->Start());
    camera->SetFaultAfterFrames(0);
    const uint64_t nowUs = o2::NowUs();
    camera->OnExposureScheduled(nowUs, nowUs, 0x10);

    ASSERT_EQ(router.Route(CreateTick(0, o2::Mode::Blue, nowUs, 1000000)),
            o2::RouteResult::DeviceFault);
    ASSERT_FALSE(router.GetErrorMessage().empty());
    ASSERT_EQ(runStates[o2::GetModeIndex(o2::Mode::Blue)].timeouts.load(), 0);

    ASSERT_TRUE(camera->Stop());
}

TEST_F(FrameRouterTest, discard_pending)
{
    o2::FrameRouter router(camera, health, runStates, nullptr, nullptr);

    camera->InjectFrame(CreateDeliveredFrame(1, 100));
    camera->InjectFrame(CreateDeliveredFrame(2, 200));

    ASSERT_EQ(router.DiscardPending(), 2);
    ASSERT_EQ(router.GetUnattributedCount(), 2);
    ASSERT_EQ(router.DiscardPending(), 0);
}
