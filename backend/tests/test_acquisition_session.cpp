#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "AcquisitionSession.h"
#include "FakeCamera.h"
#include "FakeTriggerDriver.h"
#include "LiveFeed.h"
#include "RawStackLoad.h"
#include "RunSettings.h"
#include "TestUtils.h"

namespace {

class CountingListener final : public o2::ILiveFeedListener
{
public:
    virtual void OnLiveFrame(o2::LiveFeed* sender,
            std::shared_ptr<const o2::Frame> frame) override
    {
        (void)sender;
        (void)frame;
        count++;
    }

    std::atomic<uint64_t> count{ 0 };
};

// Notes the thread patterns are asserted from and passes exposures on
class ThreadNotingListener final : public o2::IExposureListener
{
public:
    explicit ThreadNotingListener(std::shared_ptr<o2::IExposureListener> listener)
        : next(listener)
    {}

    virtual void OnExposureScheduled(uint64_t startUs, uint64_t endUs,
            uint8_t lines) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            threadId = std::this_thread::get_id();
        }
        next->OnExposureScheduled(startUs, endUs, lines);
    }

    std::thread::id GetThreadId()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return threadId;
    }

private:
    const std::shared_ptr<o2::IExposureListener> next;
    std::mutex mutex;
    std::thread::id threadId;
};

class AcquisitionSessionTest : public ::testing::Test
{
protected:
    // Patterns play this many times faster than real time
    void CreateDevices(double timeScale)
    {
        camera = std::make_shared<o2::FakeCamera>(16, 16);
        driver = std::make_shared<o2::FakeTriggerDriver>(camera, timeScale);
        session = std::make_unique<o2::AcquisitionSession>(driver, camera);
        session->SetAdvisoryHandler([this](const o2::Advisory& advisory) {
            std::lock_guard<std::mutex> lock(advisoryMutex);
            advisories.push_back(advisory);
            advisoryThreadIds.push_back(std::this_thread::get_id());
        });
    }

    size_t CountAdvisories(o2::AdvisoryKind kind)
    {
        std::lock_guard<std::mutex> lock(advisoryMutex);
        size_t count = 0;
        for (const o2::Advisory& advisory : advisories)
            count += (advisory.kind == kind) ? 1 : 0;
        return count;
    }

    virtual void TearDown() override
    {
        session.reset();
        for (const std::string& fileName : filesToRemove)
            std::remove(fileName.c_str());
    }

protected:
    std::shared_ptr<o2::FakeCamera> camera;
    std::shared_ptr<o2::FakeTriggerDriver> driver;
    std::unique_ptr<o2::AcquisitionSession> session;

    std::mutex advisoryMutex;
    std::vector<o2::Advisory> advisories;
    std::vector<std::thread::id> advisoryThreadIds;
    std::vector<std::string> filesToRemove;
};

} // namespace

TEST_F(AcquisitionSessionTest, long_exposure_clamped)
{
    CreateDevices(100.0);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(10.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Bioluminescence }));
    ASSERT_TRUE(settings.SetTickCount(3));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());

    ASSERT_EQ(CountAdvisories(o2::AdvisoryKind::ExposureClamped), 1);

    const std::vector<o2::FakeTriggerDriver::AssertRecord> history =
        driver->GetHistory();
    ASSERT_EQ(history.size(), 3);
    for (const auto& record : history)
    {
        ASSERT_EQ(record.mode, o2::Mode::Bioluminescence);
        ASSERT_TRUE(record.clamped);
        ASSERT_EQ(record.exposureUs, 90000);
        // Trigger only, bioluminescence has no illumination line
        ASSERT_EQ(record.lines, 0x10);
    }

    const o2::ModeStats stats = session->GetModeStats(o2::Mode::Bioluminescence);
    ASSERT_EQ(stats.framesRouted, 3);
    ASSERT_EQ(stats.timeouts, 0);
}

TEST_F(AcquisitionSessionTest, modes_split_into_stacks)
{
    CreateDevices(1000.0);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(1.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue, o2::Mode::Green }));
    ASSERT_TRUE(settings.SetTickCount(100));
    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetSaveDir(o2::test::GetTestDir()));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::Raw));

    CountingListener listener;
    auto liveFeed = std::make_shared<o2::LiveFeed>();
    ASSERT_TRUE(liveFeed->Start(&listener));

    ASSERT_TRUE(session->Start(settings, liveFeed));
    ASSERT_TRUE(session->WaitForStop(true));
    liveFeed->Stop(true);

    ASSERT_EQ(session->GetState(), o2::SchedulerState::Stopped);
    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::None);
    ASSERT_EQ(session->GetIssuedTickCount(), 100);
    ASSERT_EQ(session->GetUnattributedFrameCount(), 0);
    ASSERT_TRUE(driver->IsReleased());
    ASSERT_GT(listener.count.load(), 0u);

    const std::vector<o2::ModeStats> allStats = session->GetAllModeStats();
    ASSERT_EQ(allStats.size(), 2);

    // Lines the fake camera saw during exposure, encoded in pixel values
    const uint8_t expectedLines[] = { 0x12, 0x14 };
    for (size_t n = 0; n < allStats.size(); n++)
    {
        const o2::ModeStats& stats = allStats[n];
        ASSERT_EQ(stats.framesRouted, 50);
        ASSERT_EQ(stats.framesSaved, 50);
        ASSERT_EQ(stats.framesDropped, 0);
        ASSERT_EQ(stats.writeErrors, 0);
        ASSERT_FALSE(stats.stackFileName.empty());
        filesToRemove.push_back(stats.stackFileName);

        o2::RawStackLoad load(stats.stackFileName);
        ASSERT_TRUE(load.Open());
        ASSERT_EQ(load.GetMode(), stats.mode);
        ASSERT_EQ((uint32_t)load.GetHeader().frameCount, 50u);

        uint64_t lastTick = 0;
        for (uint32_t index = 0; index < 50; index++)
        {
            std::unique_ptr<o2::Frame> frame;
            ASSERT_TRUE(load.ReadFrame(index, frame));
            // Frames are stored in trigger order
            ASSERT_EQ(frame->GetTickIndex(), 2 * index + n);
            if (index > 0)
                ASSERT_GT(frame->GetTickIndex(), lastTick);
            lastTick = frame->GetTickIndex();
            ASSERT_EQ(frame->GetData()[0] >> 8, expectedLines[n]);
        }
    }
}

TEST_F(AcquisitionSessionTest, run_metadata_saved_with_stacks)
{
    CreateDevices(1000.0);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(10.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Bioluminescence, o2::Mode::Blue }));
    ASSERT_TRUE(settings.SetTickCount(4));
    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetSaveDir(o2::test::GetTestDir()));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::Tiff));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());
    for (const o2::ModeStats& stats : session->GetAllModeStats())
        filesToRemove.push_back(stats.stackFileName);

    const std::string fileName = session->GetMetadataFileName();
    ASSERT_FALSE(fileName.empty());
    filesToRemove.push_back(fileName);

    std::ifstream file(fileName);
    ASSERT_TRUE(file.is_open());
    std::string text((std::istreambuf_iterator<char>(file)),
            std::istreambuf_iterator<char>());

    ASSERT_NE(text.find("modes: Bioluminescence,Blue\n"), std::string::npos);
    ASSERT_NE(text.find("frequency: 10 Hz\n"), std::string::npos);
    // Exposure actually played, the default one does not fit 100 ms
    ASSERT_NE(text.find("bioluminescence_exposure: 90 ms (requested 700 ms)\n"),
            std::string::npos);
    ASSERT_NE(text.find("blue_exposure: 10 ms\n"), std::string::npos);
    ASSERT_NE(text.find("storage: tiff\n"), std::string::npos);
    ASSERT_NE(text.find("camera: Fake camera\n"), std::string::npos);
    ASSERT_NE(text.find("sensor: 16x16\n"), std::string::npos);
}

TEST_F(AcquisitionSessionTest, no_metadata_without_storage)
{
    CreateDevices(1000.0);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue }));
    ASSERT_TRUE(settings.SetTickCount(2));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());
    ASSERT_TRUE(session->GetMetadataFileName().empty());
}

TEST_F(AcquisitionSessionTest, missed_frame_does_not_stop_run)
{
    CreateDevices(100.0);
    camera->SetDroppedExposures({ 5 });

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(10.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue, o2::Mode::Green }));
    ASSERT_TRUE(settings.SetTickCount(20));
    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetSaveDir(o2::test::GetTestDir()));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::Raw));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());

    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::None);
    ASSERT_EQ(session->GetIssuedTickCount(), 20);

    const o2::ModeStats blue = session->GetModeStats(o2::Mode::Blue);
    const o2::ModeStats green = session->GetModeStats(o2::Mode::Green);
    filesToRemove.push_back(blue.stackFileName);
    filesToRemove.push_back(green.stackFileName);

    // Tick 5 belongs to the second mode
    ASSERT_EQ(blue.timeouts, 0);
    ASSERT_EQ(green.timeouts, 1);
    ASSERT_EQ(green.longestTimeoutRun, 1);
    ASSERT_EQ(blue.framesSaved + green.framesSaved, 19);
    ASSERT_EQ(blue.framesSaved, 10);
    ASSERT_EQ(green.framesSaved, 9);

    // Output played out while waiting for the lost frame and was restarted
    ASSERT_GE(driver->GetStreamStartCount(), 2u);
    const std::vector<o2::FakeTriggerDriver::AssertRecord> history =
        driver->GetHistory();
    ASSERT_EQ(history.size(), 20);
    ASSERT_GE(history[6].startUs, history[5].startUs + 200000);
}

TEST_F(AcquisitionSessionTest, late_frame_not_stored_under_next_mode)
{
    CreateDevices(100.0);
    // Delivered well past the deadline of its tick, during the next one
    camera->SetDelayedExposures({ 5 }, 300000);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(10.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue, o2::Mode::Green }));
    ASSERT_TRUE(settings.SetTickCount(20));
    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetSaveDir(o2::test::GetTestDir()));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::Raw));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());

    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::None);
    ASSERT_EQ(session->GetIssuedTickCount(), 20);
    ASSERT_EQ(session->GetUnattributedFrameCount(), 1);

    const o2::ModeStats blue = session->GetModeStats(o2::Mode::Blue);
    const o2::ModeStats green = session->GetModeStats(o2::Mode::Green);
    filesToRemove.push_back(blue.stackFileName);
    filesToRemove.push_back(green.stackFileName);

    // Green frame of tick 5 shows up during Blue tick 6
    ASSERT_EQ(green.timeouts, 1);
    ASSERT_EQ(blue.timeouts, 0);
    ASSERT_EQ(blue.lateFrames, 1);
    ASSERT_EQ(blue.framesSaved, 10);
    ASSERT_EQ(green.framesSaved, 9);

    const uint8_t expectedLines[] = { 0x12, 0x14 };
    const o2::ModeStats* allStats[] = { &blue, &green };
    for (size_t n = 0; n < 2; n++)
    {
        o2::RawStackLoad load(allStats[n]->stackFileName);
        ASSERT_TRUE(load.Open());
        const uint32_t frameCount = (uint32_t)load.GetHeader().frameCount;
        for (uint32_t index = 0; index < frameCount; index++)
        {
            std::unique_ptr<o2::Frame> frame;
            ASSERT_TRUE(load.ReadFrame(index, frame));
            ASSERT_EQ(frame->GetTickIndex() % 2, n);
            ASSERT_NE(frame->GetTickIndex(), 5u);
            // Camera saw this mode's lines, frame number matches the tick
            ASSERT_EQ(frame->GetData()[0] >> 8, expectedLines[n]);
            ASSERT_EQ((uint64_t)(frame->GetData()[0] & 0xFF),
                    (frame->GetTickIndex() + 1) & 0xFF);
        }
    }
}

TEST_F(AcquisitionSessionTest, health_advisories_off_scheduling_thread)
{
    camera = std::make_shared<o2::FakeCamera>(16, 16);
    auto listener = std::make_shared<ThreadNotingListener>(camera);
    driver = std::make_shared<o2::FakeTriggerDriver>(listener, 100.0);
    session = std::make_unique<o2::AcquisitionSession>(driver, camera);
    session->SetAdvisoryHandler([this](const o2::Advisory& advisory) {
        std::lock_guard<std::mutex> lock(advisoryMutex);
        advisories.push_back(advisory);
        advisoryThreadIds.push_back(std::this_thread::get_id());
    });

    // Three timeouts in a row make the mode unhealthy, next frame recovers it
    camera->SetDroppedExposures({ 2, 3, 4 });

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(10.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Green }));
    ASSERT_TRUE(settings.SetTickCount(8));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());

    ASSERT_EQ(session->GetModeStats(o2::Mode::Green).timeouts, 3);
    ASSERT_EQ(CountAdvisories(o2::AdvisoryKind::HealthDegraded), 1);
    ASSERT_EQ(CountAdvisories(o2::AdvisoryKind::HealthRecovered), 1);

    const std::thread::id schedulingThreadId = listener->GetThreadId();
    ASSERT_NE(schedulingThreadId, std::thread::id());
    std::lock_guard<std::mutex> lock(advisoryMutex);
    for (const std::thread::id& threadId : advisoryThreadIds)
        ASSERT_NE(threadId, schedulingThreadId);
}

TEST_F(AcquisitionSessionTest, camera_fault_stops_run)
{
    CreateDevices(1000.0);
    camera->SetFaultAfterFrames(6);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetFrequencyHz(1.0));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue, o2::Mode::Green }));
    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetSaveDir(o2::test::GetTestDir()));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::Raw));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_FALSE(session->WaitForStop(true));

    ASSERT_EQ(session->GetState(), o2::SchedulerState::Stopped);
    const o2::FailureReason failure = session->GetFailure();
    ASSERT_EQ(failure.kind, o2::FailureKind::AcquisitionFault);
    ASSERT_FALSE(failure.message.empty());
    ASSERT_TRUE(driver->IsReleased());
    ASSERT_EQ(session->GetIssuedTickCount(), 7);

    // Stacks hold everything routed before the fault and stay readable
    for (o2::Mode mode : settings.GetModes())
    {
        const o2::ModeStats stats = session->GetModeStats(mode);
        ASSERT_EQ(stats.framesSaved, 3);
        filesToRemove.push_back(stats.stackFileName);

        o2::RawStackLoad load(stats.stackFileName);
        ASSERT_TRUE(load.Open());
        ASSERT_EQ((uint32_t)load.GetHeader().frameCount, 3u);
    }
}

TEST_F(AcquisitionSessionTest, trigger_fault_stops_run)
{
    CreateDevices(1000.0);
    driver->SetFaultOnAssert(4);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Green }));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_FALSE(session->WaitForStop());

    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::TriggerFault);
    ASSERT_EQ(session->GetIssuedTickCount(), 4);
    ASSERT_EQ(session->GetModeStats(o2::Mode::Green).framesRouted, 4);
    ASSERT_TRUE(driver->IsReleased());
}

TEST_F(AcquisitionSessionTest, stop_request)
{
    CreateDevices(1000.0);

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Bioluminescence, o2::Mode::Blue }));

    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->IsRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    session->RequestStop();
    ASSERT_TRUE(session->WaitForStop());

    ASSERT_FALSE(session->IsRunning());
    ASSERT_EQ(session->GetState(), o2::SchedulerState::Stopped);
    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::None);

    const uint64_t ticks = session->GetIssuedTickCount();
    ASSERT_GT(ticks, 0);
    uint64_t handled = 0;
    for (const o2::ModeStats& stats : session->GetAllModeStats())
        handled += stats.framesRouted + stats.timeouts;
    ASSERT_EQ(handled, ticks);
}

TEST_F(AcquisitionSessionTest, empty_mode_set_rejected)
{
    CreateDevices(1000.0);

    o2::RunSettings settings;
    ASSERT_FALSE(session->Start(settings));
    ASSERT_FALSE(session->IsRunning());
    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::Rejected);
    ASSERT_EQ(driver->GetAssertCount(), 0);
    ASSERT_FALSE(driver->IsOpen());
}

TEST_F(AcquisitionSessionTest, readiness_required)
{
    CreateDevices(1000.0);
    session->SetReadinessCheck([](std::string& reason) {
        reason = "Sensor temperature -20.0 C, setpoint -60.0 C";
        return false;
    });

    o2::RunSettings settings;
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue }));
    ASSERT_TRUE(settings.SetTickCount(2));

    ASSERT_FALSE(session->Start(settings));
    const o2::FailureReason failure = session->GetFailure();
    ASSERT_EQ(failure.kind, o2::FailureKind::NotReady);
    ASSERT_NE(failure.message.find("temperature"), std::string::npos);
    ASSERT_EQ(driver->GetAssertCount(), 0);

    // Operator override
    ASSERT_TRUE(settings.SetIgnoreReadiness(true));
    ASSERT_TRUE(session->Start(settings));
    ASSERT_TRUE(session->WaitForStop());
    ASSERT_EQ(session->GetFailure().kind, o2::FailureKind::None);
    ASSERT_EQ(driver->GetAssertCount(), 2);
}
