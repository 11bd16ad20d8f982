#pragma once
#ifndef O2_FAKE_CAMERA_H
#define O2_FAKE_CAMERA_H

/* System */
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <set>
#include <string>

/* Local */
#include "FakeTriggerDriver.h"
#include "FrameAcquirer.h"

namespace std
{
    class thread;
}

namespace o2 {

// Simulated camera producing one frame per exposure window it is told about.
// Frames are numbered from 1 per exposure since start, lost ones leave a gap.
// Like with PVCAM the timestamp is the host time the frame was delivered.
class FakeCamera final : public FrameAcquirer, public IExposureListener
{
public:
    static constexpr uint64_t NoFault = std::numeric_limits<uint64_t>::max();

public:
    FakeCamera(uint16_t width, uint16_t height);
    virtual ~FakeCamera();

    FakeCamera() = delete;
    FakeCamera(const FakeCamera&) = delete;
    FakeCamera& operator=(const FakeCamera&) = delete;

public:
    uint16_t GetWidth() const
    { return m_width; }
    uint16_t GetHeight() const
    { return m_height; }

    // Exposures with given zero-based indices produce no frame
    void SetDroppedExposures(const std::set<uint64_t>& exposureIndices);
    // Readout of given exposures takes extra time, later frames wait behind
    void SetDelayedExposures(const std::set<uint64_t>& exposureIndices,
            uint32_t delayUs);
    // Device fails once given number of frames was delivered
    void SetFaultAfterFrames(uint64_t frameCount);
    // Puts the frame straight to the output queue
    void InjectFrame(std::unique_ptr<Frame> frame);

    uint64_t GetExposureCount() const
    { return m_exposureCount; }
    uint64_t GetGeneratedCount() const
    { return m_generatedCount; }

    // Pixel value the camera fills frames with
    static uint16_t GetPixelValue(uint8_t lines, uint32_t frameNr);

public: // From IExposureListener
    virtual void OnExposureScheduled(uint64_t startUs, uint64_t endUs,
            uint8_t lines) override;

public: // From FrameAcquirer
    virtual bool Start() override;
    virtual bool Stop() override;
    virtual bool IsRunning() const override;

    virtual PullStatus PullFrame(uint32_t timeoutUs,
            std::unique_ptr<Frame>& frame) override;
    virtual size_t DiscardQueuedFrames() override;

    virtual std::string GetErrorMessage() const override;

    virtual std::vector<DeviceSetting> GetSettings() const override;

private:
    struct Exposure
    {
        uint32_t frameNr;
        uint64_t readyUs;
        uint8_t lines;
    };

private:
    // This is the function used to generate frames
    void FrameGeneratorLoop(); // Routine launched by m_frameGenThread

private:
    const uint16_t m_width;
    const uint16_t m_height;

    std::thread* m_frameGenThread;

    mutable std::mutex m_mutex; // Covers all members below
    std::condition_variable m_exposureCond;
    std::condition_variable m_frameCond;
    bool m_isRunning;
    bool m_frameGenStopFlag;
    bool m_fault;
    std::string m_errorMessage;
    std::deque<Exposure> m_exposures;
    std::deque<std::unique_ptr<Frame>> m_frames;
    std::set<uint64_t> m_droppedExposures;
    std::set<uint64_t> m_delayedExposures;
    uint32_t m_readoutDelayUs;
    uint64_t m_faultAfterFrames;
    uint64_t m_deliveredCount;

    std::atomic<uint64_t> m_exposureCount;
    std::atomic<uint64_t> m_generatedCount;
};

} // namespace o2

#endif /* O2_FAKE_CAMERA_H */
