#pragma once
#ifndef O2_PVCAM_CAMERA_H
#define O2_PVCAM_CAMERA_H

/* System */
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/* PVCAM */
#include <master.h>
#include <pvcam.h>

/* Local */
#include "FrameAcquirer.h"

namespace o2 {

// Externally triggered PVCAM camera, exposure follows the trigger line level
class PvcamCamera final : public FrameAcquirer
{
public:
    // Frames not pulled in time are dropped above this count
    static constexpr size_t MaxQueuedFrames = 64;
    // Allowed difference between sensor temperature and setpoint
    static constexpr double TemperatureToleranceC = 0.5;

public:
    PvcamCamera();
    virtual ~PvcamCamera();

    PvcamCamera(const PvcamCamera&) = delete;
    PvcamCamera& operator=(const PvcamCamera&) = delete;

public:
    // Library state is common for all cameras
    static bool Initialize();
    static bool Uninitialize();

    bool GetCameraCount(int16& count) const;
    bool Open(int16 index);
    bool Close();
    bool IsOpen() const
    { return m_hCam >= 0; }

    uint16_t GetWidth() const
    { return m_width; }
    uint16_t GetHeight() const
    { return m_height; }

    bool SetTemperatureSetpoint(double celsius);
    bool GetTemperature(double& celsius) const;
    bool GetTemperatureSetpoint(double& celsius) const;
    // Usable as a session readiness check
    bool IsTemperatureStable(std::string& reason) const;

    bool SetEmGain(uint16_t gain);
    // One-based index of the analog amplifier gain
    bool SetAmpGain(int16 gainIndex);

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
    static void PV_DECL EofCallback(FRAME_INFO* frameInfo, void* context);
    void HandleEofCallback(FRAME_INFO* frameInfo);

    std::string GetPvcamErrorMessage() const;
    void SetFault(const std::string& message);

private:
    static bool s_isInitialized;

private:
    int16 m_hCam;
    std::string m_cameraName;
    FRAME_INFO* m_latestFrameInfo;
    uint16_t m_width;
    uint16_t m_height;
    std::vector<uns8> m_buffer; // Circular buffer owned by PVCAM while imaging
    uns32 m_frameBytes;
    bool m_isImaging;

    mutable std::mutex m_mutex; // Covers all members below
    std::condition_variable m_frameCond;
    std::deque<std::unique_ptr<Frame>> m_frames;
    uint64_t m_droppedCount;
    bool m_fault;
    std::string m_errorMessage;
};

} // namespace o2

#endif /* O2_PVCAM_CAMERA_H */
