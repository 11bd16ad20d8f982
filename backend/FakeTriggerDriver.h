#pragma once
#ifndef O2_FAKE_TRIGGER_DRIVER_H
#define O2_FAKE_TRIGGER_DRIVER_H

/* System */
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/* Local */
#include "Mode.h"
#include "TriggerDriver.h"
#include "TriggerTimeline.h"

namespace o2 {

// Receives exposure windows produced by the fake trigger output
class IExposureListener
{
public:
    virtual ~IExposureListener()
    {}

    virtual void OnExposureScheduled(uint64_t startUs, uint64_t endUs,
            uint8_t lines) = 0;
};

// In-process stand-in for the digital output device.
// Patterns are not played on any hardware, the exposure window of each one is
// forwarded to the listener, typically a FakeCamera.
class FakeTriggerDriver final : public TriggerDriver
{
public:
    struct AssertRecord
    {
        Mode mode;
        uint32_t exposureUs;
        bool clamped;
        uint8_t lines;
        uint64_t startUs;
    };

    static constexpr size_t NoFault = std::numeric_limits<size_t>::max();

public:
    /* Time scale above 1 makes patterns play faster than real time,
       e.g. 1000 turns a 1 s period into 1 ms. */
    explicit FakeTriggerDriver(std::shared_ptr<IExposureListener> listener,
            double timeScale = 1.0);
    virtual ~FakeTriggerDriver();

    FakeTriggerDriver() = delete;
    FakeTriggerDriver(const FakeTriggerDriver&) = delete;
    FakeTriggerDriver& operator=(const FakeTriggerDriver&) = delete;

public:
    // Fails the assert call with given zero-based index and all following
    void SetFaultOnAssert(size_t assertIndex);

    std::vector<AssertRecord> GetHistory() const;
    size_t GetAssertCount() const;
    // True once Release was called after the last assert
    bool IsReleased() const;
    // Output stream starts since open, see TriggerTimeline
    uint64_t GetStreamStartCount() const;

public: // From TriggerDriver
    virtual bool Open(const std::string& device,
            std::shared_ptr<const LineMap> lineMap) override;
    virtual bool IsOpen() const override;
    virtual bool Close() override;

    virtual bool AssertPattern(const TriggerPattern& pattern, uint64_t& startUs) override;
    virtual bool Release() override;

    virtual std::string GetErrorMessage() const override;

private:
    uint64_t Scale(uint32_t durationUs) const;

private:
    const std::shared_ptr<IExposureListener> m_listener;
    const double m_timeScale;

    mutable std::mutex m_mutex; // Covers all members below
    std::shared_ptr<const LineMap> m_lineMap;
    std::string m_channel;
    bool m_isOpen;
    bool m_released;
    // Played out output restarts like a hardware stream would
    TriggerTimeline m_timeline;
    size_t m_faultOnAssert;
    std::string m_errorMessage;
    std::vector<AssertRecord> m_history;
};

} // namespace o2

#endif /* O2_FAKE_TRIGGER_DRIVER_H */
