#pragma once
#ifndef O2_NIDAQ_TRIGGER_DRIVER_H
#define O2_NIDAQ_TRIGGER_DRIVER_H

/* System */
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/* NI-DAQmx */
#include <NIDAQmx.h>

/* Local */
#include "TriggerDriver.h"
#include "TriggerTimeline.h"

namespace o2 {

/* Hardware-timed digital output on an NI-DAQmx device.
   Patterns are appended to one continuous output stream, regeneration is
   disabled so every sample is played exactly once. When the stream played
   out all samples, e.g. while waiting for a missed frame, it is restarted
   with the next pattern. */
class NidaqTriggerDriver final : public TriggerDriver
{
public:
    static constexpr uint32_t DefaultSampleRateHz = 1000;

public:
    explicit NidaqTriggerDriver(uint32_t sampleRateHz = DefaultSampleRateHz);
    virtual ~NidaqTriggerDriver();

    NidaqTriggerDriver(const NidaqTriggerDriver&) = delete;
    NidaqTriggerDriver& operator=(const NidaqTriggerDriver&) = delete;

public: // From TriggerDriver
    virtual bool Open(const std::string& device,
            std::shared_ptr<const LineMap> lineMap) override;
    virtual bool IsOpen() const override;
    virtual bool Close() override;

    virtual bool AssertPattern(const TriggerPattern& pattern, uint64_t& startUs) override;
    virtual bool Release() override;

    virtual std::string GetErrorMessage() const override;

private:
    bool CreateStreamTask();
    void ClearStreamTask();
    // Stops the played out stream so the next write starts it again
    bool StopStream();
    int32 WriteSamples(const std::vector<uint8_t>& samples, int32& written);
    // Drives all lines of the channel low using an on-demand task
    bool WriteIdleState();
    // Stores extended info of the last failed call, returns false
    bool HandleError(int32 nierr, const char* what);

private:
    const uint32_t m_sampleRateHz;

    std::shared_ptr<const LineMap> m_lineMap;
    std::string m_channel;
    bool m_isOpen;

    TaskHandle m_task;
    bool m_taskStarted;
    TriggerTimeline m_timeline;

    std::string m_errorMessage;
};

} // namespace o2

#endif /* O2_NIDAQ_TRIGGER_DRIVER_H */
