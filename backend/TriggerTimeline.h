#pragma once
#ifndef O2_TRIGGER_TIMELINE_H
#define O2_TRIGGER_TIMELINE_H

/* System */
#include <cstdint>

namespace o2 {

/* Host time bookkeeping of a continuous output stream that never repeats
   old samples. Once everything queued has played, appending more would
   underflow the stream, it has to be stopped and started again. */
class TriggerTimeline
{
public:
    // Less than this left queued counts as played out
    static constexpr uint32_t DefaultMinLeadUs = 2000;

public:
    explicit TriggerTimeline(uint32_t minLeadUs = DefaultMinLeadUs);

    // Forgets the stream and its start count
    void Reset();

    bool IsRunning() const
    { return m_isRunning; }
    // True if the running stream ends before nowUs plus the minimum lead
    bool HasRunDry(uint64_t nowUs) const;

    // Stream plays from given host time with nothing queued
    void Start(uint64_t startUs);
    void Stop();

    // Queues output of given duration, returns host time it starts at
    uint64_t Append(uint64_t durationUs);
    // Host time queued output ends at, zero if stopped
    uint64_t GetEndUs() const;

    // Starts since reset, each one after the first is a restart
    uint64_t GetStartCount() const
    { return m_startCount; }

private:
    const uint32_t m_minLeadUs;

    bool m_isRunning;
    uint64_t m_startUs;
    uint64_t m_queuedUs;
    uint64_t m_startCount;
};

} // namespace o2

#endif /* O2_TRIGGER_TIMELINE_H */
