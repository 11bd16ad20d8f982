#include "TriggerTimeline.h"

constexpr uint32_t o2::TriggerTimeline::DefaultMinLeadUs;

o2::TriggerTimeline::TriggerTimeline(uint32_t minLeadUs)
    : m_minLeadUs(minLeadUs),
    m_isRunning(false),
    m_startUs(0),
    m_queuedUs(0),
    m_startCount(0)
{
}

void o2::TriggerTimeline::Reset()
{
    Stop();
    m_startCount = 0;
}

bool o2::TriggerTimeline::HasRunDry(uint64_t nowUs) const
{
    if (!m_isRunning)
        return false;
    return GetEndUs() < nowUs + m_minLeadUs;
}

void o2::TriggerTimeline::Start(uint64_t startUs)
{
    m_isRunning = true;
    m_startUs = startUs;
    m_queuedUs = 0;
    m_startCount++;
}

void o2::TriggerTimeline::Stop()
{
    m_isRunning = false;
    m_startUs = 0;
    m_queuedUs = 0;
}

uint64_t o2::TriggerTimeline::Append(uint64_t durationUs)
{
    const uint64_t startUs = m_startUs + m_queuedUs;
    m_queuedUs += durationUs;
    return startUs;
}

uint64_t o2::TriggerTimeline::GetEndUs() const
{
    return (m_isRunning) ? m_startUs + m_queuedUs : 0;
}
