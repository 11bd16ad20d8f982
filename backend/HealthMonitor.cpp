#include "HealthMonitor.h"

/* System */
#include <cmath>
#include <cstdio>

/* Local */
#include "Log.h"
#include "Utils.h"

o2::HealthMonitor::HealthMonitor(const ModeSet& modes, uint32_t periodUs,
        const HealthParams& params)
    : m_modeCount(modes.size()),
    m_targetIntervalUs(periodUs * (uint32_t)modes.size()),
    m_params(params),
    m_advisoryHandler(),
    m_health()
{
    for (Mode mode : modes)
        m_health[GetModeIndex(mode)].enabled = true;
}

void o2::HealthMonitor::SetAdvisoryHandler(const AdvisoryHandler& handler)
{
    m_advisoryHandler = handler;
}

void o2::HealthMonitor::RecordFrame(Mode mode, uint64_t tickIndex,
        uint64_t timestampUs)
{
    UNUSED(tickIndex);

    ModeHealth& health = m_health[GetModeIndex(mode)];
    if (!health.enabled)
        return;

    if (health.hasTimestamp && timestampUs >= health.lastTimestampUs)
    {
        const uint64_t intervalUs = timestampUs - health.lastTimestampUs;
        health.intervalsUs.push_back(intervalUs);
        health.intervalsSumUs += intervalUs;
        while (health.intervalsUs.size() > m_params.windowSize)
        {
            health.intervalsSumUs -= health.intervalsUs.front();
            health.intervalsUs.pop_front();
        }
    }
    health.lastTimestampUs = timestampUs;
    health.hasTimestamp = true;
    health.consecutiveTimeouts = 0;

    if (!health.intervalsUs.empty())
    {
        health.avgIntervalUs = (double)health.intervalsSumUs
            / (double)health.intervalsUs.size();
    }

    UpdateState(mode, health);
}

void o2::HealthMonitor::RecordTimeout(Mode mode, uint64_t tickIndex)
{
    ModeHealth& health = m_health[GetModeIndex(mode)];
    if (!health.enabled)
        return;

    health.consecutiveTimeouts++;
    health.timeouts.AddItem(tickIndex / m_modeCount);

    health.timeoutCount = health.timeouts.GetCount();
    health.longestTimeoutRun = health.timeouts.GetLargestCluster();
    health.avgTimeoutSpacing = health.timeouts.GetAvgSpacing();

    UpdateState(mode, health);
}

bool o2::HealthMonitor::IsHealthy(Mode mode) const
{
    return m_health[GetModeIndex(mode)].healthy;
}

double o2::HealthMonitor::GetAverageIntervalUs(Mode mode) const
{
    return m_health[GetModeIndex(mode)].avgIntervalUs;
}

double o2::HealthMonitor::GetAchievedRateHz(Mode mode) const
{
    const double intervalUs = GetAverageIntervalUs(mode);
    return (intervalUs > 0.0) ? 1000000.0 / intervalUs : 0.0;
}

size_t o2::HealthMonitor::GetTimeoutCount(Mode mode) const
{
    return m_health[GetModeIndex(mode)].timeoutCount;
}

size_t o2::HealthMonitor::GetLongestTimeoutRun(Mode mode) const
{
    return m_health[GetModeIndex(mode)].longestTimeoutRun;
}

double o2::HealthMonitor::GetAvgTimeoutSpacing(Mode mode) const
{
    return m_health[GetModeIndex(mode)].avgTimeoutSpacing;
}

bool o2::HealthMonitor::Evaluate(const ModeHealth& health) const
{
    if (m_params.maxConsecutiveTimeouts > 0
            && health.consecutiveTimeouts >= m_params.maxConsecutiveTimeouts)
        return false;

    // Not enough history to judge the rate yet
    if (health.intervalsUs.size() < m_params.windowSize
            || health.intervalsUs.empty())
        return true;

    const double avgUs =
        (double)health.intervalsSumUs / (double)health.intervalsUs.size();
    const double deviation =
        std::fabs(avgUs - (double)m_targetIntervalUs) / (double)m_targetIntervalUs;
    return deviation <= m_params.tolerance;
}

void o2::HealthMonitor::UpdateState(Mode mode, ModeHealth& health)
{
    const bool healthy = Evaluate(health);
    if (healthy == health.healthy)
        return;
    health.healthy = healthy;

    const double avgUs = health.avgIntervalUs;
    const double achievedHz = (avgUs > 0.0) ? 1000000.0 / avgUs : 0.0;
    const double targetHz = 1000000.0 / (double)m_targetIntervalUs;

    Advisory advisory;
    advisory.mode = mode;
    char msg[256];
    if (!healthy)
    {
        advisory.kind = AdvisoryKind::HealthDegraded;
        std::snprintf(msg, sizeof(msg),
                "%s frame rate degraded, achieved %.3f Hz, target %.3f Hz,"
                " %u consecutive timeouts", GetModeName(mode), achievedHz,
                targetHz, health.consecutiveTimeouts);
        Log::LogW(std::string(msg));
    }
    else
    {
        advisory.kind = AdvisoryKind::HealthRecovered;
        std::snprintf(msg, sizeof(msg),
                "%s frame rate recovered, achieved %.3f Hz, target %.3f Hz",
                GetModeName(mode), achievedHz, targetHz);
        Log::LogI(std::string(msg));
    }
    advisory.message = msg;

    if (m_advisoryHandler)
        m_advisoryHandler(advisory);
}
