#pragma once
#ifndef O2_MODE_SCHEDULER_H
#define O2_MODE_SCHEDULER_H

/* System */
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

/* Local */
#include "Advisory.h"
#include "FrameRouter.h"
#include "PatternEncoder.h"
#include "RunConfig.h"
#include "StackWriter.h"
#include "TriggerDriver.h"
#include "TriggerPattern.h"

namespace o2 {

enum class SchedulerState : int32_t
{
    Idle,
    Armed,
    Running,
    Draining,
    Stopped,
};

const char* GetSchedulerStateName(SchedulerState state);

enum class FailureKind : int32_t
{
    None,
    // Invalid configuration
    Rejected,
    // Readiness check did not pass
    NotReady,
    // Trigger output lost
    TriggerFault,
    // Camera lost
    AcquisitionFault,
};

const char* GetFailureKindName(FailureKind kind);

struct FailureReason
{
    FailureKind kind = FailureKind::None;
    std::string message;
};

// Returns false and fills the reason while e.g. sensor temperature settles
using ReadinessCheck = std::function<bool(std::string& reason)>;

// Cycles enabled modes tick by tick, the only user of the trigger output
class ModeScheduler
{
public:
    explicit ModeScheduler(std::shared_ptr<TriggerDriver> driver);
    ~ModeScheduler();

    ModeScheduler() = delete;
    ModeScheduler(const ModeScheduler&) = delete;
    ModeScheduler& operator=(const ModeScheduler&) = delete;

    void SetAdvisoryHandler(const AdvisoryHandler& handler);

    /* Validates the configuration, encodes patterns of all modes and checks
       readiness unless the configuration overrides it. The trigger output
       has to be opened already. On failure the state stays Idle and
       GetFailure describes the cause. */
    bool Arm(const RunConfig& config, const ReadinessCheck& readiness);

    /* Issues ticks until stop is requested, the tick limit is reached or
       a device fails. Returns with all lines released and stacks closed.
       Returns false on device failure. */
    bool Run(FrameRouter& router, StackWriter* writer);

    // Observed at next tick boundary
    void RequestStop();
    bool IsStopRequested() const
    { return m_stopRequested; }

    SchedulerState GetState() const
    { return m_state; }
    FailureReason GetFailure() const;

    uint64_t GetIssuedTickCount() const
    { return m_issuedTicks; }

    // Pattern encoded for the mode at arm time
    const TriggerPattern& GetArmedPattern(Mode mode) const
    { return m_armedPatterns[GetModeIndex(mode)]; }

private:
    bool NextTick(uint64_t tickIndex, FrameRouter& router);
    void Drain(FrameRouter& router, StackWriter* writer);
    void SetFailure(FailureKind kind, const std::string& message);
    void RaiseAdvisory(const Advisory& advisory);

private:
    const std::shared_ptr<TriggerDriver> m_driver;

    std::unique_ptr<PatternEncoder> m_encoder;
    ModeSet m_modes;
    uint32_t m_periodUs;
    uint64_t m_timeoutUs;
    uint64_t m_tickLimit;
    std::array<uint32_t, ModeCount> m_exposuresUs;
    std::array<TriggerPattern, ModeCount> m_armedPatterns;

    AdvisoryHandler m_advisoryHandler;

    std::atomic<SchedulerState> m_state;
    std::atomic<bool> m_stopRequested;
    std::atomic<uint64_t> m_issuedTicks;

    mutable std::mutex m_failureMutex;
    FailureReason m_failure;
};

} // namespace o2

#endif /* O2_MODE_SCHEDULER_H */
