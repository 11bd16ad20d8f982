#include "ModeScheduler.h"

/* System */
#include <cmath>
#include <sstream>
#include <vector>

/* Local */
#include "Log.h"

const char* o2::GetSchedulerStateName(SchedulerState state)
{
    switch (state)
    {
    case SchedulerState::Idle:
        return "Idle";
    case SchedulerState::Armed:
        return "Armed";
    case SchedulerState::Running:
        return "Running";
    case SchedulerState::Draining:
        return "Draining";
    case SchedulerState::Stopped:
        return "Stopped";
    }
    return "<Unknown>";
}

const char* o2::GetFailureKindName(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::None:
        return "None";
    case FailureKind::Rejected:
        return "Rejected";
    case FailureKind::NotReady:
        return "NotReady";
    case FailureKind::TriggerFault:
        return "TriggerFault";
    case FailureKind::AcquisitionFault:
        return "AcquisitionFault";
    }
    return "<Unknown>";
}

o2::ModeScheduler::ModeScheduler(std::shared_ptr<TriggerDriver> driver)
    : m_driver(driver),
    m_encoder(),
    m_modes(),
    m_periodUs(0),
    m_timeoutUs(0),
    m_tickLimit(0),
    m_exposuresUs(),
    m_armedPatterns(),
    m_advisoryHandler(),
    m_state(SchedulerState::Idle),
    m_stopRequested(false),
    m_issuedTicks(0),
    m_failureMutex(),
    m_failure()
{
    m_exposuresUs.fill(0);
}

o2::ModeScheduler::~ModeScheduler()
{
}

void o2::ModeScheduler::SetAdvisoryHandler(const AdvisoryHandler& handler)
{
    m_advisoryHandler = handler;
}

bool o2::ModeScheduler::Arm(const RunConfig& config,
        const ReadinessCheck& readiness)
{
    if (m_state != SchedulerState::Idle)
    {
        Log::LogE("Scheduler cannot be armed in %s state",
                GetSchedulerStateName(m_state));
        return false;
    }

    std::string reason;
    if (!config.Validate(reason))
    {
        SetFailure(FailureKind::Rejected, reason);
        Log::LogE("Run configuration rejected (%s)", reason.c_str());
        return false;
    }

    if (!m_driver || !m_driver->IsOpen())
    {
        SetFailure(FailureKind::Rejected, "Trigger output is not open");
        Log::LogE("Run configuration rejected (trigger output is not open)");
        return false;
    }

    const std::shared_ptr<const LineMap> lineMap =
        LineMap::Create(config.GetLineMapType());
    auto encoder = std::make_unique<PatternEncoder>(lineMap,
            config.GetSettleMarginUs());

    const uint32_t periodUs = config.GetPeriodUs();
    std::vector<Advisory> clampAdvisories;
    for (Mode mode : config.GetModes())
    {
        TriggerPattern& pattern = m_armedPatterns[GetModeIndex(mode)];
        if (!encoder->Encode(mode, periodUs, config.GetExposureUs(mode), pattern))
        {
            reason = std::string("Period of ") + std::to_string(periodUs)
                + " us leaves no room for " + GetModeName(mode) + " exposure";
            SetFailure(FailureKind::Rejected, reason);
            Log::LogE("Run configuration rejected (%s)", reason.c_str());
            return false;
        }

        if (pattern.IsExposureClamped())
        {
            std::ostringstream ss;
            ss << GetModeName(mode) << " exposure shortened from "
                << pattern.GetRequestedExposureUs() / 1000.0 << " ms to "
                << pattern.GetExposureUs() / 1000.0 << " ms to fit "
                << periodUs / 1000.0 << " ms period";

            Advisory advisory;
            advisory.kind = AdvisoryKind::ExposureClamped;
            advisory.mode = mode;
            advisory.message = ss.str();
            clampAdvisories.push_back(advisory);
        }
    }

    if (config.GetIgnoreReadiness())
    {
        Log::LogW("Readiness check skipped on request");
    }
    else if (readiness && !readiness(reason))
    {
        SetFailure(FailureKind::NotReady, reason);
        Log::LogE("System not ready (%s)", reason.c_str());
        return false;
    }

    for (const Advisory& advisory : clampAdvisories)
    {
        Log::LogW(advisory.message);
        RaiseAdvisory(advisory);
    }

    m_encoder = std::move(encoder);
    m_modes = config.GetModes();
    m_periodUs = periodUs;
    m_timeoutUs = (uint64_t)std::llround(periodUs * config.GetFrameTimeoutPeriods());
    m_tickLimit = config.GetTickCount();
    for (Mode mode : m_modes)
        m_exposuresUs[GetModeIndex(mode)] = config.GetExposureUs(mode);

    std::ostringstream ss;
    ss << "Armed " << m_modes.size() << " mode(s) at " << config.GetFrequencyHz()
        << " Hz, " << config.GetFrequencyHz() / m_modes.size() << " Hz per mode,"
        << " line map " << GetLineMapTypeName(lineMap->GetType());
    for (Mode mode : m_modes)
    {
        const TriggerPattern& pattern = GetArmedPattern(mode);
        ss << "\n  " << GetModeName(mode) << ": exposure "
            << pattern.GetExposureUs() / 1000.0 << " ms, lines 0x" << std::hex
            << (unsigned int)pattern.GetPhases().front().lines << std::dec;
    }
    Log::LogI(ss.str());

    SetFailure(FailureKind::None, "");
    m_state = SchedulerState::Armed;
    return true;
}

bool o2::ModeScheduler::Run(FrameRouter& router, StackWriter* writer)
{
    if (m_state != SchedulerState::Armed)
    {
        Log::LogE("Scheduler cannot run in %s state",
                GetSchedulerStateName(m_state));
        return false;
    }

    m_issuedTicks = 0;
    m_state = SchedulerState::Running;

    for (uint64_t tickIndex = 0; ; tickIndex++)
    {
        if (m_stopRequested)
        {
            Log::LogI("Stop requested after %llu ticks",
                    (unsigned long long)tickIndex);
            break;
        }
        if (m_tickLimit > 0 && tickIndex >= m_tickLimit)
            break;

        if (!NextTick(tickIndex, router))
            break;
    }

    Drain(router, writer);

    return GetFailure().kind == FailureKind::None;
}

void o2::ModeScheduler::RequestStop()
{
    m_stopRequested = true;
}

o2::FailureReason o2::ModeScheduler::GetFailure() const
{
    std::lock_guard<std::mutex> lock(m_failureMutex);
    return m_failure;
}

bool o2::ModeScheduler::NextTick(uint64_t tickIndex, FrameRouter& router)
{
    const Mode mode = m_modes[tickIndex % m_modes.size()];

    TriggerPattern pattern;
    if (!m_encoder->Encode(mode, m_periodUs, m_exposuresUs[GetModeIndex(mode)],
                pattern))
    {
        // Cannot happen with armed configuration
        SetFailure(FailureKind::Rejected, "Pattern encoding failed");
        return false;
    }

    uint64_t startUs;
    if (!m_driver->AssertPattern(pattern, startUs))
    {
        const std::string message = m_driver->GetErrorMessage();
        SetFailure(FailureKind::TriggerFault, message);
        Log::LogE("Failure asserting %s pattern at tick %llu (%s)",
                GetModeName(mode), (unsigned long long)tickIndex, message.c_str());
        return false;
    }
    m_issuedTicks++;

    Tick tick;
    tick.index = tickIndex;
    tick.mode = mode;
    tick.periodUs = m_periodUs;
    tick.startUs = startUs;
    tick.deadlineUs = startUs + m_timeoutUs;

    if (router.Route(tick) == RouteResult::DeviceFault)
    {
        SetFailure(FailureKind::AcquisitionFault, router.GetErrorMessage());
        return false;
    }

    return true;
}

void o2::ModeScheduler::Drain(FrameRouter& router, StackWriter* writer)
{
    const bool failed = GetFailure().kind != FailureKind::None;
    // A fault skips draining state, everything below is done anyway
    if (!failed)
        m_state = SchedulerState::Draining;

    if (!m_driver->Release())
    {
        Log::LogE("Failure releasing trigger lines (%s)",
                m_driver->GetErrorMessage().c_str());
    }

    router.DiscardPending();

    if (writer)
        writer->FlushAndCloseAll();

    m_state = SchedulerState::Stopped;

    if (failed)
    {
        const FailureReason failure = GetFailure();
        Log::LogE("Run failed after %llu ticks, %s (%s)",
                (unsigned long long)m_issuedTicks, GetFailureKindName(failure.kind),
                failure.message.c_str());
    }
}

void o2::ModeScheduler::SetFailure(FailureKind kind, const std::string& message)
{
    std::lock_guard<std::mutex> lock(m_failureMutex);
    m_failure.kind = kind;
    m_failure.message = message;
}

void o2::ModeScheduler::RaiseAdvisory(const Advisory& advisory)
{
    if (m_advisoryHandler)
        m_advisoryHandler(advisory);
}
