#include "AcquisitionSession.h"

/* System */
#include <chrono>
#include <sstream>
#include <thread>

/* Local */
#include "LineMap.h"
#include "Log.h"
#include "StackFile.h"
#include "Utils.h"
#include "osutils.h"

o2::AcquisitionSession::AcquisitionSession(std::shared_ptr<TriggerDriver> driver,
        std::shared_ptr<FrameAcquirer> acquirer)
    : m_driver(driver),
    m_acquirer(acquirer),
    m_readiness(),
    m_advisoryMutex(),
    m_advisoryHandler(),
    m_advisoryQueue(),
    m_config(),
    m_runStartTime(0),
    m_metadataFileName(),
    m_runStates(),
    m_health(),
    m_writer(),
    m_router(),
    m_scheduler(),
    m_liveFeed(),
    m_failureMutex(),
    m_startFailure(),
    m_acqThread(nullptr),
    m_acqThreadDoneFlag(true),
    m_updateThread(nullptr),
    m_updateThreadMutex(),
    m_updateThreadCond()
{
}

o2::AcquisitionSession::~AcquisitionSession()
{
    RequestStop();
    WaitForStop();
    ReleaseRun();
}

void o2::AcquisitionSession::SetReadinessCheck(const ReadinessCheck& readiness)
{
    m_readiness = readiness;
}

void o2::AcquisitionSession::SetAdvisoryHandler(const AdvisoryHandler& handler)
{
    std::lock_guard<std::mutex> lock(m_advisoryMutex);
    m_advisoryHandler = handler;
}

bool o2::AcquisitionSession::Start(const RunConfig& config,
        std::shared_ptr<LiveFeed> liveFeed)
{
    if (IsRunning())
    {
        Log::LogE("Acquisition already running");
        return false;
    }

    // Collect threads and objects of previous run if any
    WaitForStop();
    ReleaseRun();

    {
        std::lock_guard<std::mutex> lock(m_failureMutex);
        m_startFailure = FailureReason();
    }

    if (!m_driver || !m_acquirer)
    {
        Reject(FailureKind::Rejected, "Trigger output or camera missing");
        return false;
    }

    std::string reason;
    if (!config.Validate(reason))
    {
        Reject(FailureKind::Rejected, reason);
        return false;
    }

    m_config = config;

    const std::shared_ptr<const LineMap> lineMap =
        LineMap::Create(m_config.GetLineMapType());
    if (!m_driver->Open(m_config.GetDevice(), lineMap))
    {
        Reject(FailureKind::Rejected, "Failed to open trigger output '"
                + m_config.GetDevice() + "' (" + m_driver->GetErrorMessage() + ")");
        return false;
    }

    m_scheduler = std::make_unique<ModeScheduler>(m_driver);
    m_scheduler->SetAdvisoryHandler(
            [this](const Advisory& advisory) { OnAdvisory(advisory); });
    if (!m_scheduler->Arm(m_config, m_readiness))
    {
        m_driver->Close();
        return false;
    }

    m_runStartTime = std::time(nullptr);
    m_metadataFileName.clear();
    for (ModeRunState& state : m_runStates)
        state.Reset();

    m_health = std::make_unique<HealthMonitor>(m_config.GetModes(),
            m_config.GetPeriodUs(), m_config.GetHealthParams());
    m_health->SetAdvisoryHandler(
            [this](const Advisory& advisory) { OnAdvisory(advisory); });

    if (m_config.IsStoring())
    {
        m_writer = std::make_unique<StackWriter>(m_config.GetSaveDir(),
                m_config.GetStorageType(), m_config.GetModes(), m_runStartTime,
                m_config.GetMaxQueuedBytes());
        m_writer->SetAdvisoryHandler(
                [this](const Advisory& advisory) { OnAdvisory(advisory); });
        if (!m_writer->Start())
        {
            m_writer.reset();
            m_driver->Close();
            Reject(FailureKind::Rejected, "Failed to prepare storage in '"
                    + m_config.GetSaveDir() + "'");
            return false;
        }

        const std::string metadataFileName =
            RunMetadata::BuildFileName(m_config.GetSaveDir(), m_runStartTime);
        if (!BuildRunMetadata().Save(metadataFileName))
        {
            m_writer->FlushAndCloseAll();
            m_writer.reset();
            m_driver->Close();
            Reject(FailureKind::Rejected, "Failed to save run metadata to '"
                    + metadataFileName + "'");
            return false;
        }
        m_metadataFileName = metadataFileName;
    }
    else if (m_config.GetSaveEnabled())
    {
        Log::LogW("Saving enabled with no storage type, frames will not be stored");
    }

    if (!m_acquirer->Start())
    {
        if (m_writer)
            m_writer->FlushAndCloseAll();
        m_driver->Close();
        Reject(FailureKind::Rejected, "Failed to start camera ("
                + m_acquirer->GetErrorMessage() + ")");
        return false;
    }

    m_liveFeed = liveFeed;
    m_router = std::make_unique<FrameRouter>(m_acquirer, *m_health, m_runStates,
            m_writer.get(), m_liveFeed);

    m_acqThreadDoneFlag = false;

    m_updateThread =
        new(std::nothrow) std::thread(&AcquisitionSession::UpdateThreadLoop, this);
    if (m_updateThread)
    {
        m_acqThread =
            new(std::nothrow) std::thread(&AcquisitionSession::AcqThreadLoop, this);
    }

    if (!m_updateThread || !m_acqThread)
    {
        m_acqThreadDoneFlag = true;
        m_updateThreadCond.notify_all();
        WaitForStop();
        m_acquirer->Stop();
        if (m_writer)
            m_writer->FlushAndCloseAll();
        m_driver->Close();
        Reject(FailureKind::Rejected, "Failed to start acquisition threads");
        return false;
    }

    Log::LogI("Acquisition started");
    return true;
}

bool o2::AcquisitionSession::IsRunning() const
{
    return !m_acqThreadDoneFlag;
}

void o2::AcquisitionSession::RequestStop()
{
    if (m_scheduler)
        m_scheduler->RequestStop();
}

bool o2::AcquisitionSession::WaitForStop(bool printStats)
{
    const bool printEndMessage = m_acqThread && m_updateThread;

    if (m_acqThread)
    {
        if (m_acqThread->joinable())
            m_acqThread->join();
        delete m_acqThread;
        m_acqThread = nullptr;
    }
    if (m_updateThread)
    {
        if (m_updateThread->joinable())
            m_updateThread->join();
        delete m_updateThread;
        m_updateThread = nullptr;
    }

    if (printStats && m_scheduler)
        PrintRunStats();

    const FailureReason failure = GetFailure();

    if (printEndMessage)
    {
        if (failure.kind != FailureKind::None)
            Log::LogE("Acquisition failed (%s)", failure.message.c_str());
        else if (m_scheduler->IsStopRequested())
            Log::LogI("Acquisition stopped");
        else
            Log::LogI("Acquisition finished");
    }

    return failure.kind == FailureKind::None;
}

o2::SchedulerState o2::AcquisitionSession::GetState() const
{
    return (m_scheduler) ? m_scheduler->GetState() : SchedulerState::Idle;
}

o2::FailureReason o2::AcquisitionSession::GetFailure() const
{
    {
        std::lock_guard<std::mutex> lock(m_failureMutex);
        if (m_startFailure.kind != FailureKind::None)
            return m_startFailure;
    }
    return (m_scheduler) ? m_scheduler->GetFailure() : FailureReason();
}

o2::ModeStats o2::AcquisitionSession::GetModeStats(Mode mode) const
{
    const ModeRunState& state = m_runStates[GetModeIndex(mode)];

    ModeStats stats;
    stats.mode = mode;
    stats.framesRouted = state.framesRouted;
    stats.timeouts = state.timeouts;
    stats.lateFrames = state.lateFrames;
    if (m_health)
    {
        stats.avgIntervalUs = m_health->GetAverageIntervalUs(mode);
        stats.achievedRateHz = m_health->GetAchievedRateHz(mode);
        stats.longestTimeoutRun = m_health->GetLongestTimeoutRun(mode);
        stats.healthy = m_health->IsHealthy(mode);
    }
    if (m_writer)
    {
        stats.framesSaved = m_writer->GetSavedCount(mode);
        stats.framesDropped = m_writer->GetDroppedCount(mode);
        stats.writeErrors = m_writer->GetWriteErrorCount(mode);
        stats.stackFileName = m_writer->GetFileName(mode);
    }
    return stats;
}

std::vector<o2::ModeStats> o2::AcquisitionSession::GetAllModeStats() const
{
    std::vector<ModeStats> allStats;
    for (Mode mode : m_config.GetModes())
        allStats.push_back(GetModeStats(mode));
    return allStats;
}

std::string o2::AcquisitionSession::GetStackFileName(Mode mode) const
{
    return (m_writer) ? m_writer->GetFileName(mode) : "";
}

uint64_t o2::AcquisitionSession::GetUnattributedFrameCount() const
{
    return (m_router) ? m_router->GetUnattributedCount() : 0;
}

uint64_t o2::AcquisitionSession::GetIssuedTickCount() const
{
    return (m_scheduler) ? m_scheduler->GetIssuedTickCount() : 0;
}

void o2::AcquisitionSession::AcqThreadLoop()
{
    if (!SetCurrentThreadPriorityAboveNormal())
        Log::LogW("Failed to raise priority of scheduling thread");

    m_scheduler->Run(*m_router, m_writer.get());

    if (!m_acquirer->Stop())
    {
        Log::LogE("Failure stopping camera (%s)",
                m_acquirer->GetErrorMessage().c_str());
    }
    if (!m_driver->Close())
    {
        Log::LogE("Failure closing trigger output (%s)",
                m_driver->GetErrorMessage().c_str());
    }

    {
        std::lock_guard<std::mutex> lock(m_updateThreadMutex);
        m_acqThreadDoneFlag = true;
    }
    m_updateThreadCond.notify_all();
}

void o2::AcquisitionSession::UpdateThreadLoop()
{
    const std::vector<std::string> progress{ "|", "/", "-", "\\" };
    size_t progressIndex = 0;

    while (!m_acqThreadDoneFlag)
    {
        // Use wait_for instead of sleep to stop immediately on request
        {
            std::unique_lock<std::mutex> lock(m_updateThreadMutex);
            m_updateThreadCond.wait_for(lock, std::chrono::milliseconds(500), [this]() {
                return !!m_acqThreadDoneFlag;
            });
        }
        if (m_acqThreadDoneFlag)
            break;

        DeliverAdvisories();

        std::ostringstream ss;
        ss << progress[progressIndex] << " tick "
            << m_scheduler->GetIssuedTickCount();
        for (Mode mode : m_config.GetModes())
        {
            const ModeRunState& state = m_runStates[GetModeIndex(mode)];
            ss << ", " << GetModeName(mode) << " " << state.framesRouted;
            if (state.timeouts > 0)
                ss << " (" << state.timeouts << " lost)";
            if (m_writer)
                ss << " " << m_writer->GetSavedCount(mode) << " saved";
        }
        if (m_scheduler->IsStopRequested())
            ss << ", finishing...";

        Log::LogP(ss.str());

        progressIndex = (progressIndex + 1) % progress.size();
    }

    // Whatever was raised until the scheduler finished
    DeliverAdvisories();
}

void o2::AcquisitionSession::OnAdvisory(const Advisory& advisory)
{
    if (!m_advisoryQueue.Push(advisory))
    {
        Log::LogW("Advisory queue full, %s advisory not delivered",
                GetAdvisoryKindName(advisory.kind));
    }
}

void o2::AcquisitionSession::DeliverAdvisories()
{
    AdvisoryHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_advisoryMutex);
        handler = m_advisoryHandler;
    }

    Advisory advisory;
    while (m_advisoryQueue.Pop(advisory))
    {
        if (handler)
            handler(advisory);
    }
}

void o2::AcquisitionSession::Reject(FailureKind kind, const std::string& message)
{
    {
        std::lock_guard<std::mutex> lock(m_failureMutex);
        m_startFailure.kind = kind;
        m_startFailure.message = message;
    }
    Log::LogE("Acquisition not started (%s)", message.c_str());

    // No update thread runs, e.g. exposure clamps from arming are still queued
    DeliverAdvisories();
}

o2::RunMetadata o2::AcquisitionSession::BuildRunMetadata() const
{
    RunMetadata metadata;
    metadata.Add("timestamp", RunMetadata::FormatTime(m_runStartTime));
    metadata.Add("modes", ModeSetToString(m_config.GetModes()));

    std::ostringstream ss;
    ss << m_config.GetFrequencyHz() << " Hz";
    metadata.Add("frequency", ss.str());
    metadata.Add("period", std::to_string(m_config.GetPeriodUs()) + " us");

    for (Mode mode : m_config.GetModes())
    {
        const TriggerPattern& pattern = m_scheduler->GetArmedPattern(mode);
        ss.str("");
        ss << pattern.GetExposureUs() / 1000.0 << " ms";
        if (pattern.IsExposureClamped())
            ss << " (requested " << pattern.GetRequestedExposureUs() / 1000.0 << " ms)";
        metadata.Add(ToLower(GetModeName(mode)) + "_exposure", ss.str());
    }

    metadata.Add("device", m_config.GetDevice());
    metadata.Add("line_map", GetLineMapTypeName(m_config.GetLineMapType()));
    metadata.Add("settle_margin",
            std::to_string(m_config.GetSettleMarginUs()) + " us");
    ss.str("");
    ss << m_config.GetFrameTimeoutPeriods() << " periods";
    metadata.Add("frame_timeout", ss.str());
    metadata.Add("tick_count", (m_config.GetTickCount() > 0)
            ? std::to_string(m_config.GetTickCount()) : "until stopped");
    metadata.Add("storage", GetStorageTypeName(m_config.GetStorageType()));

    metadata.Add(m_acquirer->GetSettings());
    return metadata;
}

void o2::AcquisitionSession::ReleaseRun()
{
    m_router.reset();
    m_writer.reset();
    m_health.reset();
    m_liveFeed.reset();
    // Scheduler is kept, it holds state and failure of the last run
}

void o2::AcquisitionSession::PrintRunStats() const
{
    const double frequency = m_config.GetFrequencyHz();
    const double targetRate = frequency / m_config.GetModes().size();

    std::ostringstream ss;
    ss << "\nRun stats:"
        << "\n  Ticks issued = " << m_scheduler->GetIssuedTickCount()
        << " at " << frequency << " Hz"
        << "\n  Unattributed frames = " << GetUnattributedFrameCount();
    for (Mode mode : m_config.GetModes())
    {
        const ModeStats stats = GetModeStats(mode);
        ss << "\n  " << GetModeName(mode) << ":"
            << "\n    Frames routed = " << stats.framesRouted
            << "\n    # Timeouts = " << stats.timeouts
            << "\n    Longest series of timeouts = " << stats.longestTimeoutRun
            << "\n    Late frames = " << stats.lateFrames
            << "\n    Achieved rate = " << stats.achievedRateHz
            << " Hz (target " << targetRate << " Hz)";
        if (m_writer)
        {
            ss << "\n    Frames saved = " << stats.framesSaved
                << "\n    Frames dropped = " << stats.framesDropped
                << "\n    Max. queued frames = " << m_writer->GetQueuePeak(mode)
                << " out of " << m_writer->GetQueueCapacity(mode);
            if (stats.writeErrors > 0)
                ss << "\n    Write errors = " << stats.writeErrors;
            if (!stats.stackFileName.empty())
                ss << "\n    Stack file = " << stats.stackFileName;
        }
    }
    ss << "\n";

    Log::LogI(ss.str());
}
