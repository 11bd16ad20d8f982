#pragma once
#ifndef O2_ACQUISITION_SESSION_H
#define O2_ACQUISITION_SESSION_H

/* System */
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/* Local */
#include "Advisory.h"
#include "AdvisoryQueue.h"
#include "FrameAcquirer.h"
#include "FrameRouter.h"
#include "HealthMonitor.h"
#include "LiveFeed.h"
#include "ModeRunState.h"
#include "ModeScheduler.h"
#include "RunConfig.h"
#include "RunMetadata.h"
#include "StackWriter.h"
#include "TriggerDriver.h"

namespace std
{
    class thread;
}

namespace o2 {

// Owns the run lifecycle, the only entry point for front ends
class AcquisitionSession
{
public:
    AcquisitionSession(std::shared_ptr<TriggerDriver> driver,
            std::shared_ptr<FrameAcquirer> acquirer);
    ~AcquisitionSession();

    AcquisitionSession() = delete;
    AcquisitionSession(const AcquisitionSession&) = delete;
    AcquisitionSession& operator=(const AcquisitionSession&) = delete;

public:
    // Called at each start unless the configuration overrides readiness
    void SetReadinessCheck(const ReadinessCheck& readiness);
    /* Advisories raised while the run is in progress are passed on from the
       progress update thread, never from the scheduling thread. */
    void SetAdvisoryHandler(const AdvisoryHandler& handler);

    /* Validates the configuration, opens devices and starts the run in
       a separate thread. The live feed, if given, has to be started by the
       caller. Returns false with GetFailure filled if rejected. */
    bool Start(const RunConfig& config, std::shared_ptr<LiveFeed> liveFeed = nullptr);
    bool IsRunning() const;
    // Run stops at next tick boundary, stacks are flushed
    void RequestStop();
    // Blocks until the run ends, returns true if it ended without failure
    bool WaitForStop(bool printStats = false);

    SchedulerState GetState() const;
    FailureReason GetFailure() const;

    // Configuration of the last started run
    const RunConfig& GetConfig() const
    { return m_config; }

    ModeStats GetModeStats(Mode mode) const;
    std::vector<ModeStats> GetAllModeStats() const;
    std::string GetStackFileName(Mode mode) const;
    // Empty if the last run stored nothing
    std::string GetMetadataFileName() const
    { return m_metadataFileName; }
    uint64_t GetUnattributedFrameCount() const;
    uint64_t GetIssuedTickCount() const;

private:
    // The function performs in m_acqThread, runs the scheduler
    void AcqThreadLoop();
    // The function performs in m_updateThread, reports progress
    void UpdateThreadLoop();

    // Queues the advisory, called from the thread that raised it
    void OnAdvisory(const Advisory& advisory);
    // Passes queued advisories to the handler, called from one thread at a time
    void DeliverAdvisories();
    void Reject(FailureKind kind, const std::string& message);
    // Configuration, armed exposures and camera settings of the starting run
    RunMetadata BuildRunMetadata() const;
    // Releases objects of the last run, threads have to be stopped
    void ReleaseRun();
    void PrintRunStats() const;

private:
    const std::shared_ptr<TriggerDriver> m_driver;
    const std::shared_ptr<FrameAcquirer> m_acquirer;

    ReadinessCheck m_readiness;
    std::mutex m_advisoryMutex;
    AdvisoryHandler m_advisoryHandler;
    // Filled by the thread running the scheduler, drained by the update thread
    AdvisoryQueue m_advisoryQueue;

    RunConfig m_config;
    std::time_t m_runStartTime;
    std::string m_metadataFileName;

    ModeRunStates m_runStates;
    std::unique_ptr<HealthMonitor> m_health;
    std::unique_ptr<StackWriter> m_writer;
    std::unique_ptr<FrameRouter> m_router;
    std::unique_ptr<ModeScheduler> m_scheduler;
    std::shared_ptr<LiveFeed> m_liveFeed;

    mutable std::mutex m_failureMutex;
    // Start-time failure detected before the scheduler took over
    FailureReason m_startFailure;

    std::thread* m_acqThread;
    std::atomic<bool> m_acqThreadDoneFlag;
    std::thread* m_updateThread;
    std::mutex m_updateThreadMutex;
    std::condition_variable m_updateThreadCond;
};

} // namespace o2

#endif /* O2_ACQUISITION_SESSION_H */
