#pragma once
#ifndef O2_FRAME_ROUTER_H
#define O2_FRAME_ROUTER_H

/* System */
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

/* Local */
#include "FrameAcquirer.h"
#include "HealthMonitor.h"
#include "LiveFeed.h"
#include "Mode.h"
#include "ModeRunState.h"
#include "StackWriter.h"

namespace o2 {

// One scheduled trigger, i.e. one expected frame
struct Tick
{
    // Counted from zero since the camera was started, one per trigger
    uint64_t index = 0;
    Mode mode = Mode::Bioluminescence;
    uint32_t periodUs = 0;
    // Host time the exposure trigger pattern starts at
    uint64_t startUs = 0;
    // No frame for this tick is accepted after this time
    uint64_t deadlineUs = 0;
};

enum class RouteResult
{
    Routed,
    Timeout,
    DeviceFault,
};

// Binds delivered frames to the tick they were triggered by and passes them
// on to storage and live display. Used from the scheduling thread only.
// The camera numbers frames from 1 per exposure since start, frame N is the
// answer to tick N-1. Delivery time plays no role in attribution.
class FrameRouter
{
public:
    /* Writer and live feed are optional. The router does not own the run
       states, health monitor or writer, they have to outlive it. */
    FrameRouter(std::shared_ptr<FrameAcquirer> acquirer, HealthMonitor& health,
            ModeRunStates& runStates, StackWriter* writer,
            std::shared_ptr<LiveFeed> liveFeed);

    FrameRouter() = delete;
    FrameRouter(const FrameRouter&) = delete;
    FrameRouter& operator=(const FrameRouter&) = delete;

    /* Waits for the frame of given tick until its deadline.
       Frames of earlier ticks, i.e. arriving after their own deadline,
       are dropped as late ones. */
    RouteResult Route(const Tick& tick);

    // Drops frames delivered after the last routed tick, returns their count
    size_t DiscardPending();

    // Frames that could not be bound to any tick
    uint64_t GetUnattributedCount() const
    { return m_unattributedCount; }
    uint64_t GetStoreRejectedCount() const
    { return m_storeRejectedCount; }

    // Acquirer error, valid after DeviceFault
    const std::string& GetErrorMessage() const
    { return m_errorMessage; }

    // Tick the frame was triggered by
    static uint64_t GetFrameTickIndex(const Frame& frame);

private:
    void Dispatch(const Tick& tick, std::unique_ptr<Frame> frame);

private:
    const std::shared_ptr<FrameAcquirer> m_acquirer;
    HealthMonitor& m_health;
    ModeRunStates& m_runStates;
    StackWriter* const m_writer;
    const std::shared_ptr<LiveFeed> m_liveFeed;

    std::atomic<uint64_t> m_unattributedCount;
    std::atomic<uint64_t> m_storeRejectedCount;
    std::string m_errorMessage;
};

} // namespace o2

#endif /* O2_FRAME_ROUTER_H */
