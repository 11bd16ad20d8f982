#include "FrameRouter.h"

/* System */
#include <algorithm>
#include <limits>

/* Local */
#include "Log.h"
#include "Timer.h"

o2::FrameRouter::FrameRouter(std::shared_ptr<FrameAcquirer> acquirer,
        HealthMonitor& health, ModeRunStates& runStates, StackWriter* writer,
        std::shared_ptr<LiveFeed> liveFeed)
    : m_acquirer(acquirer),
    m_health(health),
    m_runStates(runStates),
    m_writer(writer),
    m_liveFeed(liveFeed),
    m_unattributedCount(0),
    m_storeRejectedCount(0),
    m_errorMessage()
{
}

o2::RouteResult o2::FrameRouter::Route(const Tick& tick)
{
    ModeRunState& state = m_runStates[GetModeIndex(tick.mode)];

    while (true)
    {
        const uint64_t remainingUs = UsUntil(tick.deadlineUs);
        const uint32_t timeoutUs = (uint32_t)std::min<uint64_t>(remainingUs,
                std::numeric_limits<uint32_t>::max());

        std::unique_ptr<Frame> frame;
        const PullStatus status = m_acquirer->PullFrame(timeoutUs, frame);

        if (status == PullStatus::Fault)
        {
            m_errorMessage = m_acquirer->GetErrorMessage();
            Log::LogE("Frame acquisition failed at tick %llu (%s)",
                    (unsigned long long)tick.index, m_errorMessage.c_str());
            return RouteResult::DeviceFault;
        }

        if (status == PullStatus::Timeout || !frame)
        {
            // Pull may return a bit early, keep waiting until the deadline
            if (NowUs() < tick.deadlineUs)
                continue;

            state.timeouts++;
            m_health.RecordTimeout(tick.mode, tick.index);
            Log::LogW("No %s frame arrived for tick %llu",
                    GetModeName(tick.mode), (unsigned long long)tick.index);
            return RouteResult::Timeout;
        }

        const uint64_t frameTickIndex = GetFrameTickIndex(*frame);
        if (frameTickIndex < tick.index)
        {
            // Its own tick is already closed
            state.lateFrames++;
            m_unattributedCount++;
            Log::LogW("Dropped late frame %u of tick %llu while waiting for %s"
                    " tick %llu", frame->GetInfo().GetFrameNr(),
                    (unsigned long long)frameTickIndex, GetModeName(tick.mode),
                    (unsigned long long)tick.index);
            continue;
        }
        if (frameTickIndex > tick.index)
        {
            // Camera counted an exposure no trigger was issued for
            m_unattributedCount++;
            Log::LogW("Dropped frame %u numbered ahead of %s tick %llu",
                    frame->GetInfo().GetFrameNr(), GetModeName(tick.mode),
                    (unsigned long long)tick.index);
            continue;
        }

        Dispatch(tick, std::move(frame));
        return RouteResult::Routed;
    }
}

size_t o2::FrameRouter::DiscardPending()
{
    const size_t count = m_acquirer->DiscardQueuedFrames();
    if (count > 0)
    {
        m_unattributedCount += count;
        Log::LogW("Discarded %zu frames not bound to any tick", count);
    }
    return count;
}

uint64_t o2::FrameRouter::GetFrameTickIndex(const Frame& frame)
{
    const uint32_t frameNr = frame.GetInfo().GetFrameNr();
    // Zero is not a valid camera frame number, never matches any tick
    return (frameNr > 0) ? (uint64_t)frameNr - 1
        : std::numeric_limits<uint64_t>::max();
}

void o2::FrameRouter::Dispatch(const Tick& tick, std::unique_ptr<Frame> frame)
{
    frame->Attribute(tick.mode, tick.index);

    const uint64_t timestampUs = frame->GetInfo().GetTimestampUs();
    m_health.RecordFrame(tick.mode, tick.index, timestampUs);

    ModeRunState& state = m_runStates[GetModeIndex(tick.mode)];
    state.lastTimestampUs = timestampUs;
    state.framesRouted++;

    std::shared_ptr<const Frame> shared(std::move(frame));
    if (m_writer && !m_writer->Append(shared))
        m_storeRejectedCount++;
    if (m_liveFeed)
        m_liveFeed->InputNewFrame(shared);
}
