#pragma once
#ifndef O2_STACK_WRITER_H
#define O2_STACK_WRITER_H

/* System */
#include <array>
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

/* Local */
#include "Advisory.h"
#include "Frame.h"
#include "MissedTickTracker.h"
#include "Mode.h"
#include "StackFile.h"

namespace std
{
    class thread;
}

namespace o2 {

// Persists attributed frames, one stack file and one disk thread per mode.
// Append is meant for a single producer thread.
class StackWriter
{
public:
    // Lower limit for queue capacity regardless of memory budget
    static constexpr size_t MinQueueCapacity = 16;

public:
    StackWriter(const std::string& saveDir, StorageType storageType,
            const ModeSet& modes, std::time_t runStartTime,
            size_t maxQueuedBytes);
    ~StackWriter();

    StackWriter() = delete;
    StackWriter(const StackWriter&) = delete;
    StackWriter& operator=(const StackWriter&) = delete;

    void SetAdvisoryHandler(const AdvisoryHandler& handler);

    // Creates save folder and starts disk threads
    bool Start();

    /* Queues the frame for its mode stack without blocking.
       Returns false if the frame was not accepted, i.e. its mode is not
       enabled, the stack was already closed or the queue is full. */
    bool Append(std::shared_ptr<const Frame> frame);

    /* Stores all queued frames of the mode and finalizes its file.
       Second and later calls do nothing. */
    bool FlushAndClose(Mode mode);
    void FlushAndCloseAll();

    // Path of the mode stack, empty until its first frame arrives
    std::string GetFileName(Mode mode) const;

    uint64_t GetSavedCount(Mode mode) const;
    uint64_t GetDroppedCount(Mode mode) const;
    uint64_t GetWriteErrorCount(Mode mode) const;
    size_t GetQueuePeak(Mode mode) const;
    // Zero until capacity is derived from the first frame size
    size_t GetQueueCapacity(Mode mode) const;
    size_t GetLongestDropRun(Mode mode) const;

private:
    struct Stream
    {
        explicit Stream(Mode m) : mode(m) {}

        const Mode mode;
        std::thread* thread = nullptr;

        mutable std::mutex mutex; // Covers all non-atomic members
        std::condition_variable cond;
        std::queue<std::shared_ptr<const Frame>> frames;
        size_t capacity = 0;
        bool backpressure = false;
        bool closeRequested = false;
        std::string fileName;
        // Dropped frames by tick index
        MissedTickTracker dropped;

        std::atomic<bool> closed{ false };
        std::atomic<uint64_t> savedCount{ 0 };
        std::atomic<uint64_t> droppedCount{ 0 };
        std::atomic<uint64_t> writeErrorCount{ 0 };
        std::atomic<size_t> peak{ 0 };
    };

private:
    // The function performs in Stream::thread, stores frames of one mode
    void DiskThreadLoop(Stream& stream);

    // Opens mode stack, called from disk thread on first frame
    std::unique_ptr<StackFile> CreateFile(Stream& stream, const Frame& frame);

    Stream* GetStream(Mode mode) const;

    void RaiseAdvisory(const Advisory& advisory);

private:
    const std::string m_saveDir;
    const StorageType m_storageType;
    const ModeSet m_modes;
    const std::time_t m_runStartTime;
    size_t m_maxQueuedBytes;

    std::mutex m_advisoryMutex;
    AdvisoryHandler m_advisoryHandler;

    std::array<std::unique_ptr<Stream>, ModeCount> m_streams;
};

} // namespace o2

#endif /* O2_STACK_WRITER_H */
