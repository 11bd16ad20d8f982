#pragma once
#ifndef O2_ADVISORY_QUEUE_H
#define O2_ADVISORY_QUEUE_H

/* System */
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

/* Local */
#include "Advisory.h"

namespace o2 {

/* Fixed size ring passing advisories from one producer thread to one
   consumer thread. Neither side locks or waits, a full ring drops the
   new advisory. */
class AdvisoryQueue
{
public:
    static constexpr size_t Capacity = 64;

public:
    AdvisoryQueue();

    AdvisoryQueue(const AdvisoryQueue&) = delete;
    AdvisoryQueue& operator=(const AdvisoryQueue&) = delete;

    // Producer side, returns false if the ring is full
    bool Push(const Advisory& advisory);
    // Consumer side, returns false if the ring is empty
    bool Pop(Advisory& advisory);

    uint64_t GetDroppedCount() const
    { return m_droppedCount; }

private:
    std::array<Advisory, Capacity> m_slots;
    // Both only grow, slot index is the value modulo capacity
    std::atomic<uint64_t> m_head; // Next slot to pop
    std::atomic<uint64_t> m_tail; // Next slot to push
    std::atomic<uint64_t> m_droppedCount;
};

} // namespace o2

#endif /* O2_ADVISORY_QUEUE_H */
