#include "AdvisoryQueue.h"

/* System */
#include <utility>

constexpr size_t o2::AdvisoryQueue::Capacity;

o2::AdvisoryQueue::AdvisoryQueue()
    : m_slots(),
    m_head(0),
    m_tail(0),
    m_droppedCount(0)
{
}

bool o2::AdvisoryQueue::Push(const Advisory& advisory)
{
    const uint64_t tail = m_tail.load(std::memory_order_relaxed);
    if (tail - m_head.load(std::memory_order_acquire) >= Capacity)
    {
        m_droppedCount++;
        return false;
    }

    m_slots[tail % Capacity] = advisory;
    m_tail.store(tail + 1, std::memory_order_release);
    return true;
}

bool o2::AdvisoryQueue::Pop(Advisory& advisory)
{
    const uint64_t head = m_head.load(std::memory_order_relaxed);
    if (head == m_tail.load(std::memory_order_acquire))
        return false;

    advisory = std::move(m_slots[head % Capacity]);
    m_head.store(head + 1, std::memory_order_release);
    return true;
}
