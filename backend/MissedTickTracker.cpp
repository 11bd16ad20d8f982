#include "MissedTickTracker.h"

/* System */
#include <algorithm>

void o2::MissedTickTracker::Clear()
{
    m_ranges.clear();
    m_normalized = false;
}

void o2::MissedTickTracker::AddItem(uint64_t tickIndex)
{
    AddRange(tickIndex, tickIndex);
}

void o2::MissedTickTracker::AddRange(uint64_t firstTickIndex, uint64_t lastTickIndex)
{
    if (firstTickIndex > lastTickIndex)
        return;

    m_ranges.emplace_back(firstTickIndex, lastTickIndex);
    m_normalized = false;
}

void o2::MissedTickTracker::Normalize() const
{
    if (m_normalized || m_ranges.empty())
        return;

    // Pairs compare by first then second index
    std::sort(m_ranges.begin(), m_ranges.end());

    std::deque<TickRange> merged;
    TickRange current = m_ranges.front();
    for (size_t n = 1; n < m_ranges.size(); n++)
    {
        const TickRange& next = m_ranges[n];
        if (next.first > current.second + 1)
        {
            merged.push_back(current);
            current = next;
        }
        else if (next.second > current.second)
        {
            current.second = next.second;
        }
    }
    merged.push_back(current);

    m_ranges.swap(merged);
    m_normalized = true;
}

size_t o2::MissedTickTracker::GetCount() const
{
    Normalize();

    size_t count = 0;
    for (const TickRange& range : m_ranges)
        count += (size_t)(range.second - range.first + 1);
    return count;
}

double o2::MissedTickTracker::GetAvgSpacing() const
{
    Normalize();

    // Each pair of neighbours inside a range is one apart, between ranges
    // the spacing is the gap from the end of one to the start of the next
    double spacingSum = 0.0;
    size_t pairs = 0;
    for (size_t n = 0; n < m_ranges.size(); n++)
    {
        const uint64_t length = m_ranges[n].second - m_ranges[n].first;
        spacingSum += (double)length;
        pairs += (size_t)length;

        if (n > 0)
        {
            spacingSum += (double)(m_ranges[n].first - m_ranges[n - 1].second);
            pairs++;
        }
    }

    return (pairs > 0) ? spacingSum / (double)pairs : 0.0;
}

size_t o2::MissedTickTracker::GetLargestCluster() const
{
    Normalize();

    size_t largest = 0;
    for (const TickRange& range : m_ranges)
        largest = std::max(largest, (size_t)(range.second - range.first + 1));
    return largest;
}
