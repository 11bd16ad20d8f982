#include "Timer.h"

/* System */
#include <chrono>

uint64_t o2::NowUs()
{
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
}

uint64_t o2::UsUntil(uint64_t hostUs)
{
    const uint64_t nowUs = NowUs();
    return (hostUs > nowUs) ? hostUs - nowUs : 0;
}
