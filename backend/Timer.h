#pragma once
#ifndef O2_TIMER_H
#define O2_TIMER_H

/* System */
#include <cstdint>

namespace o2 {

// Monotonic host time in microseconds, common time base of all devices
uint64_t NowUs();

// Microseconds to wait from now until given host time, zero if already passed
uint64_t UsUntil(uint64_t hostUs);

} // namespace o2

#endif /* O2_TIMER_H */
