#pragma once
#ifndef O2_ADVISORY_H
#define O2_ADVISORY_H

/* System */
#include <functional>
#include <string>

/* Local */
#include "Mode.h"

namespace o2 {

// Non-fatal conditions reported while a run is armed or in progress
enum class AdvisoryKind
{
    ExposureClamped,
    HealthDegraded,
    HealthRecovered,
    WriteBackpressure,
};

struct Advisory
{
    AdvisoryKind kind;
    Mode mode;
    std::string message;
};

// Invoked on the thread that detected the condition
using AdvisoryHandler = std::function<void(const Advisory&)>;

const char* GetAdvisoryKindName(AdvisoryKind kind);

} // namespace o2

#endif /* O2_ADVISORY_H */
