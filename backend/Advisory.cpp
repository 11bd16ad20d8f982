#include "Advisory.h"

const char* o2::GetAdvisoryKindName(AdvisoryKind kind)
{
    switch (kind)
    {
    case AdvisoryKind::ExposureClamped:
        return "ExposureClamped";
    case AdvisoryKind::HealthDegraded:
        return "HealthDegraded";
    case AdvisoryKind::HealthRecovered:
        return "HealthRecovered";
    case AdvisoryKind::WriteBackpressure:
        return "WriteBackpressure";
    }
    return "<unknown>";
}
