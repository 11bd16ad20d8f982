#pragma once
#ifndef O2_CONSOLE_LOGGER_H
#define O2_CONSOLE_LOGGER_H

/* System */
#include <string>

/* Local */
#include "Log.h"

namespace o2 {

// Prints log entries to stdout, errors to stderr
class ConsoleLogger : private Log::IListener
{
public:
    // Debug entries are printed only when verbose
    explicit ConsoleLogger(bool verbose = false);
    virtual ~ConsoleLogger();

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

private: // Log::IListener
    virtual void OnLogEntryAdded(const Log::Entry& entry) override;

private:
    const bool m_verbose;
    // Length of progress line currently shown, zero if none
    size_t m_progressLength;
};

} // namespace o2

#endif /* O2_CONSOLE_LOGGER_H */
