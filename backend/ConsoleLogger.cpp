#include "ConsoleLogger.h"

/* System */
#include <cstdio>
#include <iostream>

o2::ConsoleLogger::ConsoleLogger(bool verbose)
    : m_verbose(verbose),
    m_progressLength(0)
{
    Log::AddListener(this);
}

o2::ConsoleLogger::~ConsoleLogger()
{
    Log::RemoveListener(this);
    // Keep shell prompt off the last progress line
    if (m_progressLength > 0)
        std::cout << std::endl;
}

void o2::ConsoleLogger::OnLogEntryAdded(const Log::Entry& entry)
{
    // Called from log thread only, no locking needed

    const Log::Level level = entry.GetLevel();
    if (level == Log::Level::Debug && !m_verbose)
        return;

    std::string line = std::string("[") + Log::GetLevelTag(level) + "] ";
    if (m_verbose)
    {
        char hostTime[32];
        std::snprintf(hostTime, sizeof(hostTime), "%.6f ", entry.GetHostUs() / 1e6);
        line += hostTime;
    }
    line += entry.GetText();

    // Progress lines overwrite each other, anything else starts below
    std::string padding;
    if (m_progressLength > line.length())
        padding.assign(m_progressLength - line.length(), ' ');

    std::ostream& out = (level == Log::Level::Error) ? std::cerr : std::cout;
    if (level == Log::Level::Progress)
    {
        out << '\r' << line << padding << std::flush;
        m_progressLength = line.length();
        return;
    }

    if (m_progressLength > 0)
    {
        std::cout << '\r' << std::string(m_progressLength, ' ') << '\r' << std::flush;
        m_progressLength = 0;
    }
    out << line << '\n' << std::flush;
}
