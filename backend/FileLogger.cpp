#include "FileLogger.h"

/* System */
#include <ctime>

/* Local */
#include "Utils.h"
#include "osutils.h"

o2::FileLogger::FileLogger()
    : m_fileName(),
    m_file()
{
}

o2::FileLogger::~FileLogger()
{
    Close();
}

bool o2::FileLogger::Open(const std::string& dir)
{
    if (IsOpen())
        return true;

    if (!CreateDirectories(dir))
    {
        Log::LogE("Failed to create log folder '%s'", dir.c_str());
        return false;
    }

    m_fileName = dir + "/o2acq_" + FormatFileTimeStamp(std::time(nullptr)) + ".log";
    m_file.open(m_fileName, std::ios_base::out | std::ios_base::trunc);
    if (!m_file.is_open())
    {
        Log::LogE("Failed to create log file '%s'", m_fileName.c_str());
        return false;
    }

    Log::AddListener(this);
    Log::LogI("Logging to '%s'", m_fileName.c_str());
    return true;
}

bool o2::FileLogger::IsOpen() const
{
    return m_file.is_open();
}

void o2::FileLogger::Close()
{
    if (!IsOpen())
        return;

    Log::Flush();
    Log::RemoveListener(this);
    m_file.close();
}

void o2::FileLogger::OnLogEntryAdded(const Log::Entry& entry)
{
    if (entry.GetLevel() == Log::Level::Progress)
        return;

    m_file << entry.Format();
    if (entry.GetText().empty() || entry.GetText().back() != '\n')
        m_file << '\n';
    m_file.flush();
}
