#pragma once
#ifndef O2_FILE_LOGGER_H
#define O2_FILE_LOGGER_H

/* System */
#include <fstream>
#include <string>

/* Local */
#include "Log.h"

namespace o2 {

// Writes every log entry, progress excluded, into a session log file
class FileLogger : private Log::IListener
{
public:
    FileLogger();
    virtual ~FileLogger();

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

public:
    // Creates <dir>/o2acq_<YYYYMMDD_HHMMSS>.log, the folder is created if missing
    bool Open(const std::string& dir);
    bool IsOpen() const;
    void Close();

    const std::string& GetFileName() const
    { return m_fileName; }

private: // Log::IListener
    virtual void OnLogEntryAdded(const Log::Entry& entry) override;

private:
    std::string m_fileName;
    std::ofstream m_file;
};

} // namespace o2

#endif /* O2_FILE_LOGGER_H */
