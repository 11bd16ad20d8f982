#pragma once
#ifndef O2_RUN_METADATA_H
#define O2_RUN_METADATA_H

/* System */
#include <ctime>
#include <string>
#include <vector>

/* Local */
#include "FrameAcquirer.h"

namespace o2 {

// Settings a run was acquired with, saved as "key: value" lines beside stacks
class RunMetadata
{
public:
    // Builds <dir>/Metadata_<YYYYMMDD_HHMMSS>.txt
    static std::string BuildFileName(const std::string& dir,
            std::time_t runStartTime);

    // Local time as YYYY-MM-DD HH:MM:SS
    static std::string FormatTime(std::time_t time);

public:
    void Add(const std::string& key, const std::string& value);
    void Add(const std::vector<DeviceSetting>& items);

    const std::vector<DeviceSetting>& GetItems() const
    { return m_items; }
    // Value of the first item with given key, empty if there is none
    std::string GetValue(const std::string& key) const;

    bool Save(const std::string& fileName) const;

private:
    std::vector<DeviceSetting> m_items;
};

} // namespace o2

#endif /* O2_RUN_METADATA_H */
