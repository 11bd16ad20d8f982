#include "RunMetadata.h"

/* System */
#include <fstream>

/* Local */
#include "Log.h"
#include "Utils.h"

std::string o2::RunMetadata::BuildFileName(const std::string& dir,
        std::time_t runStartTime)
{
    std::string fileName = dir;
    if (!fileName.empty() && fileName.back() != '/')
        fileName += '/';
    fileName += "Metadata_" + FormatFileTimeStamp(runStartTime) + ".txt";
    return fileName;
}

std::string o2::RunMetadata::FormatTime(std::time_t time)
{
    std::tm tm;
    localtime_r(&time, &tm);

    char buffer[sizeof("YYYY-MM-DD HH:MM:SS")];
    if (0 == std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm))
        return "0000-00-00 00:00:00";
    return buffer;
}

void o2::RunMetadata::Add(const std::string& key, const std::string& value)
{
    m_items.emplace_back(key, value);
}

void o2::RunMetadata::Add(const std::vector<DeviceSetting>& items)
{
    m_items.insert(m_items.end(), items.begin(), items.end());
}

std::string o2::RunMetadata::GetValue(const std::string& key) const
{
    for (const DeviceSetting& item : m_items)
    {
        if (item.first == key)
            return item.second;
    }
    return "";
}

bool o2::RunMetadata::Save(const std::string& fileName) const
{
    std::ofstream file(fileName, std::ios::out | std::ios::trunc);
    if (!file.is_open())
    {
        Log::LogE("Failed to create metadata file '%s'", fileName.c_str());
        return false;
    }

    for (const DeviceSetting& item : m_items)
        file << item.first << ": " << item.second << "\n";

    file.flush();
    if (!file.good())
    {
        Log::LogE("Failed to write metadata file '%s'", fileName.c_str());
        return false;
    }

    Log::LogI("Saved run metadata to '%s'", fileName.c_str());
    return true;
}
