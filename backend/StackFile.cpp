#include "StackFile.h"

/* Local */
#include "Log.h"
#include "RawStackFile.h"
#include "TiffStackFile.h"
#include "Utils.h"

const char* o2::GetStorageTypeName(StorageType type)
{
    switch (type)
    {
    case StorageType::None:
        return "none";
    case StorageType::Tiff:
        return "tiff";
    case StorageType::Raw:
        return "raw";
    }
    return "<unknown>";
}

bool o2::ParseStorageType(const std::string& name, StorageType& type)
{
    const std::string lowerName = ToLower(name);
    for (StorageType t : { StorageType::None, StorageType::Tiff, StorageType::Raw })
    {
        if (lowerName == GetStorageTypeName(t))
        {
            type = t;
            return true;
        }
    }
    return false;
}

const char* o2::StackFile::GetFileExtension(StorageType type)
{
    switch (type)
    {
    case StorageType::None:
        return "";
    case StorageType::Tiff:
        return "tif";
    case StorageType::Raw:
        return "o2s";
    }
    return "";
}

std::string o2::StackFile::BuildFileName(const std::string& dir, Mode mode,
        std::time_t runStartTime, StorageType type)
{
    std::string fileName = dir;
    if (!fileName.empty() && fileName.back() != '/')
        fileName += '/';
    fileName += std::string(GetModeName(mode)) + "_"
        + FormatFileTimeStamp(runStartTime) + "." + GetFileExtension(type);
    return fileName;
}

std::unique_ptr<o2::StackFile> o2::StackFile::Create(StorageType type,
        const std::string& fileName, uint16_t width, uint16_t height,
        uint16_t bitDepth, Mode mode, std::time_t runStartTime)
{
    switch (type)
    {
    case StorageType::None:
        break;
    case StorageType::Tiff:
        return std::make_unique<TiffStackFile>(fileName, width, height,
                bitDepth, mode, runStartTime);
    case StorageType::Raw:
        return std::make_unique<RawStackFile>(fileName, width, height,
                bitDepth, mode, runStartTime);
    }
    return nullptr;
}

o2::StackFile::StackFile(const std::string& fileName, uint16_t width,
        uint16_t height, uint16_t bitDepth, Mode mode, std::time_t runStartTime)
    : m_fileName(fileName),
    m_width(width),
    m_height(height),
    m_bitDepth(bitDepth),
    m_mode(mode),
    m_runStartTime(runStartTime),
    m_frameIndex(0)
{
}

o2::StackFile::~StackFile()
{
}

bool o2::StackFile::WriteFrame(const Frame& frame)
{
    if (!IsOpen())
        return false;

    if (frame.GetWidth() != m_width || frame.GetHeight() != m_height)
    {
        Log::LogE("Frame %ux%u does not match stack '%s' of %ux%u",
                frame.GetWidth(), frame.GetHeight(), m_fileName.c_str(),
                m_width, m_height);
        return false;
    }

    if (frame.IsAttributed() && frame.GetMode() != m_mode)
    {
        Log::LogE("Frame of mode %s cannot be stored in %s stack",
                GetModeName(frame.GetMode()), GetModeName(m_mode));
        return false;
    }

    return true;
}
