#pragma once
#ifndef O2_STACK_FILE_H
#define O2_STACK_FILE_H

/* System */
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

/* Local */
#include "Frame.h"
#include "Mode.h"

namespace o2 {

enum class StorageType : int32_t
{
    None,
    Tiff,
    Raw,
};

const char* GetStorageTypeName(StorageType type);
bool ParseStorageType(const std::string& name, StorageType& type);

// One growing multi-frame file holding frames of a single mode
class StackFile
{
public:
    // Returns file extension without dot, empty for StorageType::None
    static const char* GetFileExtension(StorageType type);

    // Builds <dir>/<Mode>_<YYYYMMDD_HHMMSS>.<ext>
    static std::string BuildFileName(const std::string& dir, Mode mode,
            std::time_t runStartTime, StorageType type);

    // Returns null for StorageType::None
    static std::unique_ptr<StackFile> Create(StorageType type,
            const std::string& fileName, uint16_t width, uint16_t height,
            uint16_t bitDepth, Mode mode, std::time_t runStartTime);

public:
    StackFile(const std::string& fileName, uint16_t width, uint16_t height,
            uint16_t bitDepth, Mode mode, std::time_t runStartTime);
    virtual ~StackFile();

    StackFile() = delete;
    StackFile(const StackFile&) = delete;
    StackFile(StackFile&&) = delete;
    StackFile& operator=(const StackFile&) = delete;
    StackFile& operator=(StackFile&&) = delete;

public:
    const std::string& GetFileName() const
    { return m_fileName; }
    Mode GetMode() const
    { return m_mode; }
    uint32_t GetFrameCount() const
    { return m_frameIndex; }

public:
    virtual bool Open() = 0;
    virtual bool IsOpen() const = 0;
    virtual void Close() = 0;

    // New frame is added at end of the file
    virtual bool WriteFrame(const Frame& frame);

protected:
    const std::string m_fileName;
    const uint16_t m_width;
    const uint16_t m_height;
    const uint16_t m_bitDepth;
    const Mode m_mode;
    const std::time_t m_runStartTime;
    uint32_t m_frameIndex;
};

} // namespace o2

#endif /* O2_STACK_FILE_H */
