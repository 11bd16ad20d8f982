#pragma once
#ifndef O2_RAW_STACK_FILE_H
#define O2_RAW_STACK_FILE_H

/* System */
#include <fstream>

/* Local */
#include "RawStackFormat.h"
#include "StackFile.h"

namespace o2 {

class RawStackFile final : public StackFile
{
public:
    RawStackFile(const std::string& fileName, uint16_t width, uint16_t height,
            uint16_t bitDepth, Mode mode, std::time_t runStartTime);
    virtual ~RawStackFile();

    RawStackFile() = delete;
    RawStackFile(const RawStackFile&) = delete;
    RawStackFile(RawStackFile&&) = delete;
    RawStackFile& operator=(const RawStackFile&) = delete;
    RawStackFile& operator=(RawStackFile&&) = delete;

public:
    const RawStackHeader& GetHeader() const
    { return m_header; }

public: // From StackFile
    virtual bool Open() override;
    virtual bool IsOpen() const override;
    virtual void Close() override;

    virtual bool WriteFrame(const Frame& frame) override;

private:
    // Rewrites header with current frame count and returns to the end
    bool UpdateHeader();

private:
    RawStackHeader m_header;
    std::ofstream m_file;
};

} // namespace o2

#endif /* O2_RAW_STACK_FILE_H */
