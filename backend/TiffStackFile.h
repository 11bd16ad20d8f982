#pragma once
#ifndef O2_TIFF_STACK_FILE_H
#define O2_TIFF_STACK_FILE_H

/* Local */
#include "StackFile.h"

// Forward declaration that satisfies compiler (taken from tinytiffwriter.h)
struct TinyTIFFFile;

namespace o2 {

// Multi-page 16-bit grayscale TIFF
class TiffStackFile final : public StackFile
{
public:
    TiffStackFile(const std::string& fileName, uint16_t width, uint16_t height,
            uint16_t bitDepth, Mode mode, std::time_t runStartTime);
    virtual ~TiffStackFile();

    TiffStackFile() = delete;
    TiffStackFile(const TiffStackFile&) = delete;
    TiffStackFile(TiffStackFile&&) = delete;
    TiffStackFile& operator=(const TiffStackFile&) = delete;
    TiffStackFile& operator=(TiffStackFile&&) = delete;

public: // From StackFile
    virtual bool Open() override;
    virtual bool IsOpen() const override;
    virtual void Close() override;

    virtual bool WriteFrame(const Frame& frame) override;

private:
    TinyTIFFFile* m_file;
};

} // namespace o2

#endif /* O2_TIFF_STACK_FILE_H */
