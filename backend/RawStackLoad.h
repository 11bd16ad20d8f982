#pragma once
#ifndef O2_RAW_STACK_LOAD_H
#define O2_RAW_STACK_LOAD_H

/* System */
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

/* Local */
#include "Frame.h"
#include "RawStackFormat.h"

namespace o2 {

// Reads raw stack files back, frame by frame
class RawStackLoad
{
public:
    explicit RawStackLoad(const std::string& fileName);
    ~RawStackLoad();

    RawStackLoad() = delete;
    RawStackLoad(const RawStackLoad&) = delete;
    RawStackLoad& operator=(const RawStackLoad&) = delete;

public:
    // Opens the file and validates its header
    bool Open();
    bool IsOpen() const;
    void Close();

    const RawStackHeader& GetHeader() const
    { return m_header; }
    // Mode stored in header, valid after successful Open
    Mode GetMode() const;

    // Reads frame at given index, the frame is attributed to stack mode
    bool ReadFrame(uint32_t index, std::unique_ptr<Frame>& frame);

private:
    const std::string m_fileName;
    std::ifstream m_file;
    RawStackHeader m_header;
    size_t m_frameBytes;
};

} // namespace o2

#endif /* O2_RAW_STACK_LOAD_H */
