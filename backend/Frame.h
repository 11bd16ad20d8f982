#pragma once
#ifndef O2_FRAME_H
#define O2_FRAME_H

/* System */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/* Local */
#include "Mode.h"

namespace o2 {

// 16-bit monochrome image with acquisition info and mode attribution
class Frame
{
public:
    class Info
    {
    public:
        Info();
        Info(uint32_t frameNr, uint64_t timestampUs);

        // Sequence number assigned by the camera
        uint32_t GetFrameNr() const
        { return m_frameNr; }
        // Host steady clock, see NowUs
        uint64_t GetTimestampUs() const
        { return m_timestampUs; }

    private:
        uint32_t m_frameNr;
        uint64_t m_timestampUs;
    };

public:
    Frame(uint16_t width, uint16_t height);
    ~Frame();

    Frame() = delete;
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    uint16_t GetWidth() const
    { return m_width; }
    uint16_t GetHeight() const
    { return m_height; }
    size_t GetPixelCount() const
    { return m_pixels.size(); }
    size_t GetDataBytes() const
    { return m_pixels.size() * sizeof(uint16_t); }

    const uint16_t* GetData() const
    { return m_pixels.data(); }
    uint16_t* GetData()
    { return m_pixels.data(); }

    // Copies whole image, size has to match GetDataBytes
    bool CopyData(const void* data, size_t bytes);

    const Info& GetInfo() const
    { return m_info; }
    void SetInfo(const Info& info)
    { m_info = info; }

    // Binds the frame to the mode active when it was triggered
    void Attribute(Mode mode, uint64_t tickIndex);
    bool IsAttributed() const
    { return m_attributed; }
    Mode GetMode() const
    { return m_mode; }
    uint64_t GetTickIndex() const
    { return m_tickIndex; }

    // Average pixel value in given region, clipped to the image
    double GetMeanIntensity(uint16_t x, uint16_t y, uint16_t w, uint16_t h) const;

private:
    const uint16_t m_width;
    const uint16_t m_height;
    std::vector<uint16_t> m_pixels;
    Info m_info;
    bool m_attributed;
    Mode m_mode;
    uint64_t m_tickIndex;
};

} // namespace o2

#endif /* O2_FRAME_H */
