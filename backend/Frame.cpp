#include "Frame.h"

/* System */
#include <algorithm>
#include <cstring>

/* Local */
#include "Log.h"

o2::Frame::Info::Info()
    : m_frameNr(0),
    m_timestampUs(0)
{
}

o2::Frame::Info::Info(uint32_t frameNr, uint64_t timestampUs)
    : m_frameNr(frameNr),
    m_timestampUs(timestampUs)
{
}

o2::Frame::Frame(uint16_t width, uint16_t height)
    : m_width(width),
    m_height(height),
    m_pixels((size_t)width * height, 0),
    m_info(),
    m_attributed(false),
    m_mode(Mode::Bioluminescence),
    m_tickIndex(0)
{
}

o2::Frame::~Frame()
{
}

bool o2::Frame::CopyData(const void* data, size_t bytes)
{
    if (!data || bytes != GetDataBytes())
    {
        Log::LogE("Frame data size mismatch, got %zu bytes, expected %zu",
                bytes, GetDataBytes());
        return false;
    }
    std::memcpy(m_pixels.data(), data, bytes);
    return true;
}

void o2::Frame::Attribute(Mode mode, uint64_t tickIndex)
{
    m_mode = mode;
    m_tickIndex = tickIndex;
    m_attributed = true;
}

double o2::Frame::GetMeanIntensity(uint16_t x, uint16_t y, uint16_t w,
        uint16_t h) const
{
    const size_t x2 = std::min<size_t>((size_t)x + w, m_width);
    const size_t y2 = std::min<size_t>((size_t)y + h, m_height);
    if (x >= x2 || y >= y2)
        return 0.0;

    double sum = 0.0;
    for (size_t row = y; row < y2; row++)
    {
        const uint16_t* line = m_pixels.data() + row * m_width;
        for (size_t col = x; col < x2; col++)
            sum += line[col];
    }
    return sum / (double)((x2 - x) * (y2 - y));
}
