#include "TiffStackFile.h"

/* System */
#include <limits>

/* tinyTiff */
#include "tinytiffwriter.h"

/* Local */
#include "Log.h"

o2::TiffStackFile::TiffStackFile(const std::string& fileName, uint16_t width,
        uint16_t height, uint16_t bitDepth, Mode mode, std::time_t runStartTime)
    : StackFile(fileName, width, height, bitDepth, mode, runStartTime),
    m_file(nullptr)
{
}

o2::TiffStackFile::~TiffStackFile()
{
    if (IsOpen())
        Close();
}

bool o2::TiffStackFile::Open()
{
    if (IsOpen())
        return true;

    // Pixels are always stored in 16-bit samples regardless of sensor depth
    m_file = TinyTIFFWriter_open(m_fileName.c_str(), 16, m_width, m_height);
    if (!m_file)
    {
        Log::LogE("Failed to create TIFF file '%s'", m_fileName.c_str());
        return false;
    }

    m_frameIndex = 0;

    return true;
}

bool o2::TiffStackFile::IsOpen() const
{
    return !!m_file;
}

void o2::TiffStackFile::Close()
{
    if (!IsOpen())
        return;

    TinyTIFFWriter_close(m_file);
    m_file = nullptr;
}

bool o2::TiffStackFile::WriteFrame(const Frame& frame)
{
    if (!StackFile::WriteFrame(frame))
        return false;

    // Classic TIFF uses 32-bit offsets
    if (m_frameIndex > 0 && (uint64_t)(m_frameIndex + 1) * frame.GetDataBytes()
            > std::numeric_limits<uint32_t>::max())
    {
        Log::LogE("TIFF stack '%s' cannot grow above 4GB, frame %u not stored",
                m_fileName.c_str(), m_frameIndex);
        return false;
    }

    TinyTIFFWriter_writeImage(m_file,
            static_cast<void*>(const_cast<uint16_t*>(frame.GetData())));

    m_frameIndex++;
    return true;
}
