#include "RawStackFile.h"

/* System */
#include <cstring>

/* Local */
#include "Log.h"

o2::RawStackFile::RawStackFile(const std::string& fileName, uint16_t width,
        uint16_t height, uint16_t bitDepth, Mode mode, std::time_t runStartTime)
    : StackFile(fileName, width, height, bitDepth, mode, runStartTime),
    m_header(),
    m_file()
{
    std::memset(&m_header, 0, sizeof(m_header));
    m_header.signature = O2S_SIGNATURE;
    m_header.version = O2S_VERSION_1_0;
    m_header.bitDepth = bitDepth;
    m_header.width = width;
    m_header.height = height;
    m_header.frameCount = 0;
    m_header.sizeOfFrameMeta = sizeof(RawStackFrameMeta);
    m_header.mode = static_cast<uint8_t>(mode);
    m_header.runStartTime = static_cast<uint64_t>(runStartTime);
    std::strncpy(m_header.modeName, GetModeName(mode), O2S_MODE_NAME_LEN - 1);
}

o2::RawStackFile::~RawStackFile()
{
    if (IsOpen())
        Close();
}

bool o2::RawStackFile::Open()
{
    if (IsOpen())
        return true;

    m_file.open(m_fileName,
            std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!m_file.is_open())
    {
        Log::LogE("Failed to create file '%s'", m_fileName.c_str());
        return false;
    }

    m_frameIndex = 0;
    m_header.frameCount = 0;

    // Header goes first so even an empty stack is a valid file
    m_file.write(reinterpret_cast<const char*>(&m_header), sizeof(m_header));
    m_file.flush();
    if (!m_file.good())
    {
        Log::LogE("Failed to write header to '%s'", m_fileName.c_str());
        m_file.close();
        return false;
    }

    return true;
}

bool o2::RawStackFile::IsOpen() const
{
    return m_file.is_open();
}

void o2::RawStackFile::Close()
{
    if (!IsOpen())
        return;

    if (m_header.frameCount != m_frameIndex && !UpdateHeader())
    {
        Log::LogE("Failed to update frame count in '%s'", m_fileName.c_str());
    }

    m_file.flush();
    m_file.close();
}

bool o2::RawStackFile::WriteFrame(const Frame& frame)
{
    if (!StackFile::WriteFrame(frame))
        return false;

    RawStackFrameMeta meta;
    std::memset(&meta, 0, sizeof(meta));
    meta.frameNr = frame.GetInfo().GetFrameNr();
    meta.tickIndex = frame.GetTickIndex();
    meta.timestampUs = frame.GetInfo().GetTimestampUs();

    m_file.write(reinterpret_cast<const char*>(&meta), sizeof(meta));
    m_file.write(reinterpret_cast<const char*>(frame.GetData()),
            frame.GetDataBytes());
    if (!m_file.good())
    {
        Log::LogE("Failed to write frame %u to '%s'", m_frameIndex,
                m_fileName.c_str());
        return false;
    }

    m_frameIndex++;

    return UpdateHeader();
}

bool o2::RawStackFile::UpdateHeader()
{
    m_header.frameCount = m_frameIndex;

    m_file.seekp(0);
    m_file.write(reinterpret_cast<const char*>(&m_header), sizeof(m_header));
    m_file.seekp(0, std::ios_base::end);
    m_file.flush();

    return m_file.good();
}
