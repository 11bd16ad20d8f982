#include "RawStackLoad.h"

/* System */
#include <cstring>

/* Local */
#include "Log.h"

o2::RawStackLoad::RawStackLoad(const std::string& fileName)
    : m_fileName(fileName),
    m_file(),
    m_header(),
    m_frameBytes(0)
{
    std::memset(&m_header, 0, sizeof(m_header));
}

o2::RawStackLoad::~RawStackLoad()
{
    Close();
}

bool o2::RawStackLoad::Open()
{
    if (IsOpen())
        return true;

    m_file.open(m_fileName, std::ios_base::in | std::ios_base::binary);
    if (!m_file.is_open())
    {
        Log::LogE("Failed to open file '%s'", m_fileName.c_str());
        return false;
    }

    m_file.read(reinterpret_cast<char*>(&m_header), sizeof(m_header));
    if (!m_file.good())
    {
        Log::LogE("File '%s' is too short to be a raw stack", m_fileName.c_str());
        Close();
        return false;
    }

    if (m_header.signature != O2S_SIGNATURE)
    {
        Log::LogE("File '%s' is not a raw stack", m_fileName.c_str());
        Close();
        return false;
    }
    if (m_header.version > O2S_VERSION_1_0)
    {
        Log::LogE("Raw stack version 0x%04x is not supported", m_header.version);
        Close();
        return false;
    }
    if (m_header.mode >= ModeCount
            || m_header.sizeOfFrameMeta < sizeof(RawStackFrameMeta))
    {
        Log::LogE("Raw stack '%s' has corrupted header", m_fileName.c_str());
        Close();
        return false;
    }

    m_frameBytes = (size_t)m_header.width * m_header.height * sizeof(uint16_t);
    return true;
}

bool o2::RawStackLoad::IsOpen() const
{
    return m_file.is_open();
}

void o2::RawStackLoad::Close()
{
    if (m_file.is_open())
        m_file.close();
}

o2::Mode o2::RawStackLoad::GetMode() const
{
    return static_cast<Mode>(m_header.mode);
}

bool o2::RawStackLoad::ReadFrame(uint32_t index, std::unique_ptr<Frame>& frame)
{
    if (!IsOpen())
        return false;

    if (index >= m_header.frameCount)
    {
        Log::LogE("Frame index %u out of range, stack has %u frames", index,
                m_header.frameCount);
        return false;
    }

    const uint64_t recordBytes = m_header.sizeOfFrameMeta + m_frameBytes;
    const uint64_t offset = sizeof(RawStackHeader) + recordBytes * index;

    m_file.clear();
    m_file.seekg((std::streamoff)offset);

    RawStackFrameMeta meta;
    m_file.read(reinterpret_cast<char*>(&meta), sizeof(meta));
    // Skip meta fields added by newer producers
    m_file.seekg(m_header.sizeOfFrameMeta - sizeof(meta), std::ios_base::cur);

    auto loaded = std::make_unique<Frame>(m_header.width, m_header.height);
    m_file.read(reinterpret_cast<char*>(loaded->GetData()), m_frameBytes);
    if (!m_file.good())
    {
        Log::LogE("Failed to read frame %u from '%s'", index, m_fileName.c_str());
        return false;
    }

    loaded->SetInfo(Frame::Info(meta.frameNr, meta.timestampUs));
    loaded->Attribute(GetMode(), meta.tickIndex);
    frame = std::move(loaded);
    return true;
}
