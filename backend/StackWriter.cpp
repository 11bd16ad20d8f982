#include "StackWriter.h"

/* System */
#include <algorithm>
#include <thread>

/* Local */
#include "Log.h"
#include "osutils.h"

constexpr size_t o2::StackWriter::MinQueueCapacity;

o2::StackWriter::StackWriter(const std::string& saveDir,
        StorageType storageType, const ModeSet& modes,
        std::time_t runStartTime, size_t maxQueuedBytes)
    : m_saveDir(saveDir),
    m_storageType(storageType),
    m_modes(modes),
    m_runStartTime(runStartTime),
    m_maxQueuedBytes(maxQueuedBytes),
    m_advisoryMutex(),
    m_advisoryHandler(),
    m_streams()
{
    for (Mode mode : m_modes)
        m_streams[GetModeIndex(mode)] = std::make_unique<Stream>(mode);
}

o2::StackWriter::~StackWriter()
{
    FlushAndCloseAll();
}

void o2::StackWriter::SetAdvisoryHandler(const AdvisoryHandler& handler)
{
    std::lock_guard<std::mutex> lock(m_advisoryMutex);
    m_advisoryHandler = handler;
}

bool o2::StackWriter::Start()
{
    if (m_storageType == StorageType::None)
    {
        Log::LogE("Cannot start stack writer without storage type");
        return false;
    }

    if (!CreateDirectories(m_saveDir))
    {
        Log::LogE("Failed to create folder '%s'", m_saveDir.c_str());
        return false;
    }

    // Leave at least half of free RAM to the camera driver and the OS
    const size_t availBytes = GetAvailPhysicalMemBytes();
    if (availBytes > 0 && m_maxQueuedBytes > availBytes / 2)
    {
        Log::LogW("Write queue budget lowered from %zu MiB to %zu MiB",
                m_maxQueuedBytes >> 20, (availBytes / 2) >> 20);
        m_maxQueuedBytes = availBytes / 2;
    }

    for (Mode mode : m_modes)
    {
        Stream& stream = *GetStream(mode);
        if (stream.thread)
            continue;

        stream.thread = new(std::nothrow) std::thread(
                &StackWriter::DiskThreadLoop, this, std::ref(stream));
        if (!stream.thread)
        {
            Log::LogE("Failed to start disk thread for %s stack", GetModeName(mode));
            FlushAndCloseAll();
            return false;
        }
    }

    return true;
}

bool o2::StackWriter::Append(std::shared_ptr<const Frame> frame)
{
    if (!frame || !frame->IsAttributed())
    {
        Log::LogE("Only frames attributed to a mode can be stored");
        return false;
    }

    const Mode mode = frame->GetMode();
    Stream* stream = GetStream(mode);
    if (!stream)
    {
        Log::LogE("Mode %s is not enabled for storing", GetModeName(mode));
        return false;
    }

    bool raiseBackpressure = false;
    size_t queued;
    size_t capacity;
    {
        std::unique_lock<std::mutex> lock(stream->mutex);

        if (stream->closeRequested)
        {
            Log::LogW("%s stack already closed, frame of tick %llu not stored",
                    GetModeName(mode), (unsigned long long)frame->GetTickIndex());
            stream->droppedCount++;
            stream->dropped.AddItem(frame->GetTickIndex());
            return false;
        }

        if (stream->capacity == 0)
        {
            // Memory budget is split evenly among enabled modes
            const size_t bytesPerMode = m_maxQueuedBytes / m_modes.size();
            const size_t frameBytes = std::max<size_t>(1, frame->GetDataBytes());
            stream->capacity = std::max(MinQueueCapacity, bytesPerMode / frameBytes);
            Log::LogD("%s stack queue holds up to %zu frames", GetModeName(mode),
                    stream->capacity);
        }

        capacity = stream->capacity;
        queued = stream->frames.size();
        if (queued >= capacity)
        {
            stream->droppedCount++;
            stream->dropped.AddItem(frame->GetTickIndex());
            Log::LogW("%s stack queue full (%zu frames), frame of tick %llu dropped,"
                    " %llu dropped so far", GetModeName(mode), capacity,
                    (unsigned long long)frame->GetTickIndex(),
                    (unsigned long long)stream->droppedCount.load());
            return false;
        }

        stream->frames.push(std::move(frame));
        queued++;
        if (stream->peak < queued)
            stream->peak = queued;

        // Warn once per episode, re-arm when queue drains to half
        const size_t highWater = capacity * 3 / 4;
        if (!stream->backpressure && queued >= highWater)
        {
            stream->backpressure = true;
            raiseBackpressure = true;
        }
        else if (stream->backpressure && queued <= capacity / 2)
        {
            stream->backpressure = false;
        }
    }
    stream->cond.notify_one();

    if (raiseBackpressure)
    {
        Advisory advisory;
        advisory.kind = AdvisoryKind::WriteBackpressure;
        advisory.mode = mode;
        advisory.message = std::string(GetModeName(mode))
            + " stack writing falls behind, " + std::to_string(queued)
            + " of " + std::to_string(capacity) + " queue slots used";
        Log::LogW(advisory.message);
        RaiseAdvisory(advisory);
    }

    return true;
}

bool o2::StackWriter::FlushAndClose(Mode mode)
{
    Stream* stream = GetStream(mode);
    if (!stream)
        return false;

    if (stream->closed.exchange(true))
        return true; // Already done

    {
        std::unique_lock<std::mutex> lock(stream->mutex);
        stream->closeRequested = true;
    }
    stream->cond.notify_one();

    if (stream->thread)
    {
        if (stream->thread->joinable())
            stream->thread->join();
        delete stream->thread;
        stream->thread = nullptr;
    }

    // Frames queued without running thread cannot be stored anymore
    std::unique_lock<std::mutex> lock(stream->mutex);
    while (!stream->frames.empty())
    {
        stream->dropped.AddItem(stream->frames.front()->GetTickIndex());
        stream->droppedCount++;
        stream->frames.pop();
    }

    return stream->writeErrorCount == 0;
}

void o2::StackWriter::FlushAndCloseAll()
{
    for (Mode mode : m_modes)
        FlushAndClose(mode);
}

std::string o2::StackWriter::GetFileName(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    if (!stream)
        return "";
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->fileName;
}

uint64_t o2::StackWriter::GetSavedCount(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    return (stream) ? stream->savedCount.load() : 0;
}

uint64_t o2::StackWriter::GetDroppedCount(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    return (stream) ? stream->droppedCount.load() : 0;
}

uint64_t o2::StackWriter::GetWriteErrorCount(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    return (stream) ? stream->writeErrorCount.load() : 0;
}

size_t o2::StackWriter::GetQueuePeak(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    return (stream) ? stream->peak.load() : 0;
}

size_t o2::StackWriter::GetQueueCapacity(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    if (!stream)
        return 0;
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->capacity;
}

size_t o2::StackWriter::GetLongestDropRun(Mode mode) const
{
    const Stream* stream = GetStream(mode);
    if (!stream)
        return 0;
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->dropped.GetLargestCluster();
}

void o2::StackWriter::DiskThreadLoop(Stream& stream)
{
    std::unique_ptr<StackFile> file;
    bool fileFailed = false;

    while (true)
    {
        std::shared_ptr<const Frame> frame;
        {
            std::unique_lock<std::mutex> lock(stream.mutex);
            stream.cond.wait(lock, [&stream]() {
                return (stream.closeRequested || !stream.frames.empty());
            });
            // Queue is always drained before closing
            if (stream.frames.empty())
                break;

            frame = std::move(stream.frames.front());
            stream.frames.pop();
        }

        if (!file && !fileFailed)
        {
            file = CreateFile(stream, *frame);
            fileFailed = !file;
        }

        if (file && file->WriteFrame(*frame))
        {
            stream.savedCount++;
        }
        else
        {
            stream.writeErrorCount++;
            Log::LogE("Failed to store frame of tick %llu to %s stack",
                    (unsigned long long)frame->GetTickIndex(),
                    GetModeName(stream.mode));
        }
    }

    if (file)
    {
        file->Close();
        Log::LogI("Stored %u frames to '%s'", file->GetFrameCount(),
                file->GetFileName().c_str());
    }
}

std::unique_ptr<o2::StackFile> o2::StackWriter::CreateFile(Stream& stream,
        const Frame& frame)
{
    const std::string fileName = StackFile::BuildFileName(m_saveDir,
            stream.mode, m_runStartTime, m_storageType);

    std::unique_ptr<StackFile> file = StackFile::Create(m_storageType, fileName,
            frame.GetWidth(), frame.GetHeight(), 16, stream.mode, m_runStartTime);
    if (!file || !file->Open())
    {
        Log::LogE("Failed to create %s stack '%s', its frames will not be stored",
                GetModeName(stream.mode), fileName.c_str());
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(stream.mutex);
        stream.fileName = fileName;
    }
    Log::LogI("Storing %s frames to '%s'", GetModeName(stream.mode),
            fileName.c_str());
    return file;
}

o2::StackWriter::Stream* o2::StackWriter::GetStream(Mode mode) const
{
    return m_streams[GetModeIndex(mode)].get();
}

void o2::StackWriter::RaiseAdvisory(const Advisory& advisory)
{
    AdvisoryHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_advisoryMutex);
        handler = m_advisoryHandler;
    }
    if (handler)
        handler(advisory);
}
