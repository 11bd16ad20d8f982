#include "Log.h"

/* System */
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

/* Local */
#include "Timer.h"

constexpr size_t o2::Log::MaxQueuedEntries;

o2::Log* o2::Log::m_instance = nullptr;
std::mutex o2::Log::m_instanceMutex;
bool o2::Log::m_isUninitialized = false;

o2::Log* o2::Log::Get()
{
    std::lock_guard<std::mutex> lock(m_instanceMutex);
    if (!m_instance && !m_isUninitialized)
        m_instance = new(std::nothrow) Log();
    return m_instance;
}

bool o2::Log::Flush()
{
    Log* log = Get();
    if (!log)
        return false;

    std::unique_lock<std::mutex> lock(log->m_entriesMutex);
    const auto isIdle = [log]() {
        return log->m_entries.empty() && log->m_entriesInFlight == 0;
    };
    // Log thread notifies after every delivered entry
    return log->m_entriesCond.wait_for(lock, std::chrono::seconds(1), isIdle);
}

void o2::Log::Uninit()
{
    Log* log;
    {
        std::lock_guard<std::mutex> lock(m_instanceMutex);
        log = m_instance;
        m_instance = nullptr;
        m_isUninitialized = true;
    }
    delete log;
}

char o2::Log::GetLevelTag(Level level)
{
    switch (level)
    {
    case Level::Error:
        return 'E';
    case Level::Warning:
        return 'W';
    case Level::Info:
        return 'I';
    case Level::Debug:
        return 'D';
    case Level::Progress:
        return 'P';
    // default section missing intentionally so compiler warns when new value added
    }
    return '?';
}

void o2::Log::AddListener(IListener* listener)
{
    Log* log = Get();
    if (!log || !listener)
        return;

    std::lock_guard<std::mutex> lock(log->m_listenersMutex);
    auto& listeners = log->m_listeners;
    if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end())
        listeners.push_back(listener);
}

void o2::Log::RemoveListener(IListener* listener)
{
    Log* log = Get();
    if (!log)
        return;

    std::lock_guard<std::mutex> lock(log->m_listenersMutex);
    auto& listeners = log->m_listeners;
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener),
            listeners.end());
}

void o2::Log::LogE(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    const std::string text = FormatText(format, args);
    va_end(args);
    AddEntry(Level::Error, text);
}

void o2::Log::LogW(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    const std::string text = FormatText(format, args);
    va_end(args);
    AddEntry(Level::Warning, text);
}

void o2::Log::LogI(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    const std::string text = FormatText(format, args);
    va_end(args);
    AddEntry(Level::Info, text);
}

void o2::Log::LogD(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    const std::string text = FormatText(format, args);
    va_end(args);
    AddEntry(Level::Debug, text);
}

void o2::Log::LogP(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    const std::string text = FormatText(format, args);
    va_end(args);
    AddEntry(Level::Progress, text);
}

void o2::Log::AddEntry(Level level, const std::string& text)
{
    Log* log = Get();
    if (log)
        log->Push(Entry(level, text));
}

uint64_t o2::Log::GetDroppedCount()
{
    Log* log = Get();
    return (log) ? log->m_droppedTotal.load() : 0;
}

std::string o2::Log::FormatText(const char* format, va_list args)
{
    va_list args2;
    va_copy(args2, args);
    const int length = std::vsnprintf(nullptr, 0, format, args2);
    va_end(args2);
    if (length < 0)
        return std::string("Invalid log format '") + format + "'";

    std::vector<char> buffer((size_t)length + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    return std::string(buffer.data(), (size_t)length);
}

o2::Log::Log()
    : m_listeners(),
    m_listenersMutex(),
    m_entries(),
    m_entriesMutex(),
    m_entriesCond(),
    m_entriesInFlight(0),
    m_droppedPending(0),
    m_droppedTotal(0),
    m_thread(nullptr),
    m_threadExitFlag(false)
{
    m_thread = new(std::nothrow) std::thread(&Log::ThreadFunc, this);
}

o2::Log::~Log()
{
    {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        m_threadExitFlag = true;
    }
    m_entriesCond.notify_all();
    if (m_thread && m_thread->joinable())
        m_thread->join();
    delete m_thread;
}

void o2::Log::Push(Entry&& entry)
{
    {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        if (m_entries.size() >= MaxQueuedEntries)
        {
            m_droppedPending++;
            m_droppedTotal++;
            return;
        }
        m_entries.push_back(std::move(entry));
    }
    m_entriesCond.notify_all();
}

void o2::Log::ThreadFunc()
{
    std::unique_lock<std::mutex> lock(m_entriesMutex);
    while (true)
    {
        m_entriesCond.wait(lock, [this]() {
            return (m_threadExitFlag || !m_entries.empty());
        });
        // Entries queued before exit request are still delivered
        if (m_entries.empty())
            break;

        const Entry entry = std::move(m_entries.front());
        m_entries.pop_front();
        const uint64_t dropped = m_droppedPending;
        m_droppedPending = 0;
        m_entriesInFlight++;
        lock.unlock();

        if (dropped > 0)
        {
            Deliver(Entry(Level::Warning, std::to_string(dropped)
                    + " log entries dropped, log queue was full"));
        }
        Deliver(entry);

        lock.lock();
        m_entriesInFlight--;
        m_entriesCond.notify_all();
    }
}

void o2::Log::Deliver(const Entry& entry)
{
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    for (IListener* listener : m_listeners)
        listener->OnLogEntryAdded(entry);
}

o2::Log::Entry::Entry(Level level, const std::string& text)
    : m_level(level),
    m_threadId(std::this_thread::get_id()),
    m_time(Clock::now()),
    m_hostUs(NowUs()),
    m_text(text)
{
}

std::string o2::Log::Entry::Format() const
{
    // Log format:
    // [20151231-232359.999][  12345.678901][89ABCDEF][E] TEXT
    //            |                 |            |     |
    //            |                 |            |     \- Level
    //            |                 |            \------- Thread ID
    //            |                 \-------------------- Host time in seconds
    //            \-------------------------------------- Wall clock

    const std::time_t time = Clock::to_time_t(m_time);
    std::tm tm;
    localtime_r(&time, &tm);
    const unsigned int msec = (unsigned int)(
        std::chrono::time_point_cast<std::chrono::milliseconds>(m_time)
        .time_since_epoch().count() % 1000);

    char wallClock[32];
    if (std::strftime(wallClock, sizeof(wallClock), "%Y%m%d-%H%M%S", &tm) == 0)
        wallClock[0] = '\0';

    std::ostringstream ss;
    ss << '[' << wallClock << '.' << std::setfill('0') << std::setw(3) << msec << ']'
        << '[' << std::setfill(' ') << std::setw(14) << std::fixed
            << std::setprecision(6) << m_hostUs / 1e6 << ']'
        << '[' << std::setfill('0') << std::setw(8) << std::hex << m_threadId << ']'
        << '[' << GetLevelTag(m_level) << ']'
        << ' ' << m_text;
    return ss.str();
}
