#pragma once
#ifndef O2_LOG_H
#define O2_LOG_H

/* System */
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace o2 {

/* Asynchronous application log. Entries are queued by any thread and handed
   to listeners on a dedicated thread so acquisition threads never wait for
   console or disk. The queue is bounded, overflowing entries are counted
   and reported once there is room again. */
class Log
{
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    // Entries queued beyond this are dropped
    static constexpr size_t MaxQueuedEntries = 10000;

    enum class Level
    {
        Error,
        Warning,
        Info,
        Debug,
        // Transient status line, e.g. run statistics, not kept in files
        Progress,
    };

    class Entry
    {
    public:
        Entry(Level level, const std::string& text);

    public:
        Level GetLevel() const
        { return m_level; }
        std::thread::id GetThreadId() const
        { return m_threadId; }
        const TimePoint& GetTime() const
        { return m_time; }
        // Same time base as frame and trigger timestamps, see NowUs
        uint64_t GetHostUs() const
        { return m_hostUs; }
        const std::string& GetText() const
        { return m_text; }

        // Full line with time stamps, thread and level tag
        std::string Format() const;

    private:
        Level m_level;
        std::thread::id m_threadId;
        TimePoint m_time;
        uint64_t m_hostUs;
        std::string m_text;
    };

    class IListener
    {
    public:
        virtual ~IListener()
        {}
        virtual void OnLogEntryAdded(const Entry& entry) = 0;
    };

public:
    // Waits until queued entries reach listeners, but no longer than 1s
    static bool Flush();
    // Stops log thread, entries added afterwards go nowhere
    static void Uninit();

    static char GetLevelTag(Level level);

    static void AddListener(IListener* listener);
    static void RemoveListener(IListener* listener);

    static void LogE(const char* format, ...);
    static void LogW(const char* format, ...);
    static void LogI(const char* format, ...);
    static void LogD(const char* format, ...);
    static void LogP(const char* format, ...);

    static void LogE(const std::string& text)
    { AddEntry(Level::Error, text); }
    static void LogW(const std::string& text)
    { AddEntry(Level::Warning, text); }
    static void LogI(const std::string& text)
    { AddEntry(Level::Info, text); }
    static void LogD(const std::string& text)
    { AddEntry(Level::Debug, text); }
    static void LogP(const std::string& text)
    { AddEntry(Level::Progress, text); }

    static void AddEntry(Level level, const std::string& text);

    // Number of entries lost to a full queue since start
    static uint64_t GetDroppedCount();

private:
    static Log* Get();
    static std::string FormatText(const char* format, va_list args);

private:
    Log();
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    void Push(Entry&& entry);
    void ThreadFunc();
    void Deliver(const Entry& entry);

private:
    static Log* m_instance;
    static std::mutex m_instanceMutex;
    static bool m_isUninitialized;

    std::vector<IListener*> m_listeners;
    std::mutex m_listenersMutex;

    std::deque<Entry> m_entries;
    std::mutex m_entriesMutex;
    std::condition_variable m_entriesCond;
    // Entries taken from queue but not yet passed to listeners
    size_t m_entriesInFlight;
    // Dropped since last overflow report
    uint64_t m_droppedPending;
    std::atomic<uint64_t> m_droppedTotal;

    std::thread* m_thread;
    bool m_threadExitFlag;
};

} // namespace o2

#endif /* O2_LOG_H */
