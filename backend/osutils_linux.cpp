#if defined(__linux__)

/* System */
#include <cerrno>
#include <cstdio> // std::sscanf
#include <fstream> // std::ifstream
#include <string>
#include <sys/resource.h> // setpriority
#include <sys/stat.h> // stat, mkdir
#include <sys/syscall.h> // SYS_gettid
#include <sys/types.h>
#include <unistd.h>

/* Local */
#include "osutils.h"

size_t o2::GetAvailPhysicalMemBytes()
{
    std::ifstream file("/proc/meminfo");
    std::string line;
    while (std::getline(file, line))
    {
        size_t kiB;
        if (std::sscanf(line.c_str(), "MemAvailable: %zu kB", &kiB) == 1)
            return kiB * 1024;
    }
    return 0;
}

bool o2::CreateDirectories(const std::string& dir)
{
    if (dir.empty())
        return false;

    struct stat st;
    if (stat(dir.c_str(), &st) == 0)
        return S_ISDIR(st.st_mode);

    // Create parents first
    const std::string::size_type sepPos = dir.find_last_of('/');
    if (sepPos != std::string::npos && sepPos > 0)
    {
        if (!CreateDirectories(dir.substr(0, sepPos)))
            return false;
    }

    if (mkdir(dir.c_str(), 0775) != 0 && errno != EEXIST)
        return false;
    return true;
}

bool o2::SetCurrentThreadPriorityAboveNormal()
{
    // On Linux the nice value applies to a thread when addressed by its TID.
    // Lowering it needs CAP_SYS_NICE or a suitable RLIMIT_NICE.
    const id_t tid = (id_t)syscall(SYS_gettid);
    errno = 0;
    const int current = getpriority(PRIO_PROCESS, tid);
    if (current == -1 && errno != 0)
        return false;
    const int aboveNormal = -5;
    if (current <= aboveNormal)
        return true;
    return (setpriority(PRIO_PROCESS, tid, aboveNormal) == 0);
}

#endif // defined(__linux__)
