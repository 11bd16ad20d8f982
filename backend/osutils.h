#pragma once
#ifndef O2_OSUTILS_H
#define O2_OSUTILS_H

/* System */
#include <cstddef>
#include <string>

namespace o2 {

// Memory the OS can hand out without swapping, zero if unknown
size_t GetAvailPhysicalMemBytes();

// Creates given folder including all missing parents
bool CreateDirectories(const std::string& dir);

// Raises the priority of the current thread above normal if allowed.
// Returns false if the OS refused, the thread keeps running anyway.
bool SetCurrentThreadPriorityAboveNormal();

} // namespace o2

#endif /* O2_OSUTILS_H */
