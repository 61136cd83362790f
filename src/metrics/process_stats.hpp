#pragma once
#include <cstdint>

#if defined(_WIN32)
  #ifndef NOMINMAX
  #define NOMINMAX
  #endif
  #include <windows.h>
  #include <psapi.h>
#else
  #include <sys/resource.h>
#endif

namespace histeq {

inline constexpr double bytes_per_mb = 1024.0 * 1024.0;

#if defined(_WIN32)
inline double process_peak_rss_mb() {
    PROCESS_MEMORY_COUNTERS_EX pmc{};
    if (!GetProcessMemoryInfo(GetCurrentProcess(),
                              reinterpret_cast<PROCESS_MEMORY_COUNTERS*>(&pmc), sizeof(pmc)))
        return 0.0;
    return static_cast<double>(pmc.PeakWorkingSetSize) / bytes_per_mb;
}
#else
// ru_maxrss is kilobytes on Linux, bytes on macOS.
inline double process_peak_rss_mb() {
    rusage ru{};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
#if defined(__APPLE__)
    return static_cast<double>(ru.ru_maxrss) / bytes_per_mb;
#else
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
#endif
}
#endif

}
