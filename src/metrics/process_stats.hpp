// src/metrics/process_stats.hpp
#pragma once
#include <cstdint>

#if defined(_WIN32)
  #ifndef NOMINMAX
  #define NOMINMAX
  #endif
  #include <windows.h>
  #include <psapi.h>
#else
  #include <fstream>
  #include <string>
#endif

namespace ddattr {

// peak resident set size of this process in MiB, 0 if unknown
#if defined(_WIN32)
inline double process_peak_rss_mb() {
    PROCESS_MEMORY_COUNTERS pmc{};
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return static_cast<double>(pmc.PeakWorkingSetSize) / (1024.0 * 1024.0);
    }
    return 0.0;
}
#else
inline double process_peak_rss_mb() {
    std::ifstream f("/proc/self/status");
    std::string key;
    while (f >> key) {
        if (key == "VmHWM:") {
            double kb = 0.0;
            f >> kb;
            return kb / 1024.0;
        }
        std::string rest;
        std::getline(f, rest);
    }
    return 0.0;
}
#endif

}
