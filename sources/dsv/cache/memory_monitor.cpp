//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cache/memory_monitor.hpp"

#include <fstream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <psapi.h>
#else
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace dsv::cache {

    MemoryMonitor::MemoryMonitor(
        const std::size_t threshold_bytes,
        const std::chrono::seconds cooldown,
        Sampler sampler
    )
        : threshold_(threshold_bytes)
        , cooldown_(cooldown)
        , sampler_(sampler ? std::move(sampler) : Sampler(&MemoryMonitor::current_memory_usage)) {}

    bool MemoryMonitor::check_pressure() {
        const std::size_t usage = sampler_();

        std::lock_guard lock(mutex_);
        if (usage <= threshold_) {
            return false;
        }

        const auto now = Clock::now();
        if (last_event_.has_value() && now - *last_event_ < cooldown_) {
            return false;
        }

        last_event_ = now;
        ++events_;
        return true;
    }

    std::size_t MemoryMonitor::pressure_events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::size_t MemoryMonitor::current_memory_usage() {
    #ifdef _WIN32
        PROCESS_MEMORY_COUNTERS_EX pmc;
        if (GetProcessMemoryInfo(GetCurrentProcess(),
                                reinterpret_cast<PROCESS_MEMORY_COUNTERS*>(&pmc),
                                sizeof(pmc))) {
            return pmc.WorkingSetSize;
        }
        return 0;
    #else
        // statm reports the current resident size; ru_maxrss is only the peak.
        if (std::ifstream statm("/proc/self/statm"); statm) {
            std::size_t total_pages = 0;
            std::size_t resident_pages = 0;
            if (statm >> total_pages >> resident_pages) {
                const long page_size = sysconf(_SC_PAGESIZE);
                if (page_size > 0) {
                    return resident_pages * static_cast<std::size_t>(page_size);
                }
            }
        }

        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) == 0) {
    #ifdef __APPLE__
            return static_cast<std::size_t>(usage.ru_maxrss);
    #else
            return static_cast<std::size_t>(usage.ru_maxrss) * 1024;
    #endif
        }
        return 0;
    #endif
    }

    std::size_t MemoryMonitor::available_memory() {
    #ifdef _WIN32
        MEMORYSTATUSEX status;
        status.dwLength = sizeof(status);
        if (GlobalMemoryStatusEx(&status)) {
            return static_cast<std::size_t>(status.ullAvailPhys);
        }
        return 0;
    #else
        if (std::ifstream meminfo("/proc/meminfo"); meminfo) {
            std::string line;
            while (std::getline(meminfo, line)) {
                if (!line.starts_with("MemAvailable:")) {
                    continue;
                }
                std::istringstream fields(line.substr(13));
                std::size_t kib = 0;
                if (fields >> kib) {
                    return kib * 1024;
                }
            }
        }

    #ifdef _SC_AVPHYS_PAGES
        const long pages = sysconf(_SC_AVPHYS_PAGES);
        const long page_size = sysconf(_SC_PAGESIZE);
        if (pages > 0 && page_size > 0) {
            return static_cast<std::size_t>(pages) * static_cast<std::size_t>(page_size);
        }
    #endif
        return 0;
    #endif
    }

}  // namespace dsv::cache
