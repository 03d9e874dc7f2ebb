//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PERFORMANCE_MONITOR_HPP
#define DEPSIEVE_PERFORMANCE_MONITOR_HPP

#include "dsv/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace dsv::cache {

    struct PhaseTiming {
        std::size_t calls = 0;
        Duration total{0};
        Duration max{0};
    };

    /**
     * Accumulates wall time per named phase ("locate", "scan", "graph", ...).
     */
    class PerformanceMonitor {
    public:
        void record(const std::string& phase, Duration elapsed);

        [[nodiscard]] std::map<std::string, PhaseTiming> snapshot() const;

        [[nodiscard]] Duration total() const;

        void clear();

    private:
        mutable std::mutex mutex_;
        std::map<std::string, PhaseTiming> phases_;
    };

    /**
     * RAII timer that records into a PerformanceMonitor on destruction.
     */
    class ScopedTimer {
    public:
        ScopedTimer(PerformanceMonitor& monitor, std::string phase)
            : monitor_(monitor)
            , phase_(std::move(phase))
            , start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            monitor_.record(phase_, std::chrono::steady_clock::now() - start_);
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        PerformanceMonitor& monitor_;
        std::string phase_;
        std::chrono::steady_clock::time_point start_;
    };

}  // namespace dsv::cache

#endif //DEPSIEVE_PERFORMANCE_MONITOR_HPP
