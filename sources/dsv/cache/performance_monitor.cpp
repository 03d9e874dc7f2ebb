//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cache/performance_monitor.hpp"

namespace dsv::cache {

    void PerformanceMonitor::record(const std::string& phase, const Duration elapsed) {
        std::lock_guard lock(mutex_);
        auto& [calls, total, max] = phases_[phase];
        ++calls;
        total += elapsed;
        if (elapsed > max) {
            max = elapsed;
        }
    }

    std::map<std::string, PhaseTiming> PerformanceMonitor::snapshot() const {
        std::lock_guard lock(mutex_);
        return phases_;
    }

    Duration PerformanceMonitor::total() const {
        std::lock_guard lock(mutex_);
        Duration sum{0};
        for (const auto& [phase, timing] : phases_) {
            sum += timing.total;
        }
        return sum;
    }

    void PerformanceMonitor::clear() {
        std::lock_guard lock(mutex_);
        phases_.clear();
    }

}  // namespace dsv::cache
