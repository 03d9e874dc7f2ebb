//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cache/batch_scheduler.hpp"

namespace dsv::cache {

    std::size_t adaptive_batch_size(const PerformanceSettings& settings, const std::size_t available_bytes) {
        if (settings.fixed_batch_size > 0) {
            return settings.fixed_batch_size;
        }

        const std::size_t floor = std::max<std::size_t>(1, settings.min_batch_size);
        const std::size_t ceiling = std::max(floor, settings.max_batch_size);
        const std::size_t slot = std::max<std::size_t>(1, settings.bytes_per_batch_slot);

        return std::clamp(available_bytes / slot, floor, ceiling);
    }

    BatchScheduler::BatchScheduler(
        const PerformanceSettings& settings,
        parallel::ThreadPool& pool,
        MemoryMonitor& monitor
    )
        : pool_(pool)
        , monitor_(monitor)
        , batch_size_(adaptive_batch_size(settings, MemoryMonitor::available_memory()))
        , max_in_flight_(std::max<std::size_t>(1, settings.max_in_flight)) {}

    void BatchScheduler::relieve_pressure() {
        if (!monitor_.check_pressure()) {
            return;
        }
        ++pressure_events_;
        if (on_pressure_) {
            on_pressure_();
        }
    }

}  // namespace dsv::cache
