//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_MEMORY_MONITOR_HPP
#define DEPSIEVE_MEMORY_MONITOR_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>

namespace dsv::cache {

    /**
     * Watches the process's resident size against a threshold.
     *
     * A pressure event fires when the sampled size exceeds the threshold and
     * no event fired within the cooldown window. Callers react to an event by
     * dropping cached data.
     */
    class MemoryMonitor {
    public:
        using Sampler = std::function<std::size_t()>;
        using Clock = std::chrono::steady_clock;

        /**
         * @param threshold_bytes Resident size above which pressure is reported.
         * @param cooldown Minimum time between two pressure events.
         * @param sampler Returns the resident size in bytes. Defaults to
         *                current_memory_usage().
         */
        MemoryMonitor(std::size_t threshold_bytes, std::chrono::seconds cooldown, Sampler sampler = {});

        /**
         * Samples memory and reports whether a pressure event fires now.
         */
        [[nodiscard]] bool check_pressure();

        [[nodiscard]] std::size_t pressure_events() const;

        [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }

        /**
         * Resident set size of this process in bytes, 0 when unknown.
         */
        static std::size_t current_memory_usage();

        /**
         * Memory the system can hand out without swapping, in bytes.
         * 0 when unknown.
         */
        static std::size_t available_memory();

    private:
        std::size_t threshold_;
        std::chrono::seconds cooldown_;
        Sampler sampler_;
        mutable std::mutex mutex_;
        std::optional<Clock::time_point> last_event_;
        std::size_t events_ = 0;
    };

}  // namespace dsv::cache

#endif //DEPSIEVE_MEMORY_MONITOR_HPP
