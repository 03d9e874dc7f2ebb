//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_BATCH_SCHEDULER_HPP
#define DEPSIEVE_BATCH_SCHEDULER_HPP

/**
 * @file batch_scheduler.hpp
 * @brief Memory-aware batching of per-file work.
 *
 * Work lists are cut into batches whose size follows the memory the system
 * has available. Inside a batch at most max_in_flight items run at once on
 * the shared pool. Before each batch the memory monitor is consulted and,
 * on pressure, the registered callback (normally "clear every cache") runs.
 *
 * The batching never changes results: output order equals input order and
 * every item is processed exactly once.
 */

#include "dsv/cache/memory_monitor.hpp"
#include "dsv/types.hpp"
#include "dsv/utils/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <vector>

namespace dsv::cache {

    /**
     * available / bytes_per_batch_slot, clamped to [min, max].
     * fixed_batch_size, when set, wins.
     */
    [[nodiscard]] std::size_t adaptive_batch_size(const PerformanceSettings& settings, std::size_t available_bytes);

    struct BatchStats {
        std::size_t batches = 0;
        std::size_t items = 0;
        std::size_t pressure_events = 0;
    };

    class BatchScheduler {
    public:
        BatchScheduler(const PerformanceSettings& settings, parallel::ThreadPool& pool, MemoryMonitor& monitor);

        /**
         * Registers the action taken on a memory pressure event.
         */
        void on_memory_pressure(std::function<void()> callback) {
            on_pressure_ = std::move(callback);
        }

        [[nodiscard]] std::size_t batch_size() const noexcept { return batch_size_; }
        [[nodiscard]] std::size_t max_in_flight() const noexcept { return max_in_flight_; }

        [[nodiscard]] BatchStats stats() const noexcept {
            return BatchStats{batches_.load(), items_.load(), pressure_events_.load()};
        }

        /**
         * Maps @p f over @p items batch by batch. Results keep input order.
         */
        template<typename T, typename F>
        auto map(const std::vector<T>& items, F&& f)
            -> std::vector<std::invoke_result_t<F, const T&>> {
            using ResultType = std::invoke_result_t<F, const T&>;

            std::vector<ResultType> results;
            results.reserve(items.size());

            for (std::size_t start = 0; start < items.size(); start += batch_size_) {
                relieve_pressure();

                const std::size_t end = std::min(items.size(), start + batch_size_);
                const std::vector<T> batch(items.begin() + static_cast<std::ptrdiff_t>(start),
                                           items.begin() + static_cast<std::ptrdiff_t>(end));

                auto partial = parallel::bounded_map(batch, f, pool_, max_in_flight_);
                for (auto&& r : partial) {
                    results.push_back(std::move(r));
                }

                ++batches_;
                items_ += batch.size();
            }

            return results;
        }

    private:
        void relieve_pressure();

        parallel::ThreadPool& pool_;
        MemoryMonitor& monitor_;
        std::size_t batch_size_;
        std::size_t max_in_flight_;
        std::function<void()> on_pressure_;
        std::atomic<std::size_t> batches_{0};
        std::atomic<std::size_t> items_{0};
        std::atomic<std::size_t> pressure_events_{0};
    };

}  // namespace dsv::cache

#endif //DEPSIEVE_BATCH_SCHEDULER_HPP
