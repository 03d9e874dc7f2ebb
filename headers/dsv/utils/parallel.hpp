//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PARALLEL_HPP
#define DEPSIEVE_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool and bounded parallel map.
 */

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace dsv::parallel {

    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Fixed-size worker pool. Tasks run in submission order per worker.
     */
    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        template<typename F, typename... Args>
        auto submit(F&& f, Args&&... args)
            -> std::future<std::invoke_result_t<F, Args...>> {
            using return_type = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...)
            );

            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_ = false;
    };

    /**
     * Maps @p f over @p items with at most @p max_in_flight calls running
     * at once. Results keep the input order.
     *
     * Exceptions thrown by @p f propagate from the first failing item.
     */
    template<typename T, typename F>
    auto bounded_map(
        const std::vector<T>& items,
        F&& f,
        ThreadPool& pool,
        std::size_t max_in_flight
    ) -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        max_in_flight = std::max<std::size_t>(1, max_in_flight);

        std::vector<ResultType> results;
        results.reserve(items.size());

        for (std::size_t start = 0; start < items.size(); start += max_in_flight) {
            const std::size_t end = std::min(items.size(), start + max_in_flight);

            std::vector<std::future<ResultType>> window;
            window.reserve(end - start);
            for (std::size_t i = start; i < end; ++i) {
                window.push_back(pool.submit([&f, &items, i]() {
                    return f(items[i]);
                }));
            }
            // Tasks borrow items and f, so the whole window must finish first.
            for (auto& future : window) {
                future.wait();
            }
            for (auto& future : window) {
                results.push_back(future.get());
            }
        }

        return results;
    }

}  // namespace dsv::parallel

#endif //DEPSIEVE_PARALLEL_HPP
