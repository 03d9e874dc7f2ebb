//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_DIAGNOSTICS_HPP
#define DEPSIEVE_DIAGNOSTICS_HPP

/**
 * @file diagnostics.hpp
 * @brief Thread-safe sink for recoverable errors.
 *
 * Per-file, per-package and per-dependency failures never abort a run.
 * They are recorded here and surfaced by the CLI in verbose mode.
 */

#include "dsv/error.hpp"

#include <mutex>
#include <vector>

namespace dsv {

    class Diagnostics {
    public:
        void report(Error error) {
            std::lock_guard lock(mutex_);
            errors_.push_back(std::move(error));
        }

        [[nodiscard]] std::vector<Error> snapshot() const {
            std::lock_guard lock(mutex_);
            return errors_;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lock(mutex_);
            return errors_.size();
        }

        [[nodiscard]] bool empty() const {
            return size() == 0;
        }

        void clear() {
            std::lock_guard lock(mutex_);
            errors_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<Error> errors_;
    };

}  // namespace dsv

#endif //DEPSIEVE_DIAGNOSTICS_HPP
