#pragma once

#include "search/search_state.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>

namespace sweep {

/// Safety valve for adversarial inputs. Tracks frontier pops, frontier
/// size and wall-clock time against the caps in SearchConfig.
class BudgetManager {
public:
    explicit BudgetManager(const SearchConfig& config)
        : max_seconds_(config.budget_seconds),
          max_pops_(config.max_pops),
          max_frontier_(config.max_frontier) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        pops_ = 0;
    }

    void recordPop() { pops_++; }

    bool canContinue(int64_t frontier_size) const {
        if (isPopExhausted()) return false;
        if (frontier_size > max_frontier_) return false;
        return !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int64_t pops() const { return pops_; }
    bool isPopExhausted() const { return pops_ >= max_pops_; }
    bool isTimeExhausted() const {
        // skip the clock read when no time cap is set
        return std::isfinite(max_seconds_) && elapsedSeconds() >= max_seconds_;
    }

private:
    double max_seconds_;
    int64_t max_pops_;
    int64_t max_frontier_;
    int64_t pops_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace sweep
