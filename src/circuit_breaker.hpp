#pragma once
#include <cstdint>
#include <memory>
#include <mutex>

#include "config.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct CircuitBreakerState {
    uint64_t failures = 0;
    uint64_t successes = 0;
    Time_t last_failure_time = 0;
    bool is_open = false;

    double failure_rate() const {
        const uint64_t total = failures + successes;
        return total == 0 ? 0.0 : static_cast<double>(failures) / static_cast<double>(total);
    }
};

// Two-state breaker shared by every group of the batch pipeline. Opens once at
// least MIN_ATTEMPTS_BEFORE_TRIP attempts were seen and the failure ratio reaches
// the threshold; closes again when reset_timeout has passed since the last failure.
class CircuitBreaker {
    public:
        CircuitBreaker(double threshold, Millis reset_timeout, Clock clock, std::shared_ptr<MetricsSink> metrics = nullptr);

        // True while open. Performs the timed reset as a side effect, so the
        // first call after the cool-down returns false and clears the counters.
        bool is_open();

        void record_success();
        void record_failure();

        CircuitBreakerState snapshot() const;
        void reset();

    private:
        bool should_trip_() const;
        void trip_locked_();
        void reset_locked_();

        const double threshold_;
        const Millis reset_timeout_;
        Clock clock_;
        std::shared_ptr<MetricsSink> metrics_;

        mutable std::mutex mutex_;
        CircuitBreakerState state_;
};
