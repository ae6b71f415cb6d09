#include "circuit_breaker.hpp"

#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_BATCH, "BATCH")

CircuitBreaker::CircuitBreaker(double threshold, Millis reset_timeout, Clock clock, std::shared_ptr<MetricsSink> metrics)
    : threshold_(threshold),
      reset_timeout_(reset_timeout),
      clock_(std::move(clock)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()) {}

bool CircuitBreaker::should_trip_() const {
    const uint64_t total = state_.failures + state_.successes;
    return total >= MIN_ATTEMPTS_BEFORE_TRIP && state_.failure_rate() >= threshold_;
}

void CircuitBreaker::reset_locked_() {
    state_.failures = 0;
    state_.successes = 0;
    state_.is_open = false;
}

void CircuitBreaker::trip_locked_() {
    state_.is_open = true;
    const double rate = state_.failure_rate();
    RLOG(LG_BATCH, LogLevel::LL_WARNING)
        << "circuit breaker opened failures=" << state_.failures
        << " successes=" << state_.successes << " rate=" << rate;
    metrics_->emit("circuit_breaker_opened", rate, {{"failures", std::to_string(state_.failures)}});
}

bool CircuitBreaker::is_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.is_open) {
        if (!should_trip_()) {
            return false;
        }
        trip_locked_();
    }
    const Time_t now = clock_();
    if (now - state_.last_failure_time > reset_timeout_.count()) {
        reset_locked_();
        RLOG(LG_BATCH, LogLevel::LL_INFO) << "circuit breaker reset after " << reset_timeout_.count() << "ms cool-down";
        metrics_->emit("circuit_breaker_reset", 1, {});
        return false;
    }
    return true;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.successes;
    if (state_.successes > BREAKER_RESCALE_LIMIT) {
        state_.successes /= 2;
        state_.failures /= 2;
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.failures;
    state_.last_failure_time = clock_();
    if (!state_.is_open && should_trip_()) {
        trip_locked_();
    }
}

CircuitBreakerState CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked_();
    state_.last_failure_time = 0;
}
