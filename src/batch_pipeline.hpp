#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "data_pipeline.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct BatchResult {
    size_t quotes = 0;
    size_t groups = 0;
    size_t groups_succeeded = 0;
    size_t groups_degraded = 0;
    size_t groups_short_circuited = 0;
    size_t recovered_items = 0;
    Time_t duration_ms = 0;

    bool degraded() const {return groups_degraded > 0;}
};

struct GroupOutcome {
    bool succeeded = false;
    bool fallback = false;
    bool short_circuited = false;
    uint32_t attempts = 0;
    size_t recovered = 0;
    std::string error_type;
};

struct BatchStats {
    uint64_t total_batches = 0;
    uint64_t total_quotes = 0;
    uint64_t total_processing_time_ms = 0;
    double average_batch_size = 0.0;
    double average_processing_time_ms = 0.0;
    uint64_t total_fallbacks = 0;
    uint64_t partial_recovery_successes = 0;
    uint64_t fallback_failures = 0;
    Time_t last_fallback_time = 0;
};

struct DynamicBatchingStats {
    bool enabled = false;
    Millis current_interval{0};
    bool is_high_load = false;
    bool is_low_load = false;
    std::vector<double> recent_rates; // batches per second, oldest first
    double current_load_rate = 0.0;
    uint64_t total_adjustments = 0;
    Time_t last_adjustment_time = 0;
};

struct FallbackAnalysis {
    size_t items = 0;
    std::set<std::string> symbols;
    std::set<std::string> providers;
    std::set<std::string> capabilities;
    std::map<std::string, size_t> markets;
};

FallbackAnalysis analyze_batch(const std::vector<RawQuote>& items);

// Indices of at most max_items items, preferring those whose symbols trade in
// one of priority_markets; the leading items when none qualify.
std::vector<size_t> select_recovery_items(
    const std::vector<RawQuote>& items,
    const std::vector<std::string>& priority_markets,
    size_t max_items
);

// base * 2^(attempt - 1), the exponent capped at MAX_BACKOFF_SHIFT.
constexpr uint32_t MAX_BACKOFF_SHIFT = 16;
Millis retry_delay(Millis base, uint32_t attempt);

// Buffers raw quotes into time boxed batches and drives each (provider, capability)
// group through the data pipeline behind retry and a shared circuit breaker.
// Buffering lives on a strand of the io_context; batches run on a worker pool.
class BatchPipeline {
    public:
        BatchPipeline(
            boost::asio::io_context& context,
            const RelayConfig& config,
            std::shared_ptr<DataPipeline> pipeline,
            std::shared_ptr<MetricsSink> metrics,
            Clock clock
        );
        ~BatchPipeline();

        BatchPipeline(const BatchPipeline&) = delete;
        BatchPipeline& operator=(const BatchPipeline&) = delete;

        void start();
        // Processes whatever is still buffered, then joins the worker pools.
        void stop();

        // Thread safe. Drains early once the buffer reaches the hard cap.
        void add_quote(RawQuote quote);

        // Never throws; failures degrade to fallback processing.
        BatchResult process_batch(std::vector<RawQuote> batch);

        // One step of the adaptive window control loop.
        void adjust_batch_interval();

        Millis current_interval() const {return Millis(current_interval_ms_.load());}
        BatchStats batch_stats() const;
        DynamicBatchingStats dynamic_batching_stats() const;
        CircuitBreakerState circuit_breaker_state() const {return breaker_.snapshot();}
        CircuitBreaker& circuit_breaker() {return breaker_;}

    private:
        void buffer_quote_(RawQuote quote); // strand only
        void arm_window_(); // strand only
        void drain_(); // strand only
        void arm_adjustment_();

        GroupOutcome process_group_(const std::string& provider, const std::string& capability, const std::vector<RawQuote>& items);
        size_t fallback_(
            const std::string& provider,
            const std::string& capability,
            const std::vector<RawQuote>& items,
            bool breaker_open,
            const std::string& reason
        );
        void record_batch_(const BatchResult& result);

        boost::asio::io_context& context_;
        const RelayConfig config_;
        std::shared_ptr<DataPipeline> pipeline_;
        std::shared_ptr<MetricsSink> metrics_;
        Clock clock_;

        CircuitBreaker breaker_;

        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::steady_timer window_timer_;
        boost::asio::steady_timer adjustment_timer_;
        boost::asio::thread_pool batch_pool_;
        boost::asio::thread_pool group_pool_;

        std::vector<RawQuote> buffer_;
        uint64_t window_generation_ = 0;
        bool accepting_ = false; // strand only
        std::atomic<bool> running_{false};
        std::atomic<int64_t> current_interval_ms_;

        mutable std::mutex stats_mutex_;
        BatchStats stats_;

        mutable std::mutex dynamic_mutex_;
        std::deque<double> rate_samples_;
        uint64_t batches_since_adjustment_ = 0;
        Time_t last_adjustment_time_ = 0;
        bool is_high_load_ = false;
        bool is_low_load_ = false;
        uint64_t total_adjustments_ = 0;
};
