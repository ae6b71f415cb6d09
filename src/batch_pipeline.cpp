#include "batch_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <numeric>
#include <thread>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "error.hpp"
#include "logging.hpp"
#include "market.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_BATCH, "BATCH")

FallbackAnalysis analyze_batch(const std::vector<RawQuote>& items) {
    FallbackAnalysis analysis;
    analysis.items = items.size();
    for (const auto& item : items) {
        analysis.providers.insert(item.provider);
        analysis.capabilities.insert(item.capability);
        for (const auto& symbol : item.symbols) {
            if (analysis.symbols.insert(symbol).second) {
                ++analysis.markets[infer_market(symbol)];
            }
        }
    }
    return analysis;
}

std::vector<size_t> select_recovery_items(
    const std::vector<RawQuote>& items,
    const std::vector<std::string>& priority_markets,
    size_t max_items
) {
    std::vector<size_t> selected;
    for (size_t i = 0; i < items.size() && selected.size() < max_items; ++i) {
        const bool priority = std::any_of(items[i].symbols.begin(), items[i].symbols.end(), [&](const std::string& symbol) {
            const std::string market = infer_market(symbol);
            return std::find(priority_markets.begin(), priority_markets.end(), market) != priority_markets.end();
        });
        if (priority) {
            selected.push_back(i);
        }
    }
    if (selected.empty()) {
        for (size_t i = 0; i < items.size() && i < max_items; ++i) {
            selected.push_back(i);
        }
    }
    return selected;
}

Millis retry_delay(Millis base, uint32_t attempt) {
    const uint32_t shift = std::min<uint32_t>(attempt == 0 ? 0 : attempt - 1, MAX_BACKOFF_SHIFT);
    return base * (int64_t(1) << shift);
}

BatchPipeline::BatchPipeline(
    boost::asio::io_context& context,
    const RelayConfig& config,
    std::shared_ptr<DataPipeline> pipeline,
    std::shared_ptr<MetricsSink> metrics,
    Clock clock
)
    : context_(context),
      config_(config),
      pipeline_(std::move(pipeline)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      clock_(std::move(clock)),
      breaker_(config.circuit_breaker_threshold, config.circuit_breaker_reset_timeout, clock_, metrics_),
      strand_(boost::asio::make_strand(context)),
      window_timer_(strand_),
      adjustment_timer_(strand_),
      batch_pool_(std::max<size_t>(1, config.batch_worker_threads)),
      group_pool_(std::max<size_t>(1, config.group_worker_threads)),
      current_interval_ms_(config.batch_processing_interval.count()) {
    buffer_.reserve(config_.batch_hard_cap);
    last_adjustment_time_ = clock_();
}

BatchPipeline::~BatchPipeline() {
    stop();
}

void BatchPipeline::start() {
    if (running_.exchange(true)) {return;}
    RLOG(LG_BATCH, LogLevel::LL_INFO)
        << "batch pipeline started window=" << current_interval_ms_.load() << "ms hard_cap=" << config_.batch_hard_cap
        << " dynamic=" << (config_.dynamic_batching.enabled ? "on" : "off");
    boost::asio::post(strand_, [this] {
        accepting_ = true;
        if (config_.dynamic_batching.enabled) {
            arm_adjustment_();
        }
    });
}

void BatchPipeline::stop() {
    if (!running_.exchange(false)) {return;}

    auto remaining = std::make_shared<std::promise<std::vector<RawQuote>>>();
    auto future = remaining->get_future();
    boost::asio::post(strand_, [this, remaining] {
        accepting_ = false;
        window_timer_.cancel();
        adjustment_timer_.cancel();
        ++window_generation_;
        std::vector<RawQuote> batch;
        batch.swap(buffer_);
        remaining->set_value(std::move(batch));
    });

    if (future.wait_for(std::chrono::seconds(1)) == std::future_status::ready) {
        auto batch = future.get();
        if (!batch.empty()) {
            RLOG(LG_BATCH, LogLevel::LL_INFO) << "flushing " << batch.size() << " buffered quotes on stop";
            process_batch(std::move(batch));
        }
    } else {
        RLOG(LG_BATCH, LogLevel::LL_WARNING) << "event loop not running, buffered quotes dropped on stop";
    }

    batch_pool_.join();
    group_pool_.join();
    RLOG(LG_BATCH, LogLevel::LL_INFO) << "batch pipeline stopped";
}

void BatchPipeline::add_quote(RawQuote quote) {
    if (quote.timestamp == 0) {
        quote.timestamp = clock_();
    }
    boost::asio::post(strand_, [this, quote = std::move(quote)]() mutable {
        buffer_quote_(std::move(quote));
    });
}

void BatchPipeline::buffer_quote_(RawQuote quote) {
    if (!accepting_) {
        RLOG(LG_BATCH, LogLevel::LL_DEBUG) << "pipeline not running, dropping quote from " << quote.provider;
        return;
    }
    const bool first = buffer_.empty();
    buffer_.push_back(std::move(quote));
    if (buffer_.size() >= config_.batch_hard_cap) {
        RLOG(LG_BATCH, LogLevel::LL_DEBUG) << "hard cap " << config_.batch_hard_cap << " reached, draining early";
        drain_();
    } else if (first) {
        arm_window_();
    }
}

void BatchPipeline::arm_window_() {
    const uint64_t generation = window_generation_;
    window_timer_.expires_after(current_interval());
    window_timer_.async_wait(boost::asio::bind_executor(strand_,
        [this, generation](const boost::system::error_code& ec) {
            if (ec || generation != window_generation_) {
                return;
            }
            drain_();
        }
    ));
}

void BatchPipeline::drain_() {
    ++window_generation_;
    window_timer_.cancel();
    if (buffer_.empty()) {
        return;
    }
    auto batch = std::make_shared<std::vector<RawQuote>>();
    batch->reserve(config_.batch_hard_cap);
    batch->swap(buffer_);
    boost::asio::post(batch_pool_, [this, batch] {
        process_batch(std::move(*batch));
    });
}

void BatchPipeline::arm_adjustment_() {
    if (!running_) {return;}
    adjustment_timer_.expires_after(config_.dynamic_batching.adjustment_frequency);
    adjustment_timer_.async_wait(boost::asio::bind_executor(strand_,
        [this](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            adjust_batch_interval();
            arm_adjustment_();
        }
    ));
}

BatchResult BatchPipeline::process_batch(std::vector<RawQuote> batch) {
    BatchResult result;
    result.quotes = batch.size();
    if (batch.empty()) {
        return result;
    }
    const Time_t started = clock_();

    std::map<std::pair<std::string, std::string>, std::vector<RawQuote>> groups;
    for (auto& quote : batch) {
        auto key = std::make_pair(quote.provider, quote.capability);
        groups[key].push_back(std::move(quote));
    }
    result.groups = groups.size();

    std::vector<std::future<GroupOutcome>> outcomes;
    outcomes.reserve(groups.size());
    for (auto& [key, items] : groups) {
        auto task = std::make_shared<std::packaged_task<GroupOutcome()>>(
            [this, provider = key.first, capability = key.second, items = std::move(items)] {
                return process_group_(provider, capability, items);
            }
        );
        outcomes.push_back(task->get_future());
        boost::asio::post(group_pool_, [task] { (*task)(); });
    }

    for (auto& outcome_future : outcomes) {
        try {
            const GroupOutcome outcome = outcome_future.get();
            if (outcome.succeeded) {
                ++result.groups_succeeded;
            } else {
                ++result.groups_degraded;
            }
            if (outcome.short_circuited) {
                ++result.groups_short_circuited;
            }
            result.recovered_items += outcome.recovered;
        } catch (const std::exception& e) {
            ++result.groups_degraded;
            RLOG(LG_BATCH, LogLevel::LL_ERROR) << "group task failed unexpectedly: " << e.what();
        }
    }

    result.duration_ms = clock_() - started;
    record_batch_(result);
    return result;
}

GroupOutcome BatchPipeline::process_group_(
    const std::string& provider,
    const std::string& capability,
    const std::vector<RawQuote>& items
) {
    GroupOutcome outcome;

    const uint32_t max_attempts = std::max<uint32_t>(1, config_.max_retry_attempts);
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            if (breaker_.is_open()) {
                throw CircuitOpenError("circuit open for " + provider + ":" + capability);
            }
            ++outcome.attempts;
            pipeline_->process(provider, capability, items);
            breaker_.record_success();
            outcome.succeeded = true;
            return outcome;
        } catch (const CircuitOpenError& e) {
            outcome.short_circuited = outcome.attempts == 0;
            outcome.error_type = to_string(e.code());
            RLOG(LG_BATCH, LogLevel::LL_WARNING)
                << e.what() << " after " << outcome.attempts << " attempts, " << items.size() << " quotes go to fallback";
            break;
        } catch (const std::exception& e) {
            breaker_.record_failure();
            outcome.error_type = to_string(pipeline_error_kind(e));
            RLOG(LG_BATCH, LogLevel::LL_WARNING)
                << "attempt " << attempt << "/" << max_attempts << " for " << provider << ":" << capability
                << " failed (" << outcome.error_type << "): " << e.what();
        }

        if (attempt == max_attempts) {
            break;
        }
        std::this_thread::sleep_for(retry_delay(config_.retry_delay_base, attempt));
    }

    outcome.fallback = true;
    outcome.recovered = fallback_(provider, capability, items, breaker_.snapshot().is_open, outcome.error_type);
    return outcome;
}

size_t BatchPipeline::fallback_(
    const std::string& provider,
    const std::string& capability,
    const std::vector<RawQuote>& items,
    bool breaker_open,
    const std::string& reason
) {
    try {
        const FallbackAnalysis analysis = analyze_batch(items);
        const auto& fallback = config_.fallback;

        size_t attempted = 0;
        size_t recovered = 0;
        if (!breaker_open && items.size() <= fallback.max_batch_for_recovery && fallback.max_recovery_items > 0) {
            for (size_t index : select_recovery_items(items, fallback.priority_markets, fallback.max_recovery_items)) {
                ++attempted;
                try {
                    pipeline_->process(provider, capability, {items[index]});
                    ++recovered;
                } catch (const std::exception& e) {
                    RLOG(LG_BATCH, LogLevel::LL_DEBUG) << "partial recovery of item " << index << " failed: " << e.what();
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.total_fallbacks;
            if (recovered > 0) {
                ++stats_.partial_recovery_successes;
            }
            stats_.last_fallback_time = clock_();
        }

        std::string markets;
        for (const auto& [market, count] : analysis.markets) {
            markets += (markets.empty() ? "" : ",") + market + ":" + std::to_string(count);
        }

        RLOG(LG_BATCH, LogLevel::LL_WARNING)
            << "fallback for " << provider << ":" << capability << " items=" << analysis.items
            << " symbols=" << analysis.symbols.size() << " markets=" << markets
            << " recovered=" << recovered << "/" << attempted << " reason=" << reason;
        metrics_->emit("batch_fallback", static_cast<double>(items.size()), {
            {"provider", provider},
            {"capability", capability},
            {"reason", reason},
            {"symbols", std::to_string(analysis.symbols.size())},
            {"markets", markets},
            {"recovered", std::to_string(recovered)},
            {"circuit_open", breaker_open ? "true" : "false"}
        });
        return recovered;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.fallback_failures;
        }
        RLOG(LG_BATCH, LogLevel::LL_ERROR) << "fallback for " << provider << ":" << capability << " failed: " << e.what();
        metrics_->emit("batch_fallback_failed", static_cast<double>(items.size()), {
            {"provider", provider}, {"capability", capability}
        });
        return 0;
    }
}

void BatchPipeline::record_batch_(const BatchResult& result) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.total_batches;
        stats_.total_quotes += result.quotes;
        stats_.total_processing_time_ms += static_cast<uint64_t>(std::max<Time_t>(0, result.duration_ms));
        stats_.average_batch_size = static_cast<double>(stats_.total_quotes) / static_cast<double>(stats_.total_batches);
        stats_.average_processing_time_ms =
            static_cast<double>(stats_.total_processing_time_ms) / static_cast<double>(stats_.total_batches);
    }
    {
        std::lock_guard<std::mutex> lock(dynamic_mutex_);
        ++batches_since_adjustment_;
    }
    metrics_->emit("batch_processed", static_cast<double>(result.quotes), {
        {"groups", std::to_string(result.groups)},
        {"degraded", std::to_string(result.groups_degraded)},
        {"duration_ms", std::to_string(result.duration_ms)}
    });
}

void BatchPipeline::adjust_batch_interval() {
    const auto& dynamic = config_.dynamic_batching;
    const Time_t now = clock_();

    std::lock_guard<std::mutex> lock(dynamic_mutex_);
    const Time_t elapsed = now - last_adjustment_time_;
    if (elapsed <= 0) {
        return;
    }
    const double rate = static_cast<double>(batches_since_adjustment_) * 1000.0 / static_cast<double>(elapsed);
    batches_since_adjustment_ = 0;
    last_adjustment_time_ = now;

    rate_samples_.push_back(rate);
    while (rate_samples_.size() > std::max<size_t>(1, dynamic.sample_window)) {
        rate_samples_.pop_front();
    }
    const double average = std::accumulate(rate_samples_.begin(), rate_samples_.end(), 0.0)
        / static_cast<double>(rate_samples_.size());

    const int64_t current = current_interval_ms_.load();
    int64_t next = current;
    const char* mode = "normal";

    if (average > dynamic.high_load_threshold) {
        mode = "high_load";
        if (!is_high_load_) {
            is_high_load_ = true;
            is_low_load_ = false;
            next = std::max(dynamic.min_interval.count(), dynamic.high_load_interval.count());
        }
    } else if (average < dynamic.low_load_threshold) {
        mode = "low_load";
        if (!is_low_load_) {
            is_low_load_ = true;
            is_high_load_ = false;
            next = std::min(dynamic.max_interval.count(), dynamic.low_load_interval.count());
        }
    } else {
        is_high_load_ = false;
        is_low_load_ = false;
        const double midpoint = (dynamic.high_load_threshold + dynamic.low_load_threshold) / 2.0;
        if (average > midpoint) {
            next = current - dynamic.adjustment_step.count();
        } else if (average < midpoint) {
            next = current + dynamic.adjustment_step.count();
        }
        next = std::clamp(next, dynamic.min_interval.count(), dynamic.max_interval.count());
    }

    if (next == current) {
        return;
    }
    current_interval_ms_.store(next);
    ++total_adjustments_;

    RLOG(LG_BATCH, LogLevel::LL_INFO)
        << "batch window " << current << "ms -> " << next << "ms (" << mode << ", " << average << " batches/s)";
    metrics_->emit("batch_interval_adjusted", static_cast<double>(next), {
        {"previous_ms", std::to_string(current)},
        {"mode", mode},
        {"load_rate", std::to_string(average)}
    });
}

BatchStats BatchPipeline::batch_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

DynamicBatchingStats BatchPipeline::dynamic_batching_stats() const {
    std::lock_guard<std::mutex> lock(dynamic_mutex_);
    DynamicBatchingStats stats;
    stats.enabled = config_.dynamic_batching.enabled;
    stats.current_interval = current_interval();
    stats.is_high_load = is_high_load_;
    stats.is_low_load = is_low_load_;
    stats.recent_rates.assign(rate_samples_.begin(), rate_samples_.end());
    stats.current_load_rate = rate_samples_.empty() ? 0.0 : rate_samples_.back();
    stats.total_adjustments = total_adjustments_;
    stats.last_adjustment_time = last_adjustment_time_;
    return stats;
}
