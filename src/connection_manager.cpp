#include "connection_manager.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

#include "deadline.hpp"
#include "error.hpp"
#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_CONN, "CONN")

bool compute_connection_healthy(const ConnectionHealth& health, Time_t now, Millis staleness_bound) {
    if (health.consecutive_errors >= UNHEALTHY_CONSECUTIVE_ERRORS || health.error_count >= UNHEALTHY_TOTAL_ERRORS) {
        return false;
    }
    return now - health.last_activity < staleness_bound.count();
}

ConnectionQuality compute_connection_quality(const ConnectionHealth& health, Time_t now, Millis staleness_bound) {
    if (!compute_connection_healthy(health, now, staleness_bound)) {
        return ConnectionQuality::POOR;
    }
    const bool recent = now - health.last_activity < staleness_bound.count() / 2;
    if (health.error_count == 0 && health.consecutive_errors == 0 && recent) {
        return ConnectionQuality::EXCELLENT;
    }
    if (health.consecutive_errors <= 1 && health.error_count <= 2) {
        return ConnectionQuality::GOOD;
    }
    return ConnectionQuality::POOR;
}

ConnectionManager::ConnectionManager(
    const RelayConfig& config,
    std::shared_ptr<StreamFetcher> fetcher,
    std::shared_ptr<RateLimiter> rate_limiter,
    std::shared_ptr<MetricsSink> metrics,
    Clock clock,
    MemoryReader memory_reader
)
    : config_(config),
      fetcher_(std::move(fetcher)),
      rate_limiter_(std::move(rate_limiter)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      clock_(std::move(clock)),
      memory_reader_(std::move(memory_reader)) {}

RateLimitResult ConnectionManager::check_rate_limit(const std::string& client_identity) {
    RateLimitRequest request;
    request.limit = config_.rate_limit.max_connections_per_window;
    request.window_ms = config_.rate_limit.window_size.count();

    RateLimitResult open;
    open.allowed = true;
    open.limit = request.limit;

    if (!rate_limiter_) {
        return open;
    }

    const std::string key = "client:" + client_identity;
    try {
        RateLimitResult result = await_with_deadline(
            rate_limiter_->check_rate_limit(key, request),
            config_.timeouts.rate_limit,
            "rate limit check"
        );
        if (!result.allowed) {
            RLOG(LG_CONN, LogLevel::LL_WARNING)
                << "rate limit hit for " << key << " current=" << result.current
                << " limit=" << result.limit << " retry_after=" << result.retry_after_ms << "ms";
        }
        return result;
    } catch (const std::exception& e) {
        RLOG(LG_CONN, LogLevel::LL_WARNING) << "rate limiter unavailable for " << key << ", allowing: " << e.what();
        return open;
    }
}

std::shared_ptr<StreamConnection> ConnectionManager::get_or_create_connection(
    const std::string& provider,
    const std::string& capability,
    const SymbolList& symbols,
    const std::string& client_id
) {
    const std::string key = make_connection_key(provider, capability);
    std::unique_lock<std::mutex> lock(mutex_);

    // Another caller is establishing this key; its result is reused below.
    pending_cv_.wait(lock, [&] { return pending_.count(key) == 0; });

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (it->second.connection && it->second.connection->is_connected()) {
            it->second.health.last_activity = clock_();
            RLOG(LG_CONN, LogLevel::LL_DEBUG) << "reusing connection " << key << " for client " << client_id;
            return it->second.connection;
        }
        erase_locked_(it, "disconnected");
    }

    if (entries_.size() + pending_.size() >= config_.max_connections) {
        RLOG(LG_CONN, LogLevel::LL_WARNING)
            << "connection cap " << config_.max_connections << " reached, sweeping before admitting " << key;
        stale_sweep_locked_(clock_());
        if (entries_.size() + pending_.size() >= config_.max_connections) {
            throw ResourceExhaustedError(
                "connection limit reached (" + std::to_string(config_.max_connections) + "), cannot open " + key
            );
        }
    }

    if (!fetcher_) {
        throw CollaboratorUnavailableError("no stream fetcher configured for " + key);
    }

    ConnectionOptions options;
    options.heartbeat_interval = config_.recovery.heartbeat_interval;
    options.connection_timeout = config_.timeouts.connect;

    // The slot counts against the cap while the fetcher runs without the lock.
    pending_.insert(key);
    PendingSlot slot(*this, key);
    lock.unlock();

    std::shared_ptr<StreamConnection> connection;
    try {
        connection = fetcher_->establish_stream_connection(provider, capability, options);
    } catch (const QRError&) {
        throw;
    } catch (const std::exception& e) {
        throw CollaboratorUnavailableError("failed to establish " + key + ": " + e.what());
    }
    if (!connection) {
        throw CollaboratorUnavailableError("stream fetcher returned no connection for " + key);
    }

    lock.lock();
    slot.release_locked();
    Entry entry;
    entry.connection = connection;
    entry.health.last_activity = clock_();
    entries_[key] = std::move(entry);

    RLOG(LG_CONN, LogLevel::LL_INFO)
        << "connection " << connection->id() << " created for " << key
        << " client=" << client_id << " symbols=" << symbols.size() << " total=" << entries_.size();
    metrics_->emit("connection_created", 1, {{"provider", provider}, {"capability", capability}});
    return connection;
}

void ConnectionManager::PendingSlot::release_locked() {
    owner_.pending_.erase(key_);
    released_ = true;
}

ConnectionManager::PendingSlot::~PendingSlot() {
    if (!released_) {
        std::lock_guard<std::mutex> lock(owner_.mutex_);
        owner_.pending_.erase(key_);
    }
    owner_.pending_cv_.notify_all();
}

bool ConnectionManager::close_entry_(const std::string& key, Entry& entry) {
    if (!entry.connection) {
        return true;
    }
    try {
        entry.connection->close();
        return true;
    } catch (const std::exception& e) {
        RLOG(LG_CONN, LogLevel::LL_WARNING) << "graceful close of " << key << " failed: " << e.what();
        return false;
    }
}

void ConnectionManager::erase_locked_(EntryMap::iterator it, const char* reason) {
    const std::string key = it->first;
    close_entry_(key, it->second);
    entries_.erase(it);
    RLOG(LG_CONN, LogLevel::LL_INFO) << "connection " << key << " removed (" << reason << ")";
    metrics_->emit("connection_closed", 1, {{"key", key}, {"reason", reason}});
}

bool ConnectionManager::remove_connection(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    erase_locked_(it, "removed");
    return true;
}

CleanupResult ConnectionManager::force_connection_cleanup() {
    const Time_t started = clock_();
    CleanupResult result;
    result.type = CleanupType::FORCED;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.connections_before = entries_.size();
        if (!entries_.empty()) {
            const size_t to_evict = std::max<size_t>(
                1, static_cast<size_t>(static_cast<double>(entries_.size()) * FORCED_CLEANUP_RATIO)
            );

            std::vector<std::pair<Time_t, std::string>> by_activity;
            by_activity.reserve(entries_.size());
            for (const auto& [key, entry] : entries_) {
                by_activity.emplace_back(entry.health.last_activity, key);
            }
            std::sort(by_activity.begin(), by_activity.end());

            for (size_t i = 0; i < to_evict && i < by_activity.size(); ++i) {
                auto it = entries_.find(by_activity[i].second);
                if (!close_entry_(it->first, it->second)) {
                    ++result.close_failures;
                }
                metrics_->emit("connection_closed", 1, {{"key", it->first}, {"reason", "forced_cleanup"}});
                entries_.erase(it);
                ++result.removed;
            }
        }
        result.remaining = entries_.size();
    }

    release_free_memory();
    result.duration_ms = clock_() - started;

    RLOG(LG_CONN, LogLevel::LL_WARNING)
        << "forced cleanup removed " << result.removed << " of " << result.connections_before
        << " connections, close failures=" << result.close_failures;
    metrics_->emit("forced_connection_cleanup_completed", static_cast<double>(result.removed), {
        {"before", std::to_string(result.connections_before)},
        {"remaining", std::to_string(result.remaining)}
    });
    return result;
}

CleanupResult ConnectionManager::stale_sweep_locked_(Time_t now) {
    CleanupResult result;
    result.type = CleanupType::SCHEDULED;
    result.connections_before = entries_.size();

    size_t inactive = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = it->second;
        const bool connected = entry.connection && entry.connection->is_connected();
        const bool stale = now - entry.health.last_activity > config_.connection_stale_timeout.count();
        if (!connected || stale) {
            auto next = std::next(it);
            erase_locked_(it, connected ? "stale" : "disconnected");
            it = next;
            ++inactive;
        } else {
            ++it;
        }
    }
    if (inactive > 0) {
        metrics_->emit("inactive_connections_cleaned", static_cast<double>(inactive), {});
    }

    for (auto& [key, entry] : entries_) {
        entry.health.is_healthy = compute_connection_healthy(entry.health, now, config_.health_staleness_bound);
        entry.health.quality = compute_connection_quality(entry.health, now, config_.health_staleness_bound);
    }

    size_t unhealthy = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->second.health.is_healthy) {
            auto next = std::next(it);
            erase_locked_(it, "unhealthy");
            it = next;
            ++unhealthy;
        } else {
            ++it;
        }
    }
    if (unhealthy > 0) {
        metrics_->emit("unhealthy_connections_cleaned", static_cast<double>(unhealthy), {});
    }

    size_t evicted = 0;
    if (entries_.size() > config_.max_connections) {
        // poor before good before excellent, oldest activity first within a level
        std::vector<std::tuple<ConnectionQuality, Time_t, std::string>> order;
        order.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            order.emplace_back(entry.health.quality, entry.health.last_activity, key);
        }
        std::sort(order.begin(), order.end());
        const size_t excess = entries_.size() - config_.max_connections;
        for (size_t i = 0; i < excess; ++i) {
            erase_locked_(entries_.find(std::get<2>(order[i])), "over_capacity");
            ++evicted;
        }
        metrics_->emit("smart_connection_cleanup_completed", static_cast<double>(evicted), {});
    }

    result.removed = inactive + unhealthy + evicted;
    result.remaining = entries_.size();
    result.duration_ms = clock_() - now;

    if (result.removed > 0) {
        RLOG(LG_CONN, LogLevel::LL_INFO)
            << "stale sweep removed " << result.removed << " (inactive=" << inactive
            << " unhealthy=" << unhealthy << " evicted=" << evicted << "), remaining=" << result.remaining;
    }
    emit_health_stats_locked_();
    return result;
}

CleanupResult ConnectionManager::run_stale_sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stale_sweep_locked_(clock_());
}

size_t ConnectionManager::run_memory_sweep() {
    const size_t resident = memory_reader_ ? memory_reader_() : 0;
    const auto& thresholds = config_.memory_monitoring;

    if (resident >= thresholds.critical_threshold_bytes) {
        RLOG(LG_CONN, LogLevel::LL_ERROR)
            << "resident memory " << resident << " bytes above critical threshold "
            << thresholds.critical_threshold_bytes << ", forcing connection cleanup";
        metrics_->emit("memory_usage_alert", static_cast<double>(resident), {{"level", "critical"}});
        force_connection_cleanup();
    } else if (resident >= thresholds.warning_threshold_bytes) {
        RLOG(LG_CONN, LogLevel::LL_WARNING)
            << "resident memory " << resident << " bytes above warning threshold " << thresholds.warning_threshold_bytes;
        metrics_->emit("memory_usage_alert", static_cast<double>(resident), {{"level", "warning"}});
    }
    return resident;
}

void ConnectionManager::record_connection_activity(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    auto& health = it->second.health;
    const Time_t now = clock_();
    health.last_activity = now;
    health.consecutive_errors = 0;
    ++health.activity_count;
    health.is_healthy = compute_connection_healthy(health, now, config_.health_staleness_bound);
    health.quality = compute_connection_quality(health, now, config_.health_staleness_bound);
}

void ConnectionManager::record_connection_error(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    auto& health = it->second.health;
    const Time_t now = clock_();
    ++health.error_count;
    ++health.consecutive_errors;
    health.last_error_time = now;
    health.is_healthy = compute_connection_healthy(health, now, config_.health_staleness_bound);
    health.quality = compute_connection_quality(health, now, config_.health_staleness_bound);
    RLOG(LG_CONN, LogLevel::LL_DEBUG)
        << "connection " << key << " error count=" << health.error_count
        << " consecutive=" << health.consecutive_errors << " quality=" << health.quality;
}

std::shared_ptr<StreamConnection> ConnectionManager::find_connection(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.connection;
}

std::vector<std::string> ConnectionManager::connection_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

size_t ConnectionManager::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ConnectionManager::live_connections_for_provider(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (entry.connection && entry.connection->provider() == provider && entry.connection->is_connected()) {
            ++live;
        }
    }
    return live;
}

std::optional<ConnectionHealth> ConnectionManager::connection_health(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.health;
}

ConnectionHealthStats ConnectionManager::connection_health_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Time_t now = clock_();
    ConnectionHealthStats stats;
    for (const auto& [key, entry] : entries_) {
        ++stats.total;
        compute_connection_healthy(entry.health, now, config_.health_staleness_bound) ? ++stats.healthy : ++stats.unhealthy;
        switch (compute_connection_quality(entry.health, now, config_.health_staleness_bound)) {
            case ConnectionQuality::EXCELLENT: ++stats.excellent; break;
            case ConnectionQuality::GOOD: ++stats.good; break;
            case ConnectionQuality::POOR: ++stats.poor; break;
        }
    }
    return stats;
}

void ConnectionManager::emit_health_stats_locked_() {
    size_t healthy = 0;
    for (const auto& [key, entry] : entries_) {
        if (entry.health.is_healthy) {
            ++healthy;
        }
    }
    metrics_->emit("connection_health_stats", static_cast<double>(entries_.size()), {
        {"healthy", std::to_string(healthy)},
        {"unhealthy", std::to_string(entries_.size() - healthy)}
    });
}

void ConnectionManager::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, entry] : entries_) {
        close_entry_(key, entry);
    }
    RLOG(LG_CONN, LogLevel::LL_INFO) << "closed " << entries_.size() << " connections";
    entries_.clear();
}
