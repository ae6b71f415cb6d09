#include "local_collaborators.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "logging.hpp"
#include "market.hpp"
#include "protocol.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_LOCAL, "LOCAL")

std::future<TransformResult> PassthroughTransformer::transform(const TransformRequest& request) {
    TransformResult result;
    for (const auto& raw : request.raw_data) {
        const SymbolList symbols = extract_symbols(raw);
        if (symbols.empty()) {
            RLOG(LG_LOCAL, LogLevel::LL_DEBUG) << "update from " << request.provider << " without symbol skipped";
            continue;
        }
        FieldMap fields = raw;
        fields.erase("symbol");
        fields.erase("s");
        for (const auto& symbol : symbols) {
            result.transformed_data.push_back({symbol, fields});
        }
    }
    return make_ready_future(std::move(result));
}

std::optional<std::string> SuffixSymbolMapper::to_standard(const std::string& symbol) {
    const std::string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(symbol));
    const std::string market = infer_market(upper);
    if (upper.empty() || market == "UNKNOWN") {
        return std::nullopt;
    }
    if (upper.find('.') != std::string::npos) {
        return upper;
    }
    if (market == "HK") {
        return std::string(5 - std::min<size_t>(5, upper.size()), '0') + upper + ".HK";
    }
    if (market == "CN") {
        const std::string board = upper.substr(0, 2);
        return upper + (board == "60" || board == "68" ? ".SH" : ".SZ");
    }
    return upper + "." + market;
}

std::string SuffixSymbolMapper::from_standard(const std::string& symbol) {
    const auto dot = symbol.rfind('.');
    return dot == std::string::npos ? symbol : symbol.substr(0, dot);
}

std::future<SymbolMappingResult> SuffixSymbolMapper::transform_symbols(
    const std::string& provider,
    const SymbolList& symbols,
    MappingDirection direction
) {
    SymbolMappingResult result;
    for (const auto& symbol : symbols) {
        if (direction == MappingDirection::FROM_STANDARD) {
            result.mapping_details[symbol] = from_standard(symbol);
        } else if (auto mapped = to_standard(symbol)) {
            result.mapping_details[symbol] = *mapped;
        } else {
            RLOG(LG_LOCAL, LogLevel::LL_DEBUG) << "no standard form for " << symbol << " from " << provider;
        }
    }
    return make_ready_future(std::move(result));
}

std::future<void> InMemoryQuoteCache::set_data(const std::string& key, const std::vector<QuoteRecord>& value, CacheMode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = value;
    }
    return make_ready_future();
}

std::optional<std::vector<QuoteRecord>> InMemoryQuoteCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InMemoryQuoteCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

LocalClientRegistry::LocalClientRegistry(Clock clock, Delivery delivery)
    : clock_(std::move(clock)), delivery_(std::move(delivery)) {}

std::future<void> LocalClientRegistry::broadcast_to_symbol(const std::string& symbol, const BroadcastPayload& payload) {
    std::vector<std::string> recipients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [client_id, subscription] : subscriptions_) {
            if (std::find(subscription.symbols.begin(), subscription.symbols.end(), symbol) != subscription.symbols.end()) {
                recipients.push_back(client_id);
            }
        }
    }
    for (const auto& client_id : recipients) {
        if (delivery_) {
            delivery_(client_id, payload);
        }
        ++deliveries_;
    }
    RLOG(LG_LOCAL, LogLevel::LL_DEBUG)
        << symbol << " pushed to " << recipients.size() << " clients (" << payload.records.size() << " records)";
    return make_ready_future();
}

void LocalClientRegistry::add_client_subscription(
    const std::string& client_id,
    const SymbolList& symbols,
    const std::string& capability,
    const std::string& provider
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& subscription = subscriptions_[client_id];
    subscription.client_id = client_id;
    subscription.provider = provider;
    subscription.capability = capability;
    subscription.last_active_at = clock_();
    for (const auto& symbol : symbols) {
        if (std::find(subscription.symbols.begin(), subscription.symbols.end(), symbol) == subscription.symbols.end()) {
            subscription.symbols.push_back(symbol);
        }
    }
}

void LocalClientRegistry::remove_client_subscription(const std::string& client_id, const SymbolList& symbols) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(client_id);
    if (it == subscriptions_.end()) {
        return;
    }
    if (symbols.empty()) {
        subscriptions_.erase(it);
        return;
    }
    auto& held = it->second.symbols;
    held.erase(std::remove_if(held.begin(), held.end(), [&](const std::string& symbol) {
        return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
    }), held.end());
    if (held.empty()) {
        subscriptions_.erase(it);
    }
}

std::optional<ClientSubscription> LocalClientRegistry::get_client_subscription(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(client_id);
    if (it == subscriptions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ClientStateStats LocalClientRegistry::get_client_state_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientStateStats stats;
    stats.total_clients = subscriptions_.size();
    for (const auto& [client_id, subscription] : subscriptions_) {
        stats.total_subscriptions += subscription.symbols.size();
        ++stats.provider_breakdown[subscription.provider];
        ++stats.capability_breakdown[subscription.capability];
    }
    return stats;
}

std::vector<std::string> LocalClientRegistry::clients_for_provider(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> clients;
    for (const auto& [client_id, subscription] : subscriptions_) {
        if (subscription.provider == provider) {
            clients.push_back(client_id);
        }
    }
    return clients;
}

void LocalClientRegistry::notify_client(const std::string& client_id, const ClientNotice& notice) {
    RLOG(LG_LOCAL, LogLevel::LL_INFO)
        << "notice to " << client_id << ": "
        << (notice.type == ClientNoticeType::RESUBSCRIBE ? "resubscribe" : "reconnect") << " (" << notice.message << ")";
}

FixedWindowRateLimiter::FixedWindowRateLimiter(Clock clock) : clock_(std::move(clock)) {}

std::future<RateLimitResult> FixedWindowRateLimiter::check_rate_limit(const std::string& key, const RateLimitRequest& limit) {
    const Time_t now = clock_();
    RateLimitResult result;
    result.limit = limit.limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked_(now, limit.window_ms);
        auto& window = windows_[key];
        if (window.count == 0 || now - window.started_at >= limit.window_ms) {
            window.started_at = now;
            window.count = 0;
        }
        if (window.count >= limit.limit) {
            result.allowed = false;
            result.current = window.count;
            result.retry_after_ms = std::max<int64_t>(0, window.started_at + limit.window_ms - now);
        } else {
            ++window.count;
            result.current = window.count;
        }
    }
    return make_ready_future(result);
}

void FixedWindowRateLimiter::sweep_locked_(Time_t now, int64_t window_ms) {
    if (now - last_sweep_ < window_ms) {
        return;
    }
    last_sweep_ = now;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.started_at >= window_ms) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t FixedWindowRateLimiter::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

std::future<std::string> LocalRecoveryWorker::submit_recovery_job(const RecoveryJob& job) {
    const std::string id = "recovery-" + std::to_string(next_job_id_++);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(job);
    }
    RLOG(LG_LOCAL, LogLevel::LL_INFO)
        << id << " queued for " << job.client_id << " (" << job.symbols.size() << " symbols, priority " << job.priority << ")";
    return make_ready_future(id);
}

std::vector<RecoveryJob> LocalRecoveryWorker::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}
