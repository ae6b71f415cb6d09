#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "types.hpp"

// In-process stand-ins for the services around the relay, used by the
// standalone daemon when no external transform, cache or registry is reachable.

// One record per symbol named by the "symbol" or "s" field; other fields are copied through.
class PassthroughTransformer : public Transformer {
    public:
        std::future<TransformResult> transform(const TransformRequest& request) override;
};

// TO_STANDARD appends the inferred market ("0700" -> "00700.HK", "aapl" -> "AAPL.US").
// FROM_STANDARD strips the market suffix. Symbols of unknown market stay unmapped.
class SuffixSymbolMapper : public SymbolMapper {
    public:
        std::future<SymbolMappingResult> transform_symbols(
            const std::string& provider,
            const SymbolList& symbols,
            MappingDirection direction
        ) override;

        static std::optional<std::string> to_standard(const std::string& symbol);
        static std::string from_standard(const std::string& symbol);
};

class InMemoryQuoteCache : public QuoteCache {
    public:
        std::future<void> set_data(const std::string& key, const std::vector<QuoteRecord>& value, CacheMode mode) override;

        std::optional<std::vector<QuoteRecord>> get(const std::string& key) const;
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::vector<QuoteRecord>> entries_;
};

// Keeps one subscription per client and hands broadcasts to a delivery callback.
class LocalClientRegistry : public ClientRegistry {
    public:
        using Delivery = std::function<void(const std::string& client_id, const BroadcastPayload& payload)>;

        explicit LocalClientRegistry(Clock clock, Delivery delivery = nullptr);

        std::future<void> broadcast_to_symbol(const std::string& symbol, const BroadcastPayload& payload) override;
        void add_client_subscription(
            const std::string& client_id,
            const SymbolList& symbols,
            const std::string& capability,
            const std::string& provider
        ) override;
        void remove_client_subscription(const std::string& client_id, const SymbolList& symbols) override;
        std::optional<ClientSubscription> get_client_subscription(const std::string& client_id) const override;
        ClientStateStats get_client_state_stats() const override;
        std::vector<std::string> clients_for_provider(const std::string& provider) const override;
        void notify_client(const std::string& client_id, const ClientNotice& notice) override;

        uint64_t deliveries() const {return deliveries_.load();}

    private:
        Clock clock_;
        Delivery delivery_;
        std::atomic<uint64_t> deliveries_{0};

        mutable std::mutex mutex_;
        std::map<std::string, ClientSubscription> subscriptions_;
};

// Fixed window counter per key.
class FixedWindowRateLimiter : public RateLimiter {
    public:
        explicit FixedWindowRateLimiter(Clock clock);

        std::future<RateLimitResult> check_rate_limit(const std::string& key, const RateLimitRequest& limit) override;

        // Keys with a window that has not yet been swept.
        size_t tracked_keys() const;

    private:
        struct Window {
            Time_t started_at = 0;
            uint32_t count = 0;
        };

        // Drops expired windows, at most once per window length.
        void sweep_locked_(Time_t now, int64_t window_ms);

        Clock clock_;
        mutable std::mutex mutex_;
        std::map<std::string, Window> windows_;
        Time_t last_sweep_ = 0;
};

// Accepts every job and records it. Replay happens elsewhere.
class LocalRecoveryWorker : public RecoveryWorker {
    public:
        std::future<std::string> submit_recovery_job(const RecoveryJob& job) override;

        std::vector<RecoveryJob> jobs() const;

    private:
        std::atomic<Id_t> next_job_id_{1};
        mutable std::mutex mutex_;
        std::vector<RecoveryJob> jobs_;
};
