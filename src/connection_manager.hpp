#pragma once
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "collaborators.hpp"
#include "config.hpp"
#include "memory_probe.hpp"
#include "metrics.hpp"
#include "stream_connection.hpp"
#include "types.hpp"

static constexpr uint32_t UNHEALTHY_CONSECUTIVE_ERRORS = 5;
static constexpr uint32_t UNHEALTHY_TOTAL_ERRORS = 10;

struct ConnectionHealth {
    Time_t last_activity = 0;
    Time_t last_error_time = 0;
    uint32_t error_count = 0;
    uint32_t consecutive_errors = 0;
    uint64_t activity_count = 0;
    bool is_healthy = true;
    ConnectionQuality quality = ConnectionQuality::EXCELLENT;
};

struct CleanupResult {
    CleanupType type = CleanupType::SCHEDULED;
    size_t connections_before = 0;
    size_t removed = 0;
    size_t close_failures = 0;
    size_t remaining = 0;
    Time_t duration_ms = 0;
};

struct ConnectionHealthStats {
    size_t total = 0;
    size_t healthy = 0;
    size_t unhealthy = 0;
    size_t excellent = 0;
    size_t good = 0;
    size_t poor = 0;
};

// Health is a function of activity age and error history only.
bool compute_connection_healthy(const ConnectionHealth& health, Time_t now, Millis staleness_bound);
ConnectionQuality compute_connection_quality(const ConnectionHealth& health, Time_t now, Millis staleness_bound);

// Sole owner of the live upstream connections and their health records.
// All map mutation goes through the methods below, serialised by one mutex.
class ConnectionManager {
    public:
        ConnectionManager(
            const RelayConfig& config,
            std::shared_ptr<StreamFetcher> fetcher,
            std::shared_ptr<RateLimiter> rate_limiter,
            std::shared_ptr<MetricsSink> metrics,
            Clock clock,
            MemoryReader memory_reader = read_resident_bytes
        );

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        // Keyed "client:<identity>". Errors and timeouts fail open.
        RateLimitResult check_rate_limit(const std::string& client_identity);

        // Reuses a connected entry for provider:capability, otherwise establishes
        // a new one without holding the map lock; concurrent callers for the same
        // key wait for that attempt. Throws ResourceExhaustedError when the cap
        // still holds after a stale sweep, CollaboratorUnavailableError when the
        // fetcher fails.
        std::shared_ptr<StreamConnection> get_or_create_connection(
            const std::string& provider,
            const std::string& capability,
            const SymbolList& symbols,
            const std::string& client_id
        );

        bool remove_connection(const std::string& key);

        // Evicts the least recently active FORCED_CLEANUP_RATIO share (at least one).
        CleanupResult force_connection_cleanup();

        CleanupResult run_stale_sweep();

        // Returns the sampled resident bytes.
        size_t run_memory_sweep();

        void record_connection_activity(const std::string& key);
        void record_connection_error(const std::string& key);

        std::shared_ptr<StreamConnection> find_connection(const std::string& key) const;
        std::vector<std::string> connection_keys() const;
        size_t connection_count() const;
        size_t live_connections_for_provider(const std::string& provider) const;
        std::optional<ConnectionHealth> connection_health(const std::string& key) const;
        ConnectionHealthStats connection_health_stats() const;

        void close_all();

    private:
        struct Entry {
            std::shared_ptr<StreamConnection> connection;
            ConnectionHealth health;
        };

        using EntryMap = std::map<std::string, Entry>;

        // Frees a pending key when establishing ends, whichever way it ends.
        class PendingSlot {
            public:
                PendingSlot(ConnectionManager& owner, std::string key) : owner_(owner), key_(std::move(key)) {}
                ~PendingSlot();
                PendingSlot(const PendingSlot&) = delete;
                PendingSlot& operator=(const PendingSlot&) = delete;

                // Caller holds mutex_.
                void release_locked();

            private:
                ConnectionManager& owner_;
                std::string key_;
                bool released_ = false;
        };

        bool close_entry_(const std::string& key, Entry& entry);
        void erase_locked_(EntryMap::iterator it, const char* reason);
        CleanupResult stale_sweep_locked_(Time_t now);
        void emit_health_stats_locked_();

        const RelayConfig config_;
        std::shared_ptr<StreamFetcher> fetcher_;
        std::shared_ptr<RateLimiter> rate_limiter_;
        std::shared_ptr<MetricsSink> metrics_;
        Clock clock_;
        MemoryReader memory_reader_;

        mutable std::mutex mutex_;
        EntryMap entries_;
        // Keys being established outside the lock.
        std::set<std::string> pending_;
        std::condition_variable pending_cv_;
};
