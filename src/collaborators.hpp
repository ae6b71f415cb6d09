#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capability_mapper.hpp"
#include "types.hpp"

// Contracts consumed from the systems around the relay core. Every call is
// asynchronous; the core bounds each one with a deadline.

struct TransformRequest {
    std::string provider;
    std::string api_type = "stream";
    RuleType rule_type = RuleType::QUOTE_FIELDS;
    std::vector<FieldMap> raw_data;
};

struct TransformResult {
    std::vector<QuoteRecord> transformed_data;
};

struct Transformer {
    virtual ~Transformer() = default;
    virtual std::future<TransformResult> transform(const TransformRequest& request) = 0;
};

enum class MappingDirection : uint8_t {TO_STANDARD, FROM_STANDARD};

struct SymbolMappingResult {
    // original -> standard; a symbol without an entry could not be mapped
    std::map<std::string, std::string> mapping_details;
};

struct SymbolMapper {
    virtual ~SymbolMapper() = default;
    virtual std::future<SymbolMappingResult> transform_symbols(
        const std::string& provider,
        const SymbolList& symbols,
        MappingDirection direction
    ) = 0;
};

struct QuoteCache {
    virtual ~QuoteCache() = default;
    virtual std::future<void> set_data(const std::string& key, const std::vector<QuoteRecord>& value, CacheMode mode) = 0;
};

struct BroadcastPayload {
    std::string symbol;
    std::vector<QuoteRecord> records;
    std::string provider;
    Time_t push_timestamp = 0;
};

enum class ClientNoticeType : uint8_t {RESUBSCRIBE, RECONNECT};

struct ClientNotice {
    ClientNoticeType type = ClientNoticeType::RESUBSCRIBE;
    std::string message;
};

struct ClientStateStats {
    size_t total_clients = 0;
    size_t total_subscriptions = 0;
    std::map<std::string, size_t> provider_breakdown;
    std::map<std::string, size_t> capability_breakdown;
};

struct ClientRegistry {
    virtual ~ClientRegistry() = default;
    virtual std::future<void> broadcast_to_symbol(const std::string& symbol, const BroadcastPayload& payload) = 0;
    virtual void add_client_subscription(
        const std::string& client_id,
        const SymbolList& symbols,
        const std::string& capability,
        const std::string& provider
    ) = 0;
    // An empty symbol list removes the whole subscription.
    virtual void remove_client_subscription(const std::string& client_id, const SymbolList& symbols) = 0;
    virtual std::optional<ClientSubscription> get_client_subscription(const std::string& client_id) const = 0;
    virtual ClientStateStats get_client_state_stats() const = 0;
    virtual std::vector<std::string> clients_for_provider(const std::string& provider) const = 0;
    virtual void notify_client(const std::string& client_id, const ClientNotice& notice) = 0;
};

struct RateLimitRequest {
    uint32_t limit = 0;
    int64_t window_ms = 0;
};

struct RateLimitResult {
    bool allowed = true;
    uint32_t limit = 0;
    uint32_t current = 0;
    int64_t retry_after_ms = 0;
};

struct RateLimiter {
    virtual ~RateLimiter() = default;
    virtual std::future<RateLimitResult> check_rate_limit(const std::string& key, const RateLimitRequest& limit) = 0;
};

struct RecoveryWorker {
    virtual ~RecoveryWorker() = default;
    // Returns the job id, or fails when the worker rejects the job.
    virtual std::future<std::string> submit_recovery_job(const RecoveryJob& job) = 0;
};

template<typename T>
std::future<T> make_ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

inline std::future<void> make_ready_future() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

template<typename T, typename E>
std::future<T> make_failed_future(E error) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::move(error)));
    return promise.get_future();
}
