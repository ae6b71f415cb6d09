#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "types.hpp"

using Millis = std::chrono::milliseconds;

// Upper bounds enforced by validate_config.
static constexpr size_t MAX_CONNECTIONS_LIMIT = 100'000;
static constexpr uint32_t MAX_RETRY_ATTEMPTS_LIMIT = 10;
static constexpr size_t MAX_BATCH_HARD_CAP = 10'000;
static constexpr size_t MAX_WORKER_THREADS = 64;

struct DynamicBatchingConfig {
    bool enabled = false;
    Millis min_interval{10};
    Millis max_interval{200};
    Millis high_load_interval{25};
    Millis low_load_interval{100};
    size_t sample_window = 10;
    double high_load_threshold = 50.0; // batches per second
    double low_load_threshold = 10.0;
    Millis adjustment_step{5};
    Millis adjustment_frequency{5'000};
};

struct MemoryMonitoringConfig {
    Millis check_interval{30'000};
    size_t warning_threshold_bytes = size_t(512) * 1024 * 1024;
    size_t critical_threshold_bytes = size_t(1024) * 1024 * 1024;
};

struct RateLimitConfig {
    uint32_t max_connections_per_window = 60;
    Millis window_size{60'000};
};

struct PipelineTimeouts {
    Millis transform{5'000};
    Millis symbol_mapping{5'000};
    Millis cache{3'000};
    Millis broadcast{2'000};
    Millis rate_limit{1'000};
    Millis recovery_submit{3'000};
    Millis connect{10'000};
};

struct RecoveryConfig {
    Millis max_recovery_window{300'000};
    Millis heartbeat_interval{30'000};
    Millis detection_interval{60'000};
};

struct FallbackConfig {
    std::vector<std::string> priority_markets{"HK", "US"};
    size_t max_recovery_items = 5;
    size_t max_batch_for_recovery = 100;
};

struct RelayConfig {
    size_t max_connections = 1'000;
    Millis connection_cleanup_interval{300'000};
    Millis connection_stale_timeout{600'000};
    Millis health_staleness_bound{300'000};

    uint32_t max_retry_attempts = 3;
    Millis retry_delay_base{100};
    double circuit_breaker_threshold = 0.5; // failure ratio
    Millis circuit_breaker_reset_timeout{30'000};

    Millis batch_processing_interval{50};
    size_t batch_hard_cap = BATCH_HARD_CAP;
    size_t batch_worker_threads = 2;
    size_t group_worker_threads = 4;

    DynamicBatchingConfig dynamic_batching;
    MemoryMonitoringConfig memory_monitoring;
    RateLimitConfig rate_limit;
    PipelineTimeouts timeouts;
    RecoveryConfig recovery;
    FallbackConfig fallback;

    std::string default_provider = "longport";
    std::map<std::string, std::string> market_providers{{"HK", "longport"}, {"US", "longport"}, {"CN", "longport"}, {"SG", "longport"}};
    std::map<std::string, std::string> provider_endpoints;
};

// Returns one message per violated constraint; empty when the configuration is usable.
std::vector<std::string> validate_config(const RelayConfig& config);

// Overlays QR_* environment variables on the defaults. Falls back to the defaults
// when the merged configuration does not validate.
RelayConfig load_config_from_env();

// Parses "name=host:port,name2=host:port" into a provider -> endpoint map.
std::map<std::string, std::string> parse_endpoint_list(const std::string& text);
