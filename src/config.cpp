#include "config.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <type_traits>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_CFG, "CFG")

namespace {

template<typename T>
void overlay(const char* name, T& target) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    try {
        if constexpr (std::is_unsigned<T>::value) {
            // lexical_cast wraps "-1" around to the type's maximum.
            const long long parsed = boost::lexical_cast<long long>(raw);
            if (parsed < 0 || static_cast<unsigned long long>(parsed) > std::numeric_limits<T>::max()) {
                RLOG(LG_CFG, LogLevel::LL_WARNING) << "ignoring out of range " << name << "='" << raw << "'";
                return;
            }
            target = static_cast<T>(parsed);
        } else {
            target = boost::lexical_cast<T>(raw);
        }
    } catch (const boost::bad_lexical_cast&) {
        RLOG(LG_CFG, LogLevel::LL_WARNING) << "ignoring unparsable " << name << "='" << raw << "'";
    }
}

void overlay_millis(const char* name, Millis& target) {
    int64_t count = target.count();
    overlay(name, count);
    target = Millis(count);
}

void overlay_flag(const char* name, bool& target) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    const std::string value = boost::algorithm::to_lower_copy(std::string(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        target = true;
    } else if (value == "0" || value == "false" || value == "no" || value == "off") {
        target = false;
    } else {
        RLOG(LG_CFG, LogLevel::LL_WARNING) << "ignoring unparsable " << name << "='" << raw << "'";
    }
}

void overlay_mebibytes(const char* name, size_t& target_bytes) {
    size_t mib = target_bytes / (1024 * 1024);
    overlay(name, mib);
    target_bytes = mib * 1024 * 1024;
}

}

std::vector<std::string> validate_config(const RelayConfig& config) {
    std::vector<std::string> problems;
    if (config.max_connections == 0 || config.max_connections > MAX_CONNECTIONS_LIMIT) {
        problems.emplace_back("max_connections must be in [1, " + std::to_string(MAX_CONNECTIONS_LIMIT) + "]");
    }
    if (config.connection_cleanup_interval.count() <= 0) {
        problems.emplace_back("connection_cleanup_interval must be positive");
    }
    if (config.connection_stale_timeout.count() <= 0) {
        problems.emplace_back("connection_stale_timeout must be positive");
    }
    if (config.max_retry_attempts == 0 || config.max_retry_attempts > MAX_RETRY_ATTEMPTS_LIMIT) {
        problems.emplace_back("max_retry_attempts must be in [1, " + std::to_string(MAX_RETRY_ATTEMPTS_LIMIT) + "]");
    }
    if (config.retry_delay_base.count() < 0) {
        problems.emplace_back("retry_delay_base must not be negative");
    }
    if (config.circuit_breaker_threshold <= 0.0 || config.circuit_breaker_threshold > 1.0) {
        problems.emplace_back("circuit_breaker_threshold must be in (0, 1]");
    }
    if (config.batch_processing_interval.count() <= 0) {
        problems.emplace_back("batch_processing_interval must be positive");
    }
    if (config.batch_hard_cap == 0 || config.batch_hard_cap > MAX_BATCH_HARD_CAP) {
        problems.emplace_back("batch_hard_cap must be in [1, " + std::to_string(MAX_BATCH_HARD_CAP) + "]");
    }
    if (config.batch_worker_threads == 0 || config.group_worker_threads == 0
        || config.batch_worker_threads > MAX_WORKER_THREADS || config.group_worker_threads > MAX_WORKER_THREADS) {
        problems.emplace_back("worker thread counts must be in [1, " + std::to_string(MAX_WORKER_THREADS) + "]");
    }
    if (config.timeouts.connect.count() <= 0) {
        problems.emplace_back("connect timeout must be positive");
    }

    const auto& dyn = config.dynamic_batching;
    if (dyn.min_interval.count() <= 0 || dyn.min_interval > dyn.max_interval) {
        problems.emplace_back("dynamic batching requires 0 < min_interval <= max_interval");
    }
    if (dyn.low_load_threshold >= dyn.high_load_threshold) {
        problems.emplace_back("dynamic batching low_load_threshold must be below high_load_threshold");
    }
    if (dyn.sample_window == 0) {
        problems.emplace_back("dynamic batching sample_window must be positive");
    }
    if (dyn.adjustment_frequency.count() <= 0) {
        problems.emplace_back("dynamic batching adjustment_frequency must be positive");
    }

    const auto& mem = config.memory_monitoring;
    if (mem.warning_threshold_bytes >= mem.critical_threshold_bytes) {
        problems.emplace_back("memory warning threshold must be below the critical threshold");
    }
    if (config.rate_limit.max_connections_per_window == 0 || config.rate_limit.window_size.count() <= 0) {
        problems.emplace_back("rate limit requires a positive budget and window");
    }
    if (config.recovery.max_recovery_window.count() <= 0) {
        problems.emplace_back("max_recovery_window must be positive");
    }
    return problems;
}

std::map<std::string, std::string> parse_endpoint_list(const std::string& text) {
    std::map<std::string, std::string> endpoints;
    std::vector<std::string> entries;
    boost::algorithm::split(entries, text, boost::algorithm::is_any_of(","));
    for (auto& entry : entries) {
        boost::algorithm::trim(entry);
        const auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
            if (!entry.empty()) {
                RLOG(LG_CFG, LogLevel::LL_WARNING) << "ignoring malformed endpoint entry '" << entry << "'";
            }
            continue;
        }
        endpoints[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return endpoints;
}

RelayConfig load_config_from_env() {
    RelayConfig config;

    overlay("QR_MAX_CONNECTIONS", config.max_connections);
    overlay_millis("QR_CLEANUP_INTERVAL_MS", config.connection_cleanup_interval);
    overlay_millis("QR_STALE_TIMEOUT_MS", config.connection_stale_timeout);
    overlay_millis("QR_HEALTH_STALENESS_MS", config.health_staleness_bound);
    overlay("QR_MAX_RETRY_ATTEMPTS", config.max_retry_attempts);
    overlay_millis("QR_RETRY_DELAY_BASE_MS", config.retry_delay_base);
    overlay("QR_CIRCUIT_BREAKER_THRESHOLD", config.circuit_breaker_threshold);
    overlay_millis("QR_CIRCUIT_BREAKER_RESET_MS", config.circuit_breaker_reset_timeout);
    overlay_millis("QR_BATCH_INTERVAL_MS", config.batch_processing_interval);
    overlay("QR_BATCH_HARD_CAP", config.batch_hard_cap);
    overlay("QR_BATCH_WORKERS", config.batch_worker_threads);
    overlay("QR_GROUP_WORKERS", config.group_worker_threads);

    auto& dyn = config.dynamic_batching;
    overlay_flag("QR_DYNAMIC_BATCHING_ENABLED", dyn.enabled);
    overlay_millis("QR_DYNAMIC_MIN_INTERVAL_MS", dyn.min_interval);
    overlay_millis("QR_DYNAMIC_MAX_INTERVAL_MS", dyn.max_interval);
    overlay_millis("QR_DYNAMIC_HIGH_LOAD_INTERVAL_MS", dyn.high_load_interval);
    overlay_millis("QR_DYNAMIC_LOW_LOAD_INTERVAL_MS", dyn.low_load_interval);
    overlay("QR_DYNAMIC_SAMPLE_WINDOW", dyn.sample_window);
    overlay("QR_DYNAMIC_HIGH_LOAD_THRESHOLD", dyn.high_load_threshold);
    overlay("QR_DYNAMIC_LOW_LOAD_THRESHOLD", dyn.low_load_threshold);
    overlay_millis("QR_DYNAMIC_ADJUSTMENT_STEP_MS", dyn.adjustment_step);
    overlay_millis("QR_DYNAMIC_ADJUSTMENT_FREQUENCY_MS", dyn.adjustment_frequency);

    auto& mem = config.memory_monitoring;
    overlay_millis("QR_MEMORY_CHECK_INTERVAL_MS", mem.check_interval);
    overlay_mebibytes("QR_MEMORY_WARNING_MB", mem.warning_threshold_bytes);
    overlay_mebibytes("QR_MEMORY_CRITICAL_MB", mem.critical_threshold_bytes);

    overlay("QR_RATE_LIMIT_MAX_CONNECTIONS", config.rate_limit.max_connections_per_window);
    overlay_millis("QR_RATE_LIMIT_WINDOW_MS", config.rate_limit.window_size);

    overlay_millis("QR_TRANSFORM_TIMEOUT_MS", config.timeouts.transform);
    overlay_millis("QR_SYMBOL_TIMEOUT_MS", config.timeouts.symbol_mapping);
    overlay_millis("QR_CACHE_TIMEOUT_MS", config.timeouts.cache);
    overlay_millis("QR_BROADCAST_TIMEOUT_MS", config.timeouts.broadcast);
    overlay_millis("QR_RATE_LIMIT_TIMEOUT_MS", config.timeouts.rate_limit);
    overlay_millis("QR_RECOVERY_SUBMIT_TIMEOUT_MS", config.timeouts.recovery_submit);
    overlay_millis("QR_CONNECT_TIMEOUT_MS", config.timeouts.connect);

    overlay_millis("QR_RECOVERY_WINDOW_MS", config.recovery.max_recovery_window);
    overlay_millis("QR_HEARTBEAT_INTERVAL_MS", config.recovery.heartbeat_interval);
    overlay_millis("QR_RECONNECT_DETECTION_MS", config.recovery.detection_interval);

    overlay("QR_FALLBACK_MAX_ITEMS", config.fallback.max_recovery_items);
    overlay("QR_FALLBACK_MAX_BATCH", config.fallback.max_batch_for_recovery);
    overlay("QR_DEFAULT_PROVIDER", config.default_provider);

    if (const char* markets = std::getenv("QR_FALLBACK_PRIORITY_MARKETS")) {
        std::vector<std::string> parsed;
        boost::algorithm::split(parsed, std::string(markets), boost::algorithm::is_any_of(","));
        config.fallback.priority_markets.clear();
        for (auto& market : parsed) {
            boost::algorithm::trim(market);
            if (!market.empty()) {
                config.fallback.priority_markets.push_back(market);
            }
        }
    }

    if (const char* endpoints = std::getenv("QR_PROVIDER_ENDPOINTS")) {
        config.provider_endpoints = parse_endpoint_list(endpoints);
    }

    const auto problems = validate_config(config);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            RLOG(LG_CFG, LogLevel::LL_WARNING) << "config validation: " << problem;
        }
        RLOG(LG_CFG, LogLevel::LL_WARNING) << "falling back to default configuration";
        RelayConfig defaults;
        defaults.provider_endpoints = config.provider_endpoints;
        return defaults;
    }

    RLOG(LG_CFG, LogLevel::LL_INFO)
        << "config loaded max_connections=" << config.max_connections
        << " cleanup_interval=" << config.connection_cleanup_interval.count() << "ms"
        << " batch_interval=" << config.batch_processing_interval.count() << "ms"
        << " dynamic_batching=" << (config.dynamic_batching.enabled ? "on" : "off")
        << " memory_warning=" << config.memory_monitoring.warning_threshold_bytes / (1024 * 1024) << "MB"
        << " memory_critical=" << config.memory_monitoring.critical_threshold_bytes / (1024 * 1024) << "MB"
        << " rate_limit=" << config.rate_limit.max_connections_per_window
        << "/" << config.rate_limit.window_size.count() << "ms";
    return config;
}
