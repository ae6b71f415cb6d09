#include "metrics.hpp"

#include <cstdint>
#include <sstream>

#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_METRIC, "METRIC")

void LoggingMetricsSink::emit(const std::string& name, double value, const MetricTags& tags) {
    std::ostringstream oss;
    for (const auto& [key, tag] : tags) {
        oss << ' ' << key << '=' << tag;
    }
    RLOG(LG_METRIC, LogLevel::LL_DEBUG) << name << " value=" << value << oss.str();
}

const char* categorize_push_latency(int64_t latency_ms) {
    if (latency_ms <= 10) return "low";
    if (latency_ms <= 50) return "medium";
    if (latency_ms <= 200) return "high";
    return "critical";
}
