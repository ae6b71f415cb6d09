#pragma once
#include <cstdint>
#include <map>
#include <string>

using MetricTags = std::map<std::string, std::string>;

struct MetricsSink {
    virtual ~MetricsSink() = default;
    virtual void emit(const std::string& name, double value, const MetricTags& tags) = 0;
};

class LoggingMetricsSink : public MetricsSink {
    public:
        void emit(const std::string& name, double value, const MetricTags& tags) override;
};

// Drops every event. Used where a component is built without a sink.
class NullMetricsSink : public MetricsSink {
    public:
        void emit(const std::string&, double, const MetricTags&) override {}
};

const char* categorize_push_latency(int64_t latency_ms);
