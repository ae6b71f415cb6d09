#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "capability_mapper.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "error.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct PipelineRunResult {
    size_t quotes_in = 0;
    size_t records_out = 0;
    size_t symbols_pushed = 0;
    bool dropped_empty = false;
    bool symbol_mapping_fell_back = false;
    Time_t transform_ms = 0;
    Time_t symbol_mapping_ms = 0;
    Time_t cache_ms = 0;
    Time_t broadcast_ms = 0;
    Time_t total_ms = 0;
};

struct DataProcessingStats {
    uint64_t total_processed = 0;
    uint64_t total_symbols_processed = 0;
    uint64_t total_processing_time_ms = 0;
    double average_processing_time_ms = 0.0;
    uint64_t error_count = 0;
    double error_rate = 0.0;
    Time_t last_processed_at = 0;
};

std::string make_cache_key(const std::string& canonical_symbol);

// Kind carried by a PipelineStageError, otherwise a substring classification of what().
PipelineErrorKind pipeline_error_kind(const std::exception& error);

// Runs one (provider, capability) group through transform, symbol
// standardisation, cache write and broadcast. Any stage failure propagates.
class DataPipeline {
    public:
        DataPipeline(
            const RelayConfig& config,
            std::shared_ptr<Transformer> transformer,
            std::shared_ptr<SymbolMapper> symbol_mapper,
            std::shared_ptr<QuoteCache> cache,
            std::shared_ptr<ClientRegistry> registry,
            std::shared_ptr<MetricsSink> metrics,
            Clock clock
        );

        PipelineRunResult process(const std::string& provider, const std::string& capability, const std::vector<RawQuote>& items);

        // raw -> canonical; an empty map when the mapper failed.
        std::map<std::string, std::string> standardize_symbols(const std::string& provider, const SymbolList& symbols);

        DataProcessingStats stats() const;
        const CapabilityMapper& capability_mapper() const {return capability_mapper_;}

    private:
        PipelineRunResult run_(const std::string& provider, const std::string& capability, const std::vector<RawQuote>& items);
        void record_success_(size_t symbols, Time_t elapsed_ms);
        void record_error_();

        const RelayConfig config_;
        std::shared_ptr<Transformer> transformer_;
        std::shared_ptr<SymbolMapper> symbol_mapper_;
        std::shared_ptr<QuoteCache> cache_;
        std::shared_ptr<ClientRegistry> registry_;
        std::shared_ptr<MetricsSink> metrics_;
        Clock clock_;
        CapabilityMapper capability_mapper_;

        mutable std::mutex stats_mutex_;
        DataProcessingStats stats_;
};
