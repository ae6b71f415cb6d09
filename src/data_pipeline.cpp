#include "data_pipeline.hpp"

#include <set>
#include <utility>

#include "deadline.hpp"
#include "error.hpp"
#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_PIPE, "PIPE")

std::string make_cache_key(const std::string& canonical_symbol) {
    return "quote:" + canonical_symbol;
}

PipelineErrorKind pipeline_error_kind(const std::exception& error) {
    if (const auto* stage = dynamic_cast<const PipelineStageError*>(&error)) {
        return stage->kind();
    }
    return classify_pipeline_error(error.what());
}

DataPipeline::DataPipeline(
    const RelayConfig& config,
    std::shared_ptr<Transformer> transformer,
    std::shared_ptr<SymbolMapper> symbol_mapper,
    std::shared_ptr<QuoteCache> cache,
    std::shared_ptr<ClientRegistry> registry,
    std::shared_ptr<MetricsSink> metrics,
    Clock clock
)
    : config_(config),
      transformer_(std::move(transformer)),
      symbol_mapper_(std::move(symbol_mapper)),
      cache_(std::move(cache)),
      registry_(std::move(registry)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      clock_(std::move(clock)) {}

PipelineRunResult DataPipeline::process(
    const std::string& provider,
    const std::string& capability,
    const std::vector<RawQuote>& items
) {
    try {
        return run_(provider, capability, items);
    } catch (const std::exception& e) {
        record_error_();
        const PipelineErrorKind kind = pipeline_error_kind(e);
        RLOG(LG_PIPE, LogLevel::LL_ERROR)
            << "pipeline failed for " << provider << ":" << capability << " kind=" << kind << ": " << e.what();
        metrics_->emit("pipeline_error", 1, {
            {"provider", provider}, {"capability", capability}, {"error_type", to_string(kind)}
        });
        throw;
    }
}

std::map<std::string, std::string> DataPipeline::standardize_symbols(const std::string& provider, const SymbolList& symbols) {
    if (symbols.empty() || !symbol_mapper_) {
        return {};
    }
    try {
        SymbolMappingResult mapped = await_with_deadline(
            symbol_mapper_->transform_symbols(provider, symbols, MappingDirection::TO_STANDARD),
            config_.timeouts.symbol_mapping,
            "symbol mapping"
        );
        return std::move(mapped.mapping_details);
    } catch (const std::exception& e) {
        RLOG(LG_PIPE, LogLevel::LL_WARNING)
            << "symbol standardisation failed for " << provider << ", using raw symbols: " << e.what();
        return {};
    }
}

PipelineRunResult DataPipeline::run_(
    const std::string& provider,
    const std::string& capability,
    const std::vector<RawQuote>& items
) {
    PipelineRunResult result;
    result.quotes_in = items.size();
    const Time_t started = clock_();

    // 1. transform
    TransformRequest request;
    request.provider = provider;
    request.rule_type = capability_mapper_.map(capability);
    request.raw_data.reserve(items.size());
    for (const auto& item : items) {
        request.raw_data.push_back(item.raw_payload);
    }

    TransformResult transformed;
    try {
        transformed = await_with_deadline(transformer_->transform(request), config_.timeouts.transform, "transform");
    } catch (const PipelineStageError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineStageError(PipelineErrorKind::TRANSFORM, std::string("transform failed: ") + e.what());
    }
    const Time_t after_transform = clock_();
    result.transform_ms = after_transform - started;

    if (transformed.transformed_data.empty()) {
        RLOG(LG_PIPE, LogLevel::LL_WARNING)
            << "transform produced no records for " << provider << ":" << capability
            << " rule=" << request.rule_type << ", dropping " << items.size() << " quotes";
        result.dropped_empty = true;
        result.total_ms = after_transform - started;
        return result;
    }
    result.records_out = transformed.transformed_data.size();

    // 2. symbol standardisation
    SymbolList raw_symbols;
    std::set<std::string> seen;
    for (const auto& item : items) {
        for (const auto& symbol : item.symbols) {
            if (seen.insert(symbol).second) {
                raw_symbols.push_back(symbol);
            }
        }
    }
    for (const auto& record : transformed.transformed_data) {
        if (!record.symbol.empty() && seen.insert(record.symbol).second) {
            raw_symbols.push_back(record.symbol);
        }
    }

    const auto mapping = standardize_symbols(provider, raw_symbols);
    result.symbol_mapping_fell_back = mapping.empty() && !raw_symbols.empty();
    const Time_t after_mapping = clock_();
    result.symbol_mapping_ms = after_mapping - after_transform;

    // One canonical key per record, shared by the cache write and the broadcast.
    std::map<std::string, std::vector<QuoteRecord>> by_symbol;
    for (auto& record : transformed.transformed_data) {
        if (record.symbol.empty()) {
            RLOG(LG_PIPE, LogLevel::LL_DEBUG) << "skipping transformed record without symbol from " << provider;
            continue;
        }
        auto mapped = mapping.find(record.symbol);
        const std::string canonical = mapped == mapping.end() ? record.symbol : mapped->second;
        record.symbol = canonical;
        by_symbol[canonical].push_back(std::move(record));
    }

    // 3. cache
    for (const auto& [symbol, records] : by_symbol) {
        try {
            await_with_deadline(cache_->set_data(make_cache_key(symbol), records, CacheMode::AUTO), config_.timeouts.cache, "cache write");
        } catch (const PipelineStageError&) {
            throw;
        } catch (const std::exception& e) {
            throw PipelineStageError(PipelineErrorKind::CACHE, "cache write for " + symbol + " failed: " + e.what());
        }
    }
    const Time_t after_cache = clock_();
    result.cache_ms = after_cache - after_mapping;

    // 4. broadcast
    for (auto& [symbol, records] : by_symbol) {
        BroadcastPayload payload;
        payload.symbol = symbol;
        payload.provider = provider;
        payload.push_timestamp = clock_();
        payload.records = records;

        const Time_t push_started = clock_();
        try {
            await_with_deadline(registry_->broadcast_to_symbol(symbol, payload), config_.timeouts.broadcast, "broadcast");
        } catch (const PipelineStageError&) {
            throw;
        } catch (const std::exception& e) {
            throw PipelineStageError(PipelineErrorKind::BROADCAST, "broadcast for " + symbol + " failed: " + e.what());
        }
        const Time_t latency = clock_() - push_started;
        metrics_->emit("stream_push_latency", static_cast<double>(latency), {
            {"symbol", symbol}, {"provider", provider}, {"category", categorize_push_latency(latency)}
        });
        ++result.symbols_pushed;
    }
    const Time_t finished = clock_();
    result.broadcast_ms = finished - after_cache;
    result.total_ms = finished - started;

    // 5. performance event
    const double throughput = result.total_ms > 0
        ? static_cast<double>(items.size()) * 1000.0 / static_cast<double>(result.total_ms)
        : static_cast<double>(items.size()) * 1000.0;
    metrics_->emit("data_pipeline_processed", static_cast<double>(result.total_ms), {
        {"provider", provider},
        {"capability", capability},
        {"quotes", std::to_string(items.size())},
        {"symbols", std::to_string(by_symbol.size())},
        {"transform_ms", std::to_string(result.transform_ms)},
        {"symbol_mapping_ms", std::to_string(result.symbol_mapping_ms)},
        {"cache_ms", std::to_string(result.cache_ms)},
        {"broadcast_ms", std::to_string(result.broadcast_ms)},
        {"throughput", std::to_string(throughput)}
    });

    RLOG(LG_PIPE, LogLevel::LL_DEBUG)
        << "processed " << items.size() << " quotes for " << provider << ":" << capability
        << " symbols=" << by_symbol.size() << " in " << result.total_ms << "ms";

    record_success_(by_symbol.size(), result.total_ms);
    return result;
}

void DataPipeline::record_success_(size_t symbols, Time_t elapsed_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.total_processed;
    stats_.total_symbols_processed += symbols;
    stats_.total_processing_time_ms += static_cast<uint64_t>(elapsed_ms < 0 ? 0 : elapsed_ms);
    stats_.average_processing_time_ms =
        static_cast<double>(stats_.total_processing_time_ms) / static_cast<double>(stats_.total_processed);
    stats_.error_rate = static_cast<double>(stats_.error_count) / static_cast<double>(stats_.total_processed + stats_.error_count);
    stats_.last_processed_at = clock_();
}

void DataPipeline::record_error_() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.error_count;
    stats_.error_rate = static_cast<double>(stats_.error_count) / static_cast<double>(stats_.total_processed + stats_.error_count);
}

DataProcessingStats DataPipeline::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
