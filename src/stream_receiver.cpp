#include "stream_receiver.hpp"

#include "deadline.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "market.hpp"
#include "protocol.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_RECV, "RECV")

StreamReceiver::StreamReceiver(
    const RelayConfig& config,
    std::shared_ptr<ConnectionManager> connections,
    std::shared_ptr<BatchPipeline> batches,
    std::shared_ptr<RecoveryCoordinator> recovery,
    std::shared_ptr<SymbolMapper> symbol_mapper,
    std::shared_ptr<ClientRegistry> registry,
    Clock clock
)
    : config_(config),
      connections_(std::move(connections)),
      batches_(std::move(batches)),
      recovery_(std::move(recovery)),
      symbol_mapper_(std::move(symbol_mapper)),
      registry_(std::move(registry)),
      clock_(std::move(clock)) {}

void StreamReceiver::subscribe(
    const SymbolList& symbols,
    const std::string& capability,
    const std::optional<std::string>& preferred_provider,
    const std::string& client_id,
    const std::string& client_ip
) {
    if (client_id.empty()) {
        throw ValidationError("subscribe without client id");
    }
    if (symbols.empty()) {
        throw ValidationError("subscribe from " + client_id + " names no symbols");
    }

    const std::string& identity = client_ip.empty() ? client_id : client_ip;
    const RateLimitResult limit = connections_->check_rate_limit(identity);
    if (!limit.allowed) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "subscribe from " << client_id << " rejected by rate limit";
        throw RateLimitedError("subscription rate limit exceeded for " + identity, limit.retry_after_ms);
    }

    const std::string provider = preferred_provider && !preferred_provider->empty()
        ? *preferred_provider
        : default_provider_for(symbols, config_.market_providers, config_.default_provider);

    std::map<std::string, std::string> mapping;
    try {
        mapping = await_with_deadline(
            symbol_mapper_->transform_symbols(provider, symbols, MappingDirection::TO_STANDARD),
            config_.timeouts.symbol_mapping,
            "symbol mapping"
        ).mapping_details;
    } catch (const std::exception& e) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "symbol mapping failed for " << client_id << ", keeping raw symbols: " << e.what();
    }

    SymbolList canonical;
    canonical.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        auto it = mapping.find(symbol);
        canonical.push_back(it == mapping.end() || it->second.empty() ? symbol : it->second);
    }

    registry_->add_client_subscription(client_id, canonical, capability, provider);

    std::shared_ptr<StreamConnection> connection;
    try {
        connection = connections_->get_or_create_connection(provider, capability, symbols, client_id);
    } catch (const std::exception& e) {
        RLOG(LG_RECV, LogLevel::LL_ERROR) << "subscribe from " << client_id << " failed: " << e.what();
        registry_->remove_client_subscription(client_id, canonical);
        throw;
    }

    wire_connection_(connection);
    connection->subscribe(symbols);

    RLOG(LG_RECV, LogLevel::LL_INFO)
        << "client " << client_id << " subscribed " << symbols.size() << " symbols on "
        << make_connection_key(provider, capability) << " via " << connection->id();
}

void StreamReceiver::wire_connection_(const std::shared_ptr<StreamConnection>& connection) {
    {
        std::lock_guard<std::mutex> lock(wired_mutex_);
        for (auto it = wired_connections_.begin(); it != wired_connections_.end();) {
            const auto wired = it->second.lock();
            if (!wired || !wired->is_connected()) {
                it = wired_connections_.erase(it);
            } else {
                ++it;
            }
        }
        if (!wired_connections_.emplace(connection->id(), connection).second) {
            return;
        }
    }
    const std::string provider = connection->provider();
    const std::string capability = connection->capability();
    const std::string key = make_connection_key(provider, capability);
    const std::string id = connection->id();
    std::weak_ptr<StreamConnection> weak = connection;

    connection->set_data_handler([this, provider, capability](const FieldMap& data) {
        on_upstream_data_(provider, capability, data);
    });
    connection->set_error_handler([this, key, id, weak](const std::string& message) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "upstream " << key << " error: " << message;
        connections_->record_connection_error(key);
        const auto failed = weak.lock();
        if (!failed || !failed->is_connected()) {
            std::lock_guard<std::mutex> lock(wired_mutex_);
            wired_connections_.erase(id);
        }
    });
}

size_t StreamReceiver::wired_connections() const {
    std::lock_guard<std::mutex> lock(wired_mutex_);
    return wired_connections_.size();
}

void StreamReceiver::on_upstream_data_(const std::string& provider, const std::string& capability, const FieldMap& data) {
    connections_->record_connection_activity(make_connection_key(provider, capability));

    RawQuote quote;
    quote.raw_payload = data;
    quote.provider = provider;
    quote.capability = capability;
    quote.timestamp = clock_();
    quote.symbols = extract_symbols(data);
    batches_->add_quote(std::move(quote));
}

void StreamReceiver::unsubscribe(const SymbolList& symbols, const std::string& client_id) {
    if (client_id.empty()) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "unsubscribe without client id ignored";
        return;
    }

    const auto subscription = registry_->get_client_subscription(client_id);
    registry_->remove_client_subscription(client_id, symbols);
    if (!subscription) {
        RLOG(LG_RECV, LogLevel::LL_DEBUG) << "unsubscribe from " << client_id << " without a subscription";
        return;
    }

    // The upstream feed is narrowed only once no client of the provider is left.
    if (registry_->clients_for_provider(subscription->provider).empty()) {
        const auto key = make_connection_key(subscription->provider, subscription->capability);
        if (auto connection = connections_->find_connection(key)) {
            if (connection->is_connected()) {
                connection->unsubscribe(to_upstream_symbols_(subscription->provider, symbols.empty() ? subscription->symbols : symbols));
            }
        }
    }
    RLOG(LG_RECV, LogLevel::LL_INFO)
        << "client " << client_id << " unsubscribed " << (symbols.empty() ? "all" : std::to_string(symbols.size())) << " symbols";
}

SymbolList StreamReceiver::to_upstream_symbols_(const std::string& provider, const SymbolList& symbols) const {
    std::map<std::string, std::string> mapping;
    try {
        mapping = await_with_deadline(
            symbol_mapper_->transform_symbols(provider, symbols, MappingDirection::FROM_STANDARD),
            config_.timeouts.symbol_mapping,
            "symbol mapping"
        ).mapping_details;
    } catch (const std::exception& e) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "reverse symbol mapping for " << provider << " failed: " << e.what();
    }

    SymbolList upstream;
    upstream.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        auto it = mapping.find(symbol);
        upstream.push_back(it == mapping.end() || it->second.empty() ? symbol : it->second);
    }
    return upstream;
}

ReconnectResponse StreamReceiver::reconnect(const ReconnectRequest& request) {
    return recovery_->handle_reconnect(request, [this](const std::shared_ptr<StreamConnection>& connection) {
        wire_connection_(connection);
    });
}

void StreamReceiver::handle_client_disconnect(const std::string& client_id) {
    if (client_id.empty()) {
        return;
    }
    registry_->remove_client_subscription(client_id, {});
    RLOG(LG_RECV, LogLevel::LL_INFO) << "client " << client_id << " disconnected, subscription removed";
}

HealthReport StreamReceiver::health_check() const {
    HealthReport report;
    report.connections = connections_->connection_count();
    report.connection_health = connections_->connection_health_stats();
    report.circuit_breaker = batches_->circuit_breaker_state();
    try {
        const ClientStateStats stats = registry_->get_client_state_stats();
        report.clients = stats.total_clients;
        report.subscriptions = stats.total_subscriptions;
    } catch (const std::exception& e) {
        RLOG(LG_RECV, LogLevel::LL_WARNING) << "client registry stats unavailable: " << e.what();
        report.healthy = false;
    }

    if (report.circuit_breaker.is_open || report.connection_health.unhealthy > 0 || report.connections > config_.max_connections) {
        report.healthy = false;
    }
    report.status = report.healthy ? "healthy" : "degraded";
    return report;
}
