#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "batch_pipeline.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "recovery_coordinator.hpp"
#include "types.hpp"

struct HealthReport {
    bool healthy = true;
    std::string status = "healthy";
    size_t connections = 0;
    size_t clients = 0;
    size_t subscriptions = 0;
    ConnectionHealthStats connection_health;
    CircuitBreakerState circuit_breaker;
};

// Client facing entry point. Routes subscriptions to upstream connections and
// feeds every upstream update into the batch pipeline.
class StreamReceiver {
    public:
        StreamReceiver(
            const RelayConfig& config,
            std::shared_ptr<ConnectionManager> connections,
            std::shared_ptr<BatchPipeline> batches,
            std::shared_ptr<RecoveryCoordinator> recovery,
            std::shared_ptr<SymbolMapper> symbol_mapper,
            std::shared_ptr<ClientRegistry> registry,
            Clock clock
        );

        // Throws RateLimitedError before the cap is checked, then
        // ResourceExhaustedError when no connection can be admitted.
        void subscribe(
            const SymbolList& symbols,
            const std::string& capability,
            const std::optional<std::string>& preferred_provider,
            const std::string& client_id,
            const std::string& client_ip = ""
        );

        // An empty symbol list drops the whole subscription.
        void unsubscribe(const SymbolList& symbols, const std::string& client_id);

        // Rethrows ValidationError; other failures come back as a resubscribe response.
        ReconnectResponse reconnect(const ReconnectRequest& request);

        void handle_client_disconnect(const std::string& client_id);

        HealthReport health_check() const;

        // Connections whose handlers this receiver installed and that are still live.
        size_t wired_connections() const;

    private:
        void wire_connection_(const std::shared_ptr<StreamConnection>& connection);
        void on_upstream_data_(const std::string& provider, const std::string& capability, const FieldMap& data);
        // Canonical symbols back to the provider's notation, unchanged where unmapped.
        SymbolList to_upstream_symbols_(const std::string& provider, const SymbolList& symbols) const;

        const RelayConfig config_;
        std::shared_ptr<ConnectionManager> connections_;
        std::shared_ptr<BatchPipeline> batches_;
        std::shared_ptr<RecoveryCoordinator> recovery_;
        std::shared_ptr<SymbolMapper> symbol_mapper_;
        std::shared_ptr<ClientRegistry> registry_;
        Clock clock_;

        mutable std::mutex wired_mutex_;
        std::map<std::string, std::weak_ptr<StreamConnection>> wired_connections_;
};
