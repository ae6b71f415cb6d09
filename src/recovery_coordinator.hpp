#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "metrics.hpp"
#include "types.hpp"

// Runs on the reconnect's connection before the client is registered and the
// upstream subscription is sent.
using ConnectionHook = std::function<void(const std::shared_ptr<StreamConnection>&)>;

struct ReconnectRequest {
    std::string client_id;
    Time_t last_receive_timestamp = 0;
    SymbolList symbols;
    std::string capability;
    std::optional<std::string> preferred_provider;
    std::string reason;
};

struct RejectedSymbol {
    std::string symbol;
    std::string reason;
};

struct TimeRange {
    Time_t from = 0;
    Time_t to = 0;
};

struct RecoveryStrategy {
    bool will_recover = false;
    std::optional<TimeRange> time_range;
    std::optional<std::string> recovery_job_id;
};

struct ConnectionInfo {
    std::string provider;
    std::string connection_id;
    Time_t server_timestamp = 0;
    Millis heartbeat_interval{0};
};

struct ReconnectInstructions {
    ReconnectAction action = ReconnectAction::NONE;
    std::string message;
};

struct ReconnectResponse {
    bool success = false;
    std::string client_id;
    SymbolList confirmed_symbols;
    std::vector<RejectedSymbol> rejected_symbols;
    RecoveryStrategy recovery_strategy;
    ConnectionInfo connection_info;
    ReconnectInstructions instructions;
};

class RecoveryCoordinator {
    public:
        RecoveryCoordinator(
            const RelayConfig& config,
            std::shared_ptr<ConnectionManager> connections,
            std::shared_ptr<SymbolMapper> symbol_mapper,
            std::shared_ptr<ClientRegistry> registry,
            std::shared_ptr<RecoveryWorker> worker,
            std::shared_ptr<MetricsSink> metrics,
            Clock clock
        );

        // Throws ValidationError, before touching any state, for a missing client id
        // or a last receive timestamp that is zero or in the future. Any later
        // failure is answered with a resubscribe instruction and leaves no
        // subscription behind.
        ReconnectResponse handle_reconnect(const ReconnectRequest& request, const ConnectionHook& on_connection = nullptr);

        // Flags the clients of every provider that has subscribers but no live
        // connection. Returns the number of providers flagged.
        size_t detect_reconnection();

        // Schedules a recovery job when the client's upstream connection is gone.
        bool handle_reconnection(const std::string& client_id, const std::string& reason);

    private:
        // Returns the job id, or nothing after telling the client to resubscribe.
        std::optional<std::string> submit_job_(const RecoveryJob& job);
        std::string provider_for_(const SymbolList& symbols, const std::optional<std::string>& preferred) const;

        const RelayConfig config_;
        std::shared_ptr<ConnectionManager> connections_;
        std::shared_ptr<SymbolMapper> symbol_mapper_;
        std::shared_ptr<ClientRegistry> registry_;
        std::shared_ptr<RecoveryWorker> worker_;
        std::shared_ptr<MetricsSink> metrics_;
        Clock clock_;
};

RecoveryPriority recovery_priority_for(const std::string& reason);
