#include "recovery_coordinator.hpp"

#include "deadline.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "market.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_RECO, "RECO")

RecoveryPriority recovery_priority_for(const std::string& reason) {
    return reason == "network_error" ? RecoveryPriority::HIGH : RecoveryPriority::NORMAL;
}

RecoveryCoordinator::RecoveryCoordinator(
    const RelayConfig& config,
    std::shared_ptr<ConnectionManager> connections,
    std::shared_ptr<SymbolMapper> symbol_mapper,
    std::shared_ptr<ClientRegistry> registry,
    std::shared_ptr<RecoveryWorker> worker,
    std::shared_ptr<MetricsSink> metrics,
    Clock clock
)
    : config_(config),
      connections_(std::move(connections)),
      symbol_mapper_(std::move(symbol_mapper)),
      registry_(std::move(registry)),
      worker_(std::move(worker)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      clock_(std::move(clock)) {}

std::string RecoveryCoordinator::provider_for_(const SymbolList& symbols, const std::optional<std::string>& preferred) const {
    if (preferred && !preferred->empty()) {
        return *preferred;
    }
    return default_provider_for(symbols, config_.market_providers, config_.default_provider);
}

ReconnectResponse RecoveryCoordinator::handle_reconnect(const ReconnectRequest& request, const ConnectionHook& on_connection) {
    const Time_t now = clock_();
    if (request.client_id.empty()) {
        throw ValidationError("reconnect request without client id");
    }
    if (request.last_receive_timestamp <= 0 || request.last_receive_timestamp > now) {
        throw ValidationError(
            "invalid last receive timestamp " + std::to_string(request.last_receive_timestamp)
            + " for client " + request.client_id
        );
    }

    ReconnectResponse response;
    response.client_id = request.client_id;
    response.connection_info.server_timestamp = now;
    response.connection_info.heartbeat_interval = config_.recovery.heartbeat_interval;

    const Time_t gap = now - request.last_receive_timestamp;
    RLOG(LG_RECO, LogLevel::LL_INFO)
        << "reconnect from " << request.client_id << " gap=" << gap << "ms symbols=" << request.symbols.size()
        << " reason=" << request.reason;

    try {
        const std::string provider = provider_for_(request.symbols, request.preferred_provider);
        response.connection_info.provider = provider;

        std::map<std::string, std::string> mapping;
        try {
            mapping = await_with_deadline(
                symbol_mapper_->transform_symbols(provider, request.symbols, MappingDirection::TO_STANDARD),
                config_.timeouts.symbol_mapping,
                "symbol mapping"
            ).mapping_details;
        } catch (const std::exception& e) {
            RLOG(LG_RECO, LogLevel::LL_WARNING) << "symbol mapping failed for " << request.client_id << ": " << e.what();
        }

        SymbolList upstream_symbols;
        for (const auto& symbol : request.symbols) {
            auto it = mapping.find(symbol);
            if (it == mapping.end() || it->second.empty()) {
                response.rejected_symbols.push_back({symbol, "symbol mapping failed"});
            } else {
                response.confirmed_symbols.push_back(it->second);
                upstream_symbols.push_back(symbol);
            }
        }

        if (response.confirmed_symbols.empty()) {
            response.success = false;
            response.instructions.action = ReconnectAction::RESUBSCRIBE;
            response.instructions.message = "no requested symbol could be restored, please resubscribe";
            RLOG(LG_RECO, LogLevel::LL_WARNING) << "reconnect of " << request.client_id << " confirmed no symbols";
            return response;
        }

        // The client is registered only once its connection exists and carries handlers.
        auto connection = connections_->get_or_create_connection(
            provider, request.capability, response.confirmed_symbols, request.client_id
        );
        if (on_connection) {
            on_connection(connection);
        }
        registry_->add_client_subscription(request.client_id, response.confirmed_symbols, request.capability, provider);
        try {
            connection->subscribe(upstream_symbols);
        } catch (const std::exception&) {
            registry_->remove_client_subscription(request.client_id, response.confirmed_symbols);
            throw;
        }
        response.connection_info.connection_id = connection->id();

        if (gap <= config_.recovery.max_recovery_window.count()) {
            RecoveryJob job;
            job.client_id = request.client_id;
            job.symbols = response.confirmed_symbols;
            job.last_receive_timestamp = request.last_receive_timestamp;
            job.provider = provider;
            job.capability = request.capability;
            job.priority = recovery_priority_for(request.reason);

            if (auto job_id = submit_job_(job)) {
                response.recovery_strategy.will_recover = true;
                response.recovery_strategy.time_range = TimeRange{request.last_receive_timestamp, now};
                response.recovery_strategy.recovery_job_id = *job_id;
                response.instructions.action = ReconnectAction::WAIT_FOR_RECOVERY;
                response.instructions.message = "missed data is being replayed, live data follows";
            } else {
                response.instructions.action = ReconnectAction::RESUBSCRIBE;
                response.instructions.message = "missed data cannot be replayed, please resubscribe";
            }
        } else {
            response.instructions.action = ReconnectAction::NONE;
            response.instructions.message = "gap exceeds the recovery window, live data resumes now";
        }
        response.success = true;
    } catch (const std::exception& e) {
        RLOG(LG_RECO, LogLevel::LL_ERROR) << "reconnect of " << request.client_id << " failed: " << e.what();
        response.success = false;
        response.recovery_strategy = RecoveryStrategy{};
        response.instructions.action = ReconnectAction::RESUBSCRIBE;
        response.instructions.message = std::string("reconnect failed, please resubscribe: ") + e.what();
    }

    RLOG(LG_RECO, LogLevel::LL_INFO)
        << "reconnect of " << request.client_id << " confirmed=" << response.confirmed_symbols.size()
        << " rejected=" << response.rejected_symbols.size() << " action=" << response.instructions.action;
    return response;
}

std::optional<std::string> RecoveryCoordinator::submit_job_(const RecoveryJob& job) {
    try {
        if (!worker_) {
            throw CollaboratorUnavailableError("no recovery worker configured");
        }
        std::string job_id = await_with_deadline(
            worker_->submit_recovery_job(job), config_.timeouts.recovery_submit, "recovery job submit"
        );
        RLOG(LG_RECO, LogLevel::LL_INFO)
            << "recovery job " << job_id << " submitted for " << job.client_id
            << " symbols=" << job.symbols.size() << " priority=" << job.priority;
        metrics_->emit("recovery_job_submitted", static_cast<double>(job.symbols.size()), {
            {"provider", job.provider}, {"priority", job.priority == RecoveryPriority::HIGH ? "high" : "normal"}
        });
        return job_id;
    } catch (const std::exception& e) {
        RLOG(LG_RECO, LogLevel::LL_WARNING)
            << "recovery job for " << job.client_id << " rejected, asking client to resubscribe: " << e.what();
        metrics_->emit("recovery_job_failed", 1, {{"provider", job.provider}});
        try {
            registry_->notify_client(job.client_id, {ClientNoticeType::RESUBSCRIBE, "data recovery unavailable, please resubscribe"});
        } catch (const std::exception& notify_error) {
            RLOG(LG_RECO, LogLevel::LL_ERROR) << "resubscribe notice to " << job.client_id << " failed: " << notify_error.what();
        }
        return std::nullopt;
    }
}

size_t RecoveryCoordinator::detect_reconnection() {
    size_t flagged = 0;
    try {
        const ClientStateStats stats = registry_->get_client_state_stats();
        for (const auto& [provider, subscriptions] : stats.provider_breakdown) {
            if (subscriptions == 0 || connections_->live_connections_for_provider(provider) > 0) {
                continue;
            }
            ++flagged;
            const auto clients = registry_->clients_for_provider(provider);
            RLOG(LG_RECO, LogLevel::LL_WARNING)
                << "provider " << provider << " has " << subscriptions << " subscriptions and no live connection, flagging "
                << clients.size() << " clients";
            metrics_->emit("provider_reconnection_triggered", static_cast<double>(clients.size()), {{"provider", provider}});
            for (const auto& client : clients) {
                registry_->notify_client(client, {ClientNoticeType::RECONNECT, "upstream " + provider + " lost, please reconnect"});
            }
        }
    } catch (const std::exception& e) {
        RLOG(LG_RECO, LogLevel::LL_ERROR) << "reconnection detection failed: " << e.what();
    }
    return flagged;
}

bool RecoveryCoordinator::handle_reconnection(const std::string& client_id, const std::string& reason) {
    const auto subscription = registry_->get_client_subscription(client_id);
    if (!subscription) {
        RLOG(LG_RECO, LogLevel::LL_DEBUG) << "no subscription for " << client_id << ", nothing to recover";
        return false;
    }

    const auto connection = connections_->find_connection(make_connection_key(subscription->provider, subscription->capability));
    if (connection && connection->is_connected()) {
        RLOG(LG_RECO, LogLevel::LL_DEBUG) << "connection for " << client_id << " still active";
        return false;
    }

    RecoveryJob job;
    job.client_id = client_id;
    job.symbols = subscription->symbols;
    job.last_receive_timestamp = subscription->last_active_at > 0 ? subscription->last_active_at : clock_();
    job.provider = subscription->provider;
    job.capability = subscription->capability;
    job.priority = recovery_priority_for(reason);

    RLOG(LG_RECO, LogLevel::LL_INFO) << "connection for " << client_id << " inactive (" << reason << "), scheduling recovery";
    return submit_job_(job).has_value();
}
