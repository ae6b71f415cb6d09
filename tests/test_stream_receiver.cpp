#include <gtest/gtest.h>

#include <thread>

#include <boost/asio/executor_work_guard.hpp>

#include "error.hpp"
#include "fakes.hpp"
#include "stream_receiver.hpp"

class StreamReceiverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config_.batch_processing_interval = Millis(60'000);
            build();
        }

        void build() {
            registry_ = std::make_shared<FakeRegistry>(clock_.clock());
            fetcher_ = std::make_shared<FakeFetcher>(clock_.clock());
            connections_ = std::make_shared<ConnectionManager>(
                config_, fetcher_, limiter_, metrics_, clock_.clock(), [] { return size_t(0); }
            );
            auto pipeline = std::make_shared<DataPipeline>(
                config_, std::make_shared<FakeTransformer>(), mapper_, std::make_shared<FakeCache>(), registry_, metrics_, clock_.clock()
            );
            batches_ = std::make_shared<BatchPipeline>(io_context_, config_, pipeline, metrics_, clock_.clock());
            auto recovery = std::make_shared<RecoveryCoordinator>(
                config_, connections_, mapper_, registry_, std::make_shared<FakeRecoveryWorker>(), metrics_, clock_.clock()
            );
            receiver_ = std::make_shared<StreamReceiver>(
                config_, connections_, batches_, recovery, mapper_, registry_, clock_.clock()
            );
        }

        boost::asio::io_context io_context_;
        ManualClock clock_;
        RelayConfig config_;
        std::shared_ptr<FakeRegistry> registry_;
        std::shared_ptr<FakeFetcher> fetcher_;
        std::shared_ptr<FakeRateLimiter> limiter_ = std::make_shared<FakeRateLimiter>();
        std::shared_ptr<FakeSymbolMapper> mapper_ = std::make_shared<FakeSymbolMapper>();
        std::shared_ptr<RecordingMetrics> metrics_ = std::make_shared<RecordingMetrics>();
        std::shared_ptr<ConnectionManager> connections_;
        std::shared_ptr<BatchPipeline> batches_;
        std::shared_ptr<StreamReceiver> receiver_;
};

TEST_F(StreamReceiverTest, SubscribeWiresConnectionWithProviderSymbols) {
    receiver_->subscribe({"0700", "AAPL"}, "ws-stock-quote", std::nullopt, "client-1", "10.0.0.7");

    auto connection = fetcher_->last();
    ASSERT_NE(connection, nullptr);
    EXPECT_EQ(connection->provider(), "longport");
    ASSERT_EQ(connection->subscribed.size(), 1u);
    EXPECT_EQ(connection->subscribed[0], (SymbolList{"0700", "AAPL"}));
    EXPECT_TRUE(connection->data_handler);
    EXPECT_TRUE(connection->error_handler);

    const auto subscription = registry_->get_client_subscription("client-1");
    ASSERT_TRUE(subscription.has_value());
    EXPECT_EQ(subscription->symbols, (SymbolList{"00700.HK", "AAPL.US"}));
    EXPECT_EQ(subscription->provider, "longport");

    ASSERT_EQ(limiter_->keys.size(), 1u);
    EXPECT_EQ(limiter_->keys[0], "client:10.0.0.7");
}

TEST_F(StreamReceiverTest, SecondClientSharesTheConnection) {
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    receiver_->subscribe({"0005"}, "ws-stock-quote", std::nullopt, "client-2");
    EXPECT_EQ(fetcher_->calls.load(), 1);
    EXPECT_EQ(fetcher_->last()->subscribed.size(), 2u);
    EXPECT_EQ(connections_->connection_count(), 1u);
}

TEST_F(StreamReceiverTest, RateLimitRejectsBeforeConnecting) {
    limiter_->allow = false;
    try {
        receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
        FAIL() << "subscribe should have been rate limited";
    } catch (const RateLimitedError& e) {
        EXPECT_EQ(e.retry_after_ms(), 1'500);
    }
    EXPECT_EQ(fetcher_->calls.load(), 0);
    EXPECT_FALSE(registry_->get_client_subscription("client-1").has_value());
}

TEST_F(StreamReceiverTest, LimiterOutageFailsOpen) {
    limiter_->fail = true;
    EXPECT_NO_THROW(receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1"));
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(StreamReceiverTest, CapRejectionRollsBackRegistry) {
    config_.max_connections = 1;
    build();
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");

    EXPECT_THROW(
        receiver_->subscribe({"AAPL"}, "ws-stock-quote", std::string("itick"), "client-2"),
        ResourceExhaustedError
    );
    EXPECT_FALSE(registry_->get_client_subscription("client-2").has_value());
    EXPECT_TRUE(registry_->get_client_subscription("client-1").has_value());
    EXPECT_EQ(connections_->connection_count(), 1u);
}

TEST_F(StreamReceiverTest, RejectsEmptyRequests) {
    EXPECT_THROW(receiver_->subscribe({}, "ws-stock-quote", std::nullopt, "client-1"), ValidationError);
    EXPECT_THROW(receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, ""), ValidationError);
    EXPECT_EQ(fetcher_->calls.load(), 0);
    EXPECT_TRUE(limiter_->keys.empty());
}

TEST_F(StreamReceiverTest, UnsubscribeWithoutClientIdIsIgnored) {
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    EXPECT_NO_THROW(receiver_->unsubscribe({"00700.HK"}, ""));
    EXPECT_TRUE(registry_->get_client_subscription("client-1").has_value());
    EXPECT_TRUE(fetcher_->last()->unsubscribed.empty());
}

TEST_F(StreamReceiverTest, UpstreamNarrowedOnlyForLastClient) {
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-2");
    auto connection = fetcher_->last();

    receiver_->unsubscribe({}, "client-1");
    EXPECT_FALSE(registry_->get_client_subscription("client-1").has_value());
    EXPECT_TRUE(connection->unsubscribed.empty());

    receiver_->unsubscribe({"00700.HK"}, "client-2");
    EXPECT_FALSE(registry_->get_client_subscription("client-2").has_value());
    ASSERT_EQ(connection->unsubscribed.size(), 1u);
    EXPECT_EQ(connection->unsubscribed[0], (SymbolList{"00700"}));
}

TEST_F(StreamReceiverTest, UpstreamDataFlowsToSubscribers) {
    batches_->start();
    std::thread io([this] {
        auto guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
    });

    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    const Time_t subscribed_at = connections_->connection_health("longport:ws-stock-quote")->last_activity;
    clock_.advance(1'000);

    fetcher_->last()->push({{"symbol", "0700"}, {"last", "312.4"}});
    const auto health = connections_->connection_health("longport:ws-stock-quote");
    ASSERT_TRUE(health.has_value());
    EXPECT_GT(health->last_activity, subscribed_at);
    EXPECT_EQ(health->activity_count, 1u);

    batches_->stop();
    io_context_.stop();
    io.join();

    ASSERT_EQ(registry_->broadcasts.size(), 1u);
    EXPECT_EQ(registry_->broadcasts[0].first, "00700.HK");
    EXPECT_EQ(registry_->deliveries(), 1u);
}

TEST_F(StreamReceiverTest, UpstreamErrorCountsAgainstConnection) {
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    fetcher_->last()->error_handler("read error: connection reset");
    const auto health = connections_->connection_health("longport:ws-stock-quote");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->error_count, 1u);
    EXPECT_EQ(health->consecutive_errors, 1u);
}

TEST_F(StreamReceiverTest, DeadConnectionIsForgotten) {
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-1");
    EXPECT_EQ(receiver_->wired_connections(), 1u);

    auto dropped = fetcher_->last();
    dropped->connected = false;
    dropped->error_handler("remote disconnect");
    EXPECT_EQ(receiver_->wired_connections(), 0u);

    // a replacement for the same key is wired afresh
    receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-2");
    EXPECT_NE(fetcher_->last(), dropped);
    EXPECT_TRUE(fetcher_->last()->data_handler);
    EXPECT_EQ(receiver_->wired_connections(), 1u);
}

TEST_F(StreamReceiverTest, ReplacedConnectionsDoNotAccumulate) {
    for (int i = 0; i < 5; ++i) {
        receiver_->subscribe({"0700"}, "ws-stock-quote", std::nullopt, "client-" + std::to_string(i));
        fetcher_->last()->connected = false;
    }
    EXPECT_EQ(fetcher_->calls.load(), 5);
    EXPECT_LE(receiver_->wired_connections(), 1u);
}

TEST_F(StreamReceiverTest, DisconnectDropsWholeSubscription) {
    receiver_->subscribe({"0700", "0005"}, "ws-stock-quote", std::nullopt, "client-1");
    receiver_->handle_client_disconnect("client-1");
    EXPECT_FALSE(registry_->get_client_subscription("client-1").has_value());
    EXPECT_NO_THROW(receiver_->handle_client_disconnect(""));
}

TEST_F(StreamReceiverTest, HealthReflectsConnectionsAndBreaker) {
    receiver_->subscribe({"0700", "0005"}, "ws-stock-quote", std::nullopt, "client-1");
    HealthReport report = receiver_->health_check();
    EXPECT_TRUE(report.healthy);
    EXPECT_EQ(report.status, "healthy");
    EXPECT_EQ(report.connections, 1u);
    EXPECT_EQ(report.clients, 1u);
    EXPECT_EQ(report.subscriptions, 2u);
    EXPECT_EQ(report.connection_health.healthy, 1u);

    for (int i = 0; i < 10; ++i) {
        batches_->circuit_breaker().record_failure();
    }
    report = receiver_->health_check();
    EXPECT_FALSE(report.healthy);
    EXPECT_EQ(report.status, "degraded");
    EXPECT_TRUE(report.circuit_breaker.is_open);
}

TEST_F(StreamReceiverTest, ReconnectRewiresRestoredConnection) {
    ReconnectRequest request;
    request.client_id = "client-1";
    request.last_receive_timestamp = clock_.now() - 5'000;
    request.symbols = {"0700"};
    request.capability = "ws-stock-quote";
    request.reason = "network_error";

    const ReconnectResponse response = receiver_->reconnect(request);
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.instructions.action, ReconnectAction::WAIT_FOR_RECOVERY);
    EXPECT_TRUE(fetcher_->last()->data_handler);
    ASSERT_EQ(fetcher_->last()->subscribed_with_handler.size(), 1u);
    EXPECT_TRUE(fetcher_->last()->subscribed_with_handler[0]);

    request.client_id.clear();
    EXPECT_THROW(receiver_->reconnect(request), ValidationError);
}
