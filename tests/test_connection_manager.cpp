#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "connection_manager.hpp"
#include "error.hpp"
#include "fakes.hpp"

class ConnectionManagerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config_.max_connections = 3;
            fetcher_ = std::make_shared<FakeFetcher>(clock_.clock());
            limiter_ = std::make_shared<FakeRateLimiter>();
            rebuild();
        }

        void rebuild(MemoryReader reader = [] { return size_t(0); }) {
            manager_ = std::make_shared<ConnectionManager>(config_, fetcher_, limiter_, metrics_, clock_.clock(), reader);
        }

        ManualClock clock_;
        RelayConfig config_;
        std::shared_ptr<FakeFetcher> fetcher_;
        std::shared_ptr<FakeRateLimiter> limiter_;
        std::shared_ptr<RecordingMetrics> metrics_ = std::make_shared<RecordingMetrics>();
        std::shared_ptr<ConnectionManager> manager_;
};

TEST_F(ConnectionManagerTest, ReusesConnectionPerProviderAndCapability) {
    auto first = manager_->get_or_create_connection("longport", "ws-stock-quote", {"00700.HK"}, "c1");
    auto second = manager_->get_or_create_connection("longport", "ws-stock-quote", {"AAPL.US"}, "c2");
    EXPECT_EQ(first, second);
    EXPECT_EQ(fetcher_->calls.load(), 1);
    EXPECT_EQ(manager_->connection_count(), 1u);
    EXPECT_EQ(metrics_->count("connection_created"), 1u);

    auto other = manager_->get_or_create_connection("longport", "ws-option-quote", {"00700.HK"}, "c1");
    EXPECT_NE(first, other);
    EXPECT_EQ(manager_->connection_count(), 2u);
}

TEST_F(ConnectionManagerTest, ReplacesDisconnectedEntry) {
    manager_->get_or_create_connection("longport", "ws-stock-quote", {"00700.HK"}, "c1");
    auto dropped = fetcher_->last();
    dropped->connected = false;

    auto fresh = manager_->get_or_create_connection("longport", "ws-stock-quote", {"00700.HK"}, "c1");
    EXPECT_NE(fresh, dropped);
    EXPECT_EQ(fetcher_->calls.load(), 2);
    EXPECT_EQ(manager_->connection_count(), 1u);
}

TEST_F(ConnectionManagerTest, RejectsNewConnectionAtCap) {
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");
    manager_->get_or_create_connection("b", "q", {"X"}, "c1");
    manager_->get_or_create_connection("c", "q", {"X"}, "c1");

    EXPECT_THROW(manager_->get_or_create_connection("d", "q", {"X"}, "c1"), ResourceExhaustedError);
    EXPECT_EQ(manager_->connection_count(), 3u);
    EXPECT_EQ(fetcher_->calls.load(), 3);

    // an existing key is still served at the cap
    EXPECT_NO_THROW(manager_->get_or_create_connection("a", "q", {"Y"}, "c2"));
}

TEST_F(ConnectionManagerTest, StaleSweepFreesRoomAtCap) {
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");
    manager_->get_or_create_connection("b", "q", {"X"}, "c1");
    clock_.advance(config_.connection_stale_timeout.count() - 1'000);
    manager_->get_or_create_connection("c", "q", {"X"}, "c1");
    clock_.advance(2'000);

    EXPECT_NO_THROW(manager_->get_or_create_connection("d", "q", {"X"}, "c1"));
    const auto keys = manager_->connection_keys();
    EXPECT_EQ(keys.size(), 2u);
    EXPECT_EQ(manager_->find_connection("a:q"), nullptr);
    EXPECT_NE(manager_->find_connection("c:q"), nullptr);
}

TEST_F(ConnectionManagerTest, FetcherFailureSurfacesAsUnavailable) {
    fetcher_->fail = true;
    EXPECT_THROW(manager_->get_or_create_connection("a", "q", {"X"}, "c1"), CollaboratorUnavailableError);
    EXPECT_EQ(manager_->connection_count(), 0u);
}

TEST_F(ConnectionManagerTest, ForcedCleanupEvictsLeastRecentlyActive) {
    config_.max_connections = 50;
    rebuild();
    for (int i = 0; i < 20; ++i) {
        manager_->get_or_create_connection("p" + std::to_string(i), "q", {"X"}, "c");
        clock_.advance(10);
    }
    fetcher_->created[1]->fail_close = true;

    const CleanupResult result = manager_->force_connection_cleanup();
    EXPECT_EQ(result.type, CleanupType::FORCED);
    EXPECT_EQ(result.connections_before, 20u);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.close_failures, 1u);
    EXPECT_EQ(result.remaining, 18u);
    EXPECT_EQ(manager_->find_connection("p0:q"), nullptr);
    EXPECT_EQ(manager_->find_connection("p1:q"), nullptr);
    EXPECT_NE(manager_->find_connection("p2:q"), nullptr);
    EXPECT_EQ(metrics_->count("forced_connection_cleanup_completed"), 1u);
}

TEST_F(ConnectionManagerTest, ForcedCleanupRemovesAtLeastOne) {
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");
    clock_.advance(5);
    manager_->get_or_create_connection("b", "q", {"X"}, "c1");

    const CleanupResult result = manager_->force_connection_cleanup();
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(manager_->find_connection("a:q"), nullptr);
    EXPECT_EQ(fetcher_->created[0]->close_calls.load(), 1);
}

TEST_F(ConnectionManagerTest, RateLimitKeyAndFailOpen) {
    EXPECT_TRUE(manager_->check_rate_limit("10.0.0.7").allowed);
    ASSERT_EQ(limiter_->keys.size(), 1u);
    EXPECT_EQ(limiter_->keys[0], "client:10.0.0.7");

    limiter_->allow = false;
    const RateLimitResult denied = manager_->check_rate_limit("10.0.0.7");
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.retry_after_ms, 1'500);

    limiter_->fail = true;
    EXPECT_TRUE(manager_->check_rate_limit("10.0.0.7").allowed);
}

TEST_F(ConnectionManagerTest, MemorySweepForcesCleanupOnlyWhenCritical) {
    size_t resident = config_.memory_monitoring.warning_threshold_bytes + 1;
    rebuild([&resident] { return resident; });
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");

    EXPECT_EQ(manager_->run_memory_sweep(), resident);
    EXPECT_EQ(metrics_->count("memory_usage_alert"), 1u);
    EXPECT_EQ(metrics_->count("forced_connection_cleanup_completed"), 0u);
    EXPECT_EQ(manager_->connection_count(), 1u);

    resident = config_.memory_monitoring.critical_threshold_bytes;
    manager_->run_memory_sweep();
    EXPECT_EQ(metrics_->count("memory_usage_alert"), 2u);
    EXPECT_EQ(metrics_->count("forced_connection_cleanup_completed"), 1u);
    EXPECT_EQ(manager_->connection_count(), 0u);
}

TEST_F(ConnectionManagerTest, ErrorsDegradeHealthAndActivityRestoresIt) {
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");
    for (int i = 0; i < 5; ++i) {
        manager_->record_connection_error("a:q");
    }
    auto health = manager_->connection_health("a:q");
    ASSERT_TRUE(health.has_value());
    EXPECT_FALSE(health->is_healthy);
    EXPECT_EQ(health->quality, ConnectionQuality::POOR);

    manager_->record_connection_activity("a:q");
    health = manager_->connection_health("a:q");
    EXPECT_TRUE(health->is_healthy);
    EXPECT_EQ(health->consecutive_errors, 0u);
    EXPECT_EQ(health->activity_count, 1u);
    EXPECT_EQ(health->quality, ConnectionQuality::POOR);
}

TEST_F(ConnectionManagerTest, StaleSweepDropsUnhealthyAndDisconnected) {
    manager_->get_or_create_connection("a", "q", {"X"}, "c1");
    manager_->get_or_create_connection("b", "q", {"X"}, "c1");
    manager_->get_or_create_connection("c", "q", {"X"}, "c1");
    for (int i = 0; i < 10; ++i) {
        manager_->record_connection_error("a:q");
        manager_->record_connection_activity("a:q");
    }
    fetcher_->created[1]->connected = false;

    const CleanupResult result = manager_->run_stale_sweep();
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(result.remaining, 1u);
    EXPECT_NE(manager_->find_connection("c:q"), nullptr);
    EXPECT_EQ(metrics_->count("connection_health_stats"), 1u);
}

TEST(ConnectionHealthTest, QualityLevels) {
    const Millis bound(300'000);
    const Time_t now = 1'000'000;

    ConnectionHealth health;
    health.last_activity = now - 1'000;
    EXPECT_EQ(compute_connection_quality(health, now, bound), ConnectionQuality::EXCELLENT);

    health.error_count = 2;
    health.consecutive_errors = 1;
    EXPECT_EQ(compute_connection_quality(health, now, bound), ConnectionQuality::GOOD);

    health.error_count = 3;
    EXPECT_EQ(compute_connection_quality(health, now, bound), ConnectionQuality::POOR);
    EXPECT_TRUE(compute_connection_healthy(health, now, bound));

    ConnectionHealth idle;
    idle.last_activity = now - 200'000;
    EXPECT_EQ(compute_connection_quality(idle, now, bound), ConnectionQuality::GOOD);

    idle.last_activity = now - 300'000;
    EXPECT_FALSE(compute_connection_healthy(idle, now, bound));
    EXPECT_EQ(compute_connection_quality(idle, now, bound), ConnectionQuality::POOR);
}

TEST_F(ConnectionManagerTest, SlowConnectDoesNotBlockOtherKeys) {
    config_.max_connections = 2;
    rebuild();
    manager_->get_or_create_connection("fast", "q", {"X"}, "c1");

    std::promise<void> entered;
    auto entered_future = entered.get_future();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    fetcher_->before_connect = [&entered, released](const std::string& provider) {
        if (provider == "slow") {
            entered.set_value();
            released.wait();
        }
    };

    auto slow = std::async(std::launch::async, [this] {
        return manager_->get_or_create_connection("slow", "q", {"X"}, "c2");
    });
    const bool started = entered_future.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
    if (!started) {
        release.set_value();
    }
    ASSERT_TRUE(started);

    auto others = std::async(std::launch::async, [this] {
        manager_->record_connection_activity("fast:q");
        manager_->get_or_create_connection("fast", "q", {"Y"}, "c3");
        return manager_->connection_count();
    });
    const bool served = others.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
    EXPECT_TRUE(served);

    // the connection being established holds a slot under the cap
    EXPECT_THROW(manager_->get_or_create_connection("third", "q", {"X"}, "c4"), ResourceExhaustedError);

    release.set_value();
    EXPECT_NE(slow.get(), nullptr);
    EXPECT_EQ(others.get(), 1u);
    EXPECT_EQ(manager_->connection_count(), 2u);
    EXPECT_EQ(fetcher_->last_options.connection_timeout, config_.timeouts.connect);
}

TEST_F(ConnectionManagerTest, ConcurrentCallersShareOneConnectAttempt) {
    std::promise<void> entered;
    auto entered_future = entered.get_future();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    fetcher_->before_connect = [&entered, released](const std::string&) {
        entered.set_value();
        released.wait();
    };

    auto first = std::async(std::launch::async, [this] {
        return manager_->get_or_create_connection("longport", "q", {"X"}, "c1");
    });
    const bool started = entered_future.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
    if (!started) {
        release.set_value();
    }
    ASSERT_TRUE(started);

    auto second = std::async(std::launch::async, [this] {
        return manager_->get_or_create_connection("longport", "q", {"Y"}, "c2");
    });
    release.set_value();

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(ConnectionManagerTest, FailedConnectReleasesItsSlot) {
    config_.max_connections = 1;
    rebuild();
    fetcher_->fail = true;
    EXPECT_THROW(manager_->get_or_create_connection("a", "q", {"X"}, "c1"), CollaboratorUnavailableError);

    fetcher_->fail = false;
    EXPECT_NO_THROW(manager_->get_or_create_connection("b", "q", {"X"}, "c1"));
    EXPECT_EQ(manager_->connection_count(), 1u);
}
