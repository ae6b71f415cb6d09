#include <gtest/gtest.h>

#include "fakes.hpp"
#include "local_collaborators.hpp"

TEST(PassthroughTransformerTest, OneRecordPerSymbol) {
    PassthroughTransformer transformer;
    TransformRequest request;
    request.provider = "longport";
    request.raw_data = {
        {{"symbol", "0700,0005"}, {"last", "1"}},
        {{"last", "2"}},
        {{"s", "AAPL"}, {"bid", "3"}},
    };
    const TransformResult result = transformer.transform(request).get();
    ASSERT_EQ(result.transformed_data.size(), 3u);
    EXPECT_EQ(result.transformed_data[0].symbol, "0700");
    EXPECT_EQ(result.transformed_data[1].symbol, "0005");
    EXPECT_EQ(result.transformed_data[0].fields, (FieldMap{{"last", "1"}}));
    EXPECT_EQ(result.transformed_data[2].fields, (FieldMap{{"bid", "3"}}));
}

TEST(SuffixSymbolMapperTest, AppendsAndStripsMarketSuffix) {
    EXPECT_EQ(SuffixSymbolMapper::to_standard("0700"), std::optional<std::string>("00700.HK"));
    EXPECT_EQ(SuffixSymbolMapper::to_standard("aapl"), std::optional<std::string>("AAPL.US"));
    EXPECT_EQ(SuffixSymbolMapper::to_standard("600519"), std::optional<std::string>("600519.SH"));
    EXPECT_EQ(SuffixSymbolMapper::to_standard("000001"), std::optional<std::string>("000001.SZ"));
    EXPECT_EQ(SuffixSymbolMapper::to_standard("00700.hk"), std::optional<std::string>("00700.HK"));
    EXPECT_FALSE(SuffixSymbolMapper::to_standard("BTC-USDT").has_value());
    EXPECT_EQ(SuffixSymbolMapper::from_standard("AAPL.US"), "AAPL");

    SuffixSymbolMapper mapper;
    const auto result = mapper.transform_symbols("longport", {"0700", "BTC-USDT"}, MappingDirection::TO_STANDARD).get();
    EXPECT_EQ(result.mapping_details.size(), 1u);
    EXPECT_EQ(result.mapping_details.at("0700"), "00700.HK");
}

TEST(InMemoryQuoteCacheTest, LastWriteWins) {
    InMemoryQuoteCache cache;
    QuoteRecord first{"AAPL.US", {{"last", "1"}}};
    QuoteRecord second{"AAPL.US", {{"last", "2"}}};
    cache.set_data("quote:AAPL.US", std::vector<QuoteRecord>{first}, CacheMode::AUTO).get();
    cache.set_data("quote:AAPL.US", std::vector<QuoteRecord>{second}, CacheMode::AUTO).get();
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("quote:AAPL.US")->at(0).fields.at("last"), "2");
    EXPECT_FALSE(cache.get("quote:TSLA.US").has_value());
}

TEST(LocalClientRegistryTest, TracksSubscriptionsAndDelivers) {
    ManualClock clock;
    std::vector<std::string> delivered;
    LocalClientRegistry registry(clock.clock(), [&delivered](const std::string& client_id, const BroadcastPayload&) {
        delivered.push_back(client_id);
    });

    registry.add_client_subscription("c1", {"00700.HK"}, "ws-stock-quote", "longport");
    registry.add_client_subscription("c1", {"00700.HK", "AAPL.US"}, "ws-stock-quote", "longport");
    registry.add_client_subscription("c2", {"AAPL.US"}, "ws-option-quote", "itick");

    EXPECT_EQ(registry.get_client_subscription("c1")->symbols, (SymbolList{"00700.HK", "AAPL.US"}));
    const ClientStateStats stats = registry.get_client_state_stats();
    EXPECT_EQ(stats.total_clients, 2u);
    EXPECT_EQ(stats.total_subscriptions, 3u);
    EXPECT_EQ(stats.provider_breakdown.at("itick"), 1u);
    EXPECT_EQ(stats.capability_breakdown.at("ws-stock-quote"), 1u);
    EXPECT_EQ(registry.clients_for_provider("longport"), (std::vector<std::string>{"c1"}));

    BroadcastPayload payload;
    payload.symbol = "AAPL.US";
    registry.broadcast_to_symbol("AAPL.US", payload).get();
    EXPECT_EQ(delivered, (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(registry.deliveries(), 2u);

    registry.remove_client_subscription("c1", {"00700.HK"});
    EXPECT_EQ(registry.get_client_subscription("c1")->symbols, (SymbolList{"AAPL.US"}));
    registry.remove_client_subscription("c1", {"AAPL.US"});
    EXPECT_FALSE(registry.get_client_subscription("c1").has_value());
    registry.remove_client_subscription("c2", {});
    EXPECT_EQ(registry.get_client_state_stats().total_clients, 0u);
}

TEST(FixedWindowRateLimiterTest, BlocksUntilWindowRollsOver) {
    ManualClock clock;
    FixedWindowRateLimiter limiter(clock.clock());
    RateLimitRequest limit;
    limit.limit = 2;
    limit.window_ms = 60'000;

    EXPECT_TRUE(limiter.check_rate_limit("client:a", limit).get().allowed);
    EXPECT_TRUE(limiter.check_rate_limit("client:a", limit).get().allowed);
    clock.advance(10'000);
    const RateLimitResult blocked = limiter.check_rate_limit("client:a", limit).get();
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.retry_after_ms, 50'000);
    EXPECT_TRUE(limiter.check_rate_limit("client:b", limit).get().allowed);

    clock.advance(50'000);
    EXPECT_TRUE(limiter.check_rate_limit("client:a", limit).get().allowed);
}

TEST(FixedWindowRateLimiterTest, ExpiredWindowsAreDropped) {
    ManualClock clock;
    FixedWindowRateLimiter limiter(clock.clock());
    RateLimitRequest limit;
    limit.limit = 5;
    limit.window_ms = 1'000;

    for (int i = 0; i < 100; ++i) {
        limiter.check_rate_limit("client:" + std::to_string(i), limit).get();
    }
    EXPECT_EQ(limiter.tracked_keys(), 100u);

    clock.advance(1'000);
    EXPECT_TRUE(limiter.check_rate_limit("client:new", limit).get().allowed);
    EXPECT_EQ(limiter.tracked_keys(), 1u);
}

TEST(LocalRecoveryWorkerTest, NumbersJobs) {
    LocalRecoveryWorker worker;
    RecoveryJob job;
    job.client_id = "c1";
    EXPECT_EQ(worker.submit_recovery_job(job).get(), "recovery-1");
    EXPECT_EQ(worker.submit_recovery_job(job).get(), "recovery-2");
    EXPECT_EQ(worker.jobs().size(), 2u);
}
