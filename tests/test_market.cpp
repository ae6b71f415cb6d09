#include <gtest/gtest.h>

#include "market.hpp"

TEST(MarketTest, SuffixDecidesMarket) {
    EXPECT_EQ(infer_market("00700.HK"), "HK");
    EXPECT_EQ(infer_market("aapl.us"), "US");
    EXPECT_EQ(infer_market("MSFT.NASDAQ"), "US");
    EXPECT_EQ(infer_market("600519.SH"), "CN");
    EXPECT_EQ(infer_market("000001.SZ"), "CN");
    EXPECT_EQ(infer_market("D05.SG"), "SG");
}

TEST(MarketTest, BareCodesFollowTheirShape) {
    EXPECT_EQ(infer_market("0700"), "HK");
    EXPECT_EQ(infer_market("00005"), "HK");
    EXPECT_EQ(infer_market("AAPL"), "US");
    EXPECT_EQ(infer_market("600519"), "CN");
    EXPECT_EQ(infer_market("300750"), "CN");
    EXPECT_EQ(infer_market("900001"), "UNKNOWN");
    EXPECT_EQ(infer_market("BTC-USDT"), "UNKNOWN");
    EXPECT_EQ(infer_market(""), "UNKNOWN");
}

TEST(MarketTest, DistributionCountsEveryMarket) {
    const auto counts = market_distribution({"0700", "00005.HK", "AAPL", "600519"});
    EXPECT_EQ(counts.at("HK"), 2u);
    EXPECT_EQ(counts.at("US"), 1u);
    EXPECT_EQ(counts.at("CN"), 1u);
}

TEST(MarketTest, DominantMarketPicksProvider) {
    const std::map<std::string, std::string> providers{{"HK", "longport"}, {"US", "itick"}};
    EXPECT_EQ(default_provider_for({"AAPL", "TSLA", "0700"}, providers, "fallback"), "itick");
    EXPECT_EQ(default_provider_for({"0700"}, providers, "fallback"), "longport");
    EXPECT_EQ(default_provider_for({"600519"}, providers, "fallback"), "fallback");
    EXPECT_EQ(default_provider_for({}, providers, "fallback"), "fallback");
}
