#include "fakes.hpp"
#include "price_oracle.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

class PriceOracleTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<FakePriceSource>();
        source_->set_price("ethereum", 3000.0);
        source_->set_price("bitcoin", 60000.0);
    }

    std::shared_ptr<FakePriceSource> source_;
};

TEST_F(PriceOracleTest, StablecoinsAreOneWithoutNetwork) {
    PriceOracle oracle(source_);
    source_->set_fail(true);

    EXPECT_DOUBLE_EQ(oracle.get_price("USDC"), 1.0);
    EXPECT_DOUBLE_EQ(oracle.get_price("usdt"), 1.0);
    EXPECT_DOUBLE_EQ(oracle.get_price("Dai"), 1.0);
    EXPECT_EQ(source_->calls(), 0);
    EXPECT_TRUE(PriceOracle::is_stablecoin("frax"));
}

TEST_F(PriceOracleTest, FreshCacheHitSkipsFetch) {
    PriceOracle oracle(source_, 60s);

    EXPECT_DOUBLE_EQ(oracle.get_price("ETH"), 3000.0);
    EXPECT_DOUBLE_EQ(oracle.get_price("eth"), 3000.0);
    EXPECT_EQ(source_->calls(), 1);
}

TEST_F(PriceOracleTest, StaleEntryIsRefetched) {
    PriceOracle oracle(source_, 20ms);

    EXPECT_DOUBLE_EQ(oracle.get_price("ETH"), 3000.0);
    source_->set_price("ethereum", 3100.0);
    std::this_thread::sleep_for(40ms);

    EXPECT_DOUBLE_EQ(oracle.get_price("ETH"), 3100.0);
    EXPECT_EQ(source_->calls(), 2);
}

TEST_F(PriceOracleTest, UnmappedSymbolIsZeroWithoutNetwork) {
    PriceOracle oracle(source_);

    EXPECT_DOUBLE_EQ(oracle.get_price("NOTACOIN"), 0.0);
    EXPECT_EQ(source_->calls(), 0);
    EXPECT_TRUE(PriceOracle::asset_id_for("NOTACOIN").empty());
    EXPECT_EQ(PriceOracle::asset_id_for("weth"), "ethereum");
}

TEST_F(PriceOracleTest, BatchesAndDeduplicatesIds) {
    PriceOracle oracle(source_);

    auto prices = oracle.get_prices({"eth", "WETH", "BTC", "USDC", "NOTACOIN"});

    EXPECT_EQ(source_->calls(), 1);
    auto ids = source_->last_ids();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"bitcoin", "ethereum"}));

    EXPECT_DOUBLE_EQ(prices.at("ETH"), 3000.0);
    EXPECT_DOUBLE_EQ(prices.at("WETH"), 3000.0);
    EXPECT_DOUBLE_EQ(prices.at("BTC"), 60000.0);
    EXPECT_DOUBLE_EQ(prices.at("USDC"), 1.0);
    EXPECT_DOUBLE_EQ(prices.at("NOTACOIN"), 0.0);
}

TEST_F(PriceOracleTest, FailureServesCachedOrZeroWithoutThrowing) {
    PriceOracle oracle(source_, 0ms);

    EXPECT_DOUBLE_EQ(oracle.get_price("ETH"), 3000.0);

    source_->set_fail(true);
    std::unordered_map<std::string, double> prices;
    EXPECT_NO_THROW(prices = oracle.get_prices({"ETH", "BTC"}));

    EXPECT_DOUBLE_EQ(prices.at("ETH"), 3000.0);
    EXPECT_DOUBLE_EQ(prices.at("BTC"), 0.0);
}

TEST_F(PriceOracleTest, FailureDoesNotCacheZero) {
    PriceOracle oracle(source_, 60s);
    source_->set_fail(true);

    EXPECT_DOUBLE_EQ(oracle.get_price("BTC"), 0.0);
    EXPECT_EQ(source_->calls(), 1);

    // No fresh entry was written, so the next call goes back to the source
    source_->set_fail(false);
    EXPECT_DOUBLE_EQ(oracle.get_price("BTC"), 60000.0);
    EXPECT_EQ(source_->calls(), 2);
}

TEST_F(PriceOracleTest, MissingIdInResponseIsCachedAsZero) {
    PriceOracle oracle(source_, 60s);

    EXPECT_DOUBLE_EQ(oracle.get_price("LINK"), 0.0);
    EXPECT_DOUBLE_EQ(oracle.get_price("LINK"), 0.0);
    EXPECT_EQ(source_->calls(), 1);
}

TEST_F(PriceOracleTest, ClearCacheForcesRefetch) {
    PriceOracle oracle(source_, 60s);

    oracle.get_price("ETH");
    oracle.clear_cache();
    oracle.get_price("ETH");

    EXPECT_EQ(source_->calls(), 2);
}
