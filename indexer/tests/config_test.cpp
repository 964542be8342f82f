#include "config.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <vector>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVars) {
            unsetenv(name);
        }
    }

    static constexpr const char* kVars[] = {
        "SERVICE_NAME", "LOG_LEVEL", "CHAIN", "ETH_RPC_URL", "BASE_RPC_URL", "DB_PATH",
        "WALLETS_FILE", "POLL_INTERVAL_MS", "PRICE_REFRESH_POLLS", "NATIVE_PRICE_FALLBACK",
        "THRESHOLD_HIGH", "THRESHOLD_MEDIUM", "THRESHOLD_LOW", "MIN_VALUE_USD",
        "PRICE_API_URL", "PRICE_API_KEY", "PRICE_CACHE_TTL_MS", "HTTP_TIMEOUT_MS",
        "HEALTH_HOST", "HEALTH_PORT",
    };
};

TEST_F(ConfigTest, Defaults) {
    Config config = Config::from_env();

    EXPECT_EQ(config.chain, "ethereum");
    EXPECT_EQ(config.chain_id(), Chain::Ethereum);
    EXPECT_EQ(config.poll_interval_ms, 15000);
    EXPECT_EQ(config.health_port, 8083);
    EXPECT_DOUBLE_EQ(config.thresholds.high, 1000000.0);
    EXPECT_DOUBLE_EQ(config.thresholds.medium, 100000.0);
    EXPECT_DOUBLE_EQ(config.thresholds.low, 10000.0);
    EXPECT_DOUBLE_EQ(config.min_value_usd, 10000.0);
    EXPECT_EQ(config.rpc_url(), config.eth_rpc_url);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ReadsOverrides) {
    setenv("CHAIN", "base", 1);
    setenv("BASE_RPC_URL", "http://localhost:8545", 1);
    setenv("POLL_INTERVAL_MS", "2000", 1);
    setenv("THRESHOLD_LOW", "5000", 1);
    setenv("HEALTH_PORT", "9090", 1);

    Config config = Config::from_env();

    EXPECT_EQ(config.chain_id(), Chain::Base);
    EXPECT_EQ(config.rpc_url(), "http://localhost:8545");
    EXPECT_EQ(config.poll_interval_ms, 2000);
    EXPECT_DOUBLE_EQ(config.thresholds.low, 5000.0);
    EXPECT_DOUBLE_EQ(config.min_value_usd, 5000.0);   // follows the low threshold
    EXPECT_EQ(config.health_port, 9090);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, RejectsNonNumericValues) {
    setenv("POLL_INTERVAL_MS", "soon", 1);
    EXPECT_THROW(Config::from_env(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsUnorderedThresholds) {
    Config config;
    config.thresholds.medium = 2000000.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsMinimumBelowLowThreshold) {
    Config config;
    config.min_value_usd = 500.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsBadPolling) {
    Config config;
    config.poll_interval_ms = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.price_refresh_polls = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, SolanaHasNoEndpoint) {
    Config config;
    config.chain = "solana";
    EXPECT_EQ(config.chain_id(), Chain::Solana);
    EXPECT_THROW(config.rpc_url(), ConfigurationError);
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsUnknownChain) {
    Config config;
    config.chain = "dogechain";
    EXPECT_THROW(config.chain_id(), ConfigurationError);
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsEmptyEndpoint) {
    Config config;
    config.eth_rpc_url.clear();
    EXPECT_THROW(config.validate(), ConfigurationError);
}
