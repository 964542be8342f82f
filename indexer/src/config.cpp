#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "whale-indexer");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // Chain
    config.chain = get_env_var("CHAIN", "ethereum");
    config.eth_rpc_url = get_env_var("ETH_RPC_URL", "https://eth.drpc.org");
    config.base_rpc_url = get_env_var("BASE_RPC_URL", "https://mainnet.base.org");

    // Storage
    config.db_path = get_env_var("DB_PATH", "./data/whale-events.db");
    config.wallets_file = get_env_var("WALLETS_FILE");

    // Polling
    config.poll_interval_ms = get_env_int("POLL_INTERVAL_MS", 15000);
    config.price_refresh_polls = get_env_int("PRICE_REFRESH_POLLS", 10);
    config.native_price_fallback = get_env_double("NATIVE_PRICE_FALLBACK", 3200.0);

    // Thresholds
    config.thresholds.high = get_env_double("THRESHOLD_HIGH", 1000000.0);
    config.thresholds.medium = get_env_double("THRESHOLD_MEDIUM", 100000.0);
    config.thresholds.low = get_env_double("THRESHOLD_LOW", 10000.0);
    config.min_value_usd = get_env_double("MIN_VALUE_USD", config.thresholds.low);

    // Price API
    config.price_api_url = get_env_var("PRICE_API_URL", "https://api.coingecko.com/api/v3");
    config.price_api_key = get_env_var("PRICE_API_KEY");
    config.price_cache_ttl_ms = get_env_int("PRICE_CACHE_TTL_MS", 60000);
    config.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", 0);

    // Health
    config.health_host = get_env_var("HEALTH_HOST", "0.0.0.0");
    config.health_port = get_env_int("HEALTH_PORT", 8083);

    return config;
}

void Config::validate() const {
    if (thresholds.low <= 0.0) {
        throw ConfigurationError("THRESHOLD_LOW must be positive");
    }

    if (thresholds.medium < thresholds.low || thresholds.high < thresholds.medium) {
        throw ConfigurationError("Thresholds must satisfy high >= medium >= low");
    }

    if (min_value_usd < thresholds.low) {
        throw ConfigurationError("MIN_VALUE_USD cannot be below THRESHOLD_LOW");
    }

    if (poll_interval_ms < 1) {
        throw ConfigurationError("POLL_INTERVAL_MS must be at least 1");
    }

    if (price_refresh_polls < 1) {
        throw ConfigurationError("PRICE_REFRESH_POLLS must be at least 1");
    }

    if (price_cache_ttl_ms < 0 || http_timeout_ms < 0) {
        throw ConfigurationError("Cache TTL and HTTP timeout cannot be negative");
    }

    if (native_price_fallback < 0.0) {
        throw ConfigurationError("NATIVE_PRICE_FALLBACK cannot be negative");
    }

    if (db_path.empty()) {
        throw ConfigurationError("DB_PATH cannot be empty");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw ConfigurationError("HEALTH_PORT must be between 1 and 65535");
    }

    // Refuse to run against a missing endpoint
    rpc_url();

    spdlog::info("Configuration validated successfully");
}

Chain Config::chain_id() const {
    return parse_chain(chain);
}

std::string Config::rpc_url() const {
    std::string url;
    switch (chain_id()) {
        case Chain::Ethereum: url = eth_rpc_url; break;
        case Chain::Base:     url = base_rpc_url; break;
        case Chain::Solana:   break;
    }

    if (url.empty()) {
        throw ConfigurationError("No RPC endpoint configured for chain " + chain);
    }
    return url;
}
