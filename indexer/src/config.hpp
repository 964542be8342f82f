#pragma once
#include "types.hpp"
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "whale-indexer";
    std::string log_level = "info";

    // Chain access
    std::string chain = "ethereum";
    std::string eth_rpc_url = "https://eth.drpc.org";
    std::string base_rpc_url = "https://mainnet.base.org";

    // Storage
    std::string db_path = "./data/whale-events.db";

    // Wallet list (empty: built-in seed list)
    std::string wallets_file;

    // Polling
    int poll_interval_ms = 15000;
    int price_refresh_polls = 10;       // ~2.5 min at the default interval
    double native_price_fallback = 3200.0;

    // Significance thresholds (USD)
    Thresholds thresholds;
    double min_value_usd = 10000.0;

    // Price API
    std::string price_api_url = "https://api.coingecko.com/api/v3";
    std::string price_api_key;
    int price_cache_ttl_ms = 60000;

    // Outbound HTTP; 0 leaves calls unbounded
    int http_timeout_ms = 0;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8083;

    static Config from_env();
    void validate() const;

    Chain chain_id() const;
    // Throws ConfigurationError when the chain has no endpoint (solana has none)
    std::string rpc_url() const;
};
