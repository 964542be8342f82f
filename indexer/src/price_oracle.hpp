#pragma once
#include "price_source.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// USD prices per asset symbol with a TTL cache in front of a PriceSource.
// Never throws on upstream failure; degrades to the last cached price or 0.
class PriceOracle {
public:
    explicit PriceOracle(std::shared_ptr<PriceSource> source,
                         std::chrono::milliseconds cache_ttl = std::chrono::seconds(60));

    double get_price(const std::string& symbol);

    // Keyed by the uppercased symbol
    std::unordered_map<std::string, double> get_prices(const std::vector<std::string>& symbols);

    void clear_cache();

    static bool is_stablecoin(const std::string& symbol);

    // CoinGecko id for a symbol, empty when unmapped
    static std::string asset_id_for(const std::string& symbol);

private:
    struct PriceCacheEntry {
        double price;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::shared_ptr<PriceSource> source_;
    std::chrono::milliseconds cache_ttl_;
    std::unordered_map<std::string, PriceCacheEntry> cache_;
    std::mutex cache_mutex_;
};
