#include "price_oracle.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace {

const std::unordered_map<std::string, std::string> kSymbolToCoinGecko = {
    {"ETH", "ethereum"},
    {"WETH", "ethereum"},
    {"BTC", "bitcoin"},
    {"WBTC", "wrapped-bitcoin"},
    {"USDC", "usd-coin"},
    {"USDT", "tether"},
    {"DAI", "dai"},
    {"LINK", "chainlink"},
    {"UNI", "uniswap"},
    {"AAVE", "aave"},
    {"MKR", "maker"},
    {"SNX", "synthetix-network-token"},
    {"COMP", "compound-governance-token"},
    {"CRV", "curve-dao-token"},
    {"LDO", "lido-dao"},
    {"RPL", "rocket-pool"},
    {"ARB", "arbitrum"},
    {"OP", "optimism"},
    {"MATIC", "matic-network"},
    {"SOL", "solana"},
};

const std::unordered_set<std::string> kStablecoins = {
    "USDC", "USDT", "DAI", "BUSD", "TUSD", "FRAX"
};

} // namespace

PriceOracle::PriceOracle(std::shared_ptr<PriceSource> source, std::chrono::milliseconds cache_ttl)
    : source_(std::move(source)), cache_ttl_(cache_ttl) {}

double PriceOracle::get_price(const std::string& symbol) {
    auto prices = get_prices({symbol});
    auto it = prices.find(util::to_upper(symbol));
    return it != prices.end() ? it->second : 0.0;
}

std::unordered_map<std::string, double> PriceOracle::get_prices(const std::vector<std::string>& symbols) {
    std::unordered_map<std::string, double> result;
    std::vector<std::string> symbols_to_fetch;
    auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& symbol : symbols) {
            std::string upper = util::to_upper(symbol);

            if (kStablecoins.count(upper)) {
                result[upper] = 1.0;
                continue;
            }

            auto cached = cache_.find(upper);
            if (cached != cache_.end() && now - cached->second.fetched_at < cache_ttl_) {
                result[upper] = cached->second.price;
                continue;
            }

            if (kSymbolToCoinGecko.count(upper)) {
                if (std::find(symbols_to_fetch.begin(), symbols_to_fetch.end(), upper) == symbols_to_fetch.end()) {
                    symbols_to_fetch.push_back(upper);
                }
            } else {
                result[upper] = 0.0;
            }
        }
    }

    if (symbols_to_fetch.empty()) {
        return result;
    }

    std::vector<std::string> unique_ids;
    for (const auto& symbol : symbols_to_fetch) {
        const auto& id = kSymbolToCoinGecko.at(symbol);
        if (std::find(unique_ids.begin(), unique_ids.end(), id) == unique_ids.end()) {
            unique_ids.push_back(id);
        }
    }

    try {
        auto fetched = source_->fetch_usd_prices(unique_ids);
        auto fetched_at = std::chrono::steady_clock::now();

        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& symbol : symbols_to_fetch) {
            auto it = fetched.find(kSymbolToCoinGecko.at(symbol));
            double price = it != fetched.end() ? it->second : 0.0;

            result[symbol] = price;
            cache_[symbol] = {price, fetched_at};
        }
    } catch (const std::exception& e) {
        spdlog::warn("Price fetch failed, serving cached prices: {}", e.what());

        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& symbol : symbols_to_fetch) {
            auto cached = cache_.find(symbol);
            result[symbol] = cached != cache_.end() ? cached->second.price : 0.0;
        }
    }

    return result;
}

void PriceOracle::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

bool PriceOracle::is_stablecoin(const std::string& symbol) {
    return kStablecoins.count(util::to_upper(symbol)) > 0;
}

std::string PriceOracle::asset_id_for(const std::string& symbol) {
    auto it = kSymbolToCoinGecko.find(util::to_upper(symbol));
    return it != kSymbolToCoinGecko.end() ? it->second : std::string();
}
