#pragma once
#include "config.hpp"
#include "price_source.hpp"
#include <string>
#include <unordered_map>
#include <vector>

class CoinGeckoClient : public PriceSource {
public:
    explicit CoinGeckoClient(const Config& config);

    std::unordered_map<std::string, double> fetch_usd_prices(const std::vector<std::string>& ids) override;

    // Decodes a /simple/price body. Throws TransientUpstreamError on malformed JSON.
    static std::unordered_map<std::string, double> parse_prices(const std::string& body,
                                                                const std::vector<std::string>& ids);

private:
    std::string base_url_;
    std::string api_key_;
    int timeout_ms_;
};
