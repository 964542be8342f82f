#include "coingecko_client.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

CoinGeckoClient::CoinGeckoClient(const Config& config)
    : base_url_(config.price_api_url),
      api_key_(config.price_api_key),
      timeout_ms_(config.http_timeout_ms) {
    spdlog::info("CoinGecko client configured for {}", base_url_);
}

std::unordered_map<std::string, double> CoinGeckoClient::fetch_usd_prices(const std::vector<std::string>& ids) {
    std::unordered_map<std::string, double> prices;
    if (ids.empty()) {
        return prices;
    }

    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ",";
        joined += id;
    }

    cpr::Header headers{{"Accept", "application/json"}, {"User-Agent", "WhaleTracker/0.1"}};
    if (!api_key_.empty()) {
        headers["x-cg-demo-api-key"] = api_key_;
    }

    auto response = cpr::Get(
        cpr::Url{base_url_ + "/simple/price"},
        cpr::Parameters{{"ids", joined}, {"vs_currencies", "usd"}},
        headers,
        cpr::Timeout{timeout_ms_}
    );

    if (response.error) {
        throw TransientUpstreamError("CoinGecko request failed: " + response.error.message);
    }

    if (response.status_code != 200) {
        throw TransientUpstreamError("CoinGecko API error: " + std::to_string(response.status_code));
    }

    prices = parse_prices(response.text, ids);

    spdlog::debug("Fetched {} prices from CoinGecko", prices.size());
    return prices;
}

std::unordered_map<std::string, double> CoinGeckoClient::parse_prices(const std::string& body,
                                                                      const std::vector<std::string>& ids) {
    nlohmann::json json_res;
    try {
        json_res = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransientUpstreamError(std::string("Malformed CoinGecko response: ") + e.what());
    }

    if (!json_res.is_object()) {
        throw TransientUpstreamError("Malformed CoinGecko response: expected an object");
    }

    // Ids absent from the body, or without a numeric usd field, are left out
    std::unordered_map<std::string, double> prices;
    for (const auto& id : ids) {
        auto entry = json_res.find(id);
        if (entry == json_res.end() || !entry->is_object()) {
            continue;
        }
        auto usd = entry->find("usd");
        if (usd != entry->end() && usd->is_number()) {
            prices[id] = usd->get<double>();
        }
    }
    return prices;
}
