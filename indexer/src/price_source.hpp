#pragma once
#include <string>
#include <unordered_map>
#include <vector>

// External USD price feed keyed by the provider's asset ids
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // One batched request. Throws TransientUpstreamError on any failure.
    virtual std::unordered_map<std::string, double> fetch_usd_prices(const std::vector<std::string>& ids) = 0;
};
