#pragma once
#include "chain_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

// Ethereum JSON-RPC over HTTP (ethereum, base)
class EvmRpcClient : public ChainClient {
public:
    // Throws ConfigurationError on an empty endpoint
    EvmRpcClient(const std::string& rpc_url, int timeout_ms = 0);

    int64_t get_current_block_height() override;
    ChainBlock get_block_with_transactions(int64_t height) override;

    // Exposed for tests: decodes an eth_getBlockByNumber result
    static ChainBlock parse_block(const nlohmann::json& block);

private:
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    std::string rpc_url_;
    int timeout_ms_;
    std::atomic<int64_t> next_id_{1};
};
