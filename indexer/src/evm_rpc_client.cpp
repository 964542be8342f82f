#include "evm_rpc_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

EvmRpcClient::EvmRpcClient(const std::string& rpc_url, int timeout_ms)
    : rpc_url_(rpc_url), timeout_ms_(timeout_ms) {
    if (rpc_url_.empty()) {
        throw ConfigurationError("EVM RPC endpoint is required");
    }
    spdlog::info("EVM RPC client configured for {}", rpc_url_);
}

int64_t EvmRpcClient::get_current_block_height() {
    auto result = call("eth_blockNumber", nlohmann::json::array());
    try {
        return util::parse_hex_quantity(result.get<std::string>());
    } catch (const std::exception& e) {
        throw TransientUpstreamError(std::string("Malformed eth_blockNumber result: ") + e.what());
    }
}

ChainBlock EvmRpcClient::get_block_with_transactions(int64_t height) {
    auto params = nlohmann::json::array({fmt::format("0x{:x}", height), true});
    auto result = call("eth_getBlockByNumber", params);

    if (result.is_null()) {
        throw TransientUpstreamError(fmt::format("Block {} not available yet", height));
    }

    return parse_block(result);
}

ChainBlock EvmRpcClient::parse_block(const nlohmann::json& block) {
    try {
        ChainBlock parsed;
        parsed.number = util::parse_hex_quantity(block.at("number").get<std::string>());
        parsed.timestamp = util::parse_hex_quantity(block.at("timestamp").get<std::string>());

        for (const auto& tx : block.at("transactions")) {
            // Hash-only entries mean the node ignored the full-transactions flag
            if (!tx.is_object()) {
                throw TransientUpstreamError("Block returned without full transaction objects");
            }

            ChainTransaction transaction;
            transaction.hash = tx.at("hash").get<std::string>();
            transaction.from = tx.at("from").get<std::string>();
            if (tx.contains("to") && tx.at("to").is_string()) {
                transaction.to = tx.at("to").get<std::string>();
            }
            transaction.value = util::hex_to_decimal(tx.at("value").get<std::string>());
            transaction.block_number = tx.contains("blockNumber") && tx.at("blockNumber").is_string()
                ? util::parse_hex_quantity(tx.at("blockNumber").get<std::string>())
                : parsed.number;

            parsed.transactions.push_back(std::move(transaction));
        }

        return parsed;
    } catch (const TransientUpstreamError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransientUpstreamError(std::string("Malformed block: ") + e.what());
    }
}

nlohmann::json EvmRpcClient::call(const std::string& method, const nlohmann::json& params) {
    nlohmann::json rpc_request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    auto response = cpr::Post(
        cpr::Url{rpc_url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{rpc_request.dump()},
        cpr::Timeout{timeout_ms_}
    );

    if (response.error) {
        throw TransientUpstreamError(fmt::format("RPC {} failed: {}", method, response.error.message));
    }

    if (response.status_code != 200) {
        throw TransientUpstreamError(fmt::format("RPC {} returned status {}", method, response.status_code));
    }

    nlohmann::json json_response;
    try {
        json_response = nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransientUpstreamError(fmt::format("RPC {} returned invalid JSON: {}", method, e.what()));
    }

    if (json_response.contains("error")) {
        throw TransientUpstreamError(fmt::format("RPC {} error: {}", method, json_response["error"].dump()));
    }

    if (!json_response.contains("result")) {
        throw TransientUpstreamError(fmt::format("RPC {} response has no result", method));
    }

    return json_response["result"];
}
