#include "whale_event.hpp"
#include "util.hpp"

Significance classify_significance(double value_usd, const Thresholds& thresholds) {
    if (value_usd >= thresholds.high) return Significance::High;
    if (value_usd >= thresholds.medium) return Significance::Medium;
    return Significance::Low;
}

std::string generate_event_id(const Transfer& transfer, const std::string& wallet) {
    return to_string(transfer.chain) + ":" + transfer.hash + ":" + util::to_lower(wallet);
}

WhaleEvent create_event(const Transfer& transfer,
                        const std::string& wallet,
                        const std::optional<std::string>& wallet_label,
                        EventType type,
                        const Thresholds& thresholds,
                        int64_t created_at_ms) {
    WhaleEvent event;
    event.id = generate_event_id(transfer, wallet);
    event.type = type;
    event.wallet = util::to_lower(wallet);
    event.wallet_label = wallet_label;
    event.chain = transfer.chain;
    event.transfer = transfer;
    event.significance = classify_significance(transfer.value_usd, thresholds);
    event.created_at = created_at_ms;
    return event;
}

WhaleEvent create_event(const Transfer& transfer,
                        const std::string& wallet,
                        const std::optional<std::string>& wallet_label,
                        EventType type,
                        const Thresholds& thresholds) {
    return create_event(transfer, wallet, wallet_label, type, thresholds, util::now_ms());
}

nlohmann::json transfer_to_json(const Transfer& transfer) {
    nlohmann::json j;
    j["hash"] = transfer.hash;
    j["chain"] = to_string(transfer.chain);
    j["from"] = transfer.from;
    j["to"] = transfer.to;
    j["value"] = transfer.value;
    j["valueUsd"] = transfer.value_usd;
    j["token"] = transfer.token;
    if (transfer.token_symbol) {
        j["tokenSymbol"] = *transfer.token_symbol;
    }
    j["blockNumber"] = transfer.block_number;
    j["timestamp"] = transfer.timestamp;
    return j;
}

Transfer transfer_from_json(const nlohmann::json& j) {
    Transfer transfer;
    transfer.hash = j.at("hash").get<std::string>();
    transfer.chain = parse_chain(j.at("chain").get<std::string>());
    transfer.from = j.value("from", "");
    transfer.to = j.value("to", "");
    transfer.value = j.value("value", "0");
    transfer.value_usd = j.value("valueUsd", 0.0);
    transfer.token = j.value("token", "native");
    if (j.contains("tokenSymbol") && j.at("tokenSymbol").is_string()) {
        transfer.token_symbol = j.at("tokenSymbol").get<std::string>();
    }
    transfer.block_number = j.value("blockNumber", int64_t{0});
    transfer.timestamp = j.value("timestamp", int64_t{0});
    return transfer;
}
