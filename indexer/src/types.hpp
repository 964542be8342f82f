#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

enum class Chain {
    Ethereum,
    Solana,
    Base
};

enum class Significance {
    Low = 1,
    Medium = 2,
    High = 3
};

enum class EventType {
    TransferIn,
    TransferOut,
    Swap
};

struct Wallet {
    std::string address;
    Chain chain = Chain::Ethereum;
    std::optional<std::string> label;
    std::vector<std::string> tags;
    std::optional<std::string> source;   // e.g. "arkham", "manual"
    int64_t added_at = 0;                // Unix ms
};

// Immutable snapshot of one on-chain value movement
struct Transfer {
    std::string hash;
    Chain chain = Chain::Ethereum;
    std::string from;
    std::string to;
    std::string value;                   // raw native units (wei, lamports) in base 10
    double value_usd = 0.0;
    std::string token = "native";        // token address or "native"
    std::optional<std::string> token_symbol;
    int64_t block_number = 0;
    int64_t timestamp = 0;               // chain time, Unix seconds
};

struct WhaleEvent {
    std::string id;
    EventType type = EventType::TransferIn;
    std::string wallet;
    std::optional<std::string> wallet_label;
    Chain chain = Chain::Ethereum;
    Transfer transfer;
    Significance significance = Significance::Low;
    int64_t created_at = 0;              // processing time, Unix ms
};

struct Thresholds {
    double high = 1000000.0;
    double medium = 100000.0;
    double low = 10000.0;                // also the minimum admission bar
};

std::string to_string(Chain chain);
Chain parse_chain(const std::string& name);
std::string native_symbol(Chain chain);
int native_decimals(Chain chain);

std::string to_string(Significance significance);
Significance parse_significance(const std::string& name);
int significance_rank(Significance significance);

std::string to_string(EventType type);
EventType parse_event_type(const std::string& name);
