#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"

std::string to_string(Chain chain) {
    switch (chain) {
        case Chain::Ethereum: return "ethereum";
        case Chain::Solana:   return "solana";
        case Chain::Base:     return "base";
    }
    return "unknown";
}

Chain parse_chain(const std::string& name) {
    std::string lowered = util::to_lower(name);
    if (lowered == "ethereum") return Chain::Ethereum;
    if (lowered == "solana")   return Chain::Solana;
    if (lowered == "base")     return Chain::Base;
    throw ConfigurationError("Unsupported chain: " + name);
}

std::string native_symbol(Chain chain) {
    return chain == Chain::Solana ? "SOL" : "ETH";
}

int native_decimals(Chain chain) {
    // lamports vs wei
    return chain == Chain::Solana ? 9 : 18;
}

std::string to_string(Significance significance) {
    switch (significance) {
        case Significance::Low:    return "low";
        case Significance::Medium: return "medium";
        case Significance::High:   return "high";
    }
    return "low";
}

Significance parse_significance(const std::string& name) {
    if (name == "low")    return Significance::Low;
    if (name == "medium") return Significance::Medium;
    if (name == "high")   return Significance::High;
    throw ValidationError("Unknown significance: " + name);
}

int significance_rank(Significance significance) {
    return static_cast<int>(significance);
}

std::string to_string(EventType type) {
    switch (type) {
        case EventType::TransferIn:  return "transfer_in";
        case EventType::TransferOut: return "transfer_out";
        case EventType::Swap:        return "swap";
    }
    return "transfer_in";
}

EventType parse_event_type(const std::string& name) {
    if (name == "transfer_in")  return EventType::TransferIn;
    if (name == "transfer_out") return EventType::TransferOut;
    if (name == "swap")         return EventType::Swap;
    throw ValidationError("Unknown event type: " + name);
}
