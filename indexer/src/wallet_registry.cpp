#include "wallet_registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

Wallet InMemoryWalletRegistry::add_wallet(const Wallet& wallet) {
    Wallet full = wallet;
    full.added_at = util::now_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    wallets_[make_key(wallet.chain, wallet.address)] = full;
    return full;
}

bool InMemoryWalletRegistry::remove_wallet(Chain chain, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallets_.erase(make_key(chain, address)) > 0;
}

std::optional<Wallet> InMemoryWalletRegistry::get_wallet(Chain chain, const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = wallets_.find(make_key(chain, address));
    if (it == wallets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryWalletRegistry::is_tracked(Chain chain, const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallets_.count(make_key(chain, address)) > 0;
}

std::vector<Wallet> InMemoryWalletRegistry::get_wallets(Chain chain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Wallet> result;
    for (const auto& [key, wallet] : wallets_) {
        if (wallet.chain == chain) {
            result.push_back(wallet);
        }
    }
    return result;
}

std::vector<Wallet> InMemoryWalletRegistry::get_all_wallets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Wallet> result;
    result.reserve(wallets_.size());
    for (const auto& [key, wallet] : wallets_) {
        result.push_back(wallet);
    }
    return result;
}

std::vector<std::string> InMemoryWalletRegistry::get_addresses(Chain chain) const {
    std::vector<std::string> addresses;
    for (const auto& wallet : get_wallets(chain)) {
        addresses.push_back(util::to_lower(wallet.address));
    }
    return addresses;
}

size_t InMemoryWalletRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallets_.size();
}

void InMemoryWalletRegistry::seed_default_wallets() {
    // Well-known Ethereum whales
    const std::vector<Wallet> defaults = {
        {"0xd8dA6BF26964aF9D7eEd9e03E53415D37aA96045", Chain::Ethereum, "Vitalik Buterin",
         {"founder", "influencer"}, "manual", 0},
        {"0x47ac0Fb4F2D84898e4D9E7b4DaB3C24507a6D503", Chain::Ethereum, "Binance",
         {"exchange", "cex"}, "arkham", 0},
        {"0x742d35Cc6634C0532925a3b844Bc9e7595f1b5E0", Chain::Ethereum, "Bitfinex",
         {"exchange", "cex"}, "arkham", 0},
        {"0xBE0eB53F46cd790Cd13851d5EFf43D12404d33E8", Chain::Ethereum, "Binance 7",
         {"exchange", "cex"}, "arkham", 0},
        {"0x8315177aB297bA92A06054cE80a67Ed4DBd7ed3a", Chain::Ethereum, "Arbitrum Bridge",
         {"bridge", "l2"}, "manual", 0},
    };

    for (const auto& wallet : defaults) {
        add_wallet(wallet);
    }
    spdlog::info("Seeded {} default wallets", defaults.size());
}

size_t InMemoryWalletRegistry::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open wallets file: " + path);
    }

    nlohmann::json entries;
    try {
        entries = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Invalid JSON in wallets file " + path + ": " + e.what());
    }

    if (!entries.is_array()) {
        throw ConfigurationError("Wallets file must contain a JSON array: " + path);
    }

    size_t loaded = 0;
    for (const auto& entry : entries) {
        try {
            Wallet wallet;
            wallet.address = entry.at("address").get<std::string>();
            wallet.chain = parse_chain(entry.value("chain", "ethereum"));
            if (entry.contains("label")) {
                wallet.label = entry.at("label").get<std::string>();
            }
            if (entry.contains("source")) {
                wallet.source = entry.at("source").get<std::string>();
            }
            if (entry.contains("tags")) {
                wallet.tags = entry.at("tags").get<std::vector<std::string>>();
            }
            if (wallet.address.empty()) {
                throw ConfigurationError("empty address");
            }
            add_wallet(wallet);
            ++loaded;
        } catch (const std::exception& e) {
            throw ConfigurationError("Invalid wallet entry in " + path + ": " + e.what());
        }
    }

    spdlog::info("Loaded {} wallets from {}", loaded, path);
    return loaded;
}

std::string InMemoryWalletRegistry::make_key(Chain chain, const std::string& address) {
    return to_string(chain) + ":" + util::to_lower(address);
}
