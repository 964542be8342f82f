#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Read port over the curated wallet list. The indexer reads it once at start.
class WalletRegistry {
public:
    virtual ~WalletRegistry() = default;

    virtual std::vector<Wallet> get_wallets(Chain chain) const = 0;
};

// Wallets keyed by (chain, lowercase address)
class InMemoryWalletRegistry : public WalletRegistry {
public:
    InMemoryWalletRegistry() = default;

    // Stamps added_at; replaces an existing entry with the same key
    Wallet add_wallet(const Wallet& wallet);
    bool remove_wallet(Chain chain, const std::string& address);

    std::optional<Wallet> get_wallet(Chain chain, const std::string& address) const;
    bool is_tracked(Chain chain, const std::string& address) const;

    std::vector<Wallet> get_wallets(Chain chain) const override;
    std::vector<Wallet> get_all_wallets() const;
    std::vector<std::string> get_addresses(Chain chain) const;
    size_t size() const;

    void seed_default_wallets();

    // JSON array of {address, chain, label?, source?, tags?}.
    // Returns the number of wallets loaded; throws ConfigurationError on a bad file.
    size_t load_from_file(const std::string& path);

private:
    static std::string make_key(Chain chain, const std::string& address);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Wallet> wallets_;
};
