#pragma once
#include "chain_client.hpp"
#include "config.hpp"
#include "event_store.hpp"
#include "price_oracle.hpp"
#include "types.hpp"
#include "wallet_registry.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

// Polls one chain for transfers touching tracked wallets and writes whale
// events. A single worker thread does all polling and processing in order.
class Indexer {
public:
    enum class State {
        Stopped,
        Running
    };

    Indexer(const Config& config,
            std::shared_ptr<ChainClient> chain_client,
            std::shared_ptr<WalletRegistry> wallet_registry,
            std::unique_ptr<PriceOracle> price_oracle,
            std::shared_ptr<EventStore> event_store);
    ~Indexer();

    // Snapshots the tracked wallets and the chain head, then starts the poll loop
    void start();

    // Waits for an in-flight poll, closes the store and joins the worker.
    // No block is fetched after this returns.
    void stop();

    // One poll iteration. Throws on failure; last_block() only advances
    // once the whole block range has been processed.
    void poll();

    State state() const;
    int64_t last_block() const;
    size_t tracked_wallet_count() const;
    double native_price() const;
    uint64_t events_written() const;
    Chain chain() const;

    // Non-copyable
    Indexer(const Indexer&) = delete;
    Indexer& operator=(const Indexer&) = delete;

private:
    void run_loop();
    void tick(uint64_t poll_count);
    void poll_blocks();
    void process_transaction(const ChainTransaction& tx, int64_t block_timestamp);
    void update_native_price();

    Config config_;
    Chain chain_;
    std::shared_ptr<ChainClient> chain_client_;
    std::shared_ptr<WalletRegistry> wallet_registry_;
    std::unique_ptr<PriceOracle> price_oracle_;
    std::shared_ptr<EventStore> event_store_;

    // Lowercase address -> wallet, taken once at start
    std::unordered_map<std::string, Wallet> wallet_map_;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> last_block_{0};
    std::atomic<double> native_price_{0.0};
    std::atomic<uint64_t> events_written_{0};
    std::atomic<size_t> tracked_wallets_{0};

    std::mutex poll_mutex_;          // held for the duration of one poll
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread worker_;
};
