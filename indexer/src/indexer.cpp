#include "indexer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "whale_event.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

Indexer::Indexer(const Config& config,
                 std::shared_ptr<ChainClient> chain_client,
                 std::shared_ptr<WalletRegistry> wallet_registry,
                 std::unique_ptr<PriceOracle> price_oracle,
                 std::shared_ptr<EventStore> event_store)
    : config_(config),
      chain_(config.chain_id()),
      chain_client_(std::move(chain_client)),
      wallet_registry_(std::move(wallet_registry)),
      price_oracle_(std::move(price_oracle)),
      event_store_(std::move(event_store)) {
    if (!chain_client_ || !wallet_registry_ || !price_oracle_ || !event_store_) {
        throw std::invalid_argument("Indexer requires a chain client, wallet registry, price oracle and event store");
    }
    if (config_.price_refresh_polls < 1) {
        throw ConfigurationError("PRICE_REFRESH_POLLS must be at least 1");
    }
}

Indexer::~Indexer() {
    stop();
}

void Indexer::start() {
    std::lock_guard<std::mutex> lock(poll_mutex_);

    if (running_) {
        spdlog::warn("Indexer for {} is already running", to_string(chain_));
        return;
    }

    if (!event_store_->is_open()) {
        throw StorageError("Cannot start indexer: event store is closed");
    }

    spdlog::info("Indexer starting for {}", to_string(chain_));

    update_native_price();

    // Wallets added to the registry after this point are not picked up
    wallet_map_.clear();
    for (const auto& wallet : wallet_registry_->get_wallets(chain_)) {
        wallet_map_[util::to_lower(wallet.address)] = wallet;
    }
    tracked_wallets_ = wallet_map_.size();
    spdlog::info("Tracking {} wallets", wallet_map_.size());

    last_block_ = chain_client_->get_current_block_height();
    spdlog::info("Starting from block {}", last_block_.load());

    {
        std::lock_guard<std::mutex> wait_lock(wait_mutex_);
        running_ = true;
    }
    worker_ = std::thread(&Indexer::run_loop, this);
}

void Indexer::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> wait_lock(wait_mutex_);
        was_running = running_.exchange(false);
    }
    wait_cv_.notify_all();

    {
        // An in-flight poll finishes before the store goes away
        std::lock_guard<std::mutex> lock(poll_mutex_);
        event_store_->close();
    }

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    if (was_running) {
        spdlog::info("Indexer stopped at block {}", last_block_.load());
    }
}

void Indexer::poll() {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (!running_) {
        throw std::logic_error("Indexer is not running");
    }
    poll_blocks();
}

Indexer::State Indexer::state() const {
    return running_ ? State::Running : State::Stopped;
}

int64_t Indexer::last_block() const {
    return last_block_;
}

size_t Indexer::tracked_wallet_count() const {
    return tracked_wallets_;
}

double Indexer::native_price() const {
    return native_price_;
}

uint64_t Indexer::events_written() const {
    return events_written_;
}

Chain Indexer::chain() const {
    return chain_;
}

void Indexer::run_loop() {
    spdlog::info("Indexer poll loop started. Polling every {} ms.", config_.poll_interval_ms);

    uint64_t poll_count = 0;
    while (running_) {
        {
            std::unique_lock<std::mutex> wait_lock(wait_mutex_);
            wait_cv_.wait_for(wait_lock, std::chrono::milliseconds(config_.poll_interval_ms),
                              [this]() { return !running_; });
        }

        if (!running_) {
            break;
        }

        tick(++poll_count);
    }

    spdlog::info("Indexer poll loop finished.");
}

void Indexer::tick(uint64_t poll_count) {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (!running_) {
        return;
    }

    try {
        if (poll_count % static_cast<uint64_t>(config_.price_refresh_polls) == 0) {
            update_native_price();
        }
        poll_blocks();
    } catch (const std::exception& e) {
        // Retried from the same block on the next tick
        spdlog::error("Poll error at block {}: {}", last_block_.load() + 1, e.what());
    }
}

void Indexer::poll_blocks() {
    auto start_time = std::chrono::steady_clock::now();

    int64_t head = chain_client_->get_current_block_height();
    int64_t first = last_block_ + 1;

    if (head < first) {
        spdlog::debug("No new blocks (head {})", head);
        return;
    }

    spdlog::info("Checking blocks {} to {}", first, head);

    for (int64_t height = first; height <= head; ++height) {
        auto block = chain_client_->get_block_with_transactions(height);
        for (const auto& tx : block.transactions) {
            process_transaction(tx, block.timestamp);
        }
    }

    last_block_ = head;

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::debug("Processed {} blocks in {} ms", head - first + 1, duration);
}

void Indexer::process_transaction(const ChainTransaction& tx, int64_t block_timestamp) {
    std::string from = util::to_lower(tx.from);
    std::string to = util::to_lower(tx.to);

    auto from_it = from.empty() ? wallet_map_.end() : wallet_map_.find(from);
    auto to_it = to.empty() ? wallet_map_.end() : wallet_map_.find(to);
    const Wallet* from_wallet = from_it != wallet_map_.end() ? &from_it->second : nullptr;
    const Wallet* to_wallet = to_it != wallet_map_.end() ? &to_it->second : nullptr;

    if (!from_wallet && !to_wallet) {
        return;
    }

    double value_native;
    try {
        value_native = util::raw_units_to_double(tx.value, native_decimals(chain_));
    } catch (const std::invalid_argument& e) {
        throw TransientUpstreamError("Malformed value in transaction " + tx.hash + ": " + e.what());
    }

    double value_usd = value_native * native_price_;
    double min_value_usd = std::max(config_.min_value_usd, config_.thresholds.low);
    if (value_usd < min_value_usd) {
        spdlog::debug("Skipping {}: ${:.2f} below minimum", tx.hash, value_usd);
        return;
    }

    std::string symbol = native_symbol(chain_);

    Transfer transfer;
    transfer.hash = tx.hash;
    transfer.chain = chain_;
    transfer.from = tx.from;
    transfer.to = tx.to;
    transfer.value = tx.value;
    transfer.value_usd = value_usd;
    transfer.token = "native";
    transfer.token_symbol = symbol;
    transfer.block_number = tx.block_number;
    transfer.timestamp = block_timestamp;

    // Insert failures propagate so last_block cannot move past this block
    if (from_wallet) {
        auto event = create_event(transfer, from_wallet->address, from_wallet->label,
                                  EventType::TransferOut, config_.thresholds);
        event_store_->insert(event);
        ++events_written_;
        spdlog::info("Whale {} sent {:.2f} {} (${:.0f}, {})",
                     from_wallet->label.value_or(from_wallet->address), value_native, symbol,
                     value_usd, to_string(event.significance));
    }

    if (to_wallet) {
        auto event = create_event(transfer, to_wallet->address, to_wallet->label,
                                  EventType::TransferIn, config_.thresholds);
        event_store_->insert(event);
        ++events_written_;
        spdlog::info("Whale {} received {:.2f} {} (${:.0f}, {})",
                     to_wallet->label.value_or(to_wallet->address), value_native, symbol,
                     value_usd, to_string(event.significance));
    }
}

void Indexer::update_native_price() {
    std::string symbol = native_symbol(chain_);
    double price = price_oracle_->get_price(symbol);

    if (price > 0.0) {
        native_price_ = price;
        spdlog::info("{} price: ${:.2f}", symbol, price);
    } else if (native_price_ == 0.0) {
        native_price_ = config_.native_price_fallback;
        spdlog::warn("Could not fetch {} price, using fallback: ${:.2f}", symbol, config_.native_price_fallback);
    }
}
