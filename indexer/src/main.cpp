#include "coingecko_client.hpp"
#include "config.hpp"
#include "event_store.hpp"
#include "evm_rpc_client.hpp"
#include "health.hpp"
#include "indexer.hpp"
#include "price_oracle.hpp"
#include "wallet_registry.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

} // namespace

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        config.validate();

        // 3. Register signal handlers for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // 4. Wire up the pipeline
        auto wallet_registry = std::make_shared<InMemoryWalletRegistry>();
        if (config.wallets_file.empty()) {
            wallet_registry->seed_default_wallets();
        } else {
            wallet_registry->load_from_file(config.wallets_file);
        }

        auto chain_client = std::make_shared<EvmRpcClient>(config.rpc_url(), config.http_timeout_ms);
        auto price_oracle = std::make_unique<PriceOracle>(
            std::make_shared<CoinGeckoClient>(config),
            std::chrono::milliseconds(config.price_cache_ttl_ms));
        if (config.db_path != ":memory:") {
            auto db_dir = std::filesystem::path(config.db_path).parent_path();
            if (!db_dir.empty()) {
                std::filesystem::create_directories(db_dir);
            }
        }
        auto event_store = std::make_shared<EventStore>(config.db_path);

        Indexer indexer(config, chain_client, wallet_registry, std::move(price_oracle), event_store);
        HealthServer health_server(config, indexer, *event_store);

        // 5. Run until signalled
        indexer.start();
        health_server.start();

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown signal received, stopping...");
        health_server.stop();
        indexer.stop();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Whale indexer has shut down gracefully.");
    return 0;
}
