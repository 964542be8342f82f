#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

HealthServer::HealthServer(const Config& config, const Indexer& indexer, const EventStore& event_store)
    : config_(config),
      indexer_(indexer),
      event_store_(event_store),
      server_(std::make_unique<httplib::Server>()) {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        bool healthy = false;
        std::string body = status_json(healthy);
        res.status = healthy ? 200 : 503;
        res.set_content(body, "application/json");
    });
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    if (config_.health_port == 0) {
        port_ = server_->bind_to_any_port(config_.health_host.c_str());
    } else if (server_->bind_to_port(config_.health_host.c_str(), config_.health_port)) {
        port_ = config_.health_port;
    } else {
        port_ = -1;
    }

    if (port_ <= 0) {
        spdlog::error("Health check server failed to bind {}:{}", config_.health_host, config_.health_port);
        running_ = false;
        port_ = 0;
        return;
    }

    server_thread_ = std::thread([this]() {
        spdlog::info("Health check server listening on {}:{}", config_.health_host, port_);
        server_->listen_after_bind();
    });

    // Server::stop() is a no-op until the listen loop is running
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (!server_->is_running()) {
        spdlog::warn("Health check server on port {} did not report ready", port_);
    }
}

void HealthServer::stop() {
    if (running_.exchange(false)) {
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Health check server stopped");
    }
}

bool HealthServer::is_running() const {
    return running_;
}

int HealthServer::port() const {
    return port_;
}

std::string HealthServer::status_json(bool& healthy) const {
    bool indexer_running = indexer_.state() == Indexer::State::Running;
    bool db_healthy = event_store_.is_healthy();
    healthy = indexer_running && db_healthy;

    nlohmann::json health_status;
    health_status["service"] = config_.service_name;
    health_status["status"] = healthy ? "healthy" : "unhealthy";
    health_status["timestamp"] = util::current_iso8601();
    health_status["chain"] = to_string(indexer_.chain());

    health_status["indexer"]["state"] = indexer_running ? "running" : "stopped";
    health_status["indexer"]["last_block"] = indexer_.last_block();
    health_status["indexer"]["tracked_wallets"] = indexer_.tracked_wallet_count();
    health_status["indexer"]["native_price_usd"] = indexer_.native_price();
    health_status["indexer"]["events_written"] = indexer_.events_written();

    health_status["components"]["database"] = db_healthy ? "healthy" : "unhealthy";

    return health_status.dump(2);
}
