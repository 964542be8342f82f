#pragma once
#include "config.hpp"
#include "event_store.hpp"
#include "indexer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

// Serves GET /health on its own thread
class HealthServer {
public:
    HealthServer(const Config& config, const Indexer& indexer, const EventStore& event_store);
    ~HealthServer();

    // Returns once the listener accepts connections. Port 0 binds
    // any free port; port() reports the bound one.
    void start();
    void stop();
    bool is_running() const;
    int port() const;

    // Body served by /health; also used to pick the status code
    std::string status_json(bool& healthy) const;

    // Non-copyable
    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

private:
    Config config_;
    const Indexer& indexer_;
    const EventStore& event_store_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    int port_ = 0;
};
