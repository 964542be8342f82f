#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct QueryFilter {
    std::optional<Chain> chain;
    std::optional<Significance> min_significance;   // inclusive
    int limit = 100;
    std::optional<std::string> cursor;              // exclusive upper bound on created_at
};

struct QueryResult {
    std::vector<WhaleEvent> events;                 // created_at descending
    std::optional<std::string> next_cursor;         // set when another page exists
};

struct EventStats {
    size_t total = 0;
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
};

// SQLite-backed store of whale events. One writer and any number of readers
// may share the database file; each EventStore instance owns one connection.
class EventStore {
public:
    explicit EventStore(const std::string& db_path = ":memory:");
    ~EventStore();

    // Upsert keyed by event.id. Throws ValidationError or StorageError.
    void insert(const WhaleEvent& event);

    QueryResult query(const QueryFilter& filter = QueryFilter{});
    std::vector<WhaleEvent> get_by_wallet(const std::string& wallet, int limit = 50);

    // Tally of the most recent n events by significance
    EventStats recent_stats(int n = 100);

    bool is_healthy() const;
    bool is_open() const;
    void close();

    // Non-copyable
    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
