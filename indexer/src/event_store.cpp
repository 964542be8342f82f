#include "event_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "whale_event.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Bound in order by the query builder
struct BindValue {
    bool is_text;
    std::string text;
    int64_t integer;
};

} // namespace

class EventStore::Impl {
public:
    explicit Impl(const std::string& db_path) : db_path_(db_path), db_(nullptr) {
        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw StorageError("Cannot open event store at " + db_path_ + ": " + message);
        }

        // Readers in other processes keep working while the indexer writes
        sqlite3_busy_timeout(db_, 5000);
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
        create_tables();

        spdlog::info("Event store opened at: {}", db_path_);
    }

    ~Impl() {
        close();
    }

    void insert(const WhaleEvent& event) {
        if (event.id.empty()) {
            throw ValidationError("Event id is required");
        }
        if (event.wallet.empty()) {
            throw ValidationError("Event wallet is required");
        }
        if (event.transfer.hash.empty()) {
            throw ValidationError("Event transfer hash is required");
        }

        std::lock_guard<std::mutex> lock(db_mutex_);
        ensure_open();

        const char* sql =
            "INSERT OR REPLACE INTO events "
            "(id, type, wallet, wallet_label, chain, transfer_json, significance, significance_order, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
        Statement stmt = prepare(sql);

        std::string transfer_json = transfer_to_json(event.transfer).dump();

        bind_text(stmt.get(), 1, event.id);
        bind_text(stmt.get(), 2, to_string(event.type));
        bind_text(stmt.get(), 3, util::to_lower(event.wallet));
        if (event.wallet_label) {
            bind_text(stmt.get(), 4, *event.wallet_label);
        } else {
            sqlite3_bind_null(stmt.get(), 4);
        }
        bind_text(stmt.get(), 5, to_string(event.chain));
        bind_text(stmt.get(), 6, transfer_json);
        bind_text(stmt.get(), 7, to_string(event.significance));
        sqlite3_bind_int(stmt.get(), 8, significance_rank(event.significance));
        sqlite3_bind_int64(stmt.get(), 9, event.created_at);

        int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Failed to insert event ") + event.id + ": " + sqlite3_errmsg(db_));
        }
    }

    QueryResult query(const QueryFilter& filter) {
        if (filter.limit < 1) {
            throw ValidationError("Query limit must be at least 1");
        }

        std::vector<std::string> conditions;
        std::vector<BindValue> params;

        if (filter.chain) {
            conditions.push_back("chain = ?");
            params.push_back({true, to_string(*filter.chain), 0});
        }

        if (filter.min_significance) {
            conditions.push_back("significance_order >= ?");
            params.push_back({false, "", significance_rank(*filter.min_significance)});
        }

        if (filter.cursor) {
            conditions.push_back("created_at < ?");
            params.push_back({false, "", parse_cursor(*filter.cursor)});
        }

        std::string sql = "SELECT id, type, wallet, wallet_label, chain, transfer_json, significance, created_at "
                          "FROM events";
        for (size_t i = 0; i < conditions.size(); ++i) {
            sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
        }
        sql += " ORDER BY created_at DESC LIMIT ?";

        // One extra row tells us whether another page exists
        params.push_back({false, "", static_cast<int64_t>(filter.limit) + 1});

        std::lock_guard<std::mutex> lock(db_mutex_);
        ensure_open();

        Statement stmt = prepare(sql.c_str());
        for (size_t i = 0; i < params.size(); ++i) {
            int index = static_cast<int>(i) + 1;
            if (params[i].is_text) {
                bind_text(stmt.get(), index, params[i].text);
            } else {
                sqlite3_bind_int64(stmt.get(), index, params[i].integer);
            }
        }

        QueryResult result;
        result.events = read_rows(stmt.get());

        if (result.events.size() > static_cast<size_t>(filter.limit)) {
            result.events.resize(filter.limit);
            result.next_cursor = std::to_string(result.events.back().created_at);
        }

        return result;
    }

    std::vector<WhaleEvent> get_by_wallet(const std::string& wallet, int limit) {
        if (limit < 1) {
            throw ValidationError("Query limit must be at least 1");
        }

        std::lock_guard<std::mutex> lock(db_mutex_);
        ensure_open();

        const char* sql =
            "SELECT id, type, wallet, wallet_label, chain, transfer_json, significance, created_at "
            "FROM events WHERE wallet = ? ORDER BY created_at DESC LIMIT ?";
        Statement stmt = prepare(sql);
        bind_text(stmt.get(), 1, util::to_lower(wallet));
        sqlite3_bind_int(stmt.get(), 2, limit);

        return read_rows(stmt.get());
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        const char* sql = "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1";
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
            return false;
        }
        Statement stmt(raw);

        int rc = sqlite3_step(stmt.get());
        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return db_ != nullptr;
    }

    void close() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
            spdlog::info("Event store closed: {}", db_path_);
        }
    }

private:
    void create_tables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS events (
                id TEXT PRIMARY KEY,
                type TEXT NOT NULL,
                wallet TEXT NOT NULL,
                wallet_label TEXT,
                chain TEXT NOT NULL,
                transfer_json TEXT NOT NULL,
                significance TEXT NOT NULL,
                significance_order INTEGER NOT NULL,
                created_at INTEGER NOT NULL
            )
        )");

        exec(R"(
            CREATE INDEX IF NOT EXISTS idx_events_wallet ON events(wallet);
            CREATE INDEX IF NOT EXISTS idx_events_chain ON events(chain);
            CREATE INDEX IF NOT EXISTS idx_events_created ON events(created_at DESC);
            CREATE INDEX IF NOT EXISTS idx_events_significance ON events(significance_order DESC);
        )");
    }

    void exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            throw StorageError("Event store statement failed: " + message);
        }
    }

    void ensure_open() const {
        if (!db_) {
            throw StorageError("Event store is closed");
        }
    }

    Statement prepare(const char* sql) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
        return Statement(raw);
    }

    static void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
        sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    static std::string column_text(sqlite3_stmt* stmt, int column) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
        return text ? std::string(text) : std::string();
    }

    static int64_t parse_cursor(const std::string& cursor) {
        try {
            size_t consumed = 0;
            int64_t value = std::stoll(cursor, &consumed);
            if (consumed != cursor.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return value;
        } catch (const std::exception&) {
            throw ValidationError("Invalid cursor: " + cursor);
        }
    }

    std::vector<WhaleEvent> read_rows(sqlite3_stmt* stmt) {
        std::vector<WhaleEvent> events;

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            WhaleEvent event;
            try {
                event.id = column_text(stmt, 0);
                event.type = parse_event_type(column_text(stmt, 1));
                event.wallet = column_text(stmt, 2);
                if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
                    event.wallet_label = column_text(stmt, 3);
                }
                event.chain = parse_chain(column_text(stmt, 4));
                event.transfer = transfer_from_json(nlohmann::json::parse(column_text(stmt, 5)));
                event.significance = parse_significance(column_text(stmt, 6));
                event.created_at = sqlite3_column_int64(stmt, 7);
            } catch (const std::exception& e) {
                throw StorageError("Corrupt event row " + event.id + ": " + e.what());
            }
            events.push_back(std::move(event));
        }

        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Failed to read events: ") + sqlite3_errmsg(db_));
        }

        return events;
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

// Public interface implementation
EventStore::EventStore(const std::string& db_path)
    : pImpl_(std::make_unique<Impl>(db_path)) {}

EventStore::~EventStore() = default;

void EventStore::insert(const WhaleEvent& event) {
    pImpl_->insert(event);
}

QueryResult EventStore::query(const QueryFilter& filter) {
    return pImpl_->query(filter);
}

std::vector<WhaleEvent> EventStore::get_by_wallet(const std::string& wallet, int limit) {
    return pImpl_->get_by_wallet(wallet, limit);
}

EventStats EventStore::recent_stats(int n) {
    QueryFilter filter;
    filter.limit = n;
    auto recent = pImpl_->query(filter);

    EventStats stats;
    stats.total = recent.events.size();
    for (const auto& event : recent.events) {
        switch (event.significance) {
            case Significance::High:   ++stats.high; break;
            case Significance::Medium: ++stats.medium; break;
            case Significance::Low:    ++stats.low; break;
        }
    }
    return stats;
}

bool EventStore::is_healthy() const {
    return pImpl_->is_healthy();
}

bool EventStore::is_open() const {
    return pImpl_->is_open();
}

void EventStore::close() {
    pImpl_->close();
}
