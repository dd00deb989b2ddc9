#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <mutex>
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "session_store.hpp"

namespace tradeflow {

/**
 * PostgreSQL-backed session store.
 *
 * One row per session in `trading_sessions`, the full record in a jsonb
 * column plus a few scalar columns for listing and filtering. Closed trades
 * are also written to `session_trades` so they can be queried across sessions.
 */
class PostgresStore : public SessionStore {
public:
    explicit PostgresStore(const PostgresConfig& config);
    ~PostgresStore() override;

    // Connection management
    bool connect();
    void disconnect();
    bool is_connected() const;
    bool ensure_schema();  // Create tables if not exist

    bool save(const SessionSnapshot& snapshot) override;
    std::optional<SessionSnapshot> load(const std::string& session_id) override;
    std::vector<SessionSnapshot> load_all() override;
    bool remove(const std::string& session_id) override;

private:
    PostgresConfig config_;
    PGconn* conn_{nullptr};
    std::mutex conn_mutex_;  // libpq connections are not thread-safe

    bool exec_sql(const std::string& sql);
    PGresult* query(const std::string& sql);
    std::string escape(const std::string& str);
    bool save_trades(const SessionSnapshot& snapshot);
};

class PostgresStoreFactory {
public:
    static std::shared_ptr<PostgresStore> create(const PostgresConfig& config) {
        if (!config.enabled) {
            return nullptr;
        }
        auto store = std::make_shared<PostgresStore>(config);
        if (!store->connect()) {
            spdlog::warn("Failed to connect to PostgreSQL, keeping sessions in memory");
            return nullptr;
        }
        if (!store->ensure_schema()) {
            spdlog::warn("Failed to create PostgreSQL schema");
            return nullptr;
        }
        spdlog::info("Connected to PostgreSQL {}:{} db={}",
                     config.host, config.port, config.database);
        return store;
    }
};

} // namespace tradeflow
