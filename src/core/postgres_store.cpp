#include "postgres_store.hpp"
#include <spdlog/fmt/fmt.h>

namespace tradeflow {

PostgresStore::PostgresStore(const PostgresConfig& config)
    : config_(config) {}

PostgresStore::~PostgresStore() {
    disconnect();
}

bool PostgresStore::connect() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (conn_) {
        return true;
    }

    std::string conn_str = fmt::format(
        "host={} port={} dbname={} user={} password={}",
        config_.host, config_.port, config_.database,
        config_.user, config_.password);

    conn_ = PQconnectdb(conn_str.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        spdlog::error("PostgreSQL connection failed: {}", PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    return true;
}

void PostgresStore::disconnect() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

// Callers hold conn_mutex_.
bool PostgresStore::exec_sql(const std::string& sql) {
    if (!is_connected()) {
        // One reconnect attempt per statement after a dropped connection.
        if (conn_) PQreset(conn_);
        if (!is_connected()) return false;
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    bool ok = PQresultStatus(res) == PGRES_COMMAND_OK ||
              PQresultStatus(res) == PGRES_TUPLES_OK;

    if (!ok) {
        spdlog::error("PostgreSQL exec failed: {}", PQerrorMessage(conn_));
    }

    PQclear(res);
    return ok;
}

PGresult* PostgresStore::query(const std::string& sql) {
    if (!is_connected()) {
        if (conn_) PQreset(conn_);
        if (!is_connected()) return nullptr;
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        spdlog::error("PostgreSQL query failed: {}", PQerrorMessage(conn_));
        PQclear(res);
        return nullptr;
    }
    return res;
}

std::string PostgresStore::escape(const std::string& str) {
    if (!conn_) return "''";
    char* escaped = PQescapeLiteral(conn_, str.c_str(), str.size());
    if (!escaped) return "''";
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

bool PostgresStore::ensure_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS trading_sessions (
            session_id VARCHAR(64) PRIMARY KEY,
            name VARCHAR(128),
            symbol VARCHAR(32) NOT NULL,
            mode VARCHAR(16) NOT NULL,
            status VARCHAR(16) NOT NULL,
            initial_capital NUMERIC(28,8) NOT NULL,
            current_capital NUMERIC(28,8) NOT NULL,
            record JSONB NOT NULL,
            created_at TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP,
            updated_at TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP
        );

        CREATE TABLE IF NOT EXISTS session_trades (
            session_id VARCHAR(64) NOT NULL REFERENCES trading_sessions(session_id) ON DELETE CASCADE,
            position_id VARCHAR(32) NOT NULL,
            symbol VARCHAR(32) NOT NULL,
            side VARCHAR(8) NOT NULL,
            quantity NUMERIC(28,8) NOT NULL,
            entry_price NUMERIC(28,8) NOT NULL,
            exit_price NUMERIC(28,8) NOT NULL,
            entry_time TIMESTAMP WITH TIME ZONE NOT NULL,
            exit_time TIMESTAMP WITH TIME ZONE NOT NULL,
            exit_reason VARCHAR(16) NOT NULL,
            fees_paid NUMERIC(28,8) NOT NULL,
            realized_pnl NUMERIC(28,8) NOT NULL,
            PRIMARY KEY (session_id, position_id)
        );

        CREATE INDEX IF NOT EXISTS idx_sessions_status ON trading_sessions(status);
        CREATE INDEX IF NOT EXISTS idx_trades_exit_time ON session_trades(exit_time);
    )";

    std::lock_guard<std::mutex> lock(conn_mutex_);
    return exec_sql(schema);
}

bool PostgresStore::save(const SessionSnapshot& snapshot) {
    std::string record = snapshot_to_record(snapshot).dump();
    std::lock_guard<std::mutex> lock(conn_mutex_);
    std::string sql = fmt::format(
        "INSERT INTO trading_sessions (session_id, name, symbol, mode, status, "
        "initial_capital, current_capital, record) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, {}::jsonb) "
        "ON CONFLICT (session_id) DO UPDATE SET status = EXCLUDED.status, "
        "current_capital = EXCLUDED.current_capital, record = EXCLUDED.record, "
        "updated_at = CURRENT_TIMESTAMP",
        escape(snapshot.id), escape(snapshot.config.name), escape(snapshot.config.symbol),
        escape(to_string(snapshot.config.mode)), escape(to_string(snapshot.status)),
        snapshot.config.initial_capital.to_string(), snapshot.current_capital.to_string(),
        escape(record));

    if (!exec_sql(sql)) return false;
    return save_trades(snapshot);
}

bool PostgresStore::save_trades(const SessionSnapshot& snapshot) {
    if (snapshot.closed_trades.empty()) return true;
    std::string values;
    for (const auto& t : snapshot.closed_trades) {
        if (!values.empty()) values += ", ";
        values += fmt::format(
            "({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            escape(snapshot.id), escape(t.position.id), escape(t.position.symbol),
            escape(to_string(t.position.side)), t.position.quantity.to_string(),
            t.position.entry_price.to_string(), t.exit_price.to_string(),
            escape(utils::ts_to_iso(t.position.entry_time)), escape(utils::ts_to_iso(t.exit_time)),
            escape(to_string(t.exit_reason)), t.fees_paid.to_string(), t.realized_pnl.to_string());
    }
    std::string sql = fmt::format(
        "INSERT INTO session_trades (session_id, position_id, symbol, side, quantity, entry_price, "
        "exit_price, entry_time, exit_time, exit_reason, fees_paid, realized_pnl) VALUES {} "
        "ON CONFLICT (session_id, position_id) DO NOTHING",
        values);
    return exec_sql(sql);
}

std::optional<SessionSnapshot> PostgresStore::load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    std::string sql = fmt::format(
        "SELECT record::text FROM trading_sessions WHERE session_id = {}",
        escape(session_id));

    PGresult* res = query(sql);
    if (!res || PQntuples(res) == 0) {
        if (res) PQclear(res);
        return std::nullopt;
    }

    std::string record = PQgetvalue(res, 0, 0);
    PQclear(res);
    try {
        return snapshot_from_record(nlohmann::json::parse(record));
    } catch (const std::exception& e) {
        spdlog::error("Corrupt session record {}: {}", session_id, e.what());
        return std::nullopt;
    }
}

std::vector<SessionSnapshot> PostgresStore::load_all() {
    std::vector<SessionSnapshot> out;
    std::lock_guard<std::mutex> lock(conn_mutex_);
    PGresult* res = query("SELECT session_id, record::text FROM trading_sessions ORDER BY created_at");
    if (!res) return out;

    int rows = PQntuples(res);
    out.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        std::string id = PQgetvalue(res, i, 0);
        try {
            out.push_back(snapshot_from_record(nlohmann::json::parse(PQgetvalue(res, i, 1))));
        } catch (const std::exception& e) {
            spdlog::error("Skipping corrupt session record {}: {}", id, e.what());
        }
    }
    PQclear(res);
    return out;
}

bool PostgresStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    std::string sql = fmt::format(
        "DELETE FROM trading_sessions WHERE session_id = {}",
        escape(session_id));
    return exec_sql(sql);
}

} // namespace tradeflow
