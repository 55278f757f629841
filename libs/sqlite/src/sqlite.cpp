#include "mtgtools/sqlite.h"
#include "mtgtools/errors.h"

#include <chrono>
#include <ctime>
#include <format>
#include <utility>

namespace mtgtools::sqlite {

// ---------------------------------------------------------------------------
// Stmt
// ---------------------------------------------------------------------------

Stmt::Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
        throw SchemaError(
            std::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
}

Stmt::~Stmt() { if (stmt_) sqlite3_finalize(stmt_); }

Stmt::Stmt(Stmt&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }

Stmt& Stmt::operator=(Stmt&& o) noexcept {
    if (this != &o) { if (stmt_) sqlite3_finalize(stmt_); stmt_ = o.stmt_; o.stmt_ = nullptr; }
    return *this;
}

void Stmt::reset() { sqlite3_reset(stmt_); sqlite3_clear_bindings(stmt_); }

void Stmt::bind_text(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}
void Stmt::bind_int(int idx, int v) { sqlite3_bind_int(stmt_, idx, v); }
void Stmt::bind_int64(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
void Stmt::bind_double(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }
void Stmt::bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

void Stmt::bind_text(int idx, const std::optional<std::string>& v) {
    if (v) bind_text(idx, *v); else bind_null(idx);
}
void Stmt::bind_int64(int idx, const std::optional<int64_t>& v) {
    if (v) bind_int64(idx, *v); else bind_null(idx);
}
void Stmt::bind_double(int idx, const std::optional<double>& v) {
    if (v) bind_double(idx, *v); else bind_null(idx);
}

int Stmt::step() { return sqlite3_step(stmt_); }

void Stmt::exec() {
    int rc = step();
    if (rc != SQLITE_DONE && rc != SQLITE_ROW)
        throw SchemaError(
            std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
}

std::optional<std::string> Stmt::column_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    if (!txt) return std::nullopt;
    return std::string(txt, static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<int64_t> Stmt::column_int64(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt_, col);
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

Connection::Connection(const std::string& path, int flags) {
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw SchemaError(std::format("sqlite3_open_v2({}): {}", path, msg));
    }
}

Connection::~Connection() {
    if (db_) sqlite3_close(db_);
}

Connection::Connection(Connection&& o) noexcept : db_(o.db_) { o.db_ = nullptr; }

Connection& Connection::operator=(Connection&& o) noexcept {
    if (this != &o) { if (db_) sqlite3_close(db_); db_ = o.db_; o.db_ = nullptr; }
    return *this;
}

void Connection::close() {
    if (!db_) return;
    if (sqlite3_close(db_) != SQLITE_OK)
        throw SchemaError(std::format("sqlite3_close: {}", sqlite3_errmsg(db_)));
    db_ = nullptr;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw SchemaError(std::format("sqlite3_exec: {}", msg));
    }
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    exec_sql(db_, "BEGIN TRANSACTION");
}

Transaction::~Transaction() {
    if (done_) return;
    // Closing the connection discards the transaction if ROLLBACK fails.
    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
}

void Transaction::commit() {
    exec_sql(db_, "COMMIT");
    done_ = true;
}

bool table_exists(sqlite3* db, const char* table) {
    Stmt stmt(db,
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1");
    stmt.bind_text(1, std::string(table));
    return stmt.step() == SQLITE_ROW;
}

std::optional<std::string> read_meta(sqlite3* db, const char* table, const std::string& key) {
    if (!table_exists(db, table)) return std::nullopt;
    std::string sql = std::format("SELECT value FROM {} WHERE key = ?1", table);
    Stmt stmt(db, sql.c_str());
    stmt.bind_text(1, key);
    if (stmt.step() != SQLITE_ROW) return std::nullopt;
    return stmt.column_text(0);
}

void write_meta(sqlite3* db, const char* table, const std::string& key, const std::string& value) {
    std::string create = std::format(
        "CREATE TABLE IF NOT EXISTS {} (key TEXT PRIMARY KEY, value TEXT)", table);
    exec_sql(db, create.c_str());
    std::string sql = std::format(
        "INSERT OR REPLACE INTO {} (key, value) VALUES (?1, ?2)", table);
    Stmt stmt(db, sql.c_str());
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.exec();
}

static bool gmtime_utc(std::time_t tt, std::tm& tm_val) {
#if defined(_WIN32)
    return gmtime_s(&tm_val, &tt) == 0;
#else
    return gmtime_r(&tt, &tm_val) != nullptr;
#endif
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto tt = std::chrono::system_clock::to_time_t(now);
    char tbuf[64];
    std::tm tm_val{};
    if (!gmtime_utc(tt, tm_val)) return "";
    std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
    return tbuf;
}

} // namespace mtgtools::sqlite
