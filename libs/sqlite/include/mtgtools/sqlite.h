#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>

namespace mtgtools::sqlite {

// Stmt owns a prepared statement. Failures throw SchemaError.
class Stmt {
public:
    Stmt() = default;
    Stmt(sqlite3* db, const char* sql);
    ~Stmt();
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
    Stmt(Stmt&& o) noexcept;
    Stmt& operator=(Stmt&& o) noexcept;

    sqlite3_stmt* get() const { return stmt_; }

    void reset();

    void bind_text(int idx, const std::string& v);
    void bind_int(int idx, int v);
    void bind_int64(int idx, int64_t v);
    void bind_double(int idx, double v);
    void bind_null(int idx);

    // Optional binders write NULL when the value is absent.
    void bind_text(int idx, const std::optional<std::string>& v);
    void bind_int64(int idx, const std::optional<int64_t>& v);
    void bind_double(int idx, const std::optional<double>& v);

    int step();

    // exec steps once and throws unless the statement produced a row or finished.
    void exec();

    // Column accessors for the current row.
    std::optional<std::string> column_text(int col) const;
    std::optional<int64_t> column_int64(int col) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Connection owns an open database handle.
class Connection {
public:
    Connection() = default;
    Connection(const std::string& path, int flags);
    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& o) noexcept;
    Connection& operator=(Connection&& o) noexcept;

    sqlite3* get() const { return db_; }

    // close releases the handle early; throws if SQLite refuses.
    void close();

private:
    sqlite3* db_ = nullptr;
};

// exec_sql runs one or more statements without results.
void exec_sql(sqlite3* db, const char* sql);

// Transaction issues BEGIN on construction and ROLLBACK on destruction
// unless commit() was called.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    bool done_ = false;
};

bool table_exists(sqlite3* db, const char* table);

// read_meta returns the value stored under key in a key/value table.
// A missing table or key yields nullopt.
std::optional<std::string> read_meta(sqlite3* db, const char* table, const std::string& key);

// write_meta creates the key/value table if needed and upserts key.
void write_meta(sqlite3* db, const char* table, const std::string& key, const std::string& value);

// utc_timestamp formats the current time as YYYY-MM-DDTHH:MM:SSZ.
std::string utc_timestamp();

} // namespace mtgtools::sqlite
