#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include <gtest/gtest.h>

using namespace mtgtools::sqlite;

namespace {

Connection memory_db() {
    return Connection(":memory:", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
}

} // namespace

TEST(Sqlite, MetaRoundTrip) {
    auto conn = memory_db();
    EXPECT_FALSE(read_meta(conn.get(), "meta", "k").has_value());

    write_meta(conn.get(), "meta", "k", "v1");
    write_meta(conn.get(), "meta", "k", "v2");

    auto v = read_meta(conn.get(), "meta", "k");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "v2");
    EXPECT_FALSE(read_meta(conn.get(), "meta", "missing").has_value());
}

TEST(Sqlite, TransactionRollsBackWithoutCommit) {
    auto conn = memory_db();
    exec_sql(conn.get(), "CREATE TABLE t (x INTEGER)");
    {
        Transaction tx(conn.get());
        exec_sql(conn.get(), "INSERT INTO t VALUES (1)");
    }
    {
        Transaction tx(conn.get());
        exec_sql(conn.get(), "INSERT INTO t VALUES (2)");
        tx.commit();
    }
    Stmt stmt(conn.get(), "SELECT group_concat(x) FROM t");
    ASSERT_EQ(stmt.step(), SQLITE_ROW);
    EXPECT_EQ(stmt.column_text(0).value_or(""), "2");
}

TEST(Sqlite, OptionalBindersWriteNull) {
    auto conn = memory_db();
    exec_sql(conn.get(), "CREATE TABLE t (a TEXT, b INTEGER)");
    Stmt ins(conn.get(), "INSERT INTO t VALUES (?1, ?2)");
    ins.bind_text(1, std::optional<std::string>{});
    ins.bind_int64(2, std::optional<int64_t>{42});
    ins.exec();

    Stmt sel(conn.get(), "SELECT a, b FROM t");
    ASSERT_EQ(sel.step(), SQLITE_ROW);
    EXPECT_FALSE(sel.column_text(0).has_value());
    EXPECT_EQ(sel.column_int64(1).value_or(0), 42);
}

TEST(Sqlite, FailuresThrowSchemaError) {
    auto conn = memory_db();
    EXPECT_THROW(exec_sql(conn.get(), "CREATE TABLE"), mtgtools::SchemaError);
    EXPECT_THROW(Stmt(conn.get(), "SELECT * FROM nowhere"), mtgtools::SchemaError);
}

TEST(Sqlite, UtcTimestampIsFixedWidth) {
    auto ts = utc_timestamp();
    ASSERT_EQ(ts.size(), 20u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
