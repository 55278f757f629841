#include "mtgtools/bulkdata.h"
#include "mtgtools/carddb.h"
#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include "fake_transport.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace mtgtools::bulkdata;
using mtgtools::testing::FakeTransport;

namespace {

const char* kMetadataUrl = "https://api.example/bulk-data";

std::string metadata_body(const std::string& cards_marker) {
    return R"({"object":"list","data":[)"
           R"({"type":"oracle_cards","download_uri":"https://x/oracle.json","updated_at":"2023-01-01T00:00:00Z"},)"
           R"({"type":"default_cards","download_uri":"https://x/default.json","updated_at":")" +
           cards_marker + R"("}]})";
}

fs::path fresh_path(const char* name) {
    auto dir = fs::temp_directory_path() / "mtgtools_bulkdata_tests";
    fs::create_directories(dir);
    auto p = dir / name;
    fs::remove(p);
    return p;
}

void make_db(const fs::path& p, const char* marker) {
    mtgtools::sqlite::Connection conn(p.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    mtgtools::sqlite::exec_sql(conn.get(), "CREATE TABLE cards (id TEXT)");
    if (marker) mtgtools::sqlite::write_meta(conn.get(), "meta", mtgtools::carddb::kMarkerKey, marker);
}

} // namespace

TEST(BulkData, ParsesMetadata) {
    auto sources = parse_bulk_metadata(metadata_body("2024-01-15T10:00:00Z"));
    ASSERT_EQ(sources.size(), 2u);
    const auto* src = find_source(sources, "default_cards");
    ASSERT_NE(src, nullptr);
    EXPECT_EQ(src->download_uri, "https://x/default.json");
    EXPECT_EQ(src->updated_at, "2024-01-15T10:00:00Z");
    EXPECT_EQ(find_source(sources, "rulings"), nullptr);
}

TEST(BulkData, MissingFieldsAreVersionCheckErrors) {
    EXPECT_THROW(parse_bulk_metadata(R"({"object":"list"})"), mtgtools::VersionCheckError);
    EXPECT_THROW(parse_bulk_metadata(R"({"data":[{"type":"default_cards","download_uri":"u"}]})"),
                 mtgtools::VersionCheckError);
    EXPECT_THROW(parse_bulk_metadata("<html>"), mtgtools::ParseError);
}

TEST(BulkData, NoLocalDatabaseNeedsUpdate) {
    auto db = fresh_path("none.db");
    FakeTransport t;
    t.serve(kMetadataUrl, metadata_body("2024-01-15T10:00:00Z"));

    auto check = check_freshness(t, kMetadataUrl, db.string(), "default_cards");
    EXPECT_TRUE(check.needs_update);
    EXPECT_EQ(check.remote_marker.value_or(""), "2024-01-15T10:00:00Z");
    EXPECT_FALSE(check.stored_marker.has_value());
}

TEST(BulkData, UnchangedMarkerIsCurrent) {
    auto db = fresh_path("same.db");
    make_db(db, "2024-01-15T10:00:00Z");
    FakeTransport t;
    t.serve(kMetadataUrl, metadata_body("2024-01-15T10:00:00Z"));

    EXPECT_FALSE(check_freshness(t, kMetadataUrl, db.string(), "default_cards").needs_update);
    // Asking twice gives the same answer.
    EXPECT_FALSE(check_freshness(t, kMetadataUrl, db.string(), "default_cards").needs_update);
    EXPECT_TRUE(t.downloads.empty());
}

TEST(BulkData, NewerRemoteMarkerNeedsUpdate) {
    auto db = fresh_path("old.db");
    make_db(db, "2024-01-01T00:00:00Z");
    FakeTransport t;
    t.serve(kMetadataUrl, metadata_body("2024-02-01T00:00:00Z"));

    auto check = check_freshness(t, kMetadataUrl, db.string(), "default_cards");
    EXPECT_TRUE(check.needs_update);
    EXPECT_EQ(check.stored_marker.value_or(""), "2024-01-01T00:00:00Z");
}

TEST(BulkData, DatabaseWithoutMarkerNeedsUpdate) {
    auto db = fresh_path("nomarker.db");
    make_db(db, nullptr);
    FakeTransport t;
    t.serve(kMetadataUrl, metadata_body("2024-01-15T10:00:00Z"));
    EXPECT_TRUE(check_freshness(t, kMetadataUrl, db.string(), "default_cards").needs_update);
}

TEST(BulkData, NetworkFailureFailsOpen) {
    auto db = fresh_path("present.db");
    make_db(db, "2024-01-15T10:00:00Z");
    FakeTransport t;
    t.fail_everything();

    auto check = check_freshness(t, kMetadataUrl, db.string(), "default_cards");
    EXPECT_FALSE(check.needs_update);
    EXPECT_FALSE(check.remote_marker.has_value());

    auto missing = fresh_path("absent.db");
    auto check2 = check_freshness(t, kMetadataUrl, missing.string(), "default_cards");
    EXPECT_TRUE(check2.needs_update);
    EXPECT_FALSE(check2.remote_marker.has_value());
}

TEST(BulkData, MalformedMetadataFailsOpen) {
    auto db = fresh_path("present2.db");
    make_db(db, "2024-01-15T10:00:00Z");
    FakeTransport t;
    t.serve(kMetadataUrl, R"({"data":[{"type":"default_cards"}]})");
    EXPECT_FALSE(check_freshness(t, kMetadataUrl, db.string(), "default_cards").needs_update);
}

TEST(BulkData, UnreadableDatabaseHasNoMarker) {
    auto db = fresh_path("garbage.db");
    std::ofstream(db) << "this is not sqlite";
    EXPECT_FALSE(read_stored_marker(db.string()).has_value());
}
