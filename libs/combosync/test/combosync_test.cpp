#include "mtgtools/combosync.h"
#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include "fake_transport.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace mtgtools::combosync;
using mtgtools::testing::FakeTransport;

namespace {

const char* kReleasesUrl = "https://api.example/repos/x/releases";

fs::path test_dir(const char* name) {
    auto dir = fs::temp_directory_path() / "mtgtools_combosync_tests" / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

// A minimal combo artifact with one combo row and an optional marker.
fs::path make_artifact(const fs::path& p, const char* marker, const char* combo = "Twin") {
    mtgtools::sqlite::Connection conn(p.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    mtgtools::sqlite::exec_sql(conn.get(), "CREATE TABLE combos (name TEXT)");
    mtgtools::sqlite::Stmt ins(conn.get(), "INSERT INTO combos VALUES (?1)");
    ins.bind_text(1, std::string(combo));
    ins.exec();
    if (marker) mtgtools::sqlite::write_meta(conn.get(), "meta", kMarkerKey, marker);
    return p;
}

std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string gzip_bytes(const fs::path& src, const fs::path& scratch) {
    std::string raw = read_all(src);
    gzFile gz = gzopen(scratch.string().c_str(), "wb");
    gzwrite(gz, raw.data(), static_cast<unsigned>(raw.size()));
    gzclose(gz);
    return read_all(scratch);
}

std::string combo_name(const fs::path& db) {
    mtgtools::sqlite::Connection conn(db.string(), SQLITE_OPEN_READONLY);
    mtgtools::sqlite::Stmt stmt(conn.get(), "SELECT name FROM combos");
    if (stmt.step() != SQLITE_ROW) return "";
    return stmt.column_text(0).value_or("");
}

const char* kTwoReleases = R"([
    {"tag_name": "data-v1", "updated_at": "2024-03-01T00:00:00Z",
     "assets": [{"name": "combos.sqlite.gz", "browser_download_url": "https://dl/v1/combos.sqlite.gz"}]},
    {"tag_name": "data-v2", "updated_at": "2024-04-01T00:00:00Z",
     "assets": [{"name": "combos.sqlite.gz", "browser_download_url": "https://dl/v2/combos.sqlite.gz"}]}
])";

SyncResult run_sync(FakeTransport& t, const fs::path& dest,
                    const mtgtools::fetch::DownloadProgressFunc& progress = nullptr) {
    return sync_artifact(t, ComboSyncOptions{.releases_url = kReleasesUrl, .dest_path = dest.string()},
                         progress);
}

} // namespace

TEST(ComboSync, SortsNewestFirst) {
    auto releases = parse_releases(kTwoReleases);
    ASSERT_EQ(releases.size(), 2u);
    EXPECT_EQ(releases[0].tag_name, "data-v2");
    auto choice = select_asset(releases, "combos.sqlite.gz", "combos.sqlite");
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(choice->release->updated_at, "2024-04-01T00:00:00Z");
    EXPECT_TRUE(choice->compressed);
}

TEST(ComboSync, StopsAtFirstReleaseWithAsset) {
    auto releases = parse_releases(R"([
        {"tag_name": "new", "updated_at": "2024-05-01T00:00:00Z",
         "assets": [{"name": "notes.txt", "browser_download_url": "u0"}]},
        {"tag_name": "mid", "updated_at": "2024-04-01T00:00:00Z",
         "assets": [{"name": "combos.sqlite", "browser_download_url": "u1"}]},
        {"tag_name": "old", "published_at": "2024-03-01T00:00:00Z",
         "assets": [{"name": "combos.sqlite.gz", "browser_download_url": "u2"}]},
        {"tag_name": "draft", "published_at": null, "assets": []}
    ])");
    ASSERT_EQ(releases.size(), 3u);
    auto choice = select_asset(releases, "combos.sqlite.gz", "combos.sqlite");
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(choice->release->tag_name, "mid");
    EXPECT_FALSE(choice->compressed);
    EXPECT_EQ(choice->asset->download_url, "u1");
}

TEST(ComboSync, PrefersCompressedWithinRelease) {
    auto releases = parse_releases(R"({"tag_name": "one", "published_at": "2024-01-01T00:00:00Z",
        "assets": [{"name": "combos.sqlite", "browser_download_url": "plain"},
                   {"name": "combos.sqlite.gz", "browser_download_url": "gz"}]})");
    auto choice = select_asset(releases, "combos.sqlite.gz", "combos.sqlite");
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(choice->asset->download_url, "gz");
    EXPECT_FALSE(select_asset(releases, "other.gz", "other").has_value());
}

TEST(ComboSync, DownloadsNewerReleaseAndStampsIt) {
    auto dir = test_dir("newer");
    auto dest = dir / "combos.sqlite";
    make_artifact(dest, "2024-03-01T00:00:00Z", "Old");
    auto fresh = make_artifact(dir / "fresh.sqlite", nullptr, "New");

    FakeTransport t;
    t.serve(kReleasesUrl, kTwoReleases);
    t.serve("https://dl/v2/combos.sqlite.gz", gzip_bytes(fresh, dir / "fresh.gz"));

    uint64_t last = 0;
    auto result = run_sync(t, dest, [&](uint64_t done, uint64_t) { last = done; });

    EXPECT_EQ(result.status, SyncStatus::Updated);
    EXPECT_EQ(result.marker.value_or(""), "2024-04-01T00:00:00Z");
    ASSERT_EQ(t.downloads.size(), 1u);
    EXPECT_EQ(t.downloads[0], "https://dl/v2/combos.sqlite.gz");
    EXPECT_GT(last, 0u);
    EXPECT_EQ(read_artifact_marker(dest.string()).value_or(""), "2024-04-01T00:00:00Z");
    EXPECT_EQ(combo_name(dest), "New");
    EXPECT_FALSE(fs::exists(dest.string() + ".download"));
    EXPECT_FALSE(fs::exists(dest.string() + ".tmp"));
}

TEST(ComboSync, EqualMarkerSkipsDownload) {
    auto dir = test_dir("equal");
    auto dest = make_artifact(dir / "combos.sqlite", "2024-04-01T00:00:00Z");
    FakeTransport t;
    t.serve(kReleasesUrl, kTwoReleases);

    auto result = run_sync(t, dest);
    EXPECT_EQ(result.status, SyncStatus::UpToDate);
    EXPECT_TRUE(t.downloads.empty());
}

TEST(ComboSync, PlainAssetIsInstalledDirectly) {
    auto dir = test_dir("plain");
    auto dest = dir / "combos.sqlite";
    auto fresh = make_artifact(dir / "fresh.sqlite", nullptr, "Plain");
    FakeTransport t;
    t.serve(kReleasesUrl, R"([{"tag_name":"p","updated_at":"2024-06-01T00:00:00Z",
        "assets":[{"name":"combos.sqlite","browser_download_url":"https://dl/plain"}]}])");
    t.serve_file("https://dl/plain", fresh);

    auto result = run_sync(t, dest);
    EXPECT_EQ(result.status, SyncStatus::Updated);
    EXPECT_EQ(combo_name(dest), "Plain");
    EXPECT_EQ(read_artifact_marker(dest.string()).value_or(""), "2024-06-01T00:00:00Z");
}

TEST(ComboSync, OfflineKeepsLocalCopy) {
    auto dir = test_dir("offline");
    auto dest = make_artifact(dir / "combos.sqlite", "2024-03-01T00:00:00Z", "Local");
    FakeTransport t;
    t.fail_everything();

    auto result = run_sync(t, dest);
    EXPECT_EQ(result.status, SyncStatus::Offline);
    EXPECT_EQ(result.marker.value_or(""), "2024-03-01T00:00:00Z");
    EXPECT_EQ(combo_name(dest), "Local");
}

TEST(ComboSync, FailedDownloadKeepsLocalCopy) {
    auto dir = test_dir("faildl");
    auto dest = make_artifact(dir / "combos.sqlite", "2024-03-01T00:00:00Z", "Local");
    FakeTransport t;
    t.serve(kReleasesUrl, kTwoReleases);
    t.fail("https://dl/v2/combos.sqlite.gz");

    auto result = run_sync(t, dest);
    EXPECT_EQ(result.status, SyncStatus::Offline);
    EXPECT_EQ(combo_name(dest), "Local");
    EXPECT_FALSE(fs::exists(dest.string() + ".download"));
}

TEST(ComboSync, NoLocalCopyIsUnavailable) {
    auto dir = test_dir("unavailable");
    auto dest = dir / "combos.sqlite";
    FakeTransport t;
    t.fail_everything();

    auto result = run_sync(t, dest);
    EXPECT_EQ(result.status, SyncStatus::Unavailable);
    EXPECT_FALSE(result.message.empty());
    EXPECT_FALSE(fs::exists(dest));
}

TEST(ComboSync, CorruptGzipIsReported) {
    auto dir = test_dir("corrupt");
    auto fresh = make_artifact(dir / "fresh.sqlite", nullptr);
    std::string gz = gzip_bytes(fresh, dir / "fresh.gz");
    std::ofstream(dir / "cut.gz", std::ios::binary) << gz.substr(0, gz.size() / 2);
    EXPECT_THROW(gunzip_file((dir / "cut.gz").string(), (dir / "out.sqlite").string()),
                 mtgtools::ParseError);
}
