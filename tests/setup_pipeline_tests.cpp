#include "mtgtools/carddb.h"
#include "mtgtools/combosync.h"
#include "mtgtools/errors.h"
#include "mtgtools/pricecache.h"
#include "mtgtools/setup.h"
#include "mtgtools/sqlite.h"

#include "fake_transport.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace mtgtools;
using namespace mtgtools::setup;
using mtgtools::testing::FakeTransport;

namespace {

const char* kBulkUrl = "https://bulk.test/bulk-data";
const char* kCardsUrl = "https://bulk.test/default-cards.json";
const char* kRulingsUrl = "https://bulk.test/rulings.json";
const char* kSetsUrl = "https://bulk.test/sets";
const char* kSetListUrl = "https://sets.test/SetList.json";
const char* kReleasesUrl = "https://releases.test/releases";

json card(const std::string& id, const std::string& name, const std::string& set,
          const std::string& number, const char* usd) {
    return json{
        {"id", id}, {"oracle_id", "o-" + name}, {"name", name}, {"set", set},
        {"collector_number", number}, {"rarity", "common"}, {"layout", "normal"},
        {"type_line", "Instant"}, {"oracle_text", name + " deals 3 damage to any target."},
        {"legalities", {{"commander", "legal"}}},
        {"prices", {{"usd", usd ? json(usd) : json(nullptr)}, {"usd_foil", nullptr}}},
    };
}

class SetupPipeline : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "mtgtools_pipeline_tests" / info->name();
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "work");

        cfg_.card_db_path = (dir_ / "data" / "mtg.sqlite").string();
        cfg_.combo_db_path = (dir_ / "data" / "combos.sqlite").string();
        cfg_.price_cache_path = (dir_ / "data" / "price_cache.json").string();
        cfg_.work_dir = (dir_ / "work").string();
        cfg_.bulk_metadata_url = kBulkUrl;
        cfg_.sets_url = kSetsUrl;
        cfg_.set_list_url = kSetListUrl;
        cfg_.releases_url = kReleasesUrl;
        cfg_.batch_size = 2;
        cfg_.sync_combos = false;

        transport_ = std::make_shared<FakeTransport>();
    }

    // Publishes a bulk listing with the given marker and small source files.
    void serve_bulk(const std::string& marker, const std::string& cards_body) {
        json meta = {{"object", "list"}, {"data", json::array({
            {{"type", "default_cards"}, {"download_uri", kCardsUrl}, {"updated_at", marker}},
            {{"type", "rulings"}, {"download_uri", kRulingsUrl}, {"updated_at", marker}},
        })}};
        transport_->serve(kBulkUrl, meta.dump());
        transport_->serve(kCardsUrl, cards_body);
        transport_->serve(kRulingsUrl,
            R"([{"oracle_id":"o-Lightning Bolt","source":"wotc","published_at":"2004-10-04","comment":"Any target."}])");
        transport_->serve(kSetsUrl,
            R"({"object":"list","data":[{"code":"lea","name":"Limited Edition Alpha","set_type":"core"}]})");
        transport_->serve(kSetListUrl, R"({"data":[{"code":"LEA","block":"Core Set","baseSetSize":295}]})");
    }

    void serve_bulk(const std::string& marker) {
        json cards = json::array({
            card("c1", "Lightning Bolt", "lea", "162", "1.50"),
            card("c2", "Giant Growth", "lea", "198", "0.40"),
            card("c3", "Shock", "lea", "150", nullptr),
        });
        serve_bulk(marker, cards.dump());
    }

    void build_local(const std::string& marker) {
        serve_bulk(marker);
        ProgressChannel ch(100000);
        SetupManager(cfg_, transport_).run(ch);
        transport_->downloads.clear();
        transport_->text_requests.clear();
    }

    std::optional<std::string> stored_marker() {
        return carddb::read_stats(cfg_.card_db_path).marker;
    }

    SetupOutcome run(std::vector<ProgressState>& seen) {
        ProgressChannel ch(100000);
        SetupManager mgr(cfg_, transport_);
        auto outcome = mgr.run(ch);
        while (auto s = ch.try_pop()) seen.push_back(std::move(*s));
        return outcome;
    }

    bool work_dir_empty() const { return fs::is_empty(dir_ / "work"); }

    fs::path dir_;
    SetupConfig cfg_;
    std::shared_ptr<FakeTransport> transport_;
};

} // namespace

TEST_F(SetupPipeline, FirstRunBuildsAndStampsMarker) {
    serve_bulk("2024-01-15T10:00:00Z");
    std::vector<ProgressState> seen;
    auto outcome = run(seen);

    EXPECT_TRUE(outcome.freshness.needs_update);
    EXPECT_FALSE(outcome.freshness.stored_marker.has_value());
    EXPECT_TRUE(outcome.database_updated);
    ASSERT_TRUE(outcome.build.has_value());
    EXPECT_EQ(outcome.build->card_count, 3u);
    EXPECT_EQ(stored_marker().value_or(""), "2024-01-15T10:00:00Z");
    EXPECT_EQ(transport_->downloads.size(), 3u);
    EXPECT_TRUE(work_dir_empty());

    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().phase, Phase::Complete);
    EXPECT_DOUBLE_EQ(seen.back().fraction, 1.0);
}

TEST_F(SetupPipeline, UnchangedMarkerSkipsDownloads) {
    build_local("2024-01-15T10:00:00Z");

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    EXPECT_FALSE(outcome.freshness.needs_update);
    EXPECT_FALSE(outcome.database_updated);
    EXPECT_TRUE(transport_->downloads.empty());
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().phase, Phase::UpToDate);
}

TEST_F(SetupPipeline, NewerMarkerRebuilds) {
    build_local("2024-01-01T00:00:00Z");
    json cards = json::array({card("n1", "Lightning Bolt", "lea", "162", "2.00")});
    serve_bulk("2024-02-01T00:00:00Z", cards.dump());

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    EXPECT_TRUE(outcome.freshness.needs_update);
    EXPECT_EQ(outcome.freshness.stored_marker.value_or(""), "2024-01-01T00:00:00Z");
    EXPECT_TRUE(outcome.database_updated);
    EXPECT_EQ(stored_marker().value_or(""), "2024-02-01T00:00:00Z");
    EXPECT_EQ(carddb::read_stats(cfg_.card_db_path).card_count, 1);
}

TEST_F(SetupPipeline, RebuildStampsTheMarkerItCompared) {
    build_local("2024-01-01T00:00:00Z");
    serve_bulk("2024-02-01T00:00:00Z");

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    ASSERT_TRUE(outcome.database_updated);
    EXPECT_EQ(std::count(transport_->text_requests.begin(), transport_->text_requests.end(),
                         std::string(kBulkUrl)), 1);
    EXPECT_EQ(outcome.freshness.remote_marker.value_or(""), "2024-02-01T00:00:00Z");
    EXPECT_EQ(stored_marker(), outcome.freshness.remote_marker);
}

TEST_F(SetupPipeline, ForcedRebuildRefetchesMetadataAfterOutage) {
    build_local("2024-01-15T10:00:00Z");
    cfg_.force = true;
    transport_->fail(kBulkUrl);

    ProgressChannel ch(100000);
    SetupManager mgr(cfg_, transport_);
    EXPECT_THROW(mgr.run(ch), NetworkError);
    EXPECT_EQ(std::count(transport_->text_requests.begin(), transport_->text_requests.end(),
                         std::string(kBulkUrl)), 2);
}

TEST_F(SetupPipeline, ForceRebuildsCurrentDatabase) {
    build_local("2024-01-15T10:00:00Z");
    cfg_.force = true;

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    EXPECT_FALSE(outcome.freshness.needs_update);
    EXPECT_TRUE(outcome.database_updated);
    EXPECT_EQ(transport_->downloads.size(), 3u);
}

TEST_F(SetupPipeline, MetadataOutageKeepsExistingDatabase) {
    build_local("2024-01-15T10:00:00Z");
    transport_->fail(kBulkUrl);

    std::vector<ProgressState> seen;
    SetupOutcome outcome;
    ASSERT_NO_THROW(outcome = run(seen));
    EXPECT_FALSE(outcome.freshness.needs_update);
    EXPECT_FALSE(outcome.freshness.remote_marker.has_value());
    EXPECT_EQ(seen.back().phase, Phase::UpToDate);
    EXPECT_EQ(stored_marker().value_or(""), "2024-01-15T10:00:00Z");
}

TEST_F(SetupPipeline, RequiredDownloadFailureIsFatal) {
    serve_bulk("2024-01-15T10:00:00Z");
    transport_->fail(kRulingsUrl);

    ProgressChannel ch(100000);
    SetupManager mgr(cfg_, transport_);
    EXPECT_THROW(mgr.run(ch), NetworkError);

    std::vector<ProgressState> seen;
    while (auto s = ch.try_pop()) seen.push_back(std::move(*s));
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().phase, Phase::Error);
    EXPECT_FALSE(fs::exists(cfg_.card_db_path));
    EXPECT_TRUE(work_dir_empty());
}

TEST_F(SetupPipeline, MalformedRecordFailsBuildWithErrorState) {
    build_local("2024-01-01T00:00:00Z");
    serve_bulk("2024-02-01T00:00:00Z", R"([{"id":"x","name":"No Set"}])");

    ProgressChannel ch(100000);
    SetupManager mgr(cfg_, transport_);
    auto fut = mgr.start(ch);
    std::vector<ProgressState> seen;
    while (auto s = ch.pop()) seen.push_back(std::move(*s));

    EXPECT_THROW(fut.get(), ParseError);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().phase, Phase::Error);
    EXPECT_NE(seen.back().status.find("Update failed"), std::string::npos);
    EXPECT_FALSE(fs::exists(cfg_.card_db_path + ".tmp"));
}

TEST_F(SetupPipeline, ProgressNeverDecreases) {
    serve_bulk("2024-01-15T10:00:00Z");
    cfg_.sync_combos = true;
    transport_->fail(kReleasesUrl);

    // The channel clamps what consumers see, so the pipeline's own
    // fractions are recorded as published.
    std::vector<ProgressState> raw;
    ProgressChannel ch(100000, [&](const ProgressState& s) { raw.push_back(s); });
    SetupManager mgr(cfg_, transport_);
    auto fut = mgr.start(ch);
    std::vector<ProgressState> seen;
    while (auto s = ch.pop()) seen.push_back(std::move(*s));
    auto outcome = fut.get();

    ASSERT_GT(seen.size(), 5u);
    for (size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i].fraction, seen[i - 1].fraction) << seen[i].status;
    }
    ASSERT_EQ(raw.size(), seen.size());
    for (size_t i = 1; i < raw.size(); ++i) {
        EXPECT_GE(raw[i].fraction, raw[i - 1].fraction)
            << raw[i - 1].status << " -> " << raw[i].status;
    }
    for (const auto& s : raw) {
        EXPECT_GE(s.fraction, 0.0) << s.status;
        EXPECT_LE(s.fraction, 1.0) << s.status;
    }
    bool saw_build = false;
    for (const auto& s : seen) saw_build |= s.phase == Phase::BuildingDatabase;
    EXPECT_TRUE(saw_build);
    ASSERT_TRUE(outcome.combos.has_value());
    EXPECT_EQ(outcome.combos->status, combosync::SyncStatus::Unavailable);
    EXPECT_EQ(seen.back().phase, Phase::Complete);
}

TEST_F(SetupPipeline, CombosSyncEvenWhenCardsAreCurrent) {
    build_local("2024-01-15T10:00:00Z");
    cfg_.sync_combos = true;

    auto artifact = dir_ / "fresh_combos.sqlite";
    {
        sqlite::Connection conn(artifact.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        sqlite::exec_sql(conn.get(), "CREATE TABLE combos (id TEXT)");
    }
    auto gz_path = dir_ / "fresh_combos.sqlite.gz";
    {
        std::ifstream in(artifact, std::ios::binary);
        std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        gzFile gz = gzopen(gz_path.string().c_str(), "wb");
        gzwrite(gz, raw.data(), static_cast<unsigned>(raw.size()));
        gzclose(gz);
    }
    transport_->serve(kReleasesUrl, R"([
        {"tag_name":"a","updated_at":"2024-03-01T00:00:00Z",
         "assets":[{"name":"combos.sqlite.gz","browser_download_url":"https://dl.test/a.gz"}]},
        {"tag_name":"b","updated_at":"2024-04-01T00:00:00Z",
         "assets":[{"name":"combos.sqlite.gz","browser_download_url":"https://dl.test/b.gz"}]}
    ])");
    transport_->serve_file("https://dl.test/b.gz", gz_path);

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    EXPECT_FALSE(outcome.database_updated);
    ASSERT_TRUE(outcome.combos.has_value());
    EXPECT_EQ(outcome.combos->status, combosync::SyncStatus::Updated);
    EXPECT_EQ(combosync::read_artifact_marker(cfg_.combo_db_path).value_or(""),
              "2024-04-01T00:00:00Z");
    ASSERT_EQ(transport_->downloads.size(), 1u);
    EXPECT_EQ(transport_->downloads[0], "https://dl.test/b.gz");
}

TEST_F(SetupPipeline, CollectionPricesAreCachedAfterBuild) {
    auto collection = (dir_ / "collection.sqlite").string();
    {
        sqlite::Connection conn(collection, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        sqlite::exec_sql(conn.get(),
                         "CREATE TABLE collection_cards (card_name TEXT, set_code TEXT, "
                         "collector_number TEXT);"
                         "INSERT INTO collection_cards VALUES ('Lightning Bolt', 'LEA', '162');"
                         "INSERT INTO collection_cards VALUES ('Shock', NULL, NULL);");
    }
    cfg_.collection_db_path = collection;
    serve_bulk("2024-01-15T10:00:00Z");

    std::vector<ProgressState> seen;
    auto outcome = run(seen);
    EXPECT_TRUE(outcome.price_cache_written);

    auto cache = pricecache::load_price_cache(cfg_.price_cache_path);
    const auto& bolt = cache.prices.at("Lightning Bolt|LEA|162");
    EXPECT_DOUBLE_EQ(bolt.usd.value_or(0), 1.50);
    EXPECT_FALSE(bolt.usd_foil.has_value());
    const auto& shock = cache.prices.at("Shock");
    EXPECT_FALSE(shock.usd.has_value());
}

TEST_F(SetupPipeline, BrokenCollectionDoesNotFailBuild) {
    auto collection = (dir_ / "collection.sqlite").string();
    std::ofstream(collection) << "not a database";
    cfg_.collection_db_path = collection;
    serve_bulk("2024-01-15T10:00:00Z");

    std::vector<ProgressState> seen;
    SetupOutcome outcome;
    ASSERT_NO_THROW(outcome = run(seen));
    EXPECT_TRUE(outcome.database_updated);
    EXPECT_FALSE(outcome.price_cache_written);
    EXPECT_EQ(seen.back().phase, Phase::Complete);
}
