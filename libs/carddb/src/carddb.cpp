#include "mtgtools/carddb.h"
#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include <algorithm>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace mtgtools::carddb {

using cardimport::CardRecord;
using cardimport::RulingRecord;
using cardimport::SetRecord;
using sqlite::Stmt;
using sqlite::exec_sql;

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static constexpr const char* schema_sql = R"SQL(
CREATE TABLE cards (
    id TEXT PRIMARY KEY,
    oracle_id TEXT,
    name TEXT NOT NULL,
    flavor_name TEXT,
    layout TEXT,
    mana_cost TEXT,
    cmc REAL,
    colors TEXT,
    color_identity TEXT,
    type_line TEXT,
    oracle_text TEXT,
    flavor_text TEXT,
    power TEXT,
    toughness TEXT,
    loyalty TEXT,
    defense TEXT,
    keywords TEXT,
    set_code TEXT NOT NULL,
    set_name TEXT,
    rarity TEXT CHECK (rarity IN ('common','uncommon','rare','mythic','special','bonus') OR rarity IS NULL),
    collector_number TEXT NOT NULL,
    artist TEXT,
    release_date TEXT,
    is_token INTEGER DEFAULT 0 CHECK (is_token IN (0, 1)),
    is_promo INTEGER DEFAULT 0 CHECK (is_promo IN (0, 1)),
    is_digital_only INTEGER DEFAULT 0 CHECK (is_digital_only IN (0, 1)),
    edhrec_rank INTEGER,
    image_small TEXT,
    image_normal TEXT,
    image_large TEXT,
    image_png TEXT,
    image_art_crop TEXT,
    image_border_crop TEXT,
    price_usd INTEGER,
    price_usd_foil INTEGER,
    price_eur INTEGER,
    price_eur_foil INTEGER,
    purchase_tcgplayer TEXT,
    purchase_cardmarket TEXT,
    purchase_cardhoarder TEXT,
    link_edhrec TEXT,
    link_gatherer TEXT,
    illustration_id TEXT,
    highres_image INTEGER DEFAULT 0,
    border_color TEXT,
    frame TEXT,
    full_art INTEGER DEFAULT 0,
    art_priority INTEGER DEFAULT 2 CHECK (art_priority IN (0, 1, 2)),
    finishes TEXT,
    legalities TEXT NOT NULL,
    legal_commander INTEGER GENERATED ALWAYS AS (json_extract(legalities, '$.commander') = 'legal') STORED,
    legal_modern INTEGER GENERATED ALWAYS AS (json_extract(legalities, '$.modern') = 'legal') STORED,
    legal_standard INTEGER GENERATED ALWAYS AS (json_extract(legalities, '$.standard') = 'legal') STORED
);
CREATE TABLE sets (
    code TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    set_type TEXT,
    release_date TEXT,
    card_count INTEGER,
    icon_svg_uri TEXT,
    block TEXT,
    base_set_size INTEGER,
    total_set_size INTEGER,
    is_online_only INTEGER DEFAULT 0,
    is_foil_only INTEGER DEFAULT 0,
    keyrune_code TEXT
) WITHOUT ROWID;
CREATE TABLE rulings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    oracle_id TEXT,
    published_at TEXT,
    comment TEXT,
    source TEXT
);
CREATE TABLE meta (
    key TEXT PRIMARY KEY,
    value TEXT
);
)SQL";

// Built after import so inserts don't maintain them row by row.
static constexpr const char* index_sql = R"SQL(
CREATE INDEX idx_cards_oracle_id ON cards(oracle_id);
CREATE INDEX idx_cards_name ON cards(name COLLATE NOCASE);
CREATE INDEX idx_cards_set_number ON cards(set_code, collector_number);
CREATE INDEX idx_cards_type_line ON cards(type_line);
CREATE INDEX idx_cards_artist ON cards(artist);
CREATE INDEX idx_cards_cmc ON cards(cmc);
CREATE INDEX idx_cards_rarity ON cards(rarity);
CREATE INDEX idx_cards_illustration ON cards(name, illustration_id, art_priority);
CREATE INDEX idx_rulings_oracle_id ON rulings(oracle_id);
CREATE INDEX idx_cards_name_covering ON cards(
    name COLLATE NOCASE, release_date DESC,
    set_code, collector_number, mana_cost, type_line,
    image_normal, price_usd
);
CREATE INDEX idx_cards_real ON cards(name, set_code) WHERE is_token = 0 AND is_digital_only = 0;
CREATE INDEX idx_cards_price ON cards(price_usd) WHERE price_usd IS NOT NULL;
CREATE INDEX idx_cards_tokens ON cards(name, set_code) WHERE is_token = 1;
CREATE INDEX idx_legal_commander ON cards(legal_commander) WHERE legal_commander = 1;
CREATE INDEX idx_legal_modern ON cards(legal_modern) WHERE legal_modern = 1;
CREATE INDEX idx_legal_standard ON cards(legal_standard) WHERE legal_standard = 1;
)SQL";

static constexpr const char* fts_sql = R"SQL(
CREATE VIRTUAL TABLE cards_fts USING fts5(
    name, type_line, oracle_text, keywords,
    content='cards',
    content_rowid='rowid',
    tokenize='porter unicode61'
);
INSERT INTO cards_fts(cards_fts) VALUES('rebuild');
INSERT INTO cards_fts(cards_fts) VALUES('optimize');
)SQL";

void create_schema(sqlite3* db) { exec_sql(db, schema_sql); }

void create_indexes(sqlite3* db) { exec_sql(db, index_sql); }

void build_search_index(sqlite3* db) { exec_sql(db, fts_sql); }

const char* phase_name(BuildPhase phase) {
    switch (phase) {
        case BuildPhase::Init: return "init";
        case BuildPhase::SchemaCreated: return "schema";
        case BuildPhase::SetsImported: return "sets";
        case BuildPhase::CardsImported: return "cards";
        case BuildPhase::RulingsImported: return "rulings";
        case BuildPhase::IndexesBuilt: return "indexes";
        case BuildPhase::SearchIndexBuilt: return "search";
        case BuildPhase::VersionStamped: return "stamp";
        case BuildPhase::Done: return "done";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// CardStore
// ---------------------------------------------------------------------------

struct CardStore::Impl {
    Stmt card_stmt;
    Stmt ruling_stmt;
    Stmt set_stmt;
};

CardStore::CardStore(sqlite3* db) : impl_(std::make_unique<Impl>()) {
    impl_->card_stmt = Stmt(db,
        "INSERT OR REPLACE INTO cards ("
        " id, oracle_id, name, flavor_name, layout, mana_cost, cmc, colors, color_identity,"
        " type_line, oracle_text, flavor_text, power, toughness, loyalty, defense, keywords,"
        " set_code, set_name, rarity, collector_number, artist, release_date,"
        " is_token, is_promo, is_digital_only, edhrec_rank,"
        " image_small, image_normal, image_large, image_png, image_art_crop, image_border_crop,"
        " price_usd, price_usd_foil, price_eur, price_eur_foil,"
        " purchase_tcgplayer, purchase_cardmarket, purchase_cardhoarder, link_edhrec, link_gatherer,"
        " illustration_id, highres_image, border_color, frame, full_art, art_priority, finishes, legalities)"
        " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10,"
        " ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19, ?20,"
        " ?21, ?22, ?23, ?24, ?25, ?26, ?27, ?28, ?29, ?30,"
        " ?31, ?32, ?33, ?34, ?35, ?36, ?37, ?38, ?39, ?40,"
        " ?41, ?42, ?43, ?44, ?45, ?46, ?47, ?48, ?49, ?50)");
    impl_->ruling_stmt = Stmt(db,
        "INSERT INTO rulings (oracle_id, published_at, comment, source) VALUES (?1, ?2, ?3, ?4)");
    impl_->set_stmt = Stmt(db,
        "INSERT OR REPLACE INTO sets"
        " (code, name, set_type, release_date, card_count, icon_svg_uri,"
        " block, base_set_size, total_set_size, is_online_only, is_foil_only, keyrune_code)"
        " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)");
}

CardStore::~CardStore() = default;

void CardStore::write_cards(const std::vector<CardRecord>& batch) {
    Stmt& s = impl_->card_stmt;
    for (const auto& c : batch) {
        s.reset();
        s.bind_text(1, c.id);
        s.bind_text(2, c.oracle_id);
        s.bind_text(3, c.name);
        s.bind_text(4, c.flavor_name);
        s.bind_text(5, c.layout);
        s.bind_text(6, c.mana_cost);
        s.bind_double(7, c.cmc);
        s.bind_text(8, c.colors);
        s.bind_text(9, c.color_identity);
        s.bind_text(10, c.type_line);
        s.bind_text(11, c.oracle_text);
        s.bind_text(12, c.flavor_text);
        s.bind_text(13, c.power);
        s.bind_text(14, c.toughness);
        s.bind_text(15, c.loyalty);
        s.bind_text(16, c.defense);
        s.bind_text(17, c.keywords);
        s.bind_text(18, c.set_code);
        s.bind_text(19, c.set_name);
        s.bind_text(20, c.rarity);
        s.bind_text(21, c.collector_number);
        s.bind_text(22, c.artist);
        s.bind_text(23, c.release_date);
        s.bind_int(24, c.is_token ? 1 : 0);
        s.bind_int(25, c.is_promo ? 1 : 0);
        s.bind_int(26, c.is_digital_only ? 1 : 0);
        s.bind_int64(27, c.edhrec_rank);
        s.bind_text(28, c.image_small);
        s.bind_text(29, c.image_normal);
        s.bind_text(30, c.image_large);
        s.bind_text(31, c.image_png);
        s.bind_text(32, c.image_art_crop);
        s.bind_text(33, c.image_border_crop);
        s.bind_int64(34, c.price_usd);
        s.bind_int64(35, c.price_usd_foil);
        s.bind_int64(36, c.price_eur);
        s.bind_int64(37, c.price_eur_foil);
        s.bind_text(38, c.purchase_tcgplayer);
        s.bind_text(39, c.purchase_cardmarket);
        s.bind_text(40, c.purchase_cardhoarder);
        s.bind_text(41, c.link_edhrec);
        s.bind_text(42, c.link_gatherer);
        s.bind_text(43, c.illustration_id);
        s.bind_int(44, c.highres_image ? 1 : 0);
        s.bind_text(45, c.border_color);
        s.bind_text(46, c.frame);
        s.bind_int(47, c.full_art ? 1 : 0);
        s.bind_int(48, static_cast<int>(c.art_priority));
        s.bind_text(49, c.finishes);
        s.bind_text(50, c.legalities);
        try {
            s.exec();
        } catch (const SchemaError& e) {
            throw SchemaError(std::format("carddb: card {}: {}", c.id, e.what()));
        }
    }
}

void CardStore::write_rulings(const std::vector<RulingRecord>& batch) {
    Stmt& s = impl_->ruling_stmt;
    for (const auto& r : batch) {
        s.reset();
        s.bind_text(1, r.oracle_id);
        s.bind_text(2, r.published_at);
        s.bind_text(3, r.comment);
        s.bind_text(4, r.source);
        s.exec();
    }
}

void CardStore::write_sets(const std::vector<SetRecord>& batch) {
    Stmt& s = impl_->set_stmt;
    for (const auto& st : batch) {
        s.reset();
        s.bind_text(1, st.code);
        s.bind_text(2, st.name);
        s.bind_text(3, st.set_type);
        s.bind_text(4, st.release_date);
        s.bind_int64(5, st.card_count);
        s.bind_text(6, st.icon_svg_uri);
        s.bind_text(7, st.block);
        s.bind_int64(8, st.base_set_size);
        s.bind_int64(9, st.total_set_size);
        s.bind_int(10, st.is_online_only ? 1 : 0);
        s.bind_int(11, st.is_foil_only ? 1 : 0);
        s.bind_text(12, st.keyrune_code);
        s.exec();
    }
}

// ---------------------------------------------------------------------------
// build_db
// ---------------------------------------------------------------------------

static void remove_with_sidecars(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path + "-wal", ec);
    fs::remove(path + "-shm", ec);
    fs::remove(path + "-journal", ec);
}

// Fractions of the build at which each phase starts.
static constexpr double kSetsStart = 0.03;
static constexpr double kCardsStart = 0.09;
static constexpr double kCardsEnd = 0.80;
static constexpr double kRulingsStart = 0.86;
static constexpr double kRulingsEnd = 0.91;
static constexpr double kIndexesStart = 0.94;
static constexpr double kSearchStart = 0.97;

BuildResult build_db(const std::string& db_path, const BuildInputs& inputs,
                     const std::optional<std::string>& marker,
                     const BuildOptions& opts, const BuildProgressFunc& progress) {
    BuildResult result;

    auto report = [&](BuildPhase phase, double fraction, std::string status, uint64_t records = 0) {
        if (!progress) return;
        BuildProgress bp;
        bp.phase = phase;
        bp.fraction = std::clamp(fraction, 0.0, 1.0);
        bp.status = std::move(status);
        bp.records = records;
        progress(bp);
    };

    // The previous database goes first; a build never patches it.
    remove_with_sidecars(db_path);

    std::string tmp_path = db_path + ".tmp";
    remove_with_sidecars(tmp_path);

    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }

    report(BuildPhase::Init, 0.0, "Creating database schema...");

    try {
        sqlite::Connection conn(tmp_path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        sqlite3* db = conn.get();
        exec_sql(db, "PRAGMA journal_mode=WAL");
        exec_sql(db, "PRAGMA synchronous=NORMAL");
        exec_sql(db, "PRAGMA cache_size=-64000");

        {
            sqlite::Transaction tx(db);
            create_schema(db);
            tx.commit();
        }

        cardimport::ImportOptions import_opts;
        import_opts.batch_size = opts.batch_size;

        // Statements live in this scope so they are finalized before the
        // WAL checkpoint below.
        {
            CardStore store(db);

            report(BuildPhase::SchemaCreated, kSetsStart, "Importing sets...");
            {
                sqlite::Transaction tx(db);
                result.set_count = cardimport::import_sets(
                    inputs.sets_path, inputs.set_supplement_path, store, import_opts);
                tx.commit();
            }

            report(BuildPhase::SetsImported, kCardsStart,
                   std::format("Imported {} sets; importing cards...", result.set_count));
            {
                sqlite::Transaction tx(db);
                auto card_opts = import_opts;
                card_opts.progress = [&](uint64_t n) {
                    double f = std::min(1.0, static_cast<double>(n) / kEstimatedCardCount);
                    report(BuildPhase::SetsImported, kCardsStart + (kCardsEnd - kCardsStart) * f,
                           std::format("Imported {} cards...", n), n);
                };
                result.card_count = cardimport::import_cards(inputs.cards_path, store, card_opts);
                tx.commit();
            }

            report(BuildPhase::CardsImported, kRulingsStart,
                   std::format("Imported {} cards; importing rulings...", result.card_count),
                   result.card_count);
            {
                sqlite::Transaction tx(db);
                result.ruling_count = cardimport::import_rulings(inputs.rulings_path, store, import_opts);
                tx.commit();
            }
        }

        report(BuildPhase::RulingsImported, kRulingsEnd,
               std::format("Imported {} rulings", result.ruling_count), result.ruling_count);

        report(BuildPhase::RulingsImported, kIndexesStart, "Creating indexes...");
        {
            sqlite::Transaction tx(db);
            create_indexes(db);
            tx.commit();
        }

        report(BuildPhase::IndexesBuilt, kSearchStart, "Creating search index...");
        {
            sqlite::Transaction tx(db);
            build_search_index(db);
            tx.commit();
        }

        report(BuildPhase::SearchIndexBuilt, kSearchStart, "Finalizing...");
        {
            sqlite::Transaction tx(db);
            if (marker) sqlite::write_meta(db, "meta", kMarkerKey, *marker);
            sqlite::write_meta(db, "meta", "schema_version", kSchemaVersion);
            sqlite::write_meta(db, "meta", "created_at", sqlite::utc_timestamp());
            sqlite::write_meta(db, "meta", "card_count", std::to_string(result.card_count));
            sqlite::write_meta(db, "meta", "set_count", std::to_string(result.set_count));
            sqlite::write_meta(db, "meta", "ruling_count", std::to_string(result.ruling_count));
            tx.commit();
        }

        // Fold the WAL into the main file; the -wal sidecar is not renamed.
        exec_sql(db, "PRAGMA wal_checkpoint(TRUNCATE)");
        exec_sql(db, "PRAGMA journal_mode=DELETE");
        conn.close();
    } catch (...) {
        remove_with_sidecars(tmp_path);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp_path, db_path, ec);
    if (ec) {
        remove_with_sidecars(tmp_path);
        throw SchemaError(std::format("carddb: rename {} -> {}: {}", tmp_path, db_path, ec.message()));
    }
    remove_with_sidecars(tmp_path);

    report(BuildPhase::VersionStamped, 1.0,
           std::format("Database ready: {} cards, {} sets, {} rulings",
                       result.card_count, result.set_count, result.ruling_count));
    report(BuildPhase::Done, 1.0, "Done");
    return result;
}

// ---------------------------------------------------------------------------
// Reading back
// ---------------------------------------------------------------------------

std::map<std::string, std::string> read_meta(const std::string& db_path) {
    sqlite::Connection conn(db_path, SQLITE_OPEN_READONLY);
    std::map<std::string, std::string> out;
    if (!sqlite::table_exists(conn.get(), "meta")) return out;
    Stmt stmt(conn.get(), "SELECT key, value FROM meta");
    while (stmt.step() == SQLITE_ROW) {
        auto k = stmt.column_text(0);
        if (k) out[*k] = stmt.column_text(1).value_or("");
    }
    return out;
}

static int64_t count_rows(sqlite3* db, const char* table) {
    if (!sqlite::table_exists(db, table)) return 0;
    std::string sql = std::format("SELECT COUNT(*) FROM {}", table);
    Stmt stmt(db, sql.c_str());
    if (stmt.step() != SQLITE_ROW) return 0;
    return stmt.column_int64(0).value_or(0);
}

DbStats read_stats(const std::string& db_path) {
    std::error_code ec;
    if (!fs::exists(db_path, ec)) {
        throw SchemaError(std::format("carddb: {} does not exist", db_path));
    }
    auto meta = read_meta(db_path);
    sqlite::Connection conn(db_path, SQLITE_OPEN_READONLY);

    DbStats st;
    st.schema_version = meta["schema_version"];
    st.created_at = meta["created_at"];
    if (auto it = meta.find(kMarkerKey); it != meta.end()) st.marker = it->second;
    st.card_count = count_rows(conn.get(), "cards");
    st.set_count = count_rows(conn.get(), "sets");
    st.ruling_count = count_rows(conn.get(), "rulings");
    return st;
}

} // namespace mtgtools::carddb
