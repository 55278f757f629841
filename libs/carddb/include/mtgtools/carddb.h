#pragma once

#include "mtgtools/cardimport.h"

#include <sqlite3.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mtgtools::carddb {

inline constexpr const char* kSchemaVersion = "1";

// Meta key recording the bulk-data marker the database was built from.
inline constexpr const char* kMarkerKey = "scryfall_updated_at";

// Used to scale card-import progress; the real total is not known upfront.
inline constexpr uint64_t kEstimatedCardCount = 110000;

// Build phases in order. Each phase commits its own transaction; no phase
// marker is persisted, so an interrupted build starts over from Init.
enum class BuildPhase {
    Init,
    SchemaCreated,
    SetsImported,
    CardsImported,
    RulingsImported,
    IndexesBuilt,
    SearchIndexBuilt,
    VersionStamped,
    Done,
};

const char* phase_name(BuildPhase phase);

// BuildInputs names the downloaded source files.
struct BuildInputs {
    std::string cards_path;
    std::string sets_path;
    std::string rulings_path;
    std::string set_supplement_path;  // optional; empty skips the supplement
};

struct BuildOptions {
    size_t batch_size = cardimport::kDefaultBatchSize;
};

struct BuildProgress {
    BuildPhase phase = BuildPhase::Init;  // last completed phase
    double fraction = 0.0;  // 0..1 within the build, non-decreasing
    std::string status;
    uint64_t records = 0;   // cumulative records of the current source
};

using BuildProgressFunc = std::function<void(const BuildProgress&)>;

struct BuildResult {
    uint64_t card_count = 0;
    uint64_t set_count = 0;
    uint64_t ruling_count = 0;
};

// build_db builds a fresh card database at db_path from the downloaded
// sources and stamps it with marker (when known). Any existing database is
// removed first; the new one is written to db_path + ".tmp" and renamed
// into place once complete. On failure the temporary file is removed and
// the error (ParseError, SchemaError) propagates.
BuildResult build_db(const std::string& db_path, const BuildInputs& inputs,
                     const std::optional<std::string>& marker,
                     const BuildOptions& opts, const BuildProgressFunc& progress);

// Schema steps, exposed for tests.
void create_schema(sqlite3* db);
void create_indexes(sqlite3* db);
void build_search_index(sqlite3* db);

// CardStore writes import batches into an open card database. Statements
// are prepared once and reused for every row.
class CardStore : public cardimport::RecordSink {
public:
    explicit CardStore(sqlite3* db);
    ~CardStore() override;

    void write_cards(const std::vector<cardimport::CardRecord>& batch) override;
    void write_rulings(const std::vector<cardimport::RulingRecord>& batch) override;
    void write_sets(const std::vector<cardimport::SetRecord>& batch) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// DbStats summarizes an existing card database.
struct DbStats {
    std::string schema_version;
    std::string created_at;
    std::optional<std::string> marker;
    int64_t card_count = 0;
    int64_t set_count = 0;
    int64_t ruling_count = 0;
};

// read_meta returns every key/value of the meta table.
std::map<std::string, std::string> read_meta(const std::string& db_path);

// read_stats opens the database read-only and summarizes it.
DbStats read_stats(const std::string& db_path);

} // namespace mtgtools::carddb
