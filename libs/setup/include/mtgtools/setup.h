#pragma once

#include "mtgtools/bulkdata.h"
#include "mtgtools/cardimport.h"
#include "mtgtools/carddb.h"
#include "mtgtools/combosync.h"
#include "mtgtools/fetch.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mtgtools::setup {

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

struct SetupConfig {
    std::string card_db_path = "data/mtg.sqlite";
    std::string combo_db_path = "data/combos.sqlite";
    std::string price_cache_path = "data/price_cache.json";
    std::string collection_db_path;  // empty disables price-cache warming
    std::string work_dir;            // parent of the per-run download dir; empty = system temp

    std::string bulk_metadata_url = "https://api.scryfall.com/bulk-data";
    std::string sets_url = "https://api.scryfall.com/sets";
    std::string set_list_url = "https://mtgjson.com/api/v5/SetList.json";
    std::string releases_url =
        "https://api.github.com/repos/AImaginationLab/magic-the-gathering-toolkit/releases";

    std::string cards_source = "default_cards";
    std::string rulings_source = "rulings";
    std::string combo_compressed_asset = "combos.sqlite.gz";
    std::string combo_plain_asset = "combos.sqlite";

    size_t batch_size = cardimport::kDefaultBatchSize;
    int connect_timeout_s = 60;
    int stall_timeout_s = 600;
    int total_timeout_s = 0;  // 0 = no overall limit

    bool force = false;        // rebuild even when the marker is current
    bool sync_combos = true;

    fetch::Timeouts timeouts() const;
};

// valid_batch_size reports whether n lies in [1, cardimport::kMaxBatchSize].
bool valid_batch_size(size_t n);

// load_setup_config reads a JSON config file; keys it lacks keep their
// defaults. Throws ParseError when the file is missing or malformed.
SetupConfig load_setup_config(const std::string& path);

// save_setup_config writes every field as pretty-printed JSON.
void save_setup_config(const SetupConfig& cfg, const std::string& path);

// ---------------------------------------------------------------------------
// Progress
// ---------------------------------------------------------------------------

enum class Phase {
    Checking,
    DownloadingCards,
    DownloadingSets,
    DownloadingRulings,
    DownloadingSetList,
    BuildingDatabase,
    SyncingCombos,
    CachingPrices,
    Complete,
    UpToDate,
    Error,
};

const char* phase_name(Phase phase);

// is_terminal is true for Complete, UpToDate and Error.
bool is_terminal(Phase phase);

struct ProgressState {
    double fraction = 0.0;  // 0..1
    std::string status;
    Phase phase = Phase::Checking;
};

// ProgressChannel carries ProgressState values from the pipeline worker to
// a consumer. The producer side clamps fractions so the published sequence
// never decreases. When the channel is full the oldest pending non-terminal
// state is dropped; terminal states are never dropped.
class ProgressChannel {
public:
    // Observer sees every accepted state as published, before clamping.
    // It runs on the producer thread with the channel locked.
    using Observer = std::function<void(const ProgressState&)>;

    explicit ProgressChannel(size_t capacity = 64, Observer observer = {});

    // publish enqueues state. Returns false (and drops it) after close().
    bool publish(ProgressState state);

    // close wakes waiting consumers; pending states stay readable.
    void close();

    // pop blocks until a state is available, or returns nullopt once the
    // channel is closed and drained.
    std::optional<ProgressState> pop();

    // try_pop returns immediately.
    std::optional<ProgressState> try_pop();

    bool closed() const;
    double last_fraction() const;
    uint64_t dropped() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ProgressState> pending_;
    size_t capacity_;
    Observer observer_;
    double last_fraction_ = 0.0;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

// ---------------------------------------------------------------------------
// Orchestration
// ---------------------------------------------------------------------------

struct SetupOutcome {
    bool database_updated = false;
    bulkdata::FreshnessCheck freshness;
    std::optional<carddb::BuildResult> build;
    std::optional<combosync::SyncResult> combos;
    bool price_cache_written = false;
};

// SetupManager runs the check / download / build / combo sync / price cache
// pipeline for one configuration. At most one run is active at a time.
// The manager must outlive any future returned by start().
class SetupManager {
public:
    SetupManager(SetupConfig config, std::shared_ptr<fetch::Transport> transport);

    // run executes the pipeline on the calling thread, publishing progress
    // into channel and closing it when done. On failure an Error state is
    // published and the exception propagates.
    SetupOutcome run(ProgressChannel& channel);

    // start runs the pipeline on a worker thread. The future carries the
    // outcome or the failure. Throws Error if a run is already active.
    std::future<SetupOutcome> start(ProgressChannel& channel);

    bool running() const { return running_.load(); }
    const SetupConfig& config() const { return config_; }

private:
    SetupOutcome run_pipeline(ProgressChannel& channel);
    combosync::SyncResult sync_combos(ProgressChannel& channel);
    bool cache_prices(ProgressChannel& channel);

    SetupConfig config_;
    std::shared_ptr<fetch::Transport> transport_;
    std::atomic<bool> running_{false};
};

} // namespace mtgtools::setup
