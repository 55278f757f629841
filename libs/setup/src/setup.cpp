#include "mtgtools/setup.h"
#include "mtgtools/errors.h"
#include "mtgtools/pricecache.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mtgtools::setup {

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

fetch::Timeouts SetupConfig::timeouts() const {
    return fetch::Timeouts{
        .connect = std::chrono::seconds(connect_timeout_s),
        .stall = std::chrono::seconds(stall_timeout_s),
        .total = std::chrono::seconds(total_timeout_s),
    };
}

static void to_json(json& j, const SetupConfig& c) {
    j = json{
        {"card_db_path", c.card_db_path},
        {"combo_db_path", c.combo_db_path},
        {"price_cache_path", c.price_cache_path},
        {"collection_db_path", c.collection_db_path},
        {"work_dir", c.work_dir},
        {"bulk_metadata_url", c.bulk_metadata_url},
        {"sets_url", c.sets_url},
        {"set_list_url", c.set_list_url},
        {"releases_url", c.releases_url},
        {"cards_source", c.cards_source},
        {"rulings_source", c.rulings_source},
        {"combo_compressed_asset", c.combo_compressed_asset},
        {"combo_plain_asset", c.combo_plain_asset},
        {"batch_size", c.batch_size},
        {"connect_timeout_s", c.connect_timeout_s},
        {"stall_timeout_s", c.stall_timeout_s},
        {"total_timeout_s", c.total_timeout_s},
        {"force", c.force},
        {"sync_combos", c.sync_combos},
    };
}

static void from_json(const json& j, SetupConfig& c) {
    if (j.contains("card_db_path")) j.at("card_db_path").get_to(c.card_db_path);
    if (j.contains("combo_db_path")) j.at("combo_db_path").get_to(c.combo_db_path);
    if (j.contains("price_cache_path")) j.at("price_cache_path").get_to(c.price_cache_path);
    if (j.contains("collection_db_path")) j.at("collection_db_path").get_to(c.collection_db_path);
    if (j.contains("work_dir")) j.at("work_dir").get_to(c.work_dir);
    if (j.contains("bulk_metadata_url")) j.at("bulk_metadata_url").get_to(c.bulk_metadata_url);
    if (j.contains("sets_url")) j.at("sets_url").get_to(c.sets_url);
    if (j.contains("set_list_url")) j.at("set_list_url").get_to(c.set_list_url);
    if (j.contains("releases_url")) j.at("releases_url").get_to(c.releases_url);
    if (j.contains("cards_source")) j.at("cards_source").get_to(c.cards_source);
    if (j.contains("rulings_source")) j.at("rulings_source").get_to(c.rulings_source);
    if (j.contains("combo_compressed_asset")) j.at("combo_compressed_asset").get_to(c.combo_compressed_asset);
    if (j.contains("combo_plain_asset")) j.at("combo_plain_asset").get_to(c.combo_plain_asset);
    if (j.contains("batch_size")) {
        const auto& v = j.at("batch_size");
        if (!v.is_number_unsigned()) {
            throw ParseError("setup: batch_size must be a positive integer");
        }
        v.get_to(c.batch_size);
    }
    if (j.contains("connect_timeout_s")) j.at("connect_timeout_s").get_to(c.connect_timeout_s);
    if (j.contains("stall_timeout_s")) j.at("stall_timeout_s").get_to(c.stall_timeout_s);
    if (j.contains("total_timeout_s")) j.at("total_timeout_s").get_to(c.total_timeout_s);
    if (j.contains("force")) j.at("force").get_to(c.force);
    if (j.contains("sync_combos")) j.at("sync_combos").get_to(c.sync_combos);
}

bool valid_batch_size(size_t n) {
    return n >= 1 && n <= cardimport::kMaxBatchSize;
}

SetupConfig load_setup_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ParseError(std::format("setup: cannot open config {}", path));
    }
    SetupConfig cfg;
    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            throw ParseError(std::format("setup: config {} is not a JSON object", path));
        }
        j.get_to(cfg);
    } catch (const json::exception& e) {
        throw ParseError(std::format("setup: config {}: {}", path, e.what()));
    }
    if (!valid_batch_size(cfg.batch_size)) {
        throw ParseError(std::format("setup: config {}: batch_size must be between 1 and {}", path,
                                     cardimport::kMaxBatchSize));
    }
    return cfg;
}

void save_setup_config(const SetupConfig& cfg, const std::string& path) {
    json j = cfg;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        throw Error(std::format("setup: cannot write config {}", path));
    }
    f << j.dump(2) << "\n";
}

// ---------------------------------------------------------------------------
// Progress
// ---------------------------------------------------------------------------

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Checking: return "checking";
        case Phase::DownloadingCards: return "downloading_cards";
        case Phase::DownloadingSets: return "downloading_sets";
        case Phase::DownloadingRulings: return "downloading_rulings";
        case Phase::DownloadingSetList: return "downloading_set_list";
        case Phase::BuildingDatabase: return "building_database";
        case Phase::SyncingCombos: return "syncing_combos";
        case Phase::CachingPrices: return "caching_prices";
        case Phase::Complete: return "complete";
        case Phase::UpToDate: return "up_to_date";
        case Phase::Error: return "error";
    }
    return "unknown";
}

bool is_terminal(Phase phase) {
    return phase == Phase::Complete || phase == Phase::UpToDate || phase == Phase::Error;
}

ProgressChannel::ProgressChannel(size_t capacity, Observer observer)
    : capacity_(std::max<size_t>(capacity, 1)), observer_(std::move(observer)) {}

bool ProgressChannel::publish(ProgressState state) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) return false;
        if (observer_) observer_(state);
        state.fraction = std::clamp(state.fraction, last_fraction_, 1.0);
        last_fraction_ = state.fraction;
        if (pending_.size() >= capacity_) {
            auto victim = std::find_if(pending_.begin(), pending_.end(),
                                       [](const ProgressState& s) { return !is_terminal(s.phase); });
            if (victim != pending_.end()) {
                pending_.erase(victim);
                ++dropped_;
            }
        }
        pending_.push_back(std::move(state));
    }
    cv_.notify_one();
    return true;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<ProgressState> ProgressChannel::pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !pending_.empty() || closed_; });
    if (pending_.empty()) return std::nullopt;
    ProgressState s = std::move(pending_.front());
    pending_.pop_front();
    return s;
}

std::optional<ProgressState> ProgressChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (pending_.empty()) return std::nullopt;
    ProgressState s = std::move(pending_.front());
    pending_.pop_front();
    return s;
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

double ProgressChannel::last_fraction() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_fraction_;
}

uint64_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
}

// ---------------------------------------------------------------------------
// Pipeline helpers
// ---------------------------------------------------------------------------

namespace {

struct Reporter {
    ProgressChannel& channel;

    void operator()(double fraction, std::string status, Phase phase) const {
        channel.publish(ProgressState{.fraction = fraction, .status = std::move(status), .phase = phase});
    }
};

// WorkDir is a per-run download directory removed when the run ends.
class WorkDir {
public:
    explicit WorkDir(const std::string& parent) {
        fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = base / std::format("mtgtools-setup-{}", stamp);
        fs::create_directories(path_);
    }
    ~WorkDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) LOGW("setup: could not remove", path_.string(), ":", ec.message());
    }
    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    std::string file(const char* name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// RunGuard releases the manager's running flag.
struct RunGuard {
    std::atomic<bool>& flag;
    ~RunGuard() { flag.store(false); }
};

// Downloads url into dest, mapping byte progress onto [base, base + span].
void download_step(fetch::Transport& transport, const std::string& url, const std::string& dest,
                   double base, double span, const std::string& status, Phase phase,
                   const Reporter& report) {
    report(base, status + "...", phase);
    transport.download(url, dest, [&](uint64_t done, uint64_t total) {
        double mb = static_cast<double>(done) / 1e6;
        double frac = 0.0;
        std::string text;
        if (total > 0) {
            frac = std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
            text = std::format("{} ({:.1f} / {:.1f} MB)", status, mb, static_cast<double>(total) / 1e6);
        } else {
            text = std::format("{} ({:.1f} MB)", status, mb);
        }
        LOGD_RATE_LIMIT(1000, "setup:", text);
        report(base + span * frac, std::move(text), phase);
    });
    report(base + span, status + " complete", phase);
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error(std::format("setup: cannot create {}", path));
    }
    out << text;
    if (!out) {
        throw Error(std::format("setup: write failed for {}", path));
    }
}

} // namespace

// ---------------------------------------------------------------------------
// SetupManager
// ---------------------------------------------------------------------------

SetupManager::SetupManager(SetupConfig config, std::shared_ptr<fetch::Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw Error("setup: transport is required");
    }
    if (!valid_batch_size(config_.batch_size)) {
        throw Error(std::format("setup: batch_size must be between 1 and {}", cardimport::kMaxBatchSize));
    }
}

SetupOutcome SetupManager::run(ProgressChannel& channel) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw Error("setup: a run is already in progress");
    }
    RunGuard guard{running_};
    return run_pipeline(channel);
}

std::future<SetupOutcome> SetupManager::start(ProgressChannel& channel) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw Error("setup: a run is already in progress");
    }
    try {
        return std::async(std::launch::async, [this, &channel] {
            RunGuard guard{running_};
            return run_pipeline(channel);
        });
    } catch (...) {
        running_.store(false);
        throw;
    }
}

SetupOutcome SetupManager::run_pipeline(ProgressChannel& channel) {
    const SetupConfig& cfg = config_;
    Reporter report{channel};
    SetupOutcome outcome;

    try {
        report(0.02, "Checking for updates...", Phase::Checking);
        outcome.freshness = bulkdata::check_freshness(*transport_, cfg.bulk_metadata_url,
                                                      cfg.card_db_path, cfg.cards_source);

        if (!outcome.freshness.needs_update && !cfg.force) {
            LOGI("setup: card database is current at",
                 outcome.freshness.stored_marker.value_or("(unknown)"));
            if (cfg.sync_combos) outcome.combos = sync_combos(channel);
            outcome.price_cache_written = cache_prices(channel);
            report(1.0, "Data is up to date!", Phase::UpToDate);
            channel.close();
            return outcome;
        }

        report(0.05, "Connecting to card data service...", Phase::DownloadingCards);
        // The listing the freshness check compared is reused; it is only
        // fetched again when that check failed open.
        auto sources = outcome.freshness.sources;
        if (sources.empty()) {
            sources = bulkdata::parse_bulk_metadata(transport_->get_text(cfg.bulk_metadata_url));
        }
        const auto* cards = bulkdata::find_source(sources, cfg.cards_source);
        const auto* rulings = bulkdata::find_source(sources, cfg.rulings_source);
        if (!cards || !rulings) {
            throw VersionCheckError(std::format("setup: bulk metadata lacks {} or {}",
                                                cfg.cards_source, cfg.rulings_source));
        }

        {
            WorkDir work(cfg.work_dir);
            carddb::BuildInputs inputs{
                .cards_path = work.file("cards.json"),
                .sets_path = work.file("sets.json"),
                .rulings_path = work.file("rulings.json"),
                .set_supplement_path = cfg.set_list_url.empty() ? "" : work.file("SetList.json"),
            };

            download_step(*transport_, cards->download_uri, inputs.cards_path, 0.08, 0.35,
                          "Downloading cards", Phase::DownloadingCards, report);

            report(0.43, "Downloading set information...", Phase::DownloadingSets);
            write_text_file(inputs.sets_path, transport_->get_text(cfg.sets_url));
            report(0.45, "Set data downloaded", Phase::DownloadingSets);

            download_step(*transport_, rulings->download_uri, inputs.rulings_path, 0.45, 0.05,
                          "Downloading card rulings", Phase::DownloadingRulings, report);

            if (!cfg.set_list_url.empty()) {
                download_step(*transport_, cfg.set_list_url, inputs.set_supplement_path, 0.50, 0.02,
                              "Downloading set metadata", Phase::DownloadingSetList, report);
            }

            report(0.52, "Building card database...", Phase::BuildingDatabase);
            outcome.build = carddb::build_db(
                cfg.card_db_path, inputs, cards->updated_at,
                carddb::BuildOptions{.batch_size = cfg.batch_size},
                [&](const carddb::BuildProgress& p) {
                    report(0.52 + 0.35 * p.fraction, p.status, Phase::BuildingDatabase);
                });
        }
        outcome.database_updated = true;
        LOGI("setup: built", cfg.card_db_path, "with", outcome.build->card_count, "cards at",
             cards->updated_at);

        if (cfg.sync_combos) outcome.combos = sync_combos(channel);
        outcome.price_cache_written = cache_prices(channel);

        report(1.0, "Update complete!", Phase::Complete);
        channel.close();
        return outcome;
    } catch (const std::exception& e) {
        LOGE("setup: update failed:", e.what());
        report(channel.last_fraction(), std::format("Update failed: {}", e.what()), Phase::Error);
        channel.close();
        throw;
    }
}

combosync::SyncResult SetupManager::sync_combos(ProgressChannel& channel) {
    Reporter report{channel};
    report(0.88, "Checking combo database...", Phase::SyncingCombos);

    combosync::ComboSyncOptions opts{
        .releases_url = config_.releases_url,
        .dest_path = config_.combo_db_path,
        .compressed_asset = config_.combo_compressed_asset,
        .plain_asset = config_.combo_plain_asset,
    };
    auto result = combosync::sync_artifact(*transport_, opts, [&](uint64_t done, uint64_t total) {
        double frac = total > 0 ? std::min(1.0, static_cast<double>(done) / static_cast<double>(total)) : 0.0;
        report(0.89 + 0.05 * frac, "Downloading combo database...", Phase::SyncingCombos);
    });

    std::string status;
    switch (result.status) {
        case combosync::SyncStatus::Updated: status = "Combo database updated"; break;
        case combosync::SyncStatus::UpToDate: status = "Combo database is up to date"; break;
        case combosync::SyncStatus::Offline: status = "Combo database offline, using local copy"; break;
        case combosync::SyncStatus::Unavailable:
            status = std::format("Combo database unavailable: {}", result.message.substr(0, 50));
            break;
    }
    report(0.95, std::move(status), Phase::SyncingCombos);
    return result;
}

bool SetupManager::cache_prices(ProgressChannel& channel) {
    if (config_.collection_db_path.empty()) return false;
    std::error_code ec;
    if (!fs::exists(config_.collection_db_path, ec)) {
        LOGW_ONCE("setup.collection_missing",
                  "setup: collection store", config_.collection_db_path, "not found, price cache disabled");
        return false;
    }

    Reporter report{channel};
    report(0.96, "Caching collection prices...", Phase::CachingPrices);
    bool ok = pricecache::prepopulate(config_.card_db_path, config_.collection_db_path,
                                      config_.price_cache_path);
    report(0.99, ok ? "Collection prices cached" : "Price caching skipped", Phase::CachingPrices);
    return ok;
}

} // namespace mtgtools::setup
