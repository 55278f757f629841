#include "mtgtools/bulkdata.h"
#include "mtgtools/carddb.h"
#include "mtgtools/combosync.h"
#include "mtgtools/fetch.h"
#include "mtgtools/setup.h"

#include "../common/cli_logger.h"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using mtgtools::setup::SetupConfig;

static void print_state(const mtgtools::setup::ProgressState& s) {
    int pct = static_cast<int>(s.fraction * 100.0 + 0.5);
    if (mtgtools::setup::is_terminal(s.phase)) {
        std::cerr << std::format("\r[{:>3}%] {}\033[K\n", pct, s.status);
    } else {
        std::cerr << std::format("\r[{:>3}%] {}\033[K", pct, s.status);
    }
}

static int do_update(const SetupConfig& cfg) {
    auto transport = std::make_shared<mtgtools::fetch::CurlTransport>(cfg.timeouts());
    mtgtools::setup::SetupManager mgr(cfg, transport);
    mtgtools::setup::ProgressChannel channel;

    auto result = mgr.start(channel);
    while (auto state = channel.pop()) {
        print_state(*state);
    }

    mtgtools::setup::SetupOutcome outcome;
    try {
        outcome = result.get();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    if (outcome.build) {
        std::cerr << std::format("Imported {} cards, {} sets, {} rulings\n",
                                 outcome.build->card_count, outcome.build->set_count,
                                 outcome.build->ruling_count);
        std::error_code ec;
        auto size = fs::file_size(cfg.card_db_path, ec);
        if (!ec) {
            std::cerr << std::format("Wrote {} ({:.1f} MB)\n", cfg.card_db_path,
                                     static_cast<double>(size) / 1024 / 1024);
        }
    }
    if (outcome.combos) {
        std::cerr << "Combos: " << mtgtools::combosync::status_name(outcome.combos->status) << '\n';
    }
    return 0;
}

static int do_check(const SetupConfig& cfg) {
    mtgtools::fetch::CurlTransport transport(cfg.timeouts());
    auto check = mtgtools::bulkdata::check_freshness(transport, cfg.bulk_metadata_url,
                                                     cfg.card_db_path, cfg.cards_source);
    std::cout << "Database:      " << cfg.card_db_path << '\n';
    std::cout << "Local marker:  " << check.stored_marker.value_or("(none)") << '\n';
    std::cout << "Remote marker: " << check.remote_marker.value_or("(unavailable)") << '\n';
    std::cout << "Needs update:  " << (check.needs_update ? "yes" : "no") << '\n';
    return check.needs_update ? 2 : 0;
}

static int do_combos_only(const SetupConfig& cfg) {
    mtgtools::fetch::CurlTransport transport(cfg.timeouts());
    mtgtools::combosync::ComboSyncOptions opts{
        .releases_url = cfg.releases_url,
        .dest_path = cfg.combo_db_path,
        .compressed_asset = cfg.combo_compressed_asset,
        .plain_asset = cfg.combo_plain_asset,
    };
    auto result = mtgtools::combosync::sync_artifact(transport, opts, [](uint64_t done, uint64_t total) {
        if (total > 0) {
            std::cerr << std::format("\rDownloading combos {:.1f} / {:.1f} MB\033[K",
                                     static_cast<double>(done) / 1e6, static_cast<double>(total) / 1e6);
        } else {
            std::cerr << std::format("\rDownloading combos {:.1f} MB\033[K", static_cast<double>(done) / 1e6);
        }
    });
    std::cerr << std::format("\rCombos: {} {}\033[K\n", mtgtools::combosync::status_name(result.status),
                             result.marker.value_or(""));
    if (result.status == mtgtools::combosync::SyncStatus::Unavailable) {
        std::cerr << "Error: " << result.message << '\n';
        return 1;
    }
    return 0;
}

static int do_info(const std::string& db_path) {
    mtgtools::carddb::DbStats stats;
    try {
        stats = mtgtools::carddb::read_stats(db_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    std::error_code ec;
    auto size = fs::file_size(db_path, ec);

    std::cout << "Database:       " << db_path << '\n';
    if (!ec) {
        std::cout << std::format("Size:           {:.1f} MB\n", static_cast<double>(size) / 1024 / 1024);
    }
    std::cout << "Schema version: " << stats.schema_version << '\n';
    std::cout << "Created:        " << stats.created_at << '\n';
    std::cout << "Data marker:    " << stats.marker.value_or("(none)") << '\n';
    std::cout << "Cards:          " << stats.card_count << '\n';
    std::cout << "Sets:           " << stats.set_count << '\n';
    std::cout << "Rulings:        " << stats.ruling_count << '\n';
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: mtgdb [flags] [cards.db]\n\n"
              << "Card database setup and update tool.\n\n"
              << "Modes:\n"
              << "  Update (default)  Rebuild the card database when the remote data is newer,\n"
              << "                    then sync combos and warm the collection price cache\n"
              << "  Check  (-check)   Compare local and remote data markers (exit 2 if stale)\n"
              << "  Info   (-info)    Show database statistics\n"
              << "  Combos (-combos-only) Sync the combo database only\n\n"
              << "Flags:\n"
              << "  -config <path>      Config file (JSON)\n"
              << "  -save-config <path> Write the effective config and exit\n"
              << "  -db <path>          Card database path\n"
              << "  -combos <path>      Combo database path\n"
              << "  -collection <path>  Collection database used for price caching\n"
              << "  -prices <path>      Price cache path\n"
              << "  -workdir <dir>      Parent directory for downloads\n"
              << "  -batch <n>          Import batch size\n"
              << "  -force              Rebuild even when the data is current\n"
              << "  -no-combos          Skip the combo database\n"
              << "  -v, --verbose       Verbose logging\n"
              << "  -vv, --debug        Debug logging\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string save_config_path;
    std::string db_flag;
    std::string combos_flag;
    std::string collection_flag;
    std::string prices_flag;
    std::string workdir_flag;
    std::string batch_flag;
    bool force = false;
    bool no_combos = false;
    bool check_flag = false;
    bool info_flag = false;
    bool combos_only = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0 && i + 1 < argc) config_path = argv[++i];
        else if (std::strcmp(argv[i], "-save-config") == 0 && i + 1 < argc) save_config_path = argv[++i];
        else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) db_flag = argv[++i];
        else if (std::strcmp(argv[i], "-combos") == 0 && i + 1 < argc) combos_flag = argv[++i];
        else if (std::strcmp(argv[i], "-collection") == 0 && i + 1 < argc) collection_flag = argv[++i];
        else if (std::strcmp(argv[i], "-prices") == 0 && i + 1 < argc) prices_flag = argv[++i];
        else if (std::strcmp(argv[i], "-workdir") == 0 && i + 1 < argc) workdir_flag = argv[++i];
        else if (std::strcmp(argv[i], "-batch") == 0 && i + 1 < argc) batch_flag = argv[++i];
        else if (std::strcmp(argv[i], "-force") == 0) force = true;
        else if (std::strcmp(argv[i], "-no-combos") == 0) no_combos = true;
        else if (std::strcmp(argv[i], "-check") == 0) check_flag = true;
        else if (std::strcmp(argv[i], "-info") == 0) info_flag = true;
        else if (std::strcmp(argv[i], "-combos-only") == 0) combos_only = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) verbosity = 1;
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    mtgtools::log::set_verbosity(verbosity);

    SetupConfig cfg;
    if (!config_path.empty()) {
        try {
            cfg = mtgtools::setup::load_setup_config(config_path);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << '\n';
            return 1;
        }
    }

    // Override with flags
    if (!db_flag.empty()) cfg.card_db_path = db_flag;
    else if (!positional.empty()) cfg.card_db_path = positional[0];
    if (!combos_flag.empty()) cfg.combo_db_path = combos_flag;
    if (!collection_flag.empty()) cfg.collection_db_path = collection_flag;
    if (!prices_flag.empty()) cfg.price_cache_path = prices_flag;
    if (!workdir_flag.empty()) cfg.work_dir = workdir_flag;
    if (!batch_flag.empty()) {
        size_t n = 0;
        auto [ptr, ec] = std::from_chars(batch_flag.data(), batch_flag.data() + batch_flag.size(), n);
        if (ec != std::errc{} || ptr != batch_flag.data() + batch_flag.size() ||
            !mtgtools::setup::valid_batch_size(n)) {
            std::cerr << std::format("Error: -batch expects a number between 1 and {}, got {}\n",
                                     mtgtools::cardimport::kMaxBatchSize, batch_flag);
            return 1;
        }
        cfg.batch_size = n;
    }
    if (force) cfg.force = true;
    if (no_combos) cfg.sync_combos = false;

    if (!save_config_path.empty()) {
        try {
            mtgtools::setup::save_setup_config(cfg, save_config_path);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << '\n';
            return 1;
        }
        std::cerr << "Wrote " << save_config_path << '\n';
        return 0;
    }

    if (info_flag) return do_info(cfg.card_db_path);
    if (check_flag) return do_check(cfg);
    if (combos_only) return do_combos_only(cfg);
    return do_update(cfg);
}
