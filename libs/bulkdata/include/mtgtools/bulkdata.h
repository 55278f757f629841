#pragma once

#include "mtgtools/fetch.h"

#include <optional>
#include <string>
#include <vector>

namespace mtgtools::bulkdata {

// RemoteSource describes one downloadable bulk dataset.
struct RemoteSource {
    std::string name;         // "default_cards", "rulings", ...
    std::string download_uri;
    std::string updated_at;   // fixed-width UTC ISO-8601 freshness marker
};

// FreshnessCheck is the outcome of comparing remote and stored markers.
struct FreshnessCheck {
    bool needs_update = true;
    std::optional<std::string> remote_marker;
    std::optional<std::string> stored_marker;
    // sources is the listing the decision was made on; empty when the
    // metadata could not be fetched.
    std::vector<RemoteSource> sources;
};

// parse_bulk_metadata decodes the bulk-data listing
// ({"data": [{"type", "download_uri", "updated_at"}, ...]}).
// Throws VersionCheckError when an expected field is missing and
// ParseError when the document is not JSON.
std::vector<RemoteSource> parse_bulk_metadata(const std::string& text);

// find_source returns the entry named name, or nullptr.
const RemoteSource* find_source(const std::vector<RemoteSource>& sources, const std::string& name);

// read_stored_marker returns the marker recorded in the database's meta
// table. A missing file, table or key, or an unreadable database, yields
// nullopt.
std::optional<std::string> read_stored_marker(const std::string& db_path);

// check_freshness decides whether the local database must be rebuilt.
// Network and metadata failures fail open: an existing database is
// reported current, a missing one as needing an update.
FreshnessCheck check_freshness(fetch::Transport& transport, const std::string& metadata_url,
                               const std::string& db_path, const std::string& source_name);

} // namespace mtgtools::bulkdata
