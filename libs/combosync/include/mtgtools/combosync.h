#pragma once

#include "mtgtools/fetch.h"

#include <optional>
#include <string>
#include <vector>

namespace mtgtools::combosync {

// Meta key inside the artifact holding the release it came from.
inline constexpr const char* kMarkerKey = "release_updated_at";

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

struct Release {
    std::string tag_name;
    std::string updated_at;  // falls back to published_at
    std::vector<ReleaseAsset> assets;
};

// parse_releases decodes a release listing (an array of releases, or a
// single release object) and returns it newest first. Releases without a
// timestamp (drafts) are skipped. Throws ParseError / VersionCheckError.
std::vector<Release> parse_releases(const std::string& text);

struct AssetChoice {
    const Release* release = nullptr;
    const ReleaseAsset* asset = nullptr;
    bool compressed = false;
};

// select_asset scans releases newest first and, within a release, prefers
// compressed_name over plain_name. The scan stops at the first release
// carrying either, which need not be the newest release overall.
std::optional<AssetChoice> select_asset(const std::vector<Release>& releases,
                                        const std::string& compressed_name,
                                        const std::string& plain_name);

// read_artifact_marker reads kMarkerKey from the artifact's meta table.
// A missing or unreadable artifact yields nullopt.
std::optional<std::string> read_artifact_marker(const std::string& path);

// gunzip_file decompresses src into dest. Throws ParseError on corrupt input.
void gunzip_file(const std::string& src, const std::string& dest);

enum class SyncStatus {
    Updated,      // a newer artifact was installed
    UpToDate,     // local marker is current; nothing downloaded
    Offline,      // remote unreachable; the local copy stays in use
    Unavailable,  // remote unreachable and no local copy
};

const char* status_name(SyncStatus status);

struct SyncResult {
    SyncStatus status = SyncStatus::Unavailable;
    std::optional<std::string> marker;  // marker of the artifact now on disk
    std::string message;
};

struct ComboSyncOptions {
    std::string releases_url;
    std::string dest_path;
    std::string compressed_asset = "combos.sqlite.gz";
    std::string plain_asset = "combos.sqlite";
};

// sync_artifact brings the artifact at opts.dest_path up to date. It never
// throws: failures are reported through SyncResult.
SyncResult sync_artifact(fetch::Transport& transport, const ComboSyncOptions& opts,
                         const fetch::DownloadProgressFunc& on_progress);

} // namespace mtgtools::combosync
