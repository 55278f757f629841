#include "mtgtools/combosync.h"
#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mtgtools::combosync {

// ---------------------------------------------------------------------------
// Release listing
// ---------------------------------------------------------------------------

static std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<Release> release_from_json(const json& r) {
    if (!r.is_object()) {
        throw VersionCheckError("combosync: release entry is not an object");
    }
    auto marker = opt_string(r, "updated_at");
    if (!marker) marker = opt_string(r, "published_at");
    if (!marker) return std::nullopt;

    Release rel;
    rel.tag_name = opt_string(r, "tag_name").value_or("");
    rel.updated_at = *marker;
    if (r.contains("assets") && r["assets"].is_array()) {
        for (const auto& a : r["assets"]) {
            auto name = a.is_object() ? opt_string(a, "name") : std::nullopt;
            auto url = a.is_object() ? opt_string(a, "browser_download_url") : std::nullopt;
            if (!name || !url) {
                throw VersionCheckError(
                    std::format("combosync: release {} has an asset without name or URL", rel.tag_name));
            }
            rel.assets.push_back(ReleaseAsset{.name = *name, .download_url = *url});
        }
    }
    return rel;
}

std::vector<Release> parse_releases(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw ParseError("combosync: release listing is not valid JSON");
    }

    std::vector<Release> releases;
    auto add = [&](const json& r) {
        if (auto rel = release_from_json(r)) releases.push_back(std::move(*rel));
    };
    if (doc.is_array()) {
        for (const auto& r : doc) add(r);
    } else if (doc.is_object()) {
        add(doc);
    } else {
        throw VersionCheckError("combosync: unexpected release listing");
    }

    std::stable_sort(releases.begin(), releases.end(),
                     [](const Release& a, const Release& b) { return a.updated_at > b.updated_at; });
    return releases;
}

std::optional<AssetChoice> select_asset(const std::vector<Release>& releases,
                                        const std::string& compressed_name,
                                        const std::string& plain_name) {
    for (const auto& rel : releases) {
        const ReleaseAsset* plain = nullptr;
        for (const auto& a : rel.assets) {
            if (a.name == compressed_name) {
                return AssetChoice{.release = &rel, .asset = &a, .compressed = true};
            }
            if (a.name == plain_name && !plain) plain = &a;
        }
        if (plain) return AssetChoice{.release = &rel, .asset = plain, .compressed = false};
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Artifact handling
// ---------------------------------------------------------------------------

std::optional<std::string> read_artifact_marker(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    try {
        sqlite::Connection conn(path, SQLITE_OPEN_READONLY);
        return sqlite::read_meta(conn.get(), "meta", kMarkerKey);
    } catch (const SchemaError& e) {
        LOGD("combosync: artifact marker unreadable:", e.what());
        return std::nullopt;
    }
}

void gunzip_file(const std::string& src, const std::string& dest) {
    gzFile in = gzopen(src.c_str(), "rb");
    if (!in) {
        throw ParseError(std::format("combosync: cannot open {}", src));
    }
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        gzclose(in);
        throw ParseError(std::format("combosync: cannot create {}", dest));
    }

    std::vector<char> buf(fetch::kChunkSize);
    for (;;) {
        int n = gzread(in, buf.data(), static_cast<unsigned>(buf.size()));
        if (n < 0) {
            int errnum = 0;
            std::string msg = gzerror(in, &errnum);
            gzclose(in);
            throw ParseError(std::format("combosync: {}: {}", src, msg));
        }
        if (n == 0) break;
        out.write(buf.data(), n);
        if (!out) {
            gzclose(in);
            throw ParseError(std::format("combosync: write failed for {}", dest));
        }
    }
    int rc = gzclose(in);
    if (rc != Z_OK) {
        throw ParseError(std::format("combosync: {}: truncated or corrupt gzip stream", src));
    }
}

// Stamps the staged artifact and moves it over dest.
static void install_artifact(const std::string& staged, const std::string& dest,
                             const std::string& marker) {
    {
        sqlite::Connection conn(staged, SQLITE_OPEN_READWRITE);
        sqlite::write_meta(conn.get(), "meta", kMarkerKey, marker);
        conn.close();
    }
    std::error_code ec;
    fs::rename(staged, dest, ec);
    if (ec) {
        throw SchemaError(std::format("combosync: rename {} -> {}: {}", staged, dest, ec.message()));
    }
}

const char* status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Updated: return "updated";
        case SyncStatus::UpToDate: return "up to date";
        case SyncStatus::Offline: return "offline";
        case SyncStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// sync_artifact
// ---------------------------------------------------------------------------

SyncResult sync_artifact(fetch::Transport& transport, const ComboSyncOptions& opts,
                         const fetch::DownloadProgressFunc& on_progress) {
    SyncResult result;
    std::error_code ec;
    const bool have_local = fs::exists(opts.dest_path, ec);
    const auto stored = read_artifact_marker(opts.dest_path);

    auto degrade = [&](const std::string& why) {
        result.message = why;
        if (have_local) {
            result.status = SyncStatus::Offline;
            result.marker = stored;
            LOGW("combosync: keeping local combo database:", why);
        } else {
            result.status = SyncStatus::Unavailable;
            LOGW("combosync: combo database unavailable:", why);
        }
        return result;
    };

    const std::string download_path = opts.dest_path + ".download";
    const std::string staged_path = opts.dest_path + ".tmp";
    auto cleanup = [&] {
        std::error_code rm_ec;
        fs::remove(download_path, rm_ec);
        fs::remove(staged_path, rm_ec);
    };

    try {
        auto releases = parse_releases(transport.get_text(opts.releases_url));
        auto choice = select_asset(releases, opts.compressed_asset, opts.plain_asset);
        if (!choice) {
            return degrade(std::format("no release carries {} or {}",
                                       opts.compressed_asset, opts.plain_asset));
        }

        const std::string& remote = choice->release->updated_at;
        if (stored && *stored >= remote) {
            result.status = SyncStatus::UpToDate;
            result.marker = stored;
            result.message = "Combo database is up to date";
            LOGI("combosync: up to date at", *stored);
            return result;
        }

        auto parent = fs::path(opts.dest_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);

        LOGI("combosync: downloading", choice->asset->name, "from release", choice->release->tag_name);
        transport.download(choice->asset->download_url, download_path, on_progress);
        if (choice->compressed) {
            gunzip_file(download_path, staged_path);
            fs::remove(download_path, ec);
        } else {
            fs::rename(download_path, staged_path, ec);
            if (ec) {
                throw SchemaError(std::format("combosync: rename {}: {}", download_path, ec.message()));
            }
        }
        install_artifact(staged_path, opts.dest_path, remote);

        result.status = SyncStatus::Updated;
        result.marker = remote;
        result.message = "Combo database updated";
        LOGI("combosync: installed release", remote);
        return result;
    } catch (const Error& e) {
        cleanup();
        return degrade(e.what());
    }
}

} // namespace mtgtools::combosync
