#include "mtgtools/bulkdata.h"
#include "mtgtools/carddb.h"
#include "mtgtools/errors.h"
#include "mtgtools/sqlite.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mtgtools::bulkdata {

static std::string require_string(const json& item, const char* key) {
    if (!item.contains(key) || !item[key].is_string()) {
        throw VersionCheckError(std::format("bulkdata: entry lacks \"{}\"", key));
    }
    return item[key].get<std::string>();
}

std::vector<RemoteSource> parse_bulk_metadata(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw ParseError("bulkdata: metadata is not valid JSON");
    }
    if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_array()) {
        throw VersionCheckError("bulkdata: metadata lacks \"data\" array");
    }

    std::vector<RemoteSource> sources;
    for (const auto& item : doc["data"]) {
        if (!item.is_object()) {
            throw VersionCheckError("bulkdata: metadata entry is not an object");
        }
        sources.push_back(RemoteSource{
            .name = require_string(item, "type"),
            .download_uri = require_string(item, "download_uri"),
            .updated_at = require_string(item, "updated_at"),
        });
    }
    return sources;
}

const RemoteSource* find_source(const std::vector<RemoteSource>& sources, const std::string& name) {
    for (const auto& s : sources) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

std::optional<std::string> read_stored_marker(const std::string& db_path) {
    std::error_code ec;
    if (!fs::exists(db_path, ec)) return std::nullopt;
    try {
        sqlite::Connection conn(db_path, SQLITE_OPEN_READONLY);
        return sqlite::read_meta(conn.get(), "meta", carddb::kMarkerKey);
    } catch (const SchemaError& e) {
        LOGD("bulkdata: stored marker unreadable:", e.what());
        return std::nullopt;
    }
}

FreshnessCheck check_freshness(fetch::Transport& transport, const std::string& metadata_url,
                               const std::string& db_path, const std::string& source_name) {
    FreshnessCheck result;
    std::error_code ec;
    bool have_local = fs::exists(db_path, ec);

    auto fail_open = [&](const char* what) {
        result.needs_update = !have_local;
        result.remote_marker.reset();
        if (have_local) {
            result.stored_marker = read_stored_marker(db_path);
            LOGW("bulkdata: freshness check failed, keeping local database:", what);
        } else {
            LOGW("bulkdata: freshness check failed and no local database:", what);
        }
        return result;
    };

    std::vector<RemoteSource> sources;
    try {
        sources = parse_bulk_metadata(transport.get_text(metadata_url));
    } catch (const NetworkError& e) {
        return fail_open(e.what());
    } catch (const VersionCheckError& e) {
        return fail_open(e.what());
    } catch (const ParseError& e) {
        return fail_open(e.what());
    }

    result.sources = std::move(sources);
    const RemoteSource* src = find_source(result.sources, source_name);
    if (!src) {
        return fail_open(std::format("bulkdata: no source named {}", source_name).c_str());
    }
    result.remote_marker = src->updated_at;
    result.stored_marker = read_stored_marker(db_path);

    if (!result.stored_marker) {
        result.needs_update = true;
    } else {
        result.needs_update = *result.remote_marker > *result.stored_marker;
    }
    LOGI("bulkdata: remote", *result.remote_marker, "stored",
         result.stored_marker.value_or("<none>"),
         result.needs_update ? "-> update" : "-> current");
    return result;
}

} // namespace mtgtools::bulkdata
