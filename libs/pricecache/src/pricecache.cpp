#include "mtgtools/pricecache.h"
#include "mtgtools/errors.h"
#include "mtgtools/money.h"
#include "mtgtools/sqlite.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <unordered_map>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mtgtools::pricecache {

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_leading_zeros(const std::string& number) {
    auto pos = number.find_first_not_of('0');
    if (pos == std::string::npos) return "0";
    return number.substr(pos);
}

std::string cache_key(const CollectionItem& item) {
    if (!item.has_printing()) return item.name;
    return std::format("{}|{}|{}", item.name, to_upper(*item.set_code), *item.collector_number);
}

// Zero cents means "no price", same as NULL.
static std::optional<double> to_amount(const std::optional<int64_t>& cents) {
    if (!cents || *cents == 0) return std::nullopt;
    return money::to_decimal(*cents);
}

static PricePair pair_from_row(const sqlite::Stmt& stmt, int usd_col) {
    return PricePair{
        .usd = to_amount(stmt.column_int64(usd_col)),
        .usd_foil = to_amount(stmt.column_int64(usd_col + 1)),
    };
}

// ---------------------------------------------------------------------------
// Collection store
// ---------------------------------------------------------------------------

std::vector<CollectionItem> read_collection(const std::string& collection_db) {
    sqlite::Connection conn(collection_db, SQLITE_OPEN_READONLY);
    if (!sqlite::table_exists(conn.get(), "collection_cards")) {
        throw SchemaError(std::format("pricecache: {} has no collection_cards table", collection_db));
    }
    sqlite::Stmt stmt(conn.get(),
                      "SELECT card_name, set_code, collector_number FROM collection_cards");
    std::vector<CollectionItem> items;
    while (stmt.step() == SQLITE_ROW) {
        auto name = stmt.column_text(0);
        if (!name || name->empty()) continue;
        CollectionItem item{.name = *name};
        auto set = stmt.column_text(1);
        auto number = stmt.column_text(2);
        if (set && !set->empty()) item.set_code = *set;
        if (number && !number->empty()) item.collector_number = *number;
        items.push_back(std::move(item));
    }
    return items;
}

// ---------------------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------------------

using PrintingKey = std::pair<std::string, std::string>;  // (SET, number)

static std::map<PrintingKey, PricePair> lookup_printings(
        sqlite3* db, const std::vector<const CollectionItem*>& items) {
    std::map<PrintingKey, PricePair> found;
    for (size_t start = 0; start < items.size(); start += kLookupBatch) {
        size_t end = std::min(items.size(), start + kLookupBatch);
        std::string sql =
            "SELECT set_code, collector_number, price_usd, price_usd_foil FROM cards WHERE ";
        for (size_t i = start; i < end; ++i) {
            if (i > start) sql += " OR ";
            sql += "(UPPER(set_code) = ? AND (collector_number = ? OR collector_number = ?))";
        }

        sqlite::Stmt stmt(db, sql.c_str());
        int idx = 1;
        for (size_t i = start; i < end; ++i) {
            stmt.bind_text(idx++, to_upper(*items[i]->set_code));
            stmt.bind_text(idx++, *items[i]->collector_number);
            stmt.bind_text(idx++, strip_leading_zeros(*items[i]->collector_number));
        }
        while (stmt.step() == SQLITE_ROW) {
            auto set = stmt.column_text(0);
            auto number = stmt.column_text(1);
            if (!set || !number) continue;
            found.emplace(PrintingKey{to_upper(*set), *number}, pair_from_row(stmt, 2));
        }
    }
    return found;
}

// Keys of the result are lower-cased names.
static std::unordered_map<std::string, PricePair> lookup_names(
        sqlite3* db, const std::vector<const CollectionItem*>& items) {
    std::unordered_map<std::string, PricePair> found;
    for (size_t start = 0; start < items.size(); start += kLookupBatch) {
        size_t end = std::min(items.size(), start + kLookupBatch);
        std::string sql = "SELECT name, price_usd, price_usd_foil FROM cards WHERE name COLLATE NOCASE IN (";
        for (size_t i = start; i < end; ++i) {
            sql += (i > start) ? ",?" : "?";
        }
        sql += ") GROUP BY name";

        sqlite::Stmt stmt(db, sql.c_str());
        int idx = 1;
        for (size_t i = start; i < end; ++i) stmt.bind_text(idx++, items[i]->name);
        while (stmt.step() == SQLITE_ROW) {
            auto name = stmt.column_text(0);
            if (!name) continue;
            found.emplace(to_lower(*name), pair_from_row(stmt, 1));
        }
    }
    return found;
}

PriceCache build_price_cache(sqlite3* card_db, const std::vector<CollectionItem>& items) {
    std::vector<const CollectionItem*> printings;
    std::vector<const CollectionItem*> names;
    for (const auto& item : items) {
        (item.has_printing() ? printings : names).push_back(&item);
    }

    PriceCache cache;
    cache.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    auto by_printing = lookup_printings(card_db, printings);
    for (const auto* item : printings) {
        std::string set = to_upper(*item->set_code);
        auto it = by_printing.find({set, *item->collector_number});
        if (it == by_printing.end()) {
            it = by_printing.find({set, strip_leading_zeros(*item->collector_number)});
        }
        if (it != by_printing.end()) cache.prices[cache_key(*item)] = it->second;
    }

    auto by_name = lookup_names(card_db, names);
    for (const auto* item : names) {
        auto it = by_name.find(to_lower(item->name));
        if (it != by_name.end()) cache.prices[cache_key(*item)] = it->second;
    }
    return cache;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

static json amount_json(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

static std::optional<double> amount_from_json(const json& v) {
    if (v.is_number()) return v.get<double>();
    return std::nullopt;
}

void save_price_cache(const PriceCache& cache, const std::string& path) {
    json prices = json::object();
    for (const auto& [key, pair] : cache.prices) {
        prices[key] = json::array({amount_json(pair.usd), amount_json(pair.usd_foil)});
    }
    json doc = {{"timestamp", cache.timestamp}, {"prices", std::move(prices)}};

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw Error(std::format("pricecache: cannot create {}", tmp));
        }
        out << doc.dump();
        if (!out) {
            throw Error(std::format("pricecache: write failed for {}", tmp));
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw Error(std::format("pricecache: rename {} -> {} failed", tmp, path));
    }
}

PriceCache load_price_cache(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError(std::format("pricecache: cannot open {}", path));
    }
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ParseError(std::format("pricecache: {} is not a JSON object", path));
    }
    if (!doc.contains("timestamp") || !doc["timestamp"].is_number() ||
        !doc.contains("prices") || !doc["prices"].is_object()) {
        throw ParseError(std::format("pricecache: {} lacks timestamp or prices", path));
    }

    PriceCache cache;
    cache.timestamp = doc["timestamp"].get<int64_t>();
    for (const auto& [key, value] : doc["prices"].items()) {
        if (!value.is_array() || value.size() != 2) {
            throw ParseError(std::format("pricecache: bad entry for \"{}\"", key));
        }
        cache.prices[key] = PricePair{
            .usd = amount_from_json(value[0]),
            .usd_foil = amount_from_json(value[1]),
        };
    }
    return cache;
}

bool is_fresh(const PriceCache& cache, std::chrono::seconds ttl,
              std::chrono::system_clock::time_point now) {
    auto written = std::chrono::system_clock::time_point(std::chrono::seconds(cache.timestamp));
    return now - written < ttl;
}

// ---------------------------------------------------------------------------
// prepopulate
// ---------------------------------------------------------------------------

bool prepopulate(const std::string& card_db, const std::string& collection_db,
                 const std::string& cache_path) {
    std::error_code ec;
    if (collection_db.empty() || !fs::exists(collection_db, ec)) {
        LOGI("pricecache: no collection store, skipping");
        return false;
    }
    try {
        auto items = read_collection(collection_db);
        sqlite::Connection conn(card_db, SQLITE_OPEN_READONLY);
        auto cache = build_price_cache(conn.get(), items);
        save_price_cache(cache, cache_path);
        LOGI("pricecache: cached", cache.prices.size(), "of", items.size(), "collection items");
        return true;
    } catch (const std::exception& e) {
        LOGW("pricecache: skipped:", e.what());
        return false;
    }
}

} // namespace mtgtools::pricecache
