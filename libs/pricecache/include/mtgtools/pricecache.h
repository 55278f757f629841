#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mtgtools::pricecache {

// Lookups are issued in groups of this many items per query.
inline constexpr size_t kLookupBatch = 200;

// PricePair holds decimal amounts; a zero or missing price is nullopt.
struct PricePair {
    std::optional<double> usd;
    std::optional<double> usd_foil;
};

struct PriceCache {
    int64_t timestamp = 0;  // unix seconds
    std::map<std::string, PricePair> prices;
};

// CollectionItem is one row of the collection store. Items without a set
// code or collector number are looked up by name.
struct CollectionItem {
    std::string name;
    std::optional<std::string> set_code;
    std::optional<std::string> collector_number;

    bool has_printing() const { return set_code && collector_number; }
};

// strip_leading_zeros turns "0162" into "162" and "000" into "0".
std::string strip_leading_zeros(const std::string& number);

// cache_key returns "name|SET|number" for a printing, else "name".
std::string cache_key(const CollectionItem& item);

// read_collection loads collection_cards(card_name, set_code, collector_number).
// Throws SchemaError when the store cannot be read.
std::vector<CollectionItem> read_collection(const std::string& collection_db);

// build_price_cache resolves prices for items against an open card database.
// Printings match on upper-cased set code and on the collector number as
// recorded or with leading zeros stripped. Throws SchemaError.
PriceCache build_price_cache(sqlite3* card_db, const std::vector<CollectionItem>& items);

// save_price_cache writes {"timestamp": ..., "prices": {key: [usd, foil]}}
// through a temporary file. Throws Error.
void save_price_cache(const PriceCache& cache, const std::string& path);

// load_price_cache reads a file written by save_price_cache. Throws
// ParseError when the file is missing or malformed.
PriceCache load_price_cache(const std::string& path);

// is_fresh reports whether cache is younger than ttl at time now.
bool is_fresh(const PriceCache& cache, std::chrono::seconds ttl,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// prepopulate warms the price cache for an existing collection. It never
// throws: failures are logged and reported as false, as is a missing
// collection store.
bool prepopulate(const std::string& card_db, const std::string& collection_db,
                 const std::string& cache_path);

} // namespace mtgtools::pricecache
