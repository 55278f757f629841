#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mtgtools::cardimport {

inline constexpr size_t kDefaultBatchSize = 5000;
// kMaxBatchSize is the largest batch_size a configuration may ask for.
inline constexpr size_t kMaxBatchSize = 1000000;

// Art priority ranks printings for display: lower is preferred.
enum class ArtPriority : int { Borderless = 0, FullArt = 1, Regular = 2 };

// CardRecord is one printing, flattened for the cards table.
// List and map fields hold serialized JSON.
struct CardRecord {
    std::string id;
    std::optional<std::string> oracle_id;
    std::string name;
    std::optional<std::string> flavor_name;
    std::optional<std::string> layout;
    std::optional<std::string> mana_cost;
    std::optional<double> cmc;
    std::string colors = "[]";
    std::string color_identity = "[]";
    std::optional<std::string> type_line;
    std::optional<std::string> oracle_text;
    std::optional<std::string> flavor_text;
    std::optional<std::string> power;
    std::optional<std::string> toughness;
    std::optional<std::string> loyalty;
    std::optional<std::string> defense;
    std::string keywords = "[]";
    std::string set_code;
    std::optional<std::string> set_name;
    std::optional<std::string> rarity;
    std::string collector_number;
    std::optional<std::string> artist;
    std::optional<std::string> release_date;
    bool is_token = false;
    bool is_promo = false;
    bool is_digital_only = false;
    std::optional<int64_t> edhrec_rank;

    std::optional<std::string> image_small;
    std::optional<std::string> image_normal;
    std::optional<std::string> image_large;
    std::optional<std::string> image_png;
    std::optional<std::string> image_art_crop;
    std::optional<std::string> image_border_crop;

    // Prices in cents.
    std::optional<int64_t> price_usd;
    std::optional<int64_t> price_usd_foil;
    std::optional<int64_t> price_eur;
    std::optional<int64_t> price_eur_foil;

    std::optional<std::string> purchase_tcgplayer;
    std::optional<std::string> purchase_cardmarket;
    std::optional<std::string> purchase_cardhoarder;
    std::optional<std::string> link_edhrec;
    std::optional<std::string> link_gatherer;

    std::optional<std::string> illustration_id;
    bool highres_image = false;
    std::optional<std::string> border_color;
    std::optional<std::string> frame;
    bool full_art = false;
    ArtPriority art_priority = ArtPriority::Regular;
    std::string finishes = "[]";
    std::string legalities = "{}";
};

struct RulingRecord {
    std::optional<std::string> oracle_id;
    std::optional<std::string> published_at;
    std::optional<std::string> comment;
    std::optional<std::string> source;
};

struct SetRecord {
    std::string code;  // lowercase
    std::string name;
    std::optional<std::string> set_type;
    std::optional<std::string> release_date;
    std::optional<int64_t> card_count;
    std::optional<std::string> icon_svg_uri;
    std::optional<std::string> block;
    std::optional<int64_t> base_set_size;
    std::optional<int64_t> total_set_size;
    bool is_online_only = false;
    bool is_foil_only = false;
    std::optional<std::string> keyrune_code;
};

// RecordSink receives whole batches. Implementations write inside a
// transaction owned by the caller of the import.
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual void write_cards(const std::vector<CardRecord>& batch) = 0;
    virtual void write_rulings(const std::vector<RulingRecord>& batch) = 0;
    virtual void write_sets(const std::vector<SetRecord>& batch) = 0;
};

// BatchBuffer collects records and hands them to flush in groups of
// exactly batch_size; finish() flushes the remainder.
template <typename Record>
class BatchBuffer {
public:
    using FlushFunc = std::function<void(const std::vector<Record>&)>;

    BatchBuffer(size_t batch_size, FlushFunc flush)
        : batch_size_(batch_size == 0 ? 1 : batch_size), flush_(std::move(flush)) {
        pending_.reserve(std::min(batch_size_, kDefaultBatchSize));
    }

    // push returns true when the record completed a batch.
    bool push(Record rec) {
        pending_.push_back(std::move(rec));
        ++total_;
        if (pending_.size() < batch_size_) return false;
        flush_pending();
        return true;
    }

    // finish returns true when a partial batch was flushed.
    bool finish() {
        if (pending_.empty()) return false;
        flush_pending();
        return true;
    }

    uint64_t total() const { return total_; }
    uint64_t flushes() const { return flushes_; }

private:
    void flush_pending() {
        flush_(pending_);
        pending_.clear();
        ++flushes_;
    }

    size_t batch_size_;
    FlushFunc flush_;
    std::vector<Record> pending_;
    uint64_t total_ = 0;
    uint64_t flushes_ = 0;
};

// CountProgressFunc receives the cumulative number of imported records.
using CountProgressFunc = std::function<void(uint64_t count)>;

struct ImportOptions {
    size_t batch_size = kDefaultBatchSize;
    CountProgressFunc progress;  // called after each flush
};

using ItemFunc = std::function<void(const nlohmann::json& item)>;

// for_each_array_item streams a JSON document whose top level is an array,
// or an object carrying the array under "data", and calls fn for every
// element. Only one element is held in memory at a time. Malformed JSON
// throws ParseError; exceptions from fn propagate and end the pass.
void for_each_array_item(std::istream& in, const ItemFunc& fn);

// card_from_json maps a card object to a CardRecord. Throws ParseError
// for a non-object or when id, name, set or collector_number is missing.
CardRecord card_from_json(const nlohmann::json& j);

RulingRecord ruling_from_json(const nlohmann::json& j);

// SetSupplement is extra set metadata keyed by lowercase set code.
using SetSupplement = std::unordered_map<std::string, nlohmann::json>;

// read_set_supplement loads the set-list supplement ({"data": [{"code",
// "block", "baseSetSize", "totalSetSize", "keyruneCode"}, ...]}).
SetSupplement read_set_supplement(std::istream& in);

SetRecord set_from_json(const nlohmann::json& j, const SetSupplement& supplement);

// import_cards streams the card file at path into sink and returns the
// number of records written.
uint64_t import_cards(const std::string& path, RecordSink& sink, const ImportOptions& options);

uint64_t import_rulings(const std::string& path, RecordSink& sink, const ImportOptions& options);

// import_sets reads the set list and merges the optional supplement
// (empty supplement_path skips it).
uint64_t import_sets(const std::string& path, const std::string& supplement_path,
                     RecordSink& sink, const ImportOptions& options);

} // namespace mtgtools::cardimport
