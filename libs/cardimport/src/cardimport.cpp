#include "mtgtools/cardimport.h"
#include "mtgtools/errors.h"
#include "mtgtools/money.h"

#include <algorithm>
#include <cstdint>
#include <cctype>
#include <format>
#include <fstream>

using json = nlohmann::json;

namespace mtgtools::cardimport {

// ---------------------------------------------------------------------------
// Streaming array reader
// ---------------------------------------------------------------------------

void for_each_array_item(std::istream& in, const ItemFunc& fn) {
    // Depth at which elements live: 1 for a bare array, 2 under "data".
    int item_depth = -1;
    bool in_data = false;

    json::parser_callback_t cb = [&](int depth, json::parse_event_t event, json& parsed) -> bool {
        if (item_depth < 0) {
            if (event == json::parse_event_t::array_start && depth == 0) {
                item_depth = 1;
                in_data = true;
                return true;
            }
            if (event == json::parse_event_t::object_start && depth == 0) {
                item_depth = 2;
                return true;
            }
            throw ParseError("cardimport: top level is neither an array nor an object");
        }

        if (item_depth == 2 && depth == 1 && event == json::parse_event_t::key) {
            in_data = parsed.is_string() && parsed.get<std::string>() == "data";
            return true;
        }
        if (!in_data || depth != item_depth) return true;

        switch (event) {
            case json::parse_event_t::value:
            case json::parse_event_t::object_end:
            case json::parse_event_t::array_end:
                fn(parsed);
                return false;
            default:
                return true;
        }
    };

    try {
        // Elements were discarded by the callback; what remains is the empty shell.
        [[maybe_unused]] json shell = json::parse(in, cb);
    } catch (const json::exception& e) {
        throw ParseError(std::format("cardimport: {}", e.what()));
    }
}

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

static std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static std::string required_string(const json& j, const char* key, const char* what) {
    auto v = opt_string(j, key);
    if (!v) {
        std::string id = opt_string(j, "id").value_or("?");
        throw ParseError(std::format("cardimport: {} {} lacks \"{}\"", what, id, key));
    }
    return *v;
}

static std::optional<double> opt_double(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

static std::optional<int64_t> opt_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    if (it->is_number_float()) {
        double v = it->get<double>();
        // 2^63 is exact as a double; anything at or past it does not convert.
        if (!(v >= -9223372036854775808.0 && v < 9223372036854775808.0)) return std::nullopt;
        return static_cast<int64_t>(v);
    }
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
    return it->get<int64_t>();
}

static bool flag(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

static std::string serialized(const json& j, const char* key, const json& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback.dump();
    return it->dump();
}

static const json& sub_object(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

// Prices arrive as decimal strings; numbers are tolerated.
static std::optional<int64_t> cents(const json& prices, const char* key) {
    auto it = prices.find(key);
    if (it == prices.end()) return std::nullopt;
    if (it->is_string()) return money::parse_minor_units(it->get_ref<const std::string&>());
    if (it->is_number()) return money::parse_minor_units(it->dump());
    return std::nullopt;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---------------------------------------------------------------------------
// Record mapping
// ---------------------------------------------------------------------------

CardRecord card_from_json(const json& j) {
    if (!j.is_object()) {
        throw ParseError("cardimport: card element is not an object");
    }

    CardRecord c;
    c.id = required_string(j, "id", "card");
    c.name = required_string(j, "name", "card");
    c.set_code = required_string(j, "set", "card");
    c.collector_number = required_string(j, "collector_number", "card");

    c.oracle_id = opt_string(j, "oracle_id");
    c.flavor_name = opt_string(j, "flavor_name");
    c.layout = opt_string(j, "layout");
    c.mana_cost = opt_string(j, "mana_cost");
    c.cmc = opt_double(j, "cmc");
    c.colors = serialized(j, "colors", json::array());
    c.color_identity = serialized(j, "color_identity", json::array());
    c.type_line = opt_string(j, "type_line");
    c.oracle_text = opt_string(j, "oracle_text");
    c.flavor_text = opt_string(j, "flavor_text");
    c.power = opt_string(j, "power");
    c.toughness = opt_string(j, "toughness");
    c.loyalty = opt_string(j, "loyalty");
    c.defense = opt_string(j, "defense");
    c.keywords = serialized(j, "keywords", json::array());
    c.set_name = opt_string(j, "set_name");
    c.rarity = opt_string(j, "rarity");
    c.artist = opt_string(j, "artist");
    c.release_date = opt_string(j, "released_at");

    const std::string layout = c.layout.value_or("");
    c.is_token = layout == "token" || layout == "double_faced_token" || layout == "emblem";
    c.is_promo = flag(j, "promo");
    c.is_digital_only = flag(j, "digital");
    c.edhrec_rank = opt_int(j, "edhrec_rank");

    // Multi-faced cards carry images on their first face.
    const json* images = &sub_object(j, "image_uris");
    if (images->empty()) {
        auto faces = j.find("card_faces");
        if (faces != j.end() && faces->is_array() && !faces->empty()) {
            images = &sub_object(faces->front(), "image_uris");
        }
    }
    c.image_small = opt_string(*images, "small");
    c.image_normal = opt_string(*images, "normal");
    c.image_large = opt_string(*images, "large");
    c.image_png = opt_string(*images, "png");
    c.image_art_crop = opt_string(*images, "art_crop");
    c.image_border_crop = opt_string(*images, "border_crop");

    const json& prices = sub_object(j, "prices");
    c.price_usd = cents(prices, "usd");
    c.price_usd_foil = cents(prices, "usd_foil");
    c.price_eur = cents(prices, "eur");
    c.price_eur_foil = cents(prices, "eur_foil");

    const json& purchase = sub_object(j, "purchase_uris");
    c.purchase_tcgplayer = opt_string(purchase, "tcgplayer");
    c.purchase_cardmarket = opt_string(purchase, "cardmarket");
    c.purchase_cardhoarder = opt_string(purchase, "cardhoarder");
    const json& related = sub_object(j, "related_uris");
    c.link_edhrec = opt_string(related, "edhrec");
    c.link_gatherer = opt_string(related, "gatherer");

    c.illustration_id = opt_string(j, "illustration_id");
    c.highres_image = flag(j, "highres_image");
    c.border_color = opt_string(j, "border_color");
    c.frame = opt_string(j, "frame");
    c.full_art = flag(j, "full_art");
    if (c.border_color.value_or("") == "borderless")
        c.art_priority = ArtPriority::Borderless;
    else if (c.full_art)
        c.art_priority = ArtPriority::FullArt;
    else
        c.art_priority = ArtPriority::Regular;
    c.finishes = serialized(j, "finishes", json::array());
    c.legalities = serialized(j, "legalities", json::object());
    return c;
}

RulingRecord ruling_from_json(const json& j) {
    if (!j.is_object()) {
        throw ParseError("cardimport: ruling element is not an object");
    }
    return RulingRecord{
        .oracle_id = opt_string(j, "oracle_id"),
        .published_at = opt_string(j, "published_at"),
        .comment = opt_string(j, "comment"),
        .source = opt_string(j, "source"),
    };
}

SetSupplement read_set_supplement(std::istream& in) {
    SetSupplement out;
    for_each_array_item(in, [&](const json& s) {
        if (!s.is_object()) return;
        auto code = opt_string(s, "code");
        if (!code) return;
        json keep = json::object();
        for (const char* key : {"block", "baseSetSize", "totalSetSize", "keyruneCode"}) {
            if (s.contains(key)) keep[key] = s[key];
        }
        out[lower(*code)] = std::move(keep);
    });
    return out;
}

SetRecord set_from_json(const json& j, const SetSupplement& supplement) {
    if (!j.is_object()) {
        throw ParseError("cardimport: set element is not an object");
    }
    SetRecord s;
    s.code = lower(opt_string(j, "code").value_or(""));
    if (s.code.empty()) {
        throw ParseError("cardimport: set lacks \"code\"");
    }
    auto name = opt_string(j, "name");
    if (!name) {
        throw ParseError(std::format("cardimport: set {} lacks \"name\"", s.code));
    }
    s.name = *name;
    s.set_type = opt_string(j, "set_type");
    s.release_date = opt_string(j, "released_at");
    s.card_count = opt_int(j, "card_count");
    s.icon_svg_uri = opt_string(j, "icon_svg_uri");
    s.is_online_only = flag(j, "digital");
    s.is_foil_only = flag(j, "foil_only");

    auto extra = supplement.find(s.code);
    if (extra != supplement.end()) {
        s.block = opt_string(extra->second, "block");
        s.base_set_size = opt_int(extra->second, "baseSetSize");
        s.total_set_size = opt_int(extra->second, "totalSetSize");
        s.keyrune_code = opt_string(extra->second, "keyruneCode");
    }
    return s;
}

// ---------------------------------------------------------------------------
// Import passes
// ---------------------------------------------------------------------------

static std::ifstream open_input(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ParseError(std::format("cardimport: cannot open {}", path));
    }
    return in;
}

template <typename Record, typename MapFunc, typename WriteFunc>
static uint64_t run_import(const std::string& path, const ImportOptions& options,
                           MapFunc map, WriteFunc write) {
    auto in = open_input(path);
    BatchBuffer<Record> buffer(options.batch_size, [&](const std::vector<Record>& batch) {
        write(batch);
    });
    auto report = [&] {
        if (options.progress) options.progress(buffer.total());
    };

    for_each_array_item(in, [&](const json& item) {
        if (buffer.push(map(item))) report();
    });
    if (buffer.finish()) report();
    return buffer.total();
}

uint64_t import_cards(const std::string& path, RecordSink& sink, const ImportOptions& options) {
    return run_import<CardRecord>(
        path, options, [](const json& j) { return card_from_json(j); },
        [&](const std::vector<CardRecord>& b) { sink.write_cards(b); });
}

uint64_t import_rulings(const std::string& path, RecordSink& sink, const ImportOptions& options) {
    return run_import<RulingRecord>(
        path, options, [](const json& j) { return ruling_from_json(j); },
        [&](const std::vector<RulingRecord>& b) { sink.write_rulings(b); });
}

uint64_t import_sets(const std::string& path, const std::string& supplement_path,
                     RecordSink& sink, const ImportOptions& options) {
    SetSupplement supplement;
    if (!supplement_path.empty()) {
        auto in = open_input(supplement_path);
        supplement = read_set_supplement(in);
    }
    return run_import<SetRecord>(
        path, options, [&](const json& j) { return set_from_json(j, supplement); },
        [&](const std::vector<SetRecord>& b) { sink.write_sets(b); });
}

} // namespace mtgtools::cardimport
