#include "mtgtools/money.h"

#include <charconv>
#include <format>
#include <limits>

namespace mtgtools::money {

std::optional<int64_t> parse_minor_units(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
    if (whole.empty() && frac.empty()) return std::nullopt;

    for (char c : whole) if (c < '0' || c > '9') return std::nullopt;
    for (char c : frac) if (c < '0' || c > '9') return std::nullopt;

    int64_t units = 0;
    if (!whole.empty()) {
        auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), units);
        if (ec != std::errc{} || ptr != whole.data() + whole.size()) return std::nullopt;
    }
    int64_t cents = 0;
    if (frac.size() >= 1) cents += (frac[0] - '0') * 10;
    if (frac.size() >= 2) cents += frac[1] - '0';

    // units * 100 + cents must fit; the negated total then fits as well.
    if (units > (std::numeric_limits<int64_t>::max() - cents) / 100) return std::nullopt;

    int64_t total = units * 100 + cents;
    return negative ? -total : total;
}

double to_decimal(int64_t minor_units) {
    return static_cast<double>(minor_units) / 100.0;
}

std::string format_minor_units(int64_t minor_units) {
    bool negative = minor_units < 0;
    uint64_t abs = negative ? 0 - static_cast<uint64_t>(minor_units)
                            : static_cast<uint64_t>(minor_units);
    return std::format("{}{}.{:02}", negative ? "-" : "", abs / 100, abs % 100);
}

} // namespace mtgtools::money
