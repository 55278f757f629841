#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mtgtools::money {

// parse_minor_units converts a decimal amount such as "12.34" to integer
// minor units (1234) without going through floating point. Digits past the
// second decimal place are truncated. Returns nullopt for anything that is
// not a plain decimal number.
std::optional<int64_t> parse_minor_units(std::string_view text);

// to_decimal converts minor units back to a decimal amount (1234 -> 12.34).
double to_decimal(int64_t minor_units);

// format_minor_units renders minor units with exactly two decimals ("12.34").
std::string format_minor_units(int64_t minor_units);

} // namespace mtgtools::money
