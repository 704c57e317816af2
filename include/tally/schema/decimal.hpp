#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tally::schema {

/// Exact base-10 fixed-point number: value = units * 10^-scale.
///
/// Monetary amounts and balances are stored as decimal strings on the ledger;
/// this type parses them without going through binary floating point so that
/// repeated transfers never drift.
struct decimal_t final {
  boost::multiprecision::cpp_int units;
  uint32_t scale{};
};

/// Largest number of fractional digits accepted by the parser.
inline constexpr uint32_t kMaxDecimalScale = 64;

/// Largest number of mantissa digits, integral and fractional together.
inline constexpr uint32_t kMaxDecimalDigits = 128;

/// Parse `[+-]digits[.digits][(e|E)[+-]digits]`.
///
/// The exponent form is accepted for records written by the legacy float
/// encoder (`5E+02`). Returns std::nullopt for anything else, including empty
/// input, surrounding whitespace, `nan` and `inf`.
std::optional<decimal_t> try_parse_decimal(std::string_view text);

/// Canonical plain rendering with exactly `scale` fractional digits.
std::string to_string(const decimal_t& value);

/// Same value re-expressed with `scale` fractional digits (scale can only
/// grow).
decimal_t rescale(const decimal_t& value, uint32_t scale);

/// -1, 0 or 1 comparing numeric values, independent of scale.
int compare(const decimal_t& lhs, const decimal_t& rhs);

bool is_negative(const decimal_t& value);
bool is_zero(const decimal_t& value);

decimal_t operator+(const decimal_t& lhs, const decimal_t& rhs);
decimal_t operator-(const decimal_t& lhs, const decimal_t& rhs);

inline bool operator==(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) == 0;
}
inline bool operator!=(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) != 0;
}
inline bool operator<(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) < 0;
}
inline bool operator>(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) > 0;
}
inline bool operator<=(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const decimal_t& lhs, const decimal_t& rhs) {
  return compare(lhs, rhs) >= 0;
}

}  // namespace tally::schema
