#include <tally/schema/decimal.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tally::schema {

namespace {

using units_t = boost::multiprecision::cpp_int;

units_t power_of_ten(const uint32_t exponent) {
  return boost::multiprecision::pow(units_t{10}, exponent);
}

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Exponents are bounded well below anything that could allocate a huge
// coefficient.
std::optional<int32_t> parse_exponent(std::string_view text) {
  auto negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty() || text.size() > 4 ||
      !std::ranges::all_of(text, is_digit)) {
    return std::nullopt;
  }
  auto value = int32_t{};
  for (const auto c : text) {
    value = (value * 10) + (c - '0');
  }
  return negative ? -value : value;
}

}  // namespace

std::optional<decimal_t> try_parse_decimal(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  auto negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto exponent = int32_t{};
  const auto exponent_at = text.find_first_of("eE");
  if (exponent_at != std::string_view::npos) {
    auto parsed = parse_exponent(text.substr(exponent_at + 1));
    if (!parsed) {
      return std::nullopt;
    }
    exponent = *parsed;
    text = text.substr(0, exponent_at);
  }

  auto integral = text;
  auto fractional = std::string_view{};
  const auto point_at = text.find('.');
  if (point_at != std::string_view::npos) {
    integral = text.substr(0, point_at);
    fractional = text.substr(point_at + 1);
  }
  if (integral.empty() && fractional.empty()) {
    return std::nullopt;
  }
  if (integral.size() + fractional.size() > kMaxDecimalDigits) {
    return std::nullopt;
  }
  if (!std::ranges::all_of(integral, is_digit) ||
      !std::ranges::all_of(fractional, is_digit)) {
    return std::nullopt;
  }

  auto digits = std::string{integral};
  digits.append(fractional);
  auto units = units_t{};
  for (const auto c : digits) {
    units = (units * 10) + (c - '0');
  }

  auto scale = static_cast<int64_t>(fractional.size()) - exponent;
  if (scale < 0) {
    if (-scale > static_cast<int64_t>(kMaxDecimalScale)) {
      return std::nullopt;
    }
    units *= power_of_ten(static_cast<uint32_t>(-scale));
    scale = 0;
  }
  if (scale > static_cast<int64_t>(kMaxDecimalScale)) {
    return std::nullopt;
  }

  auto value = decimal_t{};
  value.units = negative ? units_t{-units} : units;
  value.scale = static_cast<uint32_t>(scale);
  return value;
}

std::string to_string(const decimal_t& value) {
  auto digits = units_t{boost::multiprecision::abs(value.units)}.str();
  if (digits.size() <= value.scale) {
    digits.insert(0, value.scale - digits.size() + 1, '0');
  }

  auto out = std::string{};
  if (value.units < 0) {
    out.push_back('-');
  }
  const auto split = digits.size() - value.scale;
  out.append(digits, 0, split);
  if (value.scale > 0) {
    out.push_back('.');
    out.append(digits, split, std::string::npos);
  }
  return out;
}

decimal_t rescale(const decimal_t& value, const uint32_t scale) {
  if (scale <= value.scale) {
    return value;
  }
  auto out = decimal_t{};
  out.units = value.units * power_of_ten(scale - value.scale);
  out.scale = scale;
  return out;
}

int compare(const decimal_t& lhs, const decimal_t& rhs) {
  const auto scale = std::max(lhs.scale, rhs.scale);
  const auto a = rescale(lhs, scale);
  const auto b = rescale(rhs, scale);
  if (a.units < b.units) {
    return -1;
  }
  if (a.units > b.units) {
    return 1;
  }
  return 0;
}

bool is_negative(const decimal_t& value) {
  return value.units < 0;
}

bool is_zero(const decimal_t& value) {
  return value.units == 0;
}

decimal_t operator+(const decimal_t& lhs, const decimal_t& rhs) {
  const auto scale = std::max(lhs.scale, rhs.scale);
  auto out = rescale(lhs, scale);
  out.units += rescale(rhs, scale).units;
  return out;
}

decimal_t operator-(const decimal_t& lhs, const decimal_t& rhs) {
  const auto scale = std::max(lhs.scale, rhs.scale);
  auto out = rescale(lhs, scale);
  out.units -= rescale(rhs, scale).units;
  return out;
}

}  // namespace tally::schema
