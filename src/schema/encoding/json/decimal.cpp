#include <tally/schema/encoding/json/decimal.hpp>
#include <tally/schema/primitives.hpp>

#include <string>

namespace tally::schema::encoding::json {

void encode(const decimal_t& o, Json::Value& out) {
  out = to_string(o);
}

bool decode(const Json::Value& in, decimal_t& o) {
  if (!in.isString()) {
    return false;
  }
  auto parsed = try_parse_decimal(in.asString());
  if (!parsed) {
    return false;
  }
  o = std::move(*parsed);
  return true;
}

void encode(const std::optional<decimal_t>& o, Json::Value& out) {
  if (!o) {
    out = std::string{kUndefined};
    return;
  }
  encode(*o, out);
}

bool decode(const Json::Value& in, std::optional<decimal_t>& o) {
  if (in.isNull() || (in.isString() && in.asString() == kUndefined)) {
    o.reset();
    return true;
  }
  auto value = decimal_t{};
  if (!decode(in, value)) {
    return false;
  }
  o = std::move(value);
  return true;
}

}  // namespace tally::schema::encoding::json
