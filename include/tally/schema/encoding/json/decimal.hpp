#pragma once
#include <json/json.h>
#include <tally/schema/decimal.hpp>
#include <optional>

namespace tally::schema::encoding::json {

void encode(const decimal_t& o, Json::Value& out);
bool decode(const Json::Value& in, decimal_t& o);

/// Decimal field that stores the literal `UNDEFINED` when unset.
void encode(const std::optional<decimal_t>& o, Json::Value& out);
bool decode(const Json::Value& in, std::optional<decimal_t>& o);

}  // namespace tally::schema::encoding::json
