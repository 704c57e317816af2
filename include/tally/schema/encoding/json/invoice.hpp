#pragma once
#include <json/json.h>
#include <tally/schema/invoice.hpp>

namespace tally::schema::encoding::json {

void encode(const invoice<1>& o, Json::Value& out);
bool decode(const Json::Value& in, invoice<1>& o);

}  // namespace tally::schema::encoding::json
