#pragma once
#include <json/json.h>
#include <tally/schema/account.hpp>

namespace tally::schema::encoding::json {

void encode(const account<1>& o, Json::Value& out);
bool decode(const Json::Value& in, account<1>& o);

}  // namespace tally::schema::encoding::json
