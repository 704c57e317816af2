#pragma once
#include <json/json.h>
#include <tally/schema/index_record.hpp>

namespace tally::schema::encoding::json {

void encode(const account_index<1>& o, Json::Value& out);
bool decode(const Json::Value& in, account_index<1>& o);

void encode(const invoice_index<1>& o, Json::Value& out);
bool decode(const Json::Value& in, invoice_index<1>& o);

}  // namespace tally::schema::encoding::json
