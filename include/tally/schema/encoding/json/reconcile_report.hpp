#pragma once
#include <json/json.h>
#include <tally/schema/reconcile_report.hpp>

namespace tally::schema::encoding::json {

void encode(const reconcile_report<1>& o, Json::Value& out);
bool decode(const Json::Value& in, reconcile_report<1>& o);

}  // namespace tally::schema::encoding::json
