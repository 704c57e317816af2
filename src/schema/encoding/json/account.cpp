#include <tally/schema/encoding/json/account.hpp>
#include <tally/schema/encoding/json/decimal.hpp>
#include <tally/schema/encoding/json/fields.hpp>

namespace tally::schema::encoding::json {

void encode(const account<1>& o, Json::Value& out) {
  out = Json::Value{Json::objectValue};
  out["accountnumber"] = o.account_number;
  out["ownername"] = o.owner_name;
  out["currency"] = o.currency;
  encode(o.balance, out["balance"]);
}

bool decode(const Json::Value& in, account<1>& o) {
  if (!in.isObject()) {
    return false;
  }
  return read_string(in, "accountnumber", o.account_number) &&
         read_string(in, "ownername", o.owner_name) &&
         read_string(in, "currency", o.currency) &&
         decode(in["balance"], o.balance);
}

}  // namespace tally::schema::encoding::json
