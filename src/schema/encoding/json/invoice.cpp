#include <tally/schema/encoding/json/decimal.hpp>
#include <tally/schema/encoding/json/fields.hpp>
#include <tally/schema/encoding/json/invoice.hpp>

#include <algorithm>
#include <cctype>

namespace tally::schema::encoding::json {

namespace {

// Older records carry the status as a digit string ("0"), newer ones as a
// JSON integer.
bool decode_status(const Json::Value& in, invoice_status_t& o) {
  auto number = int64_t{-1};
  if (in.isIntegral()) {
    number = in.asInt64();
  } else if (in.isString()) {
    const auto text = in.asString();
    if (text.size() != 1 ||
        std::isdigit(static_cast<unsigned char>(text.front())) == 0) {
      return false;
    }
    number = text.front() - '0';
  } else {
    return false;
  }
  auto status = invoice_status_from_number(number);
  if (!status) {
    return false;
  }
  o = *status;
  return true;
}

}  // namespace

void encode(const invoice<1>& o, Json::Value& out) {
  out = Json::Value{Json::objectValue};
  out["invoiceid"] = o.invoice_id;
  encode(o.amount, out["amount"]);
  out["currency"] = o.currency;
  out["supplier"] = o.supplier;
  out["payer"] = o.payer;
  write_optional_string(o.buyer, out["buyer"]);
  write_optional_string(o.due_date, out["duedate"]);
  encode(o.discount, out["discount"]);
  out["status"] = static_cast<Json::Int>(o.status);
}

bool decode(const Json::Value& in, invoice<1>& o) {
  if (!in.isObject()) {
    return false;
  }
  return read_string(in, "invoiceid", o.invoice_id) &&
         decode(in["amount"], o.amount) &&
         read_string(in, "currency", o.currency) &&
         read_string(in, "supplier", o.supplier) &&
         read_string(in, "payer", o.payer) &&
         read_optional_string(in, "buyer", o.buyer) &&
         read_optional_string(in, "duedate", o.due_date) &&
         decode(in["discount"], o.discount) &&
         decode_status(in["status"], o.status);
}

}  // namespace tally::schema::encoding::json
