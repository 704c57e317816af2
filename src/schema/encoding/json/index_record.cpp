#include <tally/schema/encoding/json/fields.hpp>
#include <tally/schema/encoding/json/index_record.hpp>

namespace tally::schema::encoding::json {

namespace {

void encode_list(const std::vector<std::string>& ids, Json::Value& out) {
  out = Json::Value{Json::arrayValue};
  for (const auto& id : ids) {
    out.append(id);
  }
}

}  // namespace

void encode(const account_index<1>& o, Json::Value& out) {
  out = Json::Value{Json::objectValue};
  encode_list(o.account_numbers, out["accountnumbers"]);
}

// Accepts the legacy encodings too: a bare array, or `null` for an index
// that was initialized from an empty list.
bool decode(const Json::Value& in, account_index<1>& o) {
  if (in.isNull() || in.isArray()) {
    return read_string_list(in, o.account_numbers);
  }
  if (!in.isObject() || !in.isMember("accountnumbers")) {
    return false;
  }
  return read_string_list(in["accountnumbers"], o.account_numbers);
}

void encode(const invoice_index<1>& o, Json::Value& out) {
  out = Json::Value{Json::objectValue};
  encode_list(o.invoice_ids, out["invoiceids"]);
}

bool decode(const Json::Value& in, invoice_index<1>& o) {
  if (!in.isObject()) {
    return false;
  }
  if (in.isMember("invoices")) {
    return read_string_list(in["invoices"], o.invoice_ids);
  }
  if (!in.isMember("invoiceids")) {
    return false;
  }
  return read_string_list(in["invoiceids"], o.invoice_ids);
}

}  // namespace tally::schema::encoding::json
