#include <tally/schema/encoding/json/reconcile_report.hpp>

namespace tally::schema::encoding::json {

namespace {

bool read_count(const Json::Value& in, const char* field, uint64_t& out) {
  const auto& value = in[field];
  if (!value.isUInt64()) {
    return false;
  }
  out = value.asUInt64();
  return true;
}

}  // namespace

void encode(const reconcile_report<1>& o, Json::Value& out) {
  out = Json::Value{Json::objectValue};
  out["accountsadded"] = Json::UInt64{o.accounts_added};
  out["accountsdropped"] = Json::UInt64{o.accounts_dropped};
  out["invoicesadded"] = Json::UInt64{o.invoices_added};
  out["invoicesdropped"] = Json::UInt64{o.invoices_dropped};
}

bool decode(const Json::Value& in, reconcile_report<1>& o) {
  if (!in.isObject()) {
    return false;
  }
  return read_count(in, "accountsadded", o.accounts_added) &&
         read_count(in, "accountsdropped", o.accounts_dropped) &&
         read_count(in, "invoicesadded", o.invoices_added) &&
         read_count(in, "invoicesdropped", o.invoices_dropped);
}

}  // namespace tally::schema::encoding::json
