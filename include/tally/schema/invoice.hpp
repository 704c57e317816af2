#pragma once
#include <tally/schema/decimal.hpp>
#include <tally/schema/invoice_status.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: invoice.
// Invoice workflow: issued by a supplier against a payer, offered for trade
// at a discount, then accepted by a buyer.
namespace tally::schema {

/// Currency assigned to invoices created through the invoke verb.
inline constexpr auto kDefaultInvoiceCurrency = std::string_view{"USD"};

template <uint16_t Version>
struct invoice;

template <>
struct invoice<1> final {
  std::string invoice_id;
  decimal_t amount;
  std::string currency;
  principal_t supplier;
  principal_t payer;
  std::optional<principal_t> buyer;
  std::optional<std::string> due_date;
  std::optional<decimal_t> discount;
  invoice_status_t status{invoice_status_t::created};
};

using invoice_t = invoice<1>;

}  // namespace tally::schema
