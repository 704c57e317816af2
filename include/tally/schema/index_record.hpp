#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: index records.
// Singleton lists of primary keys used to enumerate all accounts or all
// invoices, stored at reserved keys.
namespace tally::schema {

inline constexpr auto kAccountIndexKey = std::string_view{"_accountindex"};
inline constexpr auto kInvoiceIndexKey = std::string_view{"invoiceIDs"};

template <uint16_t Version>
struct account_index;

template <>
struct account_index<1> final {
  std::vector<std::string> account_numbers;
};

using account_index_t = account_index<1>;

template <uint16_t Version>
struct invoice_index;

template <>
struct invoice_index<1> final {
  std::vector<std::string> invoice_ids;
};

using invoice_index_t = invoice_index<1>;

}  // namespace tally::schema
