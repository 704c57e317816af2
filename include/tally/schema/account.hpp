#pragma once
#include <tally/schema/decimal.hpp>
#include <string>

// Schema type: account.
// Balance-holding record keyed by its account number. The balance is never
// negative at rest.
namespace tally::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  std::string account_number;
  std::string owner_name;
  std::string currency;
  decimal_t balance;
};

using account_t = account<1>;

}  // namespace tally::schema
