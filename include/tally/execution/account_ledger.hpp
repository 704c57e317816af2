#pragma once
#include <tally/execution/index_maintainer.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/storage/storage.hpp>
#include <string_view>

namespace tally::execution {

/// Account records, the account index and balance transfers.
///
/// Amount and balance arguments are decimal strings as received from the
/// dispatch layer; they are parsed into `decimal_t` and never touch binary
/// floating point.
template <typename Library>
class account_ledger final {
 public:
  account_ledger(tally::storage::storage<Library>& storage,
                 index_maintainer<Library>& indexes);

  /// Create an account and list it in the account index.
  ///
  /// A key that already holds an account carrying the same account number
  /// fails with already_exists. Anything else at the key (nothing, another
  /// record type, unreadable bytes) counts as free and is overwritten.
  tally::schema::operation_result_t create_account(
      std::string_view account_number,
      std::string_view owner_name,
      std::string_view currency,
      std::string_view initial_balance);

  /// Move `amount` from one account to another. Both records are committed
  /// together; the sum of the two balances is unchanged.
  tally::schema::operation_result_t transfer_balance(
      std::string_view from_account,
      std::string_view to_account,
      std::string_view amount);

  /// Raw removal of any key, plus removal of a matching account index entry.
  tally::schema::operation_result_t delete_entry(std::string_view key);

  tally::schema::operation_result_t get_account(
      std::string_view account_number) const;

  /// Every account listed in the account index, in index order.
  tally::schema::operation_result_t list_accounts() const;

 private:
  std::optional<record_t<tally::schema::account_t>> load_account(
      std::string_view account_number,
      tally::schema::operation_result_t& failure) const;

  tally::storage::storage<Library>& storage_;
  index_maintainer<Library>& indexes_;
};

}  // namespace tally::execution
