#pragma once

#include <tally/execution/account_ledger.hpp>
#include <tally/execution/identity.hpp>
#include <tally/execution/index_maintainer.hpp>
#include <tally/execution/invoice_ledger.hpp>
#include <tally/execution/role_registry.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/storage/storage.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally::execution {

inline constexpr auto kInvokeCodespace = std::string_view{"tally.invoke"};
inline constexpr auto kQueryCodespace = std::string_view{"tally.query"};

/// Dispatch layer over the account and invoice ledgers.
///
/// Two verbs, each taking an operation name and positional string
/// arguments. `invoke` may mutate the store; `query` never does. Each call
/// runs under the engine mutex, reads what it needs, and commits at most one
/// write set.
template <typename Library>
class engine final {
 public:
  /// `identity` is optional. When installed, the acting-principal argument of
  /// an invoice operation must equal `identity->current_principal()`.
  explicit engine(tally::storage::storage<Library>& storage,
                  std::shared_ptr<const identity_provider> identity = nullptr);

  tally::schema::operation_result_t invoke(
      std::string_view operation,
      const std::vector<std::string>& args);

  tally::schema::operation_result_t query(
      std::string_view operation,
      const std::vector<std::string>& args);

 private:
  using handler_t = tally::schema::operation_result_t (engine::*)(
      const std::vector<std::string>&);

  struct operation_t final {
    std::string_view name;
    /// std::nullopt when the handler validates the count itself.
    std::optional<std::size_t> arity;
    /// Position of the argument naming the acting principal, if any.
    std::optional<std::size_t> principal_arg;
    handler_t handler;
  };

  tally::schema::operation_result_t dispatch(
      std::string_view verb,
      std::string_view codespace,
      std::span<const operation_t> table,
      std::string_view operation,
      const std::vector<std::string>& args);

  // invoke
  tally::schema::operation_result_t init(const std::vector<std::string>& args);
  tally::schema::operation_result_t write(const std::vector<std::string>& args);
  tally::schema::operation_result_t remove(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t init_account(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t transfer_balance(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t create_invoice(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t offer_trade(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t accept_trade(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t reconcile_indexes(
      const std::vector<std::string>& args);

  // query
  tally::schema::operation_result_t read(const std::vector<std::string>& args);
  tally::schema::operation_result_t get_account(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t get_accounts(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t get_invoice_details(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t get_invoices(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t get_opening_trade_invoices(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t check_unique_invoice(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t get_username(
      const std::vector<std::string>& args);
  tally::schema::operation_result_t ping(const std::vector<std::string>& args);

  static const std::vector<operation_t>& invoke_operations();
  static const std::vector<operation_t>& query_operations();

  mutable std::mutex mutex_;
  tally::storage::storage<Library>& storage_;
  std::shared_ptr<const identity_provider> identity_;
  index_maintainer<Library> indexes_;
  role_registry<Library> roles_;
  account_ledger<Library> accounts_;
  invoice_ledger<Library> invoices_;
};

}  // namespace tally::execution
