#pragma once
#include <tally/execution/authorization.hpp>
#include <tally/execution/index_maintainer.hpp>
#include <tally/execution/role_registry.hpp>
#include <tally/schema/invoice.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/storage/storage.hpp>
#include <string_view>

namespace tally::execution {

/// Invoice lifecycle: CREATED -> OFFERED -> ACCEPTED.
///
/// Every operation re-reads the caller's role from the role registry and
/// hands the decision to `authorize`. Transitions only move one step forward;
/// an invoice in the wrong state is left untouched and the call fails with
/// invalid_state.
template <typename Library>
class invoice_ledger final {
 public:
  invoice_ledger(tally::storage::storage<Library>& storage,
                 index_maintainer<Library>& indexes,
                 const role_registry<Library>& roles);

  /// Issue a new invoice from `supplier` to `payer` and list it in the
  /// invoice index.
  tally::schema::operation_result_t create_invoice(
      std::string_view invoice_id,
      std::string_view amount,
      std::string_view supplier,
      std::string_view payer);

  /// Supplier puts a CREATED invoice up for trade at `discount`.
  tally::schema::operation_result_t offer_trade(std::string_view invoice_id,
                                                std::string_view discount,
                                                std::string_view caller);

  /// A buyer takes an OFFERED invoice; the buyer is bound to the record.
  tally::schema::operation_result_t accept_trade(std::string_view invoice_id,
                                                 std::string_view caller);

  tally::schema::operation_result_t get_invoice_details(
      std::string_view invoice_id,
      std::string_view caller) const;

  /// Invoices in index order that `caller` may view. Others are omitted.
  tally::schema::operation_result_t list_invoices(
      std::string_view caller) const;

  /// Every OFFERED invoice, regardless of caller.
  tally::schema::operation_result_t list_open_trade_offers() const;

  /// Succeeds with `true` when nothing is stored at `invoice_id`.
  tally::schema::operation_result_t check_unique_invoice(
      std::string_view invoice_id) const;

 private:
  std::optional<record_t<tally::schema::invoice_t>> load_invoice(
      std::string_view invoice_id,
      tally::schema::operation_result_t& failure) const;

  // Walk the invoice index; `visible` decides which records are returned.
  template <typename Predicate>
  tally::schema::operation_result_t collect(Predicate visible) const;

  tally::storage::storage<Library>& storage_;
  index_maintainer<Library>& indexes_;
  const role_registry<Library>& roles_;
};

}  // namespace tally::execution
