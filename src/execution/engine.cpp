#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <tally/execution/engine.hpp>
#include <tally/storage/memory/storage.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <utility>

using namespace tally::schema;

namespace tally::execution {

template <typename Library>
engine<Library>::engine(tally::storage::storage<Library>& storage,
                        std::shared_ptr<const identity_provider> identity)
    : storage_{storage},
      identity_{std::move(identity)},
      indexes_{storage},
      roles_{storage},
      accounts_{storage, indexes_},
      invoices_{storage, indexes_, roles_} {
  if (identity_) {
    spdlog::info("Execution engine ready for principal '{}'",
                 identity_->current_principal());
  } else {
    spdlog::info(
        "Execution engine ready without an identity provider; caller "
        "arguments are trusted");
  }
}

template <typename Library>
const std::vector<typename engine<Library>::operation_t>&
engine<Library>::invoke_operations() {
  static const auto operations = std::vector<operation_t>{
      {"init", std::nullopt, std::nullopt, &engine::init},
      {"write", 2, std::nullopt, &engine::write},
      {"delete", 1, std::nullopt, &engine::remove},
      {"init_account", 4, std::nullopt, &engine::init_account},
      {"transfer_balance", 3, std::nullopt, &engine::transfer_balance},
      {"create_invoice", 4, 2, &engine::create_invoice},
      {"offer_trade", 3, 2, &engine::offer_trade},
      {"accept_trade", 2, 1, &engine::accept_trade},
      {"reconcile_indexes", 0, std::nullopt, &engine::reconcile_indexes}};
  return operations;
}

template <typename Library>
const std::vector<typename engine<Library>::operation_t>&
engine<Library>::query_operations() {
  static const auto operations = std::vector<operation_t>{
      {"read", 1, std::nullopt, &engine::read},
      {"get_account", 1, std::nullopt, &engine::get_account},
      {"get_accounts", 0, std::nullopt, &engine::get_accounts},
      {"get_invoice_details", 2, 1, &engine::get_invoice_details},
      {"get_invoices", 1, 0, &engine::get_invoices},
      {"get_opening_trade_invoices", 0, std::nullopt,
       &engine::get_opening_trade_invoices},
      {"check_unique_invoice", 1, std::nullopt, &engine::check_unique_invoice},
      {"get_username", 0, std::nullopt, &engine::get_username},
      {"ping", 0, std::nullopt, &engine::ping}};
  return operations;
}

template <typename Library>
operation_result_t engine<Library>::invoke(
    const std::string_view operation,
    const std::vector<std::string>& args) {
  auto lock = std::scoped_lock{mutex_};
  return dispatch("invoke", kInvokeCodespace, invoke_operations(), operation,
                  args);
}

template <typename Library>
operation_result_t engine<Library>::query(
    const std::string_view operation,
    const std::vector<std::string>& args) {
  auto lock = std::scoped_lock{mutex_};
  return dispatch("query", kQueryCodespace, query_operations(), operation,
                  args);
}

template <typename Library>
operation_result_t engine<Library>::dispatch(
    const std::string_view verb,
    const std::string_view codespace,
    const std::span<const operation_t> table,
    const std::string_view operation,
    const std::vector<std::string>& args) {
  spdlog::debug("{} {} with {} argument(s)", verb, operation, args.size());

  auto result = [&]() -> operation_result_t {
    auto found = std::ranges::find(table, operation, &operation_t::name);
    if (found == std::end(table)) {
      spdlog::warn("Unknown {} operation '{}'", verb, operation);
      return make_failure(error_code::unknown_operation,
                          "unknown operation", std::string{operation});
    }
    if (found->arity && args.size() != *found->arity) {
      return make_validation_failure(
          "expected " + std::to_string(*found->arity) + " argument(s), got " +
              std::to_string(args.size()),
          std::string{operation});
    }
    if (found->principal_arg && identity_) {
      const auto& acting = args[*found->principal_arg];
      const auto current = identity_->current_principal();
      if (acting != current) {
        spdlog::warn("{} names '{}' but the caller is '{}'", operation,
                     acting, current);
        return make_failure(error_code::permission_denied,
                            "acting principal does not match the caller",
                            acting);
      }
    }
    return (this->*(found->handler))(args);
  }();

  if (result.code != 0) {
    result.codespace = std::string{codespace};
    spdlog::debug("{} {} failed with code {}: {} ({})", verb, operation,
                  result.code, result.log, result.info);
  }
  return result;
}

template <typename Library>
operation_result_t engine<Library>::init(
    const std::vector<std::string>& args) {
  auto error = std::string{};
  auto assignments = role_registry<Library>::parse_assignments(args, error);
  if (!assignments) {
    return make_validation_failure(std::move(error), "init");
  }

  // Indexes are re-derived from the primary records so a repeated init on a
  // populated store keeps listing them.
  auto writes = tally::storage::write_set{};
  auto report = reconcile_report_t{};
  indexes_.stage_rebuild(report, writes);
  roles_.stage_assignments(*assignments, writes);

  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Initialized ledger with {} role assignment(s)",
               assignments->size());
  return make_success();
}

template <typename Library>
operation_result_t engine<Library>::write(
    const std::vector<std::string>& args) {
  if (args[0].empty()) {
    return make_validation_failure("key must be non-empty", "key");
  }
  auto key = make_bytes(args[0]);
  auto previous = storage_.get(make_bytes_view(key));
  auto writes = tally::storage::write_set{};
  writes.put(std::move(key), make_bytes(args[1]), std::move(previous));

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Wrote {} byte(s) to key '{}'", args[1].size(), args[0]);
  return make_success();
}

template <typename Library>
operation_result_t engine<Library>::remove(
    const std::vector<std::string>& args) {
  return accounts_.delete_entry(args[0]);
}

template <typename Library>
operation_result_t engine<Library>::init_account(
    const std::vector<std::string>& args) {
  return accounts_.create_account(args[0], args[1], args[2], args[3]);
}

template <typename Library>
operation_result_t engine<Library>::transfer_balance(
    const std::vector<std::string>& args) {
  return accounts_.transfer_balance(args[0], args[1], args[2]);
}

template <typename Library>
operation_result_t engine<Library>::create_invoice(
    const std::vector<std::string>& args) {
  return invoices_.create_invoice(args[0], args[1], args[2], args[3]);
}

template <typename Library>
operation_result_t engine<Library>::offer_trade(
    const std::vector<std::string>& args) {
  return invoices_.offer_trade(args[0], args[1], args[2]);
}

template <typename Library>
operation_result_t engine<Library>::accept_trade(
    const std::vector<std::string>& args) {
  return invoices_.accept_trade(args[0], args[1]);
}

template <typename Library>
operation_result_t engine<Library>::reconcile_indexes(
    const std::vector<std::string>&) {
  auto report = reconcile_report_t{};
  auto error = std::string{};
  if (!indexes_.reconcile(report, error)) {
    return make_storage_failure(std::move(error));
  }
  auto encoder = json_encoder_t{};
  return make_success(encoder.encode(report));
}

template <typename Library>
operation_result_t engine<Library>::read(
    const std::vector<std::string>& args) {
  auto value = storage_.get(make_bytes_view(args[0]));
  if (!value) {
    return make_failure(error_code::not_found, "key not found", args[0]);
  }
  return make_success(std::move(*value));
}

template <typename Library>
operation_result_t engine<Library>::get_account(
    const std::vector<std::string>& args) {
  return accounts_.get_account(args[0]);
}

template <typename Library>
operation_result_t engine<Library>::get_accounts(
    const std::vector<std::string>&) {
  return accounts_.list_accounts();
}

template <typename Library>
operation_result_t engine<Library>::get_invoice_details(
    const std::vector<std::string>& args) {
  return invoices_.get_invoice_details(args[0], args[1]);
}

template <typename Library>
operation_result_t engine<Library>::get_invoices(
    const std::vector<std::string>& args) {
  return invoices_.list_invoices(args[0]);
}

template <typename Library>
operation_result_t engine<Library>::get_opening_trade_invoices(
    const std::vector<std::string>&) {
  return invoices_.list_open_trade_offers();
}

template <typename Library>
operation_result_t engine<Library>::check_unique_invoice(
    const std::vector<std::string>& args) {
  return invoices_.check_unique_invoice(args[0]);
}

template <typename Library>
operation_result_t engine<Library>::get_username(
    const std::vector<std::string>&) {
  if (!identity_) {
    return make_failure(error_code::permission_denied,
                        "no identity provider installed", "username");
  }
  auto username = identity_->attribute("username");
  if (!username) {
    return make_failure(error_code::not_found,
                        "caller credential carries no username", "username");
  }
  return make_success(make_bytes(*username));
}

template <typename Library>
operation_result_t engine<Library>::ping(const std::vector<std::string>&) {
  return make_success(make_bytes(std::string_view{"Hello, world!"}));
}

template class engine<tally::storage::rocksdb_storage_tag>;
template class engine<tally::storage::memory_storage_tag>;

}  // namespace tally::execution
