#include <spdlog/spdlog.h>
#include <tally/execution/account_ledger.hpp>
#include <tally/storage/memory/storage.hpp>
#include <tally/storage/rocksdb/storage.hpp>

using namespace tally::schema;

namespace tally::execution {

namespace {

std::optional<operation_result_t> require_non_empty(const std::string_view value,
                                                    const std::string_view field) {
  if (value.empty()) {
    return make_validation_failure(std::string{field} + " must be non-empty",
                                   std::string{field});
  }
  return std::nullopt;
}

}  // namespace

template <typename Library>
account_ledger<Library>::account_ledger(
    tally::storage::storage<Library>& storage,
    index_maintainer<Library>& indexes)
    : storage_{storage}, indexes_{indexes} {}

template <typename Library>
operation_result_t account_ledger<Library>::create_account(
    const std::string_view account_number,
    const std::string_view owner_name,
    const std::string_view currency,
    const std::string_view initial_balance) {
  if (auto invalid = check_record_id(account_number, "account number")) {
    return *invalid;
  }
  if (auto invalid = require_non_empty(owner_name, "owner name")) {
    return *invalid;
  }
  if (auto invalid = require_non_empty(currency, "currency")) {
    return *invalid;
  }
  if (auto invalid = require_non_empty(initial_balance, "initial balance")) {
    return *invalid;
  }
  auto balance = try_parse_decimal(initial_balance);
  if (!balance) {
    return make_validation_failure("initial balance must be a decimal number",
                                   std::string{initial_balance});
  }
  if (is_negative(*balance)) {
    return make_validation_failure("initial balance must not be negative",
                                   std::string{initial_balance});
  }

  auto existing = load_record<account_t>(storage_, account_number);
  if (existing.value && existing.value->account_number == account_number) {
    spdlog::warn("Account {} already exists", account_number);
    return make_failure(error_code::already_exists, "account already exists",
                        std::string{account_number});
  }
  if (existing.raw) {
    spdlog::warn(
        "Key '{}' holds a record that is not account {}; it will be "
        "overwritten",
        account_number, account_number);
  }

  auto failure = operation_result_t{};
  auto index = indexes_.template load<account_index_t>(failure);
  if (!index) {
    return failure;
  }

  auto account = account_t{.account_number = std::string{account_number},
                           .owner_name = to_lower(owner_name),
                           .currency = std::string{currency},
                           .balance = std::move(*balance)};
  auto encoder = json_encoder_t{};
  auto writes = tally::storage::write_set{};
  writes.put(key::make_record_key(account_number), encoder.encode(account),
             std::move(existing.raw));
  indexes_.stage_append(*index, account.account_number, writes);

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Created account {} for '{}' with balance {} {}",
               account.account_number, account.owner_name,
               to_string(account.balance), account.currency);
  return make_success();
}

template <typename Library>
operation_result_t account_ledger<Library>::transfer_balance(
    const std::string_view from_account,
    const std::string_view to_account,
    const std::string_view amount) {
  if (auto invalid = require_non_empty(from_account, "source account")) {
    return *invalid;
  }
  if (auto invalid = require_non_empty(to_account, "destination account")) {
    return *invalid;
  }
  auto value = try_parse_decimal(amount);
  if (!value) {
    return make_validation_failure("transfer amount must be a decimal number",
                                   std::string{amount});
  }
  if (is_negative(*value) || is_zero(*value)) {
    return make_validation_failure("transfer amount must be positive",
                                   std::string{amount});
  }
  if (from_account == to_account) {
    return make_validation_failure(
        "source and destination accounts must differ",
        std::string{from_account});
  }

  auto failure = operation_result_t{};
  auto from = load_account(from_account, failure);
  if (!from) {
    return failure;
  }
  auto to = load_account(to_account, failure);
  if (!to) {
    return failure;
  }

  auto& source = *from->value;
  auto& destination = *to->value;
  if (source.currency != destination.currency) {
    return make_validation_failure(
        "accounts hold different currencies",
        source.currency + " != " + destination.currency);
  }
  auto remaining = source.balance - *value;
  if (is_negative(remaining)) {
    spdlog::warn("Transfer of {} from {} rejected: balance is {}",
                 to_string(*value), from_account, to_string(source.balance));
    return make_failure(error_code::insufficient_funds,
                        "insufficient funds for transfer",
                        std::string{from_account});
  }
  source.balance = std::move(remaining);
  destination.balance = destination.balance + *value;

  auto encoder = json_encoder_t{};
  auto writes = tally::storage::write_set{};
  writes.put(key::make_record_key(from_account), encoder.encode(source),
             std::move(from->raw));
  writes.put(key::make_record_key(to_account), encoder.encode(destination),
             std::move(to->raw));

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Transferred {} {} from {} to {}", to_string(*value),
               source.currency, from_account, to_account);
  return make_success();
}

template <typename Library>
operation_result_t account_ledger<Library>::delete_entry(
    const std::string_view target) {
  if (auto invalid = require_non_empty(target, "key")) {
    return *invalid;
  }
  auto writes = tally::storage::write_set{};
  auto previous = storage_.get(make_bytes_view(target));
  if (previous) {
    writes.remove(key::make_record_key(target), std::move(previous));
  }

  // Index records themselves carry no index entry.
  if (!key::is_reserved(target)) {
    auto failure = operation_result_t{};
    if (auto index = indexes_.template load<account_index_t>(failure)) {
      indexes_.stage_remove(*index, target, writes);
    } else {
      spdlog::warn("Deleting '{}' without touching the unreadable account "
                   "index; run reconcile_indexes",
                   target);
    }
  }

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Deleted key '{}'", target);
  return make_success();
}

template <typename Library>
operation_result_t account_ledger<Library>::get_account(
    const std::string_view account_number) const {
  auto failure = operation_result_t{};
  auto account = load_account(account_number, failure);
  if (!account) {
    return failure;
  }
  auto encoder = json_encoder_t{};
  return make_success(encoder.encode(*account->value));
}

template <typename Library>
operation_result_t account_ledger<Library>::list_accounts() const {
  auto failure = operation_result_t{};
  auto index = indexes_.template load<account_index_t>(failure);
  if (!index) {
    return failure;
  }
  auto accounts = std::vector<account_t>{};
  for (const auto& account_number : index->value->account_numbers) {
    auto account = load_account(account_number, failure);
    if (account) {
      accounts.push_back(std::move(*account->value));
      continue;
    }
    if (failure.code == static_cast<uint32_t>(error_code::corrupt_record)) {
      return failure;
    }
    spdlog::warn("Account index lists '{}' but no account is stored there",
                 account_number);
  }
  auto encoder = json_encoder_t{};
  return make_success(encoder.encode_list(accounts));
}

template <typename Library>
std::optional<record_t<account_t>> account_ledger<Library>::load_account(
    const std::string_view account_number,
    operation_result_t& failure) const {
  auto account = load_record<account_t>(storage_, account_number);
  switch (account.status) {
    case record_status::found:
      if (account.value->account_number == account_number) {
        return account;
      }
      break;
    case record_status::malformed:
      spdlog::error("Account record at '{}' is corrupt", account_number);
      failure = make_failure(error_code::corrupt_record,
                             "account record is corrupt",
                             std::string{account_number});
      return std::nullopt;
    case record_status::missing:
    case record_status::foreign:
      break;
  }
  failure = make_failure(error_code::not_found, "account not found",
                         std::string{account_number});
  return std::nullopt;
}

template class account_ledger<tally::storage::rocksdb_storage_tag>;
template class account_ledger<tally::storage::memory_storage_tag>;

}  // namespace tally::execution
