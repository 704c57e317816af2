#include <spdlog/spdlog.h>
#include <tally/execution/invoice_ledger.hpp>
#include <tally/storage/memory/storage.hpp>
#include <tally/storage/rocksdb/storage.hpp>

using namespace tally::schema;

namespace tally::execution {

namespace {

operation_result_t make_permission_denied(const std::string_view principal,
                                          const action_t action,
                                          const std::string_view subject) {
  spdlog::warn("Denied {} on '{}' for '{}'", to_string(action), subject,
               principal);
  return make_failure(error_code::permission_denied,
                      std::string{principal} + " may not " +
                          std::string{to_string(action)},
                      std::string{subject});
}

operation_result_t make_invalid_state(const invoice_t& invoice,
                                      const invoice_status_t expected) {
  spdlog::warn("Invoice {} is {}, expected {}", invoice.invoice_id,
               to_string(invoice.status), to_string(expected));
  return make_failure(error_code::invalid_state,
                      "invoice is " + std::string{to_string(invoice.status)} +
                          ", expected " + std::string{to_string(expected)},
                      invoice.invoice_id);
}

}  // namespace

template <typename Library>
invoice_ledger<Library>::invoice_ledger(
    tally::storage::storage<Library>& storage,
    index_maintainer<Library>& indexes,
    const role_registry<Library>& roles)
    : storage_{storage}, indexes_{indexes}, roles_{roles} {}

template <typename Library>
operation_result_t invoice_ledger<Library>::create_invoice(
    const std::string_view invoice_id,
    const std::string_view amount,
    const std::string_view supplier,
    const std::string_view payer) {
  if (auto invalid = check_record_id(invoice_id, "invoice id")) {
    return *invalid;
  }
  if (supplier.empty() || payer.empty()) {
    return make_validation_failure("supplier and payer must be non-empty",
                                   std::string{invoice_id});
  }
  auto value = try_parse_decimal(amount);
  if (!value || is_negative(*value) || is_zero(*value)) {
    return make_validation_failure("invoice amount must be a positive decimal",
                                   std::string{amount});
  }

  if (authorize(supplier, roles_.role_of(supplier),
                action_t::create_invoice) != decision_t::allow) {
    return make_permission_denied(supplier, action_t::create_invoice,
                                  invoice_id);
  }
  if (authorize(payer, roles_.role_of(payer), action_t::owe_invoice) !=
      decision_t::allow) {
    return make_permission_denied(payer, action_t::owe_invoice, invoice_id);
  }

  auto existing = storage_.get(make_bytes_view(invoice_id));
  if (existing) {
    spdlog::warn("Invoice {} already exists", invoice_id);
    return make_failure(error_code::already_exists, "invoice already exists",
                        std::string{invoice_id});
  }

  auto failure = operation_result_t{};
  auto index = indexes_.template load<invoice_index_t>(failure);
  if (!index) {
    return failure;
  }

  auto invoice = invoice_t{};
  invoice.invoice_id = std::string{invoice_id};
  invoice.amount = std::move(*value);
  invoice.currency = std::string{kDefaultInvoiceCurrency};
  invoice.supplier = std::string{supplier};
  invoice.payer = std::string{payer};

  auto encoder = json_encoder_t{};
  auto writes = tally::storage::write_set{};
  writes.put(key::make_record_key(invoice_id), encoder.encode(invoice),
             std::nullopt);
  indexes_.stage_append(*index, invoice.invoice_id, writes);

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Created invoice {} for {} {} from '{}' to '{}'",
               invoice.invoice_id, to_string(invoice.amount), invoice.currency,
               invoice.supplier, invoice.payer);
  return make_success();
}

template <typename Library>
operation_result_t invoice_ledger<Library>::offer_trade(
    const std::string_view invoice_id,
    const std::string_view discount,
    const std::string_view caller) {
  auto value = try_parse_decimal(discount);
  if (!value || is_negative(*value)) {
    return make_validation_failure("discount must be a non-negative decimal",
                                   std::string{discount});
  }

  auto failure = operation_result_t{};
  auto record = load_invoice(invoice_id, failure);
  if (!record) {
    return failure;
  }
  auto& invoice = *record->value;
  if (authorize(caller, roles_.role_of(caller), action_t::offer_trade,
                &invoice) != decision_t::allow) {
    return make_permission_denied(caller, action_t::offer_trade, invoice_id);
  }
  if (invoice.status != invoice_status_t::created) {
    return make_invalid_state(invoice, invoice_status_t::created);
  }

  invoice.discount = std::move(*value);
  invoice.status = invoice_status_t::offered;

  auto encoder = json_encoder_t{};
  auto writes = tally::storage::write_set{};
  writes.put(key::make_record_key(invoice_id), encoder.encode(invoice),
             std::move(record->raw));

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Invoice {} offered for trade at discount {}", invoice_id,
               to_string(*invoice.discount));
  return make_success();
}

template <typename Library>
operation_result_t invoice_ledger<Library>::accept_trade(
    const std::string_view invoice_id,
    const std::string_view caller) {
  auto failure = operation_result_t{};
  auto record = load_invoice(invoice_id, failure);
  if (!record) {
    return failure;
  }
  auto& invoice = *record->value;
  if (authorize(caller, roles_.role_of(caller), action_t::accept_trade,
                &invoice) != decision_t::allow) {
    return make_permission_denied(caller, action_t::accept_trade, invoice_id);
  }
  if (invoice.status != invoice_status_t::offered) {
    return make_invalid_state(invoice, invoice_status_t::offered);
  }

  invoice.buyer = std::string{caller};
  invoice.status = invoice_status_t::accepted;

  auto encoder = json_encoder_t{};
  auto writes = tally::storage::write_set{};
  writes.put(key::make_record_key(invoice_id), encoder.encode(invoice),
             std::move(record->raw));

  auto error = std::string{};
  if (!commit_or_restore(storage_, writes, error)) {
    return make_storage_failure(std::move(error));
  }
  spdlog::info("Invoice {} accepted by '{}'", invoice_id, caller);
  return make_success();
}

template <typename Library>
operation_result_t invoice_ledger<Library>::get_invoice_details(
    const std::string_view invoice_id,
    const std::string_view caller) const {
  auto failure = operation_result_t{};
  auto record = load_invoice(invoice_id, failure);
  if (!record) {
    return failure;
  }
  if (authorize(caller, roles_.role_of(caller), action_t::view_invoice,
                &*record->value) != decision_t::allow) {
    return make_permission_denied(caller, action_t::view_invoice, invoice_id);
  }
  auto encoder = json_encoder_t{};
  return make_success(encoder.encode(*record->value));
}

template <typename Library>
operation_result_t invoice_ledger<Library>::list_invoices(
    const std::string_view caller) const {
  const auto role = roles_.role_of(caller);
  return collect([&](const invoice_t& invoice) {
    return authorize(caller, role, action_t::view_invoice, &invoice) ==
           decision_t::allow;
  });
}

template <typename Library>
operation_result_t invoice_ledger<Library>::list_open_trade_offers() const {
  return collect([](const invoice_t& invoice) {
    return invoice.status == invoice_status_t::offered;
  });
}

template <typename Library>
operation_result_t invoice_ledger<Library>::check_unique_invoice(
    const std::string_view invoice_id) const {
  if (auto invalid = check_record_id(invoice_id, "invoice id")) {
    return *invalid;
  }
  if (storage_.get(make_bytes_view(invoice_id))) {
    return make_failure(error_code::already_exists, "invoice already exists",
                        std::string{invoice_id});
  }
  return make_success(make_bytes(std::string_view{"true"}));
}

template <typename Library>
std::optional<record_t<invoice_t>> invoice_ledger<Library>::load_invoice(
    const std::string_view invoice_id,
    operation_result_t& failure) const {
  if (invoice_id.empty()) {
    failure = make_validation_failure("invoice id must be non-empty",
                                      "invoice id");
    return std::nullopt;
  }
  auto invoice = load_record<invoice_t>(storage_, invoice_id);
  switch (invoice.status) {
    case record_status::found:
      if (invoice.value->invoice_id == invoice_id) {
        return invoice;
      }
      break;
    case record_status::malformed:
      spdlog::error("Invoice record at '{}' is corrupt", invoice_id);
      failure = make_failure(error_code::corrupt_record,
                             "invoice record is corrupt",
                             std::string{invoice_id});
      return std::nullopt;
    case record_status::missing:
    case record_status::foreign:
      break;
  }
  failure = make_failure(error_code::not_found, "invoice not found",
                         std::string{invoice_id});
  return std::nullopt;
}

template <typename Library>
template <typename Predicate>
operation_result_t invoice_ledger<Library>::collect(Predicate visible) const {
  auto failure = operation_result_t{};
  auto index = indexes_.template load<invoice_index_t>(failure);
  if (!index) {
    return failure;
  }
  auto invoices = std::vector<invoice_t>{};
  for (const auto& invoice_id : index->value->invoice_ids) {
    auto record = load_invoice(invoice_id, failure);
    if (!record) {
      if (failure.code == static_cast<uint32_t>(error_code::corrupt_record)) {
        return failure;
      }
      spdlog::warn("Invoice index lists '{}' but no invoice is stored there",
                   invoice_id);
      continue;
    }
    if (visible(*record->value)) {
      invoices.push_back(std::move(*record->value));
    }
  }
  auto encoder = json_encoder_t{};
  return make_success(encoder.encode_list(invoices));
}

template class invoice_ledger<tally::storage::rocksdb_storage_tag>;
template class invoice_ledger<tally::storage::memory_storage_tag>;

}  // namespace tally::execution
