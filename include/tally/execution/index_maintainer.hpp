#pragma once
#include <spdlog/spdlog.h>
#include <tally/execution/state.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/index_record.hpp>
#include <tally/schema/invoice.hpp>
#include <tally/schema/reconcile_report.hpp>
#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tally::execution {

template <typename Index>
struct index_traits;

template <>
struct index_traits<tally::schema::account_index_t> final {
  static constexpr auto key = tally::schema::kAccountIndexKey;
  static constexpr auto name = std::string_view{"account index"};
  static std::vector<std::string>& entries(
      tally::schema::account_index_t& index) {
    return index.account_numbers;
  }
};

template <>
struct index_traits<tally::schema::invoice_index_t> final {
  static constexpr auto key = tally::schema::kInvoiceIndexKey;
  static constexpr auto name = std::string_view{"invoice index"};
  static std::vector<std::string>& entries(
      tally::schema::invoice_index_t& index) {
    return index.invoice_ids;
  }
};

/// Keeps the account and invoice index records equal to the set of live
/// primary records.
///
/// Creation paths load the index, `stage_append` to it and commit it in the
/// same write set as the primary record. `reconcile` re-derives both indexes
/// from a full scan of the store for the cases where a raw write or delete,
/// or a backend without atomic commit, let them drift.
template <typename Library>
class index_maintainer final {
 public:
  explicit index_maintainer(tally::storage::storage<Library>& storage)
      : storage_{storage} {}

  /// Load an index record. A missing record is an empty index. Returns
  /// std::nullopt with `failure` set when the stored record is unreadable.
  template <typename Index>
  std::optional<record_t<Index>> load(
      tally::schema::operation_result_t& failure) const {
    using traits = index_traits<Index>;
    auto index = load_record<Index>(storage_, traits::key);
    switch (index.status) {
      case record_status::found:
        return index;
      case record_status::missing:
        index.value = Index{};
        return index;
      case record_status::foreign:
      case record_status::malformed:
        break;
    }
    spdlog::error("Stored {} is corrupt", traits::name);
    failure = tally::schema::make_failure(
        tally::schema::error_code::corrupt_record,
        std::string{traits::name} + " record is corrupt",
        std::string{traits::key});
    return std::nullopt;
  }

  /// Append `id` and stage the updated index. An id already listed is left
  /// alone so the index never holds duplicates.
  template <typename Index>
  void stage_append(record_t<Index>& index,
                    const std::string& id,
                    tally::storage::write_set& writes) const {
    using traits = index_traits<Index>;
    auto& entries = traits::entries(*index.value);
    if (std::ranges::find(entries, id) != std::end(entries)) {
      spdlog::warn("'{}' is already listed in the {}", id, traits::name);
      return;
    }
    entries.push_back(id);
    stage(index, writes);
  }

  /// Remove the first entry equal to `id` and stage the updated index.
  /// Returns false, staging nothing, when `id` is not listed.
  template <typename Index>
  bool stage_remove(record_t<Index>& index,
                    const std::string_view id,
                    tally::storage::write_set& writes) const {
    using traits = index_traits<Index>;
    auto& entries = traits::entries(*index.value);
    auto found = std::ranges::find(entries, id);
    if (found == std::end(entries)) {
      return false;
    }
    entries.erase(found);
    stage(index, writes);
    return true;
  }

  /// Rebuild both indexes from the primary records present in the store.
  ///
  /// Live entries keep their order; dangling and duplicate entries are
  /// dropped; live records missing from an index are appended in key order.
  /// An unreadable index record is rebuilt from scratch.
  bool reconcile(tally::schema::reconcile_report_t& report,
                 std::string& error) {
    auto writes = tally::storage::write_set{};
    stage_rebuild(report, writes);
    return commit_or_restore(storage_, writes, error);
  }

  /// Stage the rebuilt indexes into `writes` without committing. A missing
  /// index record is staged even when it would be empty.
  void stage_rebuild(tally::schema::reconcile_report_t& report,
                     tally::storage::write_set& writes) const {
    auto live_accounts = std::vector<std::string>{};
    auto live_invoices = std::vector<std::string>{};
    scan(live_accounts, live_invoices);

    rebuild<tally::schema::account_index_t>(
        live_accounts, report.accounts_added, report.accounts_dropped, writes);
    rebuild<tally::schema::invoice_index_t>(
        live_invoices, report.invoices_added, report.invoices_dropped, writes);

    spdlog::info(
        "Reconciled indexes: accounts +{} -{}, invoices +{} -{}",
        report.accounts_added, report.accounts_dropped, report.invoices_added,
        report.invoices_dropped);
  }

 private:
  template <typename Index>
  void stage(const record_t<Index>& index,
             tally::storage::write_set& writes) const {
    auto encoder = json_encoder_t{};
    writes.put(tally::schema::make_bytes(index_traits<Index>::key),
               encoder.encode(*index.value), index.raw);
  }

  // Classify every non-reserved key as a live account, a live invoice or
  // neither. A record only counts when its embedded id matches its key.
  void scan(std::vector<std::string>& accounts,
            std::vector<std::string>& invoices) const {
    auto encoder = json_encoder_t{};
    for (const auto& [raw_key, value] :
         storage_.list_by_prefix(tally::schema::bytes_view_t{})) {
      auto key = tally::schema::make_string(raw_key);
      if (tally::schema::key::is_reserved(key)) {
        continue;
      }
      const auto bytes = tally::schema::make_bytes_view(value);
      if (auto account = encoder.try_decode<tally::schema::account_t>(bytes);
          account && account->account_number == key) {
        accounts.push_back(std::move(key));
        continue;
      }
      if (auto invoice = encoder.try_decode<tally::schema::invoice_t>(bytes);
          invoice && invoice->invoice_id == key) {
        invoices.push_back(std::move(key));
      }
    }
  }

  template <typename Index>
  void rebuild(const std::vector<std::string>& live,
               uint64_t& added,
               uint64_t& dropped,
               tally::storage::write_set& writes) const {
    using traits = index_traits<Index>;
    auto index = load_record<Index>(storage_, traits::key);
    auto current = std::vector<std::string>{};
    if (index.value) {
      current = traits::entries(*index.value);
    } else if (index.status != record_status::missing) {
      spdlog::warn("Rebuilding unreadable {} from scratch", traits::name);
    }

    const auto live_set = std::set<std::string>{std::begin(live), std::end(live)};
    auto kept = std::set<std::string>{};
    auto rebuilt = Index{};
    auto& entries = traits::entries(rebuilt);
    for (const auto& id : current) {
      if (live_set.contains(id) && kept.insert(id).second) {
        entries.push_back(id);
      }
    }
    dropped = current.size() - entries.size();
    for (const auto& id : live) {
      if (kept.insert(id).second) {
        entries.push_back(id);
        ++added;
      }
    }

    if (index.value && added == 0 && dropped == 0) {
      return;
    }
    auto encoder = json_encoder_t{};
    writes.put(tally::schema::make_bytes(traits::key), encoder.encode(rebuilt),
               index.raw);
  }

  tally::storage::storage<Library>& storage_;
};

}  // namespace tally::execution
