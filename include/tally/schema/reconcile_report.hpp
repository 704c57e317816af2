#pragma once
#include <cstdint>

// Schema type: reconcile report.
// Counts of index entries added (live records missing from an index) and
// dropped (dangling or duplicate entries) by one reconciliation pass.
namespace tally::schema {

template <uint16_t Version>
struct reconcile_report;

template <>
struct reconcile_report<1> final {
  uint64_t accounts_added{};
  uint64_t accounts_dropped{};
  uint64_t invoices_added{};
  uint64_t invoices_dropped{};
};

using reconcile_report_t = reconcile_report<1>;

}  // namespace tally::schema
