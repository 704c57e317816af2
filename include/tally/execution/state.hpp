#pragma once
#include <spdlog/spdlog.h>
#include <tally/schema/encoding/json/encoder.hpp>
#include <tally/schema/error_code.hpp>
#include <tally/schema/key/keys.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/storage/storage.hpp>
#include <optional>
#include <string>
#include <string_view>

// Shared read/commit plumbing for the ledgers. Every operation reads the
// records it needs through `load_record`, stages its writes in one
// `write_set`, and finishes with a single `commit_or_restore`.
namespace tally::execution {

using json_encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::json_encoder_tag>;

/// What was found at a key, from the point of view of one record type.
enum class record_status : uint8_t {
  /// Key holds a record of the requested type.
  found = 0,
  /// Key is absent.
  missing = 1,
  /// Key holds valid JSON of some other shape (another record type).
  foreign = 2,
  /// Key holds bytes that are not a JSON document.
  malformed = 3,
};

template <typename T>
struct record_t final {
  record_status status{record_status::missing};
  /// Bytes stored at the key; kept as the before-image for write sets.
  std::optional<tally::schema::bytes_t> raw;
  std::optional<T> value;
};

template <typename T, typename Library>
record_t<T> load_record(const tally::storage::storage<Library>& storage,
                        const std::string_view key) {
  auto out = record_t<T>{};
  out.raw = storage.get(tally::schema::make_bytes_view(key));
  if (!out.raw) {
    out.status = record_status::missing;
    return out;
  }
  const auto bytes = tally::schema::make_bytes_view(*out.raw);
  if (!tally::schema::encoding::json::read_document(bytes)) {
    out.status = record_status::malformed;
    return out;
  }
  auto encoder = json_encoder_t{};
  out.value = encoder.try_decode<T>(bytes);
  out.status = out.value ? record_status::found : record_status::foreign;
  return out;
}

/// Commit `writes`; on failure, commit the inverse so every touched key is
/// back to the contents read before the operation.
///
/// Needed for bindings that cannot apply a write set atomically. Returns
/// false with `error` set when the original commit failed, whether or not the
/// restore succeeded.
template <typename Library>
bool commit_or_restore(tally::storage::storage<Library>& storage,
                       const tally::storage::write_set& writes,
                       std::string& error) {
  if (writes.empty() || storage.commit(writes, error)) {
    return true;
  }
  spdlog::error("Commit of {} write(s) failed: {}", writes.entries.size(),
                error);
  auto restore_error = std::string{};
  if (!storage.commit(writes.inverse(), restore_error)) {
    spdlog::error(
        "Restoring {} key(s) after failed commit also failed: {}; indexes may "
        "need reconcile_indexes",
        writes.entries.size(), restore_error);
  } else {
    spdlog::warn("Restored {} key(s) after failed commit",
                 writes.entries.size());
  }
  return false;
}

inline tally::schema::operation_result_t make_storage_failure(
    std::string error) {
  return tally::schema::make_failure(tally::schema::error_code::storage_failure,
                                     "ledger store rejected the write set",
                                     std::move(error));
}

inline tally::schema::operation_result_t make_validation_failure(
    std::string log,
    std::string info) {
  return tally::schema::make_failure(
      tally::schema::error_code::validation_failed, std::move(log),
      std::move(info));
}

/// Reject empty ids and ids that collide with reserved keys.
inline std::optional<tally::schema::operation_result_t> check_record_id(
    const std::string_view id,
    const std::string_view field) {
  if (id.empty()) {
    return make_validation_failure(std::string{field} + " must be non-empty",
                                   std::string{field});
  }
  if (tally::schema::key::is_reserved(id)) {
    return make_validation_failure(
        std::string{field} + " collides with a reserved key", std::string{id});
  }
  return std::nullopt;
}

}  // namespace tally::execution
