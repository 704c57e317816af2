#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// One staged single-key mutation.
///
/// `value` is the new contents (std::nullopt deletes the key); `previous` is
/// the contents read before the operation staged this write (std::nullopt
/// when the key was absent). `previous` is what a compensating commit
/// restores.
struct write_entry final {
  tally::schema::bytes_t key;
  std::optional<tally::schema::bytes_t> value;
  std::optional<tally::schema::bytes_t> previous;
};

/// All writes of one ledger operation, applied together by `commit`.
struct write_set final {
  std::vector<write_entry> entries;

  void put(tally::schema::bytes_t key,
           tally::schema::bytes_t value,
           std::optional<tally::schema::bytes_t> previous);
  void remove(tally::schema::bytes_t key,
              std::optional<tally::schema::bytes_t> previous);

  bool empty() const { return entries.empty(); }

  /// Write set that puts every touched key back to its `previous` contents.
  write_set inverse() const;
};

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  std::optional<tally::schema::bytes_t> get(
      const tally::schema::bytes_view_t& key) const;

  /// Single-key write outside any write set.
  void put(const tally::schema::bytes_view_t& key,
           const tally::schema::bytes_view_t& value);

  /// Single-key removal outside any write set. Missing keys are ignored.
  void remove(const tally::schema::bytes_view_t& key);

  /// Apply a write set. Returns false and fills `error` on failure; what was
  /// applied before the failure depends on the backend.
  bool commit(const write_set& writes, std::string& error);

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order. An empty prefix lists the whole store.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
