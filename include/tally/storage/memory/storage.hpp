#pragma once
#include <tally/storage/storage.hpp>
#include <functional>
#include <map>
#include <string_view>

namespace tally::storage {

struct memory_storage_tag {};

/// How the in-memory binding applies a write set.
enum class commit_mode : uint8_t {
  /// Stage on a copy and swap it in: all-or-nothing.
  atomic = 0,
  /// Apply one key at a time; a failure leaves earlier writes applied.
  per_key = 1,
};

/// Called before each write of a commit; returning true fails that write.
using fault_injector_t = std::function<bool(const write_entry&)>;

/// Process-local binding used by tests and dry runs.
template <>
struct storage<memory_storage_tag> final {
  std::map<tally::schema::bytes_t, tally::schema::bytes_t> entries;
  commit_mode mode{commit_mode::atomic};
  fault_injector_t fault_injector;

  std::optional<tally::schema::bytes_t> get(
      const tally::schema::bytes_view_t& key) const;
  void put(const tally::schema::bytes_view_t& key,
           const tally::schema::bytes_view_t& value);
  void remove(const tally::schema::bytes_view_t& key);
  bool commit(const write_set& writes, std::string& error);
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace tally::storage
