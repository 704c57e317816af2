#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <tally/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace tally::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Durable binding. A write set is committed as one `WriteBatch`, so either
/// every write of an operation lands or none does.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

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
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace tally::storage
