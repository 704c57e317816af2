#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::storage {

namespace {

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

std::optional<tally::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const tally::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tally::common::critical("Failed to get value from RocksDB");
  }
  return tally::schema::make_bytes(value);
}

void storage<rocksdb_storage_tag>::put(
    const tally::schema::bytes_view_t& key,
    const tally::schema::bytes_view_t& value) {
  require_open(database);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    tally::common::critical("Failed to put value into RocksDB");
  }
}

void storage<rocksdb_storage_tag>::remove(
    const tally::schema::bytes_view_t& key) {
  require_open(database);
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    tally::common::critical("Failed to delete key from RocksDB");
  }
}

bool storage<rocksdb_storage_tag>::commit(const write_set& writes,
                                          std::string& error) {
  require_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : writes.entries) {
    auto key = detail::to_slice(entry.key);
    auto status = entry.value
                      ? batch.Put(key, detail::to_slice(*entry.value))
                      : batch.Delete(key);
    if (!status.ok()) {
      error = status.ToString();
      return false;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write set to RocksDB: {}",
                  status.ToString());
    error = status.ToString();
    return false;
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  require_open(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    tally::common::critical("RocksDB iteration failed");
  }
  return entries;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    tally::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB ledger store at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace tally::storage
