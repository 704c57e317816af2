#include <spdlog/spdlog.h>
#include <tally/storage/memory/storage.hpp>

#include <algorithm>

namespace tally::storage {

namespace {

using map_t = std::map<tally::schema::bytes_t, tally::schema::bytes_t>;

bool apply(map_t& target,
           const write_set& writes,
           const fault_injector_t& fault_injector,
           std::string& error) {
  for (const auto& entry : writes.entries) {
    if (fault_injector && fault_injector(entry)) {
      error = "injected fault writing key '" +
              tally::schema::make_string(entry.key) + "'";
      return false;
    }
    if (entry.value) {
      target[entry.key] = *entry.value;
    } else {
      target.erase(entry.key);
    }
  }
  return true;
}

}  // namespace

std::optional<tally::schema::bytes_t> storage<memory_storage_tag>::get(
    const tally::schema::bytes_view_t& key) const {
  auto found = entries.find(tally::schema::make_bytes(key));
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return found->second;
}

void storage<memory_storage_tag>::put(
    const tally::schema::bytes_view_t& key,
    const tally::schema::bytes_view_t& value) {
  entries[tally::schema::make_bytes(key)] = tally::schema::make_bytes(value);
}

void storage<memory_storage_tag>::remove(
    const tally::schema::bytes_view_t& key) {
  entries.erase(tally::schema::make_bytes(key));
}

bool storage<memory_storage_tag>::commit(const write_set& writes,
                                         std::string& error) {
  if (mode == commit_mode::per_key) {
    return apply(entries, writes, fault_injector, error);
  }
  auto staged = entries;
  if (!apply(staged, writes, fault_injector, error)) {
    return false;
  }
  entries.swap(staged);
  return true;
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  for (auto it = entries.lower_bound(tally::schema::make_bytes(prefix));
       it != std::end(entries); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    out.push_back(*it);
  }
  return out;
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::info("Using in-memory ledger store ({})",
               path.empty() ? std::string_view{"unnamed"} : path);
  return storage<memory_storage_tag>{};
}

}  // namespace tally::storage
