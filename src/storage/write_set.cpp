#include <tally/storage/storage.hpp>

#include <algorithm>
#include <iterator>

namespace tally::storage {

void write_set::put(tally::schema::bytes_t key,
                    tally::schema::bytes_t value,
                    std::optional<tally::schema::bytes_t> previous) {
  entries.push_back(write_entry{.key = std::move(key),
                                .value = std::move(value),
                                .previous = std::move(previous)});
}

void write_set::remove(tally::schema::bytes_t key,
                       std::optional<tally::schema::bytes_t> previous) {
  entries.push_back(write_entry{.key = std::move(key),
                                .value = std::nullopt,
                                .previous = std::move(previous)});
}

write_set write_set::inverse() const {
  auto out = write_set{};
  out.entries.reserve(entries.size());
  // Restore in reverse so a key staged twice ends at its earliest image.
  std::transform(std::rbegin(entries), std::rend(entries),
                 std::back_inserter(out.entries),
                 [](const write_entry& entry) {
                   return write_entry{.key = entry.key,
                                      .value = entry.previous,
                                      .previous = entry.value};
                 });
  return out;
}

}  // namespace tally::storage
