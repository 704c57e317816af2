#include <spdlog/spdlog.h>
#include <tally/execution/role_registry.hpp>
#include <tally/schema/key/keys.hpp>
#include <tally/storage/memory/storage.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::execution {

template <typename Library>
role_registry<Library>::role_registry(tally::storage::storage<Library>& storage)
    : storage_{storage} {}

template <typename Library>
std::optional<tally::schema::role_t> role_registry<Library>::role_of(
    const std::string_view principal) const {
  if (principal.empty()) {
    return std::nullopt;
  }
  const auto key = tally::schema::key::make_role_key(principal);
  auto stored = storage_.get(tally::schema::make_bytes_view(key));
  if (!stored) {
    spdlog::debug("No role on record for '{}'", principal);
    return std::nullopt;
  }
  auto label = tally::schema::make_string_view(*stored);
  auto role = tally::schema::try_from_string<tally::schema::role_t>(label);
  if (!role) {
    spdlog::warn("Unknown role label '{}' stored for '{}'", label, principal);
  }
  return role;
}

template <typename Library>
void role_registry<Library>::stage_assignments(
    const std::vector<role_assignment_t>& assignments,
    tally::storage::write_set& writes) const {
  for (const auto& [principal, role] : assignments) {
    auto key = tally::schema::key::make_role_key(principal);
    auto previous = storage_.get(tally::schema::make_bytes_view(key));
    writes.put(std::move(key),
               tally::schema::make_bytes(tally::schema::to_string(role)),
               std::move(previous));
  }
}

template <typename Library>
std::optional<std::vector<role_assignment_t>>
role_registry<Library>::parse_assignments(const std::vector<std::string>& args,
                                          std::string& error) {
  if ((args.size() % 2) != 0) {
    error = "expected name/role pairs";
    return std::nullopt;
  }
  auto out = std::vector<role_assignment_t>{};
  out.reserve(args.size() / 2);
  for (std::size_t i = 0; i < args.size(); i += 2) {
    if (args[i].empty()) {
      error = "participant name at position " + std::to_string(i) +
              " must be non-empty";
      return std::nullopt;
    }
    auto role = tally::schema::try_from_string<tally::schema::role_t>(
        tally::schema::to_lower(args[i + 1]));
    if (!role) {
      error = "unknown role '" + args[i + 1] + "' for " + args[i];
      return std::nullopt;
    }
    out.emplace_back(args[i], *role);
  }
  return out;
}

template class role_registry<tally::storage::rocksdb_storage_tag>;
template class role_registry<tally::storage::memory_storage_tag>;

}  // namespace tally::execution
