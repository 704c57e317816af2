#pragma once
#include <tally/schema/role.hpp>
#include <tally/storage/storage.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::execution {

using role_assignment_t = std::pair<std::string, tally::schema::role_t>;

/// Principal -> role records kept in the ledger store.
///
/// Roles are looked up from storage on every call; nothing is cached.
template <typename Library>
class role_registry final {
 public:
  explicit role_registry(tally::storage::storage<Library>& storage);

  /// Registered role of `principal`; std::nullopt when none is on record or
  /// the stored label is not a known role.
  std::optional<tally::schema::role_t> role_of(
      std::string_view principal) const;

  /// Stage role records for `assignments` into `writes`.
  void stage_assignments(const std::vector<role_assignment_t>& assignments,
                         tally::storage::write_set& writes) const;

  /// Parse `name role name role ...`. Returns std::nullopt with `error` set
  /// for an odd count, an empty name or an unknown role label.
  static std::optional<std::vector<role_assignment_t>> parse_assignments(
      const std::vector<std::string>& args,
      std::string& error);

 private:
  tally::storage::storage<Library>& storage_;
};

}  // namespace tally::execution
