#include <tally/execution/identity.hpp>

#include <iterator>
#include <utility>

namespace tally::execution {

static_identity::static_identity(std::string principal,
                                 std::map<std::string, std::string> attributes)
    : principal_{std::move(principal)},
      attributes_{std::begin(attributes), std::end(attributes)} {
  if (!attributes_.contains("username")) {
    attributes_.emplace("username", principal_);
  }
}

std::string static_identity::current_principal() const {
  return principal_;
}

std::optional<std::string> static_identity::attribute(
    const std::string_view name) const {
  auto found = attributes_.find(name);
  if (found == std::end(attributes_)) {
    return std::nullopt;
  }
  return found->second;
}

}  // namespace tally::execution
