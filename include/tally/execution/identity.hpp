#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tally::execution {

/// Source of the authenticated caller for the current invocation.
///
/// Certificate handling lives in the host; the engine only asks who is
/// calling and for named attributes of that caller.
class identity_provider {
 public:
  virtual ~identity_provider() = default;

  virtual std::string current_principal() const = 0;

  /// Named attribute of the caller, std::nullopt when the credential does not
  /// carry it.
  virtual std::optional<std::string> attribute(std::string_view name) const = 0;
};

/// Identity fixed at construction (CLI flags, tests).
class static_identity final : public identity_provider {
 public:
  explicit static_identity(std::string principal,
                           std::map<std::string, std::string> attributes = {});

  std::string current_principal() const override;
  std::optional<std::string> attribute(std::string_view name) const override;

 private:
  std::string principal_;
  std::map<std::string, std::string, std::less<>> attributes_;
};

}  // namespace tally::execution
