#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: participant role.
// Invoice workflow: suppliers issue and offer invoices, payers owe them,
// buyers accept offered invoices.
namespace tally::schema {

enum class role_t : uint8_t { supplier = 0, payer = 1, buyer = 2 };

inline constexpr auto kRoleMappings = std::array{
    std::pair<std::string_view, role_t>{"supplier", role_t::supplier},
    std::pair<std::string_view, role_t>{"payer", role_t::payer},
    std::pair<std::string_view, role_t>{"buyer", role_t::buyer},
};

template <>
inline std::optional<role_t> try_from_string<role_t>(
    const std::string_view value) {
  return from_string(value, kRoleMappings);
}

inline constexpr std::string_view to_string(const role_t value) {
  return to_string(value, kRoleMappings).value_or("unknown");
}

}  // namespace tally::schema
