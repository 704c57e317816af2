#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: invoice status.
// Invoice workflow: created -> offered -> accepted, one step at a time.
namespace tally::schema {

enum class invoice_status_t : uint8_t { created = 0, offered = 1, accepted = 2 };

inline constexpr auto kInvoiceStatusMappings = std::array{
    std::pair<std::string_view, invoice_status_t>{"created",
                                                  invoice_status_t::created},
    std::pair<std::string_view, invoice_status_t>{"offered",
                                                  invoice_status_t::offered},
    std::pair<std::string_view, invoice_status_t>{"accepted",
                                                  invoice_status_t::accepted}};

template <>
inline std::optional<invoice_status_t> try_from_string<invoice_status_t>(
    const std::string_view value) {
  return from_string(value, kInvoiceStatusMappings);
}

inline constexpr std::string_view to_string(const invoice_status_t value) {
  return to_string(value, kInvoiceStatusMappings).value_or("unknown");
}

/// Map a stored status number onto the enum, rejecting unknown values.
inline constexpr std::optional<invoice_status_t> invoice_status_from_number(
    const int64_t value) {
  switch (value) {
    case 0:
      return invoice_status_t::created;
    case 1:
      return invoice_status_t::offered;
    case 2:
      return invoice_status_t::accepted;
    default:
      return std::nullopt;
  }
}

}  // namespace tally::schema
