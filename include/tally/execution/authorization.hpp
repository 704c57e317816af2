#pragma once
#include <tally/schema/enum_string.hpp>
#include <tally/schema/invoice.hpp>
#include <tally/schema/role.hpp>
#include <array>
#include <optional>
#include <string_view>

namespace tally::execution {

/// Invoice operations subject to authorization.
enum class action_t : uint8_t {
  create_invoice = 0,
  /// Being named as the payer of a new invoice.
  owe_invoice = 1,
  offer_trade = 2,
  accept_trade = 3,
  view_invoice = 4,
};

inline constexpr auto kActionMappings = std::array{
    std::pair<std::string_view, action_t>{"create_invoice",
                                          action_t::create_invoice},
    std::pair<std::string_view, action_t>{"owe_invoice", action_t::owe_invoice},
    std::pair<std::string_view, action_t>{"offer_trade", action_t::offer_trade},
    std::pair<std::string_view, action_t>{"accept_trade",
                                          action_t::accept_trade},
    std::pair<std::string_view, action_t>{"view_invoice",
                                          action_t::view_invoice}};

inline constexpr std::string_view to_string(const action_t value) {
  return tally::schema::to_string(value, kActionMappings).value_or("unknown");
}

enum class decision_t : uint8_t { deny = 0, allow = 1 };

/// Authorization policy for invoice operations.
///
/// `role` is the principal's registered role (std::nullopt when none is on
/// record). `invoice` is the record acted upon, required for offer_trade and
/// view_invoice and ignored otherwise. Pure: no storage access.
decision_t authorize(std::string_view principal,
                     std::optional<tally::schema::role_t> role,
                     action_t action,
                     const tally::schema::invoice_t* invoice = nullptr);

}  // namespace tally::execution
