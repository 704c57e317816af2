#pragma once
#include <tally/schema/primitives.hpp>
#include <string_view>

// Schema key helpers: every record lives under a plain string key. Accounts
// and invoices use their natural id, index records use reserved constants and
// role records use a fixed prefix.
namespace tally::schema::key {

inline constexpr auto kRolePrefix = std::string_view{"ROLE|"};

bytes_t make_record_key(std::string_view id);
bytes_t make_role_key(std::string_view principal);

/// True for keys that a caller may not claim as an account number or
/// invoice id.
bool is_reserved(std::string_view id);

}  // namespace tally::schema::key
