#include <tally/execution/authorization.hpp>

namespace tally::execution {

namespace {

decision_t require_role(const std::optional<tally::schema::role_t>& role,
                        const tally::schema::role_t expected) {
  return role == expected ? decision_t::allow : decision_t::deny;
}

bool is_participant(const std::string_view principal,
                    const tally::schema::invoice_t& invoice) {
  return principal == invoice.supplier || principal == invoice.payer ||
         (invoice.buyer.has_value() && principal == *invoice.buyer);
}

}  // namespace

decision_t authorize(const std::string_view principal,
                     const std::optional<tally::schema::role_t> role,
                     const action_t action,
                     const tally::schema::invoice_t* invoice) {
  if (principal.empty()) {
    return decision_t::deny;
  }
  switch (action) {
    case action_t::create_invoice:
      return require_role(role, tally::schema::role_t::supplier);
    case action_t::owe_invoice:
      return require_role(role, tally::schema::role_t::payer);
    case action_t::accept_trade:
      return require_role(role, tally::schema::role_t::buyer);
    case action_t::offer_trade:
      // Ownership, not role: only the issuing supplier may offer.
      return invoice != nullptr && principal == invoice->supplier
                 ? decision_t::allow
                 : decision_t::deny;
    case action_t::view_invoice:
      return invoice != nullptr && is_participant(principal, *invoice)
                 ? decision_t::allow
                 : decision_t::deny;
  }
  return decision_t::deny;
}

}  // namespace tally::execution
