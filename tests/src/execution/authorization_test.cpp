#include <gtest/gtest.h>
#include <tally/execution/authorization.hpp>
#include <tally/testing/common.hpp>

#include <optional>

namespace {

using tally::execution::action_t;
using tally::execution::authorize;
using tally::execution::decision_t;
using tally::schema::role_t;

tally::schema::invoice_t make_invoice() {
  auto invoice = tally::schema::invoice_t{};
  invoice.invoice_id = "INV1";
  invoice.amount = tally::testing::make_decimal("100.00");
  invoice.currency = "USD";
  invoice.supplier = "supplier1";
  invoice.payer = "payer1";
  return invoice;
}

}  // namespace

TEST(authorization, role_gated_actions_require_the_matching_role) {
  EXPECT_EQ(authorize("s", role_t::supplier, action_t::create_invoice),
            decision_t::allow);
  EXPECT_EQ(authorize("s", role_t::buyer, action_t::create_invoice),
            decision_t::deny);
  EXPECT_EQ(authorize("s", std::nullopt, action_t::create_invoice),
            decision_t::deny);

  EXPECT_EQ(authorize("p", role_t::payer, action_t::owe_invoice),
            decision_t::allow);
  EXPECT_EQ(authorize("p", role_t::supplier, action_t::owe_invoice),
            decision_t::deny);

  EXPECT_EQ(authorize("b", role_t::buyer, action_t::accept_trade),
            decision_t::allow);
  EXPECT_EQ(authorize("b", role_t::payer, action_t::accept_trade),
            decision_t::deny);
}

TEST(authorization, offer_requires_the_issuing_supplier) {
  auto invoice = make_invoice();
  EXPECT_EQ(authorize("supplier1", role_t::supplier, action_t::offer_trade,
                      &invoice),
            decision_t::allow);
  // Holding the role is not enough.
  EXPECT_EQ(authorize("supplier2", role_t::supplier, action_t::offer_trade,
                      &invoice),
            decision_t::deny);
  EXPECT_EQ(authorize("supplier1", role_t::supplier, action_t::offer_trade),
            decision_t::deny);
}

TEST(authorization, view_is_limited_to_recorded_participants) {
  auto invoice = make_invoice();
  EXPECT_EQ(authorize("supplier1", std::nullopt, action_t::view_invoice,
                      &invoice),
            decision_t::allow);
  EXPECT_EQ(authorize("payer1", std::nullopt, action_t::view_invoice, &invoice),
            decision_t::allow);
  EXPECT_EQ(authorize("buyer1", role_t::buyer, action_t::view_invoice,
                      &invoice),
            decision_t::deny);

  invoice.buyer = "buyer1";
  EXPECT_EQ(authorize("buyer1", role_t::buyer, action_t::view_invoice,
                      &invoice),
            decision_t::allow);
  EXPECT_EQ(authorize("buyer2", role_t::buyer, action_t::view_invoice,
                      &invoice),
            decision_t::deny);
}

TEST(authorization, empty_principal_is_always_denied) {
  auto invoice = make_invoice();
  invoice.supplier = "";
  EXPECT_EQ(authorize("", role_t::supplier, action_t::create_invoice),
            decision_t::deny);
  EXPECT_EQ(authorize("", std::nullopt, action_t::offer_trade, &invoice),
            decision_t::deny);
  EXPECT_EQ(authorize("", std::nullopt, action_t::view_invoice, &invoice),
            decision_t::deny);
}

TEST(authorization, action_labels) {
  EXPECT_EQ(tally::execution::to_string(action_t::accept_trade),
            "accept_trade");
  EXPECT_EQ(tally::execution::to_string(action_t::view_invoice),
            "view_invoice");
}
