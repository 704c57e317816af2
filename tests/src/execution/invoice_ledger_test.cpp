#include <gtest/gtest.h>
#include <tally/testing/execution_fixture.hpp>

#include <string>
#include <vector>

namespace {

using tally::schema::error_code;
using tally::schema::invoice_status_t;
using tally::testing::code_of;
using tally::testing::json_of;

template <typename Library>
class invoice_ledger_test : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(fixture.init_participants().code, 0u);
    ASSERT_EQ(fixture.invoke("init", {"supplier2", "supplier", "buyer2", "buyer"})
                  .code,
              0u);
  }

  void create_inv1() {
    auto result = fixture.invoke("create_invoice",
                                 {"INV1", "100.00", "supplier1", "payer1"});
    ASSERT_EQ(result.code, 0u) << result.log;
  }

  invoice_status_t status_of(const std::string_view invoice_id) {
    auto invoice = fixture.invoice(invoice_id);
    EXPECT_TRUE(invoice.has_value()) << invoice_id;
    return invoice ? invoice->status : invoice_status_t::created;
  }

  std::vector<std::string> ids_of(
      const tally::schema::operation_result_t& result) {
    EXPECT_EQ(result.code, 0u) << result.log;
    auto out = std::vector<std::string>{};
    for (const auto& invoice : json_of(result)) {
      out.push_back(invoice["invoiceid"].asString());
    }
    return out;
  }

  tally::testing::execution_fixture<Library> fixture{"tally_invoice_ledger"};
};

using backends = ::testing::Types<tally::storage::memory_storage_tag,
                                  tally::storage::rocksdb_storage_tag>;
TYPED_TEST_SUITE(invoice_ledger_test, backends);

}  // namespace

TYPED_TEST(invoice_ledger_test, new_invoice_starts_created_with_defaults) {
  this->create_inv1();
  auto invoice = this->fixture.invoice("INV1");
  ASSERT_TRUE(invoice.has_value());
  EXPECT_EQ(invoice->status, invoice_status_t::created);
  EXPECT_EQ(invoice->currency, "USD");
  EXPECT_EQ(invoice->supplier, "supplier1");
  EXPECT_EQ(invoice->payer, "payer1");
  EXPECT_FALSE(invoice->buyer.has_value());
  EXPECT_FALSE(invoice->discount.has_value());
  EXPECT_FALSE(invoice->due_date.has_value());
  EXPECT_EQ(tally::schema::to_string(invoice->amount), "100.00");

  auto index = json_of(tally::schema::make_success(
      tally::schema::make_bytes(*this->fixture.raw("invoiceIDs"))));
  ASSERT_EQ(index["invoiceids"].size(), 1u);
  EXPECT_EQ(index["invoiceids"][0].asString(), "INV1");
}

TYPED_TEST(invoice_ledger_test, non_supplier_cannot_offer) {
  this->create_inv1();
  for (const auto caller : {"payer1", "buyer1", "supplier2", ""}) {
    auto result = this->fixture.invoke("offer_trade", {"INV1", "5.00", caller});
    EXPECT_EQ(result.code, code_of(error_code::permission_denied)) << caller;
  }
  EXPECT_EQ(this->status_of("INV1"), invoice_status_t::created);
}

TYPED_TEST(invoice_ledger_test, offer_then_accept_binds_buyer) {
  this->create_inv1();
  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "5.00", "supplier1"}).code,
      0u);
  auto offered = this->fixture.invoice("INV1");
  ASSERT_TRUE(offered.has_value());
  EXPECT_EQ(offered->status, invoice_status_t::offered);
  ASSERT_TRUE(offered->discount.has_value());
  EXPECT_EQ(tally::schema::to_string(*offered->discount), "5.00");

  ASSERT_EQ(this->fixture.invoke("accept_trade", {"INV1", "buyer1"}).code, 0u);
  auto accepted = this->fixture.invoice("INV1");
  ASSERT_TRUE(accepted.has_value());
  EXPECT_EQ(accepted->status, invoice_status_t::accepted);
  EXPECT_EQ(accepted->buyer, std::optional<std::string>{"buyer1"});

  auto again = this->fixture.invoke("accept_trade", {"INV1", "buyer2"});
  EXPECT_EQ(again.code, code_of(error_code::invalid_state));
  EXPECT_EQ(this->fixture.invoice("INV1")->buyer,
            std::optional<std::string>{"buyer1"});
}

TYPED_TEST(invoice_ledger_test, accept_before_offer_is_invalid_state) {
  this->create_inv1();
  const auto before = this->fixture.raw("INV1");
  auto result = this->fixture.invoke("accept_trade", {"INV1", "buyer1"});
  EXPECT_EQ(result.code, code_of(error_code::invalid_state));
  EXPECT_EQ(result.info, "INV1");
  EXPECT_EQ(this->fixture.raw("INV1"), before);
}

TYPED_TEST(invoice_ledger_test, offer_cannot_be_repeated) {
  this->create_inv1();
  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "5.00", "supplier1"}).code,
      0u);
  auto result =
      this->fixture.invoke("offer_trade", {"INV1", "1.00", "supplier1"});
  EXPECT_EQ(result.code, code_of(error_code::invalid_state));
  EXPECT_EQ(tally::schema::to_string(*this->fixture.invoice("INV1")->discount),
            "5.00");
}

TYPED_TEST(invoice_ledger_test, accept_requires_buyer_role) {
  this->create_inv1();
  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "5.00", "supplier1"}).code,
      0u);
  for (const auto caller : {"supplier1", "payer1", "nobody"}) {
    EXPECT_EQ(this->fixture.invoke("accept_trade", {"INV1", caller}).code,
              code_of(error_code::permission_denied))
        << caller;
  }
  EXPECT_EQ(this->status_of("INV1"), invoice_status_t::offered);
}

TYPED_TEST(invoice_ledger_test, create_checks_roles_and_duplicates) {
  EXPECT_EQ(this->fixture
                .invoke("create_invoice", {"INV2", "10", "payer1", "payer1"})
                .code,
            code_of(error_code::permission_denied));
  EXPECT_EQ(this->fixture
                .invoke("create_invoice", {"INV2", "10", "nobody", "payer1"})
                .code,
            code_of(error_code::permission_denied));
  EXPECT_EQ(this->fixture
                .invoke("create_invoice",
                        {"INV2", "10", "supplier1", "buyer1"})
                .code,
            code_of(error_code::permission_denied));
  EXPECT_FALSE(this->fixture.raw("INV2").has_value());

  this->create_inv1();
  auto duplicate = this->fixture.invoke(
      "create_invoice", {"INV1", "999", "supplier2", "payer1"});
  EXPECT_EQ(duplicate.code, code_of(error_code::already_exists));
  EXPECT_EQ(this->fixture.invoice("INV1")->supplier, "supplier1");

  // Any record at the key blocks creation, not only invoices.
  ASSERT_EQ(this->fixture.invoke("write", {"INV3", "anything"}).code, 0u);
  EXPECT_EQ(this->fixture
                .invoke("create_invoice",
                        {"INV3", "10", "supplier1", "payer1"})
                .code,
            code_of(error_code::already_exists));
}

TYPED_TEST(invoice_ledger_test, create_rejects_invalid_arguments) {
  const auto invalid = std::vector<std::vector<std::string>>{
      {"", "10", "supplier1", "payer1"},
      {"INV9", "0", "supplier1", "payer1"},
      {"INV9", "-10", "supplier1", "payer1"},
      {"INV9", "ten", "supplier1", "payer1"},
      {"invoiceIDs", "10", "supplier1", "payer1"},
      {"ROLE|supplier1", "10", "supplier1", "payer1"}};
  for (const auto& args : invalid) {
    EXPECT_EQ(this->fixture.invoke("create_invoice", args).code,
              code_of(error_code::validation_failed))
        << args[0] << " " << args[1];
  }
}

TYPED_TEST(invoice_ledger_test, offer_rejects_bad_discount_and_missing) {
  this->create_inv1();
  EXPECT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "-1", "supplier1"}).code,
      code_of(error_code::validation_failed));
  EXPECT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "five", "supplier1"}).code,
      code_of(error_code::validation_failed));
  EXPECT_EQ(
      this->fixture.invoke("offer_trade", {"NOPE", "1", "supplier1"}).code,
      code_of(error_code::not_found));
  EXPECT_EQ(this->fixture.invoke("accept_trade", {"NOPE", "buyer1"}).code,
            code_of(error_code::not_found));

  ASSERT_EQ(this->fixture.invoke("write", {"BAD1", "[broken"}).code, 0u);
  EXPECT_EQ(
      this->fixture.invoke("offer_trade", {"BAD1", "1", "supplier1"}).code,
      code_of(error_code::corrupt_record));
  EXPECT_EQ(this->fixture.invoke("accept_trade", {"BAD1", "buyer1"}).code,
            code_of(error_code::corrupt_record));
}

TYPED_TEST(invoice_ledger_test, details_are_limited_to_participants) {
  this->create_inv1();
  for (const auto caller : {"supplier1", "payer1"}) {
    auto result =
        this->fixture.query("get_invoice_details", {"INV1", caller});
    ASSERT_EQ(result.code, 0u) << caller;
    EXPECT_EQ(json_of(result)["invoiceid"].asString(), "INV1");
  }
  EXPECT_EQ(
      this->fixture.query("get_invoice_details", {"INV1", "buyer1"}).code,
      code_of(error_code::permission_denied));

  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "5.00", "supplier1"}).code,
      0u);
  ASSERT_EQ(this->fixture.invoke("accept_trade", {"INV1", "buyer1"}).code, 0u);
  EXPECT_EQ(
      this->fixture.query("get_invoice_details", {"INV1", "buyer1"}).code, 0u);
  EXPECT_EQ(
      this->fixture.query("get_invoice_details", {"INV1", "buyer2"}).code,
      code_of(error_code::permission_denied));
  EXPECT_EQ(
      this->fixture.query("get_invoice_details", {"NOPE", "supplier1"}).code,
      code_of(error_code::not_found));
}

TYPED_TEST(invoice_ledger_test, list_invoices_omits_what_caller_cannot_view) {
  this->create_inv1();
  ASSERT_EQ(this->fixture
                .invoke("create_invoice",
                        {"INV2", "20.00", "supplier2", "payer1"})
                .code,
            0u);

  EXPECT_EQ(this->ids_of(this->fixture.query("get_invoices", {"payer1"})),
            (std::vector<std::string>{"INV1", "INV2"}));
  EXPECT_EQ(this->ids_of(this->fixture.query("get_invoices", {"supplier1"})),
            std::vector<std::string>{"INV1"});
  EXPECT_EQ(this->ids_of(this->fixture.query("get_invoices", {"supplier2"})),
            std::vector<std::string>{"INV2"});
  EXPECT_TRUE(
      this->ids_of(this->fixture.query("get_invoices", {"buyer1"})).empty());
}

TYPED_TEST(invoice_ledger_test, list_invoices_skips_dangling_entries) {
  this->create_inv1();
  ASSERT_EQ(this->fixture
                .invoke("create_invoice",
                        {"INV2", "20.00", "supplier1", "payer1"})
                .code,
            0u);
  this->fixture.storage().remove(
      tally::schema::make_bytes_view(std::string_view{"INV1"}));
  EXPECT_EQ(this->ids_of(this->fixture.query("get_invoices", {"supplier1"})),
            std::vector<std::string>{"INV2"});

  ASSERT_EQ(this->fixture.invoke("write", {"INV2", "{"}).code, 0u);
  EXPECT_EQ(this->fixture.query("get_invoices", {"supplier1"}).code,
            code_of(error_code::corrupt_record));
}

TYPED_TEST(invoice_ledger_test, open_offers_are_visible_to_anyone) {
  this->create_inv1();
  ASSERT_EQ(this->fixture
                .invoke("create_invoice",
                        {"INV2", "20.00", "supplier2", "payer1"})
                .code,
            0u);
  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV2", "1.00", "supplier2"}).code,
      0u);

  EXPECT_EQ(this->ids_of(this->fixture.query("get_opening_trade_invoices")),
            std::vector<std::string>{"INV2"});

  ASSERT_EQ(this->fixture.invoke("accept_trade", {"INV2", "buyer2"}).code, 0u);
  EXPECT_TRUE(
      this->ids_of(this->fixture.query("get_opening_trade_invoices")).empty());
}

TYPED_TEST(invoice_ledger_test, check_unique_invoice) {
  auto unique = this->fixture.query("check_unique_invoice", {"INV1"});
  ASSERT_EQ(unique.code, 0u);
  EXPECT_EQ(tally::testing::data_of(unique), "true");

  this->create_inv1();
  EXPECT_EQ(this->fixture.query("check_unique_invoice", {"INV1"}).code,
            code_of(error_code::already_exists));
  EXPECT_EQ(this->fixture.query("check_unique_invoice", {""}).code,
            code_of(error_code::validation_failed));
}

TYPED_TEST(invoice_ledger_test, check_unique_invoice_rejects_reserved_ids) {
  for (const auto* id : {"invoiceIDs", "_accountindex", "ROLE|x"}) {
    EXPECT_EQ(this->fixture.query("check_unique_invoice", {id}).code,
              code_of(error_code::validation_failed))
        << id;
    EXPECT_EQ(this->fixture
                  .invoke("create_invoice", {id, "10.00", "supplier1", "payer1"})
                  .code,
              code_of(error_code::validation_failed))
        << id;
  }
}

TYPED_TEST(invoice_ledger_test, roles_are_reread_on_every_call) {
  this->create_inv1();
  ASSERT_EQ(
      this->fixture.invoke("offer_trade", {"INV1", "5.00", "supplier1"}).code,
      0u);
  EXPECT_EQ(this->fixture.invoke("accept_trade", {"INV1", "payer1"}).code,
            code_of(error_code::permission_denied));

  ASSERT_EQ(this->fixture.invoke("init", {"payer1", "BUYER"}).code, 0u);
  EXPECT_EQ(this->ids_of(this->fixture.query("get_invoices", {"supplier1"})),
            std::vector<std::string>{"INV1"});
  EXPECT_EQ(this->fixture.invoke("accept_trade", {"INV1", "payer1"}).code, 0u);
}
