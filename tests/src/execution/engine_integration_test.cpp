#include <gtest/gtest.h>
#include <tally/testing/execution_fixture.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

using tally::schema::error_code;
using tally::testing::code_of;
using tally::testing::data_of;
using tally::testing::json_of;

std::shared_ptr<const tally::execution::identity_provider> identity_of(
    const std::string& principal,
    std::map<std::string, std::string> attributes = {}) {
  return std::make_shared<tally::execution::static_identity>(
      principal, std::move(attributes));
}

}  // namespace

TEST(engine_integration, unknown_operations_are_reported_per_verb) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};

  auto invoke = fixture.invoke("mint_money", {"A001"});
  EXPECT_EQ(invoke.code, code_of(error_code::unknown_operation));
  EXPECT_EQ(invoke.codespace, "tally.invoke");
  EXPECT_EQ(invoke.info, "mint_money");

  // Query operations are not reachable through invoke, and vice versa.
  EXPECT_EQ(fixture.invoke("read", {"A001"}).code,
            code_of(error_code::unknown_operation));
  auto query = fixture.query("transfer_balance", {"A001", "B001", "1"});
  EXPECT_EQ(query.code, code_of(error_code::unknown_operation));
  EXPECT_EQ(query.codespace, "tally.query");
}

TEST(engine_integration, arity_mismatch_is_validation_failure) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};

  const auto invoke_cases = std::vector<
      std::pair<std::string, std::vector<std::string>>>{
      {"write", {"k"}},
      {"delete", {}},
      {"init_account", {"A001", "alice", "USD"}},
      {"transfer_balance", {"A001", "B001"}},
      {"create_invoice", {"INV1", "10", "supplier1"}},
      {"offer_trade", {"INV1", "5", "supplier1", "extra"}},
      {"accept_trade", {"INV1"}},
      {"reconcile_indexes", {"now"}},
      {"init", {"alice"}}};
  for (const auto& [operation, args] : invoke_cases) {
    auto result = fixture.invoke(operation, args);
    EXPECT_EQ(result.code, code_of(error_code::validation_failed))
        << operation;
    EXPECT_EQ(result.codespace, "tally.invoke") << operation;
  }

  const auto query_cases = std::vector<
      std::pair<std::string, std::vector<std::string>>>{
      {"read", {}},
      {"get_account", {}},
      {"get_accounts", {"x"}},
      {"get_invoice_details", {"INV1"}},
      {"get_invoices", {}},
      {"get_opening_trade_invoices", {"x"}},
      {"check_unique_invoice", {}},
      {"get_username", {"username"}},
      {"ping", {"x"}}};
  for (const auto& [operation, args] : query_cases) {
    auto result = fixture.query(operation, args);
    EXPECT_EQ(result.code, code_of(error_code::validation_failed))
        << operation;
    EXPECT_EQ(result.codespace, "tally.query") << operation;
  }
  EXPECT_TRUE(fixture.storage().entries.empty());
}

TEST(engine_integration, init_rejects_malformed_role_assignments) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  EXPECT_EQ(fixture.invoke("init", {"alice", "auditor"}).code,
            code_of(error_code::validation_failed));
  EXPECT_EQ(fixture.invoke("init", {"", "buyer"}).code,
            code_of(error_code::validation_failed));
  EXPECT_TRUE(fixture.storage().entries.empty());

  ASSERT_EQ(fixture.invoke("init", {}).code, 0u);
  EXPECT_TRUE(fixture.raw("_accountindex").has_value());
  EXPECT_TRUE(fixture.raw("invoiceIDs").has_value());
}

TEST(engine_integration, init_records_roles_under_prefixed_keys) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  ASSERT_EQ(fixture.init_participants().code, 0u);
  EXPECT_EQ(fixture.raw("ROLE|supplier1"), std::optional<std::string>{"supplier"});
  EXPECT_EQ(fixture.raw("ROLE|payer1"), std::optional<std::string>{"payer"});
  EXPECT_EQ(fixture.raw("ROLE|buyer1"), std::optional<std::string>{"buyer"});
  EXPECT_FALSE(fixture.raw("supplier1").has_value());
}

TEST(engine_integration, repeated_init_keeps_indexes_listing_live_records) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  ASSERT_EQ(fixture.invoke("init", {"s1", "supplier", "p1", "payer"}).code, 0u);
  ASSERT_EQ(fixture.invoke("init_account", {"A001", "alice", "USD", "500"}).code,
            0u);
  ASSERT_EQ(fixture.invoke("create_invoice", {"INV1", "100", "s1", "p1"}).code,
            0u);
  ASSERT_EQ(fixture.invoke("write", {"_accountindex",
                                     R"({"accountnumbers":["A001","GONE"]})"})
                .code,
            0u);

  ASSERT_EQ(fixture.invoke("init", {"b1", "buyer"}).code, 0u);

  auto accounts = json_of(fixture.query("get_accounts"));
  ASSERT_EQ(accounts.size(), 1u);
  EXPECT_EQ(accounts[0]["accountnumber"].asString(), "A001");
  auto invoices = json_of(fixture.query("get_invoices", {"s1"}));
  ASSERT_EQ(invoices.size(), 1u);
  EXPECT_EQ(invoices[0]["invoiceid"].asString(), "INV1");
  EXPECT_EQ(fixture.raw("ROLE|b1"), std::optional<std::string>{"buyer"});
  EXPECT_EQ(fixture.invoke("init_account", {"A001", "alice", "USD", "1"}).code,
            code_of(error_code::already_exists));
}

TEST(engine_integration, raw_write_and_read) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  ASSERT_EQ(fixture.invoke("write", {"greeting", "hello"}).code, 0u);

  auto read = fixture.query("read", {"greeting"});
  ASSERT_EQ(read.code, 0u);
  EXPECT_EQ(data_of(read), "hello");

  auto missing = fixture.query("read", {"nothing"});
  EXPECT_EQ(missing.code, code_of(error_code::not_found));
  EXPECT_EQ(missing.info, "nothing");

  EXPECT_EQ(fixture.invoke("write", {"", "x"}).code,
            code_of(error_code::validation_failed));
}

TEST(engine_integration, ping_answers) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  auto result = fixture.query("ping");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(data_of(result), "Hello, world!");
}

TEST(engine_integration, get_username_reads_identity_attribute) {
  auto anonymous = tally::testing::memory_fixture{"tally_engine"};
  EXPECT_EQ(anonymous.query("get_username").code,
            code_of(error_code::permission_denied));

  auto defaulted =
      tally::testing::memory_fixture{"tally_engine", identity_of("supplier1")};
  auto result = defaulted.query("get_username");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(data_of(result), "supplier1");

  auto explicit_name = tally::testing::memory_fixture{
      "tally_engine", identity_of("cn=supplier1", {{"username", "Sue"}})};
  EXPECT_EQ(data_of(explicit_name.query("get_username")), "Sue");
}

TEST(engine_integration, acting_principal_must_match_identity) {
  auto fixture =
      tally::testing::memory_fixture{"tally_engine", identity_of("supplier1")};
  ASSERT_EQ(fixture.init_participants().code, 0u);

  auto forged = fixture.invoke("create_invoice",
                               {"INV1", "10", "supplier2", "payer1"});
  EXPECT_EQ(forged.code, code_of(error_code::permission_denied));
  EXPECT_EQ(forged.info, "supplier2");
  EXPECT_FALSE(fixture.raw("INV1").has_value());

  ASSERT_EQ(fixture
                .invoke("create_invoice", {"INV1", "10", "supplier1", "payer1"})
                .code,
            0u);
  EXPECT_EQ(fixture.invoke("accept_trade", {"INV1", "buyer1"}).code,
            code_of(error_code::permission_denied));
  EXPECT_EQ(fixture.query("get_invoices", {"payer1"}).code,
            code_of(error_code::permission_denied));
  EXPECT_EQ(fixture.query("get_invoice_details", {"INV1", "payer1"}).code,
            code_of(error_code::permission_denied));
  EXPECT_EQ(json_of(fixture.query("get_invoices", {"supplier1"})).size(), 1u);

  // Operations without an acting principal are unaffected.
  EXPECT_EQ(fixture.query("get_opening_trade_invoices").code, 0u);
}

TEST(engine_integration, per_key_backend_is_restored_by_compensation) {
  auto fixture = tally::testing::memory_fixture{"tally_engine"};
  ASSERT_EQ(fixture.init_participants().code, 0u);
  fixture.storage().mode = tally::storage::commit_mode::per_key;
  fixture.storage().fault_injector = tally::testing::fail_once_at("invoiceIDs");

  auto result = fixture.invoke("create_invoice",
                               {"INV1", "10", "supplier1", "payer1"});
  EXPECT_EQ(result.code, code_of(error_code::storage_failure));
  EXPECT_EQ(result.codespace, "tally.invoke");
  EXPECT_FALSE(fixture.raw("INV1").has_value());
  EXPECT_EQ(fixture.query("check_unique_invoice", {"INV1"}).code, 0u);
  EXPECT_TRUE(json_of(fixture.query("get_invoices", {"supplier1"})).empty());
}

TEST(engine_integration, rocksdb_ledger_survives_reopen) {
  const auto db = tally::testing::make_db_path("tally_engine_reopen");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto engine =
        tally::execution::engine<tally::storage::rocksdb_storage_tag>{storage};
    ASSERT_EQ(engine.invoke("init", {"supplier1", "supplier", "payer1", "payer"})
                  .code,
              0u);
    ASSERT_EQ(engine.invoke("init_account", {"A001", "alice", "USD", "500.00"})
                  .code,
              0u);
    ASSERT_EQ(engine.invoke("init_account", {"B001", "bob", "USD", "0.00"})
                  .code,
              0u);
    ASSERT_EQ(engine.invoke("transfer_balance", {"A001", "B001", "200.00"})
                  .code,
              0u);
    ASSERT_EQ(engine
                  .invoke("create_invoice",
                          {"INV1", "100.00", "supplier1", "payer1"})
                  .code,
              0u);
  }
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto engine =
        tally::execution::engine<tally::storage::rocksdb_storage_tag>{storage};
    auto accounts = json_of(engine.query("get_accounts", {}));
    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[0]["balance"].asString(), "300.00");
    EXPECT_EQ(accounts[1]["balance"].asString(), "200.00");

    auto details = engine.query("get_invoice_details", {"INV1", "payer1"});
    ASSERT_EQ(details.code, 0u);
    EXPECT_EQ(json_of(details)["status"].asInt(), 0);
  }
  tally::testing::remove_path(db);
}
