#include <gtest/gtest.h>
#include <tokenlock/execution/engine.hpp>
#include <tokenlock/execution/engine_error.hpp>
#include <tokenlock/testing/common.hpp>
#include <tokenlock/testing/execution_fixture.hpp>
#include <tokenlock/testing/mock_token_ledger.hpp>

#include <chrono>
#include <variant>

namespace {

uint64_t system_seconds() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

TEST(engine_types, defaults_are_stable) {
  auto result = tokenlock::schema::operation_result_t{};
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.events.empty());

  auto query = tokenlock::schema::query_result_t{};
  EXPECT_EQ(query.code, 0u);
  EXPECT_TRUE(query.value.empty());

  auto record = tokenlock::schema::lockup_record_t{};
  EXPECT_FALSE(record.present);
  EXPECT_EQ(record.total_amount, 0);
  EXPECT_FALSE(record.revoked);
}

TEST(engine_types, operation_variant_holds_each_payload) {
  auto operation = tokenlock::schema::operation_t{
      tokenlock::schema::transfer_ownership_t{}};
  EXPECT_TRUE(
      std::holds_alternative<tokenlock::schema::transfer_ownership_t>(operation));
  operation = tokenlock::schema::release_t{};
  EXPECT_TRUE(std::holds_alternative<tokenlock::schema::release_t>(operation));
}

TEST(engine_types, null_code_inspector_rejects_every_token) {
  auto path = tokenlock::testing::make_db_path("tokenlock_engine_null_inspector");
  {
    auto encoder = tokenlock::testing::scale_encoder_t{};
    auto storage = tokenlock::storage::make_storage<
        tokenlock::storage::rocksdb_storage_tag>(path);
    auto ledger = tokenlock::testing::mock_token_ledger{};
    auto deployment = tokenlock::schema::deployment_t{
        .instance = tokenlock::testing::make_address(0xB0),
        .token = tokenlock::testing::make_address(0xA0),
        .deployer = tokenlock::testing::make_address(0x10)};
    ledger.deploy_code(deployment.token);

    EXPECT_THROW((tokenlock::execution::engine{encoder, storage, deployment,
                                               ledger, {}, {}}),
                 tokenlock::execution::engine_error);
    EXPECT_FALSE(storage.load_instance_state().has_value());
  }
  tokenlock::testing::remove_path(path);
}

TEST(engine_types, null_clock_starts_lockups_at_system_time) {
  auto path = tokenlock::testing::make_db_path("tokenlock_engine_null_clock");
  {
    auto encoder = tokenlock::testing::scale_encoder_t{};
    auto storage = tokenlock::storage::make_storage<
        tokenlock::storage::rocksdb_storage_tag>(path);
    auto ledger = tokenlock::testing::mock_token_ledger{};
    auto deployment = tokenlock::schema::deployment_t{
        .instance = tokenlock::testing::make_address(0xB0),
        .token = tokenlock::testing::make_address(0xA0),
        .deployer = tokenlock::testing::make_address(0x10)};
    ledger.deploy_code(deployment.token);
    ledger.mint(deployment.deployer, 1000);
    ledger.approve(deployment.deployer, deployment.instance, 1000);

    auto engine = tokenlock::execution::engine{
        encoder, storage, deployment, ledger, ledger.code_inspector(), {}};
    const auto before = system_seconds();
    auto created = engine.create_lockup(
        deployment.deployer,
        tokenlock::schema::create_lockup_t{
            .beneficiary = tokenlock::testing::make_address(0x20),
            .total_amount = 1000,
            .cliff_duration = 0,
            .vesting_duration = 10 * tokenlock::testing::kDay,
            .revocable = false});
    const auto after = system_seconds();
    ASSERT_TRUE(created.ok());

    const auto start = engine.lockup_info().start_time;
    EXPECT_GE(start, before);
    EXPECT_LE(start, after);
  }
  tokenlock::testing::remove_path(path);
}

TEST(engine_types, engine_error_carries_its_code) {
  auto error = tokenlock::execution::engine_error{
      tokenlock::schema::lockup_error_code::invalid_token_address, "bad token"};
  EXPECT_EQ(error.code(),
            tokenlock::schema::lockup_error_code::invalid_token_address);
  EXPECT_STREQ(error.what(), "bad token");
}
