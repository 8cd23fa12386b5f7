#include <gtest/gtest.h>
#include <tokenlock/execution/validation_guard.hpp>
#include <tokenlock/testing/common.hpp>
#include <tokenlock/testing/mock_token_ledger.hpp>

namespace {

using tokenlock::schema::lockup_error_code;
using tokenlock::testing::kDay;
using tokenlock::testing::make_address;

tokenlock::schema::create_lockup_t valid_request() {
  return tokenlock::schema::create_lockup_t{.beneficiary = make_address(0x20),
                                            .total_amount = 1000,
                                            .cliff_duration = 30 * kDay,
                                            .vesting_duration = 360 * kDay,
                                            .revocable = true};
}

}  // namespace

TEST(validation_guard, token_address_must_be_non_zero_with_code) {
  auto token = make_address(0xA0);
  auto has_code = [&](const tokenlock::schema::address_t& address) {
    return address == token;
  };
  EXPECT_FALSE(tokenlock::execution::validation::check_token_address(token,
                                                                     has_code)
                   .has_value());
  EXPECT_EQ(tokenlock::execution::validation::check_token_address(
                tokenlock::schema::make_zero_address(), has_code),
            lockup_error_code::invalid_token_address);
  EXPECT_EQ(tokenlock::execution::validation::check_token_address(
                make_address(0x40), has_code),
            lockup_error_code::invalid_token_address);
  EXPECT_EQ(tokenlock::execution::validation::check_token_address(token, {}),
            lockup_error_code::invalid_token_address);
}

TEST(validation_guard, beneficiary_cannot_be_zero_or_the_instance) {
  auto instance = make_address(0xB0);
  EXPECT_EQ(tokenlock::execution::validation::check_beneficiary(
                tokenlock::schema::make_zero_address(), instance),
            lockup_error_code::invalid_beneficiary);
  EXPECT_EQ(
      tokenlock::execution::validation::check_beneficiary(instance, instance),
      lockup_error_code::invalid_beneficiary);
  EXPECT_FALSE(tokenlock::execution::validation::check_beneficiary(
                   make_address(0x20), instance)
                   .has_value());
}

TEST(validation_guard, durations_are_bounded) {
  using tokenlock::execution::validation::check_durations;
  EXPECT_EQ(check_durations(0, 0), lockup_error_code::invalid_duration);
  EXPECT_EQ(check_durations(100, 100), lockup_error_code::invalid_duration);
  EXPECT_EQ(check_durations(101, 100), lockup_error_code::invalid_duration);
  EXPECT_FALSE(check_durations(99, 100).has_value());
  EXPECT_FALSE(
      check_durations(0, tokenlock::schema::kMaxVestingDuration).has_value());
  EXPECT_EQ(check_durations(0, tokenlock::schema::kMaxVestingDuration + 1),
            lockup_error_code::invalid_duration);
}

TEST(validation_guard, duplicate_is_reported_before_anything_else) {
  auto existing = tokenlock::schema::lockup_record_t{};
  existing.present = true;
  auto request = tokenlock::schema::create_lockup_t{};
  EXPECT_EQ(tokenlock::execution::validation::check_create_request(
                existing, request, make_address(0xB0)),
            lockup_error_code::lockup_already_exists);
}

TEST(validation_guard, create_request_checks_in_order) {
  auto empty = tokenlock::schema::lockup_record_t{};
  auto instance = make_address(0xB0);

  auto request = valid_request();
  EXPECT_FALSE(tokenlock::execution::validation::check_create_request(
                   empty, request, instance)
                   .has_value());

  request.total_amount = 0;
  request.vesting_duration = 0;
  EXPECT_EQ(tokenlock::execution::validation::check_create_request(
                empty, request, instance),
            lockup_error_code::invalid_amount);

  request = valid_request();
  request.cliff_duration = request.vesting_duration;
  EXPECT_EQ(tokenlock::execution::validation::check_create_request(
                empty, request, instance),
            lockup_error_code::invalid_duration);
}

TEST(validation_guard, funding_checks_balance_before_allowance) {
  auto ledger = tokenlock::testing::mock_token_ledger{};
  auto gateway = tokenlock::execution::token_gateway{ledger, make_address(0xA0),
                                                     make_address(0xB0)};
  auto holder = make_address(0x10);

  EXPECT_EQ(tokenlock::execution::validation::check_funding(gateway, holder, 10),
            lockup_error_code::insufficient_balance);
  ledger.mint(holder, 10);
  EXPECT_EQ(tokenlock::execution::validation::check_funding(gateway, holder, 10),
            lockup_error_code::insufficient_allowance);
  ledger.approve(holder, make_address(0xB0), 10);
  EXPECT_FALSE(
      tokenlock::execution::validation::check_funding(gateway, holder, 10)
          .has_value());
}

TEST(validation_guard, received_amount_must_match_exactly) {
  using tokenlock::execution::pull_outcome;
  using tokenlock::execution::validation::check_received;
  EXPECT_EQ(check_received(pull_outcome{.accepted = false}, 10),
            lockup_error_code::transfer_failed);
  EXPECT_EQ(check_received(pull_outcome{.accepted = true, .received = 9}, 10),
            lockup_error_code::transfer_amount_mismatch);
  EXPECT_EQ(check_received(pull_outcome{.accepted = true, .received = 11}, 10),
            lockup_error_code::transfer_amount_mismatch);
  EXPECT_FALSE(
      check_received(pull_outcome{.accepted = true, .received = 10}, 10)
          .has_value());
}

TEST(validation_guard, revocable_requires_flag_and_not_yet_revoked) {
  auto record = tokenlock::schema::lockup_record_t{};
  EXPECT_EQ(tokenlock::execution::validation::check_revocable(record),
            lockup_error_code::not_revocable);
  record.present = true;
  EXPECT_EQ(tokenlock::execution::validation::check_revocable(record),
            lockup_error_code::not_revocable);
  record.revocable = true;
  EXPECT_FALSE(
      tokenlock::execution::validation::check_revocable(record).has_value());
  record.revoked = true;
  EXPECT_EQ(tokenlock::execution::validation::check_revocable(record),
            lockup_error_code::already_revoked);
}
