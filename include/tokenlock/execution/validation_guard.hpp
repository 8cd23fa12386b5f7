#pragma once

#include <tokenlock/execution/collaborators.hpp>
#include <tokenlock/execution/token_gateway.hpp>
#include <tokenlock/schema/create_lockup.hpp>
#include <tokenlock/schema/lockup_error_code.hpp>
#include <tokenlock/schema/lockup_record.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <optional>

/// Precondition checks for the lockup lifecycle. Each returns the first
/// failing error code, or std::nullopt when the precondition holds. None of
/// them mutate anything.
namespace tokenlock::execution::validation {

/// Token must be non-zero and host code.
std::optional<tokenlock::schema::lockup_error_code> check_token_address(
    const tokenlock::schema::address_t& token,
    const code_inspector_t& has_code);

std::optional<tokenlock::schema::lockup_error_code> check_lockup_absent(
    const tokenlock::schema::lockup_record_t& record);

std::optional<tokenlock::schema::lockup_error_code> check_beneficiary(
    const tokenlock::schema::address_t& beneficiary,
    const tokenlock::schema::address_t& instance);

std::optional<tokenlock::schema::lockup_error_code> check_amount(
    const tokenlock::schema::amount_t& amount);

/// `cliff < vesting <= kMaxVestingDuration`.
std::optional<tokenlock::schema::lockup_error_code> check_durations(
    tokenlock::schema::duration_seconds_t cliff_duration,
    tokenlock::schema::duration_seconds_t vesting_duration);

/// Local checks for a create request, duplicate first. Makes no ledger
/// calls.
std::optional<tokenlock::schema::lockup_error_code> check_create_request(
    const tokenlock::schema::lockup_record_t& existing,
    const tokenlock::schema::create_lockup_t& request,
    const tokenlock::schema::address_t& instance);

/// Balance, then allowance, of `holder` against `amount`.
std::optional<tokenlock::schema::lockup_error_code> check_funding(
    const token_gateway& gateway,
    const tokenlock::schema::address_t& holder,
    const tokenlock::schema::amount_t& amount);

/// The observed balance delta must equal the request exactly.
std::optional<tokenlock::schema::lockup_error_code> check_received(
    const pull_outcome& outcome,
    const tokenlock::schema::amount_t& requested);

/// Present, revocable and not yet revoked.
std::optional<tokenlock::schema::lockup_error_code> check_revocable(
    const tokenlock::schema::lockup_record_t& record);

}  // namespace tokenlock::execution::validation
