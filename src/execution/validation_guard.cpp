#include <tokenlock/execution/validation_guard.hpp>

using namespace tokenlock::schema;

namespace tokenlock::execution::validation {

std::optional<lockup_error_code> check_token_address(
    const address_t& token,
    const code_inspector_t& has_code) {
  if (is_zero(token)) {
    return lockup_error_code::invalid_token_address;
  }
  // Only rules out plain accounts; does not prove the token interface.
  if (!has_code || !has_code(token)) {
    return lockup_error_code::invalid_token_address;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_lockup_absent(
    const lockup_record_t& record) {
  if (record.present) {
    return lockup_error_code::lockup_already_exists;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_beneficiary(const address_t& beneficiary,
                                                   const address_t& instance) {
  if (is_zero(beneficiary) || beneficiary == instance) {
    return lockup_error_code::invalid_beneficiary;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_amount(const amount_t& amount) {
  if (amount == 0) {
    return lockup_error_code::invalid_amount;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_durations(
    const duration_seconds_t cliff_duration,
    const duration_seconds_t vesting_duration) {
  if (vesting_duration == 0 || vesting_duration > kMaxVestingDuration) {
    return lockup_error_code::invalid_duration;
  }
  // Equal durations would leave no gradual vesting window.
  if (cliff_duration >= vesting_duration) {
    return lockup_error_code::invalid_duration;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_create_request(
    const lockup_record_t& existing,
    const create_lockup_t& request,
    const address_t& instance) {
  if (auto error = check_lockup_absent(existing)) {
    return error;
  }
  if (auto error = check_beneficiary(request.beneficiary, instance)) {
    return error;
  }
  if (auto error = check_amount(request.total_amount)) {
    return error;
  }
  return check_durations(request.cliff_duration, request.vesting_duration);
}

std::optional<lockup_error_code> check_funding(const token_gateway& gateway,
                                               const address_t& holder,
                                               const amount_t& amount) {
  if (gateway.balance_of(holder) < amount) {
    return lockup_error_code::insufficient_balance;
  }
  if (gateway.allowance_of(holder) < amount) {
    return lockup_error_code::insufficient_allowance;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_received(const pull_outcome& outcome,
                                                const amount_t& requested) {
  if (!outcome.accepted) {
    return lockup_error_code::transfer_failed;
  }
  if (outcome.received != requested) {
    return lockup_error_code::transfer_amount_mismatch;
  }
  return std::nullopt;
}

std::optional<lockup_error_code> check_revocable(
    const lockup_record_t& record) {
  if (!record.present || !record.revocable) {
    return lockup_error_code::not_revocable;
  }
  if (record.revoked) {
    return lockup_error_code::already_revoked;
  }
  return std::nullopt;
}

}  // namespace tokenlock::execution::validation
