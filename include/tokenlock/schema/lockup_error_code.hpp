#pragma once

#include <tokenlock/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lockup error code.
// Lockup workflow: Stable numeric failure taxonomy returned in
// operation_result.code; zero means success.
namespace tokenlock::schema {

enum class lockup_error_code : uint32_t {
  invalid_token_address = 1,
  invalid_beneficiary = 2,
  lockup_already_exists = 3,
  invalid_amount = 4,
  invalid_duration = 5,
  insufficient_balance = 6,
  insufficient_allowance = 7,
  transfer_amount_mismatch = 8,
  not_revocable = 9,
  already_revoked = 10,
  nothing_to_revoke = 11,
  no_tokens_available = 12,
  unauthorized = 13,
  reentrant_call = 14,
  transfer_failed = 15,
  invalid_owner = 16,
};

inline constexpr auto kLockupErrorCodeMappings = std::array{
    std::pair<std::string_view, lockup_error_code>{
        "invalid_token_address", lockup_error_code::invalid_token_address},
    std::pair<std::string_view, lockup_error_code>{
        "invalid_beneficiary", lockup_error_code::invalid_beneficiary},
    std::pair<std::string_view, lockup_error_code>{
        "lockup_already_exists", lockup_error_code::lockup_already_exists},
    std::pair<std::string_view, lockup_error_code>{
        "invalid_amount", lockup_error_code::invalid_amount},
    std::pair<std::string_view, lockup_error_code>{
        "invalid_duration", lockup_error_code::invalid_duration},
    std::pair<std::string_view, lockup_error_code>{
        "insufficient_balance", lockup_error_code::insufficient_balance},
    std::pair<std::string_view, lockup_error_code>{
        "insufficient_allowance", lockup_error_code::insufficient_allowance},
    std::pair<std::string_view, lockup_error_code>{
        "transfer_amount_mismatch",
        lockup_error_code::transfer_amount_mismatch},
    std::pair<std::string_view, lockup_error_code>{
        "not_revocable", lockup_error_code::not_revocable},
    std::pair<std::string_view, lockup_error_code>{
        "already_revoked", lockup_error_code::already_revoked},
    std::pair<std::string_view, lockup_error_code>{
        "nothing_to_revoke", lockup_error_code::nothing_to_revoke},
    std::pair<std::string_view, lockup_error_code>{
        "no_tokens_available", lockup_error_code::no_tokens_available},
    std::pair<std::string_view, lockup_error_code>{
        "unauthorized", lockup_error_code::unauthorized},
    std::pair<std::string_view, lockup_error_code>{
        "reentrant_call", lockup_error_code::reentrant_call},
    std::pair<std::string_view, lockup_error_code>{
        "transfer_failed", lockup_error_code::transfer_failed},
    std::pair<std::string_view, lockup_error_code>{
        "invalid_owner", lockup_error_code::invalid_owner}};

template <>
inline std::optional<lockup_error_code> try_from_string<lockup_error_code>(
    const std::string_view value) {
  return from_string(value, kLockupErrorCodeMappings);
}

inline constexpr std::string_view to_string(const lockup_error_code value) {
  return name_or_unknown(value, kLockupErrorCodeMappings);
}

}  // namespace tokenlock::schema
