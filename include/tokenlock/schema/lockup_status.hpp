#pragma once

#include <tokenlock/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lockup status.
// Lockup workflow: Derived lifecycle phase of the single lockup record at a
// point in time.
namespace tokenlock::schema {

enum class lockup_status_t : uint8_t {
  uninitialized = 0,
  cliff = 1,
  vesting = 2,
  fully_vested = 3,
  revoked = 4,
  fully_released = 5
};

inline constexpr auto kLockupStatusMappings =
    std::array{std::pair<std::string_view, lockup_status_t>{
                   "uninitialized", lockup_status_t::uninitialized},
               std::pair<std::string_view, lockup_status_t>{
                   "cliff", lockup_status_t::cliff},
               std::pair<std::string_view, lockup_status_t>{
                   "vesting", lockup_status_t::vesting},
               std::pair<std::string_view, lockup_status_t>{
                   "fully_vested", lockup_status_t::fully_vested},
               std::pair<std::string_view, lockup_status_t>{
                   "revoked", lockup_status_t::revoked},
               std::pair<std::string_view, lockup_status_t>{
                   "fully_released", lockup_status_t::fully_released}};

template <>
inline std::optional<lockup_status_t> try_from_string<lockup_status_t>(
    const std::string_view value) {
  return from_string(value, kLockupStatusMappings);
}

inline constexpr std::string_view to_string(const lockup_status_t value) {
  return name_or_unknown(value, kLockupStatusMappings);
}

}  // namespace tokenlock::schema
