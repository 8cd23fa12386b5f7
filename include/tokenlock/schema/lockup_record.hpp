#pragma once
#include <tokenlock/schema/primitives.hpp>

// Schema type: lockup record.
// Lockup workflow: The single vesting schedule held by an instance. Created
// once, advanced by release, frozen by revoke, never deleted.
namespace tokenlock::schema {

/// Ten years of 365 days.
inline constexpr auto kMaxVestingDuration =
    duration_seconds_t{10ull * 365ull * 24ull * 60ull * 60ull};

template <uint16_t Version>
struct lockup_record;

template <>
struct lockup_record<1> final {
  uint16_t version{1};
  bool present{};
  address_t beneficiary{};
  amount_t total_amount{};
  amount_t released_amount{};
  timestamp_seconds_t start_time{};
  duration_seconds_t cliff_duration{};
  duration_seconds_t vesting_duration{};
  bool revocable{};
  bool revoked{};
  amount_t vested_at_revoke{};

  bool operator==(const lockup_record<1>&) const = default;
};

using lockup_record_t = lockup_record<1>;

}  // namespace tokenlock::schema
