#pragma once
#include <tokenlock/schema/primitives.hpp>

// Schema type: create lockup.
// Lockup workflow: Owner locks total_amount for one beneficiary, vesting
// linearly over vesting_duration after cliff_duration.
namespace tokenlock::schema {

template <uint16_t Version>
struct create_lockup;

template <>
struct create_lockup<1> final {
  uint16_t version{1};
  address_t beneficiary{};
  amount_t total_amount{};
  duration_seconds_t cliff_duration{};
  duration_seconds_t vesting_duration{};
  bool revocable{};
};

using create_lockup_t = create_lockup<1>;

}  // namespace tokenlock::schema
