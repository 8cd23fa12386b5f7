#pragma once
#include <tokenlock/schema/primitives.hpp>

#include <string>

// Schema type: vesting milestone.
// Lockup workflow: One row of a vesting timeline: the vested amount at a
// labelled point of the schedule.
namespace tokenlock::schema {

template <uint16_t Version>
struct vesting_milestone;

template <>
struct vesting_milestone<1> final {
  uint16_t version{1};
  std::string label;
  timestamp_seconds_t timestamp{};
  amount_t vested_amount{};
  uint8_t vested_percent{};
};

using vesting_milestone_t = vesting_milestone<1>;

}  // namespace tokenlock::schema
