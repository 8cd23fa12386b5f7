#pragma once
#include <tokenlock/schema/lockup_record.hpp>
#include <tokenlock/schema/primitives.hpp>

#include <optional>

// Schema type: instance state.
// Lockup workflow: Everything an instance persists. Constant size: the
// contract-level addresses plus at most one lockup record.
namespace tokenlock::schema {

template <uint16_t Version>
struct instance_state;

template <>
struct instance_state<1> final {
  uint16_t version{1};
  address_t instance{};
  address_t token{};
  address_t owner{};
  std::optional<lockup_record_t> record;
};

using instance_state_t = instance_state<1>;

}  // namespace tokenlock::schema
