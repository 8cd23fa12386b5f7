#pragma once
#include <tokenlock/schema/primitives.hpp>

// Schema type: transfer ownership.
// Lockup workflow: Hands the owner role (create, revoke, refund recipient)
// to another non-zero account.
namespace tokenlock::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  address_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

}  // namespace tokenlock::schema
