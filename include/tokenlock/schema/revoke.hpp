#pragma once
#include <cstdint>

namespace tokenlock::schema {

template <uint16_t Version>
struct revoke;

template <>
struct revoke<1> final {
  uint16_t version{1};
};

using revoke_t = revoke<1>;

}  // namespace tokenlock::schema
