#pragma once
#include <cstdint>

namespace tokenlock::schema {

template <uint16_t Version>
struct renounce_ownership;

template <>
struct renounce_ownership<1> final {
  uint16_t version{1};
};

using renounce_ownership_t = renounce_ownership<1>;

}  // namespace tokenlock::schema
