#pragma once
#include <cstdint>

namespace tokenlock::schema {

template <uint16_t Version>
struct release;

template <>
struct release<1> final {
  uint16_t version{1};
};

using release_t = release<1>;

}  // namespace tokenlock::schema
