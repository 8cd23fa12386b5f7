#pragma once

#include <tokenlock/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Lockup workflow: Read API envelope: SCALE-encoded value plus error
// metadata. Queries never change state.
namespace tokenlock::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  std::string codespace;

  bool ok() const { return code == 0; }
};

using query_result_t = query_result<1>;

}  // namespace tokenlock::schema
