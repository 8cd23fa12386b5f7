#pragma once

#include <tokenlock/schema/operation_event.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tokenlock::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<operation_event_t> events;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

}  // namespace tokenlock::schema
