#pragma once

#include <tokenlock/schema/operation_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation event.
// Lockup workflow: Emitted on lockup_created, tokens_released,
// lockup_revoked and ownership_transferred.
namespace tokenlock::schema {

template <uint16_t Version>
struct operation_event;

template <>
struct operation_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<operation_event_attribute_t> attributes;
};

using operation_event_t = operation_event<1>;

}  // namespace tokenlock::schema
