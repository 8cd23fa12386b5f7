#pragma once

#include <tokenlock/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: query error code.
// Lockup workflow: Query failure taxonomy for the routed read path. The name
// doubles as query_result.log.
namespace tokenlock::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

inline constexpr auto kQueryErrorCodeMappings = std::array{
    std::pair<std::string_view, query_error_code>{
        "invalid_key", query_error_code::invalid_key},
    std::pair<std::string_view, query_error_code>{
        "not_found", query_error_code::not_found},
    std::pair<std::string_view, query_error_code>{
        "unsupported_path", query_error_code::unsupported_path}};

template <>
inline std::optional<query_error_code> try_from_string<query_error_code>(
    const std::string_view value) {
  return from_string(value, kQueryErrorCodeMappings);
}

inline constexpr std::string_view to_string(const query_error_code value) {
  return name_or_unknown(value, kQueryErrorCodeMappings);
}

}  // namespace tokenlock::schema
