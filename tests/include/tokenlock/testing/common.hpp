#pragma once

#include <tokenlock/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tokenlock::testing {

inline tokenlock::schema::address_t make_address(const uint8_t seed) {
  auto out = tokenlock::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Whole tokens with 18 decimals.
inline tokenlock::schema::amount_t tokens(const uint64_t whole) {
  return tokenlock::schema::amount_t{whole} *
         tokenlock::schema::amount_t{1'000'000'000'000'000'000ull};
}

inline constexpr auto kDay = tokenlock::schema::duration_seconds_t{86'400};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tokenlock::testing
