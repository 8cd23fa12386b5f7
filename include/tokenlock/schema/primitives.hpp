#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tokenlock::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
// Intermediate width for amount * elapsed products.
using wide_amount_t = boost::multiprecision::uint512_t;
using amount_bytes_t = std::array<uint8_t, 32>;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
/// Views a RocksDB value without copying.
bytes_view_t make_bytes_view(const std::string& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Parse a 20-byte address from hex, with or without a `0x` prefix.
std::optional<address_t> try_make_address(std::string_view hex);
address_t make_address(std::string_view hex);
address_t make_zero_address();
bool is_zero(const address_t& address);
/// `0x`-prefixed lowercase hex.
std::string to_string(const address_t& address);

/// Big-endian, left padded to 32 bytes.
amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);
std::string to_string(const amount_t& amount);

}  // namespace tokenlock::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
