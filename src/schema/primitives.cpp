#include <tokenlock/common/critical.hpp>
#include <tokenlock/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tokenlock::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<address_t>) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(address));
  return address;
}

address_t make_address(const std::string_view hex) {
  auto address = try_make_address(hex);
  if (!address) {
    tokenlock::common::critical("make_address expected 20 hex-encoded bytes");
  }
  return *address;
}

address_t make_zero_address() {
  return {};
}

bool is_zero(const address_t& address) {
  return std::all_of(std::begin(address), std::end(address),
                     [](const uint8_t byte) { return byte == 0; });
}

std::string to_string(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

amount_bytes_t to_amount_bytes(const amount_t& amount) {
  auto significant = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(significant),
                                     8);
  auto out = amount_bytes_t{};
  std::copy(std::begin(significant), std::end(significant),
            std::end(out) - static_cast<std::ptrdiff_t>(significant.size()));
  return out;
}

amount_t from_amount_bytes(const amount_bytes_t& bytes) {
  auto amount = amount_t{};
  boost::multiprecision::import_bits(amount, std::begin(bytes),
                                     std::end(bytes), 8);
  return amount;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace tokenlock::schema
