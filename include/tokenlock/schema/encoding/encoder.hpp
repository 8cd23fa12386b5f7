#pragma once
#include <tokenlock/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tokenlock::schema::encoding {

// The wire/storage codec is a build time choice selected by tag, the same
// way storage backends are. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  tokenlock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tokenlock::schema::bytes_t& out);

  template <typename T>
  T decode(const tokenlock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tokenlock::schema::bytes_view_t& bytes);
};

}  // namespace tokenlock::schema::encoding
