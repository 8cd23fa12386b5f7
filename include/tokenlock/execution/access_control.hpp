#pragma once

#include <tokenlock/schema/lockup_error_code.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <optional>

namespace tokenlock::execution {

/// Single owner role. A renounced role (zero owner) matches no caller.
class access_control final {
 public:
  explicit access_control(tokenlock::schema::address_t owner);

  const tokenlock::schema::address_t& owner() const { return owner_; }
  bool is_owner(const tokenlock::schema::address_t& caller) const;

  std::optional<tokenlock::schema::lockup_error_code> transfer_ownership(
      const tokenlock::schema::address_t& caller,
      const tokenlock::schema::address_t& new_owner);

  std::optional<tokenlock::schema::lockup_error_code> renounce_ownership(
      const tokenlock::schema::address_t& caller);

 private:
  tokenlock::schema::address_t owner_;
};

}  // namespace tokenlock::execution
