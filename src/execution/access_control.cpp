#include <spdlog/spdlog.h>
#include <tokenlock/execution/access_control.hpp>

using namespace tokenlock::schema;

namespace tokenlock::execution {

access_control::access_control(address_t owner) : owner_{owner} {}

bool access_control::is_owner(const address_t& caller) const {
  return !is_zero(owner_) && caller == owner_;
}

std::optional<lockup_error_code> access_control::transfer_ownership(
    const address_t& caller,
    const address_t& new_owner) {
  if (!is_owner(caller)) {
    return lockup_error_code::unauthorized;
  }
  if (is_zero(new_owner)) {
    return lockup_error_code::invalid_owner;
  }
  spdlog::info("Ownership transferred from {} to {}", to_string(owner_),
               to_string(new_owner));
  owner_ = new_owner;
  return std::nullopt;
}

std::optional<lockup_error_code> access_control::renounce_ownership(
    const address_t& caller) {
  if (!is_owner(caller)) {
    return lockup_error_code::unauthorized;
  }
  spdlog::info("Ownership renounced by {}", to_string(owner_));
  owner_ = make_zero_address();
  return std::nullopt;
}

}  // namespace tokenlock::execution
