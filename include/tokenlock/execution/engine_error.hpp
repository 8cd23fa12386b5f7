#pragma once

#include <tokenlock/schema/lockup_error_code.hpp>
#include <stdexcept>
#include <string>

namespace tokenlock::execution {

/// Raised when an engine cannot be brought up.
class engine_error final : public std::runtime_error {
 public:
  engine_error(const tokenlock::schema::lockup_error_code code,
               const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  tokenlock::schema::lockup_error_code code() const noexcept { return code_; }

 private:
  tokenlock::schema::lockup_error_code code_;
};

}  // namespace tokenlock::execution
