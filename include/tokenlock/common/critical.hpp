#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tokenlock::common {

/// Log, flush and terminate. Reserved for state the engine cannot recover
/// from (unreadable or unwritable persisted state).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tokenlock::common
