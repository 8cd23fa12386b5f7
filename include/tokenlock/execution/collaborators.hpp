#pragma once

#include <tokenlock/schema/primitives.hpp>
#include <functional>

namespace tokenlock::execution {

/// Current time in seconds. Must never move backwards.
using clock_source_t = std::function<tokenlock::schema::timestamp_seconds_t()>;

/// True when the address hosts executable code rather than being a plain
/// account.
using code_inspector_t =
    std::function<bool(const tokenlock::schema::address_t& address)>;

}  // namespace tokenlock::execution
