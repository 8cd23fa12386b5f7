#pragma once
#include <tokenlock/schema/create_lockup.hpp>
#include <tokenlock/schema/release.hpp>
#include <tokenlock/schema/renounce_ownership.hpp>
#include <tokenlock/schema/revoke.hpp>
#include <tokenlock/schema/transfer_ownership.hpp>
#include <variant>

namespace tokenlock::schema {

using operation_t = std::variant<create_lockup_t,
                                 release_t,
                                 revoke_t,
                                 transfer_ownership_t,
                                 renounce_ownership_t>;

}  // namespace tokenlock::schema
