#pragma once
#include <tokenlock/schema/vesting_milestone.hpp>
#include <string>
#include <tuple>

namespace tokenlock::schema::encoding::scale {

using vesting_milestone_tuple_t =
    std::tuple<std::string, timestamp_seconds_t, amount_bytes_t, uint8_t>;

vesting_milestone_tuple_t to_tuple(const vesting_milestone<1>& o);
vesting_milestone<1> from_tuple(const vesting_milestone_tuple_t& t);

}  // namespace tokenlock::schema::encoding::scale
