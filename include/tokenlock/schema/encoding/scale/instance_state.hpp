#pragma once
#include <tokenlock/schema/instance_state.hpp>
#include <tuple>

namespace tokenlock::schema::encoding::scale {

// version, instance, token, owner
using contract_state_tuple_t =
    std::tuple<uint16_t, address_t, address_t, address_t>;

contract_state_tuple_t to_contract_tuple(const instance_state<1>& o);
void from_contract_tuple(const contract_state_tuple_t& t, instance_state<1>& o);

}  // namespace tokenlock::schema::encoding::scale
