#include <tokenlock/schema/encoding/scale/instance_state.hpp>

using namespace tokenlock::schema;

namespace tokenlock::schema::encoding::scale {

contract_state_tuple_t to_contract_tuple(const instance_state<1>& o) {
  return contract_state_tuple_t{o.version, o.instance, o.token, o.owner};
}

void from_contract_tuple(const contract_state_tuple_t& t,
                         instance_state<1>& o) {
  o.version = std::get<0>(t);
  o.instance = std::get<1>(t);
  o.token = std::get<2>(t);
  o.owner = std::get<3>(t);
}

}  // namespace tokenlock::schema::encoding::scale
