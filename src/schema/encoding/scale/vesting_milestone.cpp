#include <tokenlock/schema/encoding/scale/vesting_milestone.hpp>

using namespace tokenlock::schema;

namespace tokenlock::schema::encoding::scale {

vesting_milestone_tuple_t to_tuple(const vesting_milestone<1>& o) {
  return vesting_milestone_tuple_t{o.label, o.timestamp,
                                   to_amount_bytes(o.vested_amount),
                                   o.vested_percent};
}

vesting_milestone<1> from_tuple(const vesting_milestone_tuple_t& t) {
  auto o = vesting_milestone<1>{};
  o.label = std::get<0>(t);
  o.timestamp = std::get<1>(t);
  o.vested_amount = from_amount_bytes(std::get<2>(t));
  o.vested_percent = std::get<3>(t);
  return o;
}

}  // namespace tokenlock::schema::encoding::scale
