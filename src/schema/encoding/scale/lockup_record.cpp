#include <tokenlock/schema/encoding/scale/lockup_record.hpp>

using namespace tokenlock::schema;

namespace tokenlock::schema::encoding::scale {

lockup_record_tuple_t to_tuple(const lockup_record<1>& o) {
  return lockup_record_tuple_t{o.version,
                               o.present,
                               o.beneficiary,
                               to_amount_bytes(o.total_amount),
                               to_amount_bytes(o.released_amount),
                               o.start_time,
                               o.cliff_duration,
                               o.vesting_duration,
                               o.revocable,
                               o.revoked,
                               to_amount_bytes(o.vested_at_revoke)};
}

lockup_record<1> from_tuple(const lockup_record_tuple_t& t) {
  auto o = lockup_record<1>{};
  o.version = std::get<0>(t);
  o.present = std::get<1>(t);
  o.beneficiary = std::get<2>(t);
  o.total_amount = from_amount_bytes(std::get<3>(t));
  o.released_amount = from_amount_bytes(std::get<4>(t));
  o.start_time = std::get<5>(t);
  o.cliff_duration = std::get<6>(t);
  o.vesting_duration = std::get<7>(t);
  o.revocable = std::get<8>(t);
  o.revoked = std::get<9>(t);
  o.vested_at_revoke = from_amount_bytes(std::get<10>(t));
  return o;
}

}  // namespace tokenlock::schema::encoding::scale
