#pragma once
#include <tokenlock/schema/lockup_record.hpp>
#include <tuple>

// Fixed field order of a persisted lockup record. Amounts travel as 32-byte
// big-endian arrays.
namespace tokenlock::schema::encoding::scale {

using lockup_record_tuple_t = std::tuple<uint16_t,
                                         bool,
                                         address_t,
                                         amount_bytes_t,
                                         amount_bytes_t,
                                         timestamp_seconds_t,
                                         duration_seconds_t,
                                         duration_seconds_t,
                                         bool,
                                         bool,
                                         amount_bytes_t>;

lockup_record_tuple_t to_tuple(const lockup_record<1>& o);
lockup_record<1> from_tuple(const lockup_record_tuple_t& t);

}  // namespace tokenlock::schema::encoding::scale
