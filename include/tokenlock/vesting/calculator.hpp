#pragma once

#include <tokenlock/schema/lockup_record.hpp>
#include <tokenlock/schema/lockup_status.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <tokenlock/schema/vesting_milestone.hpp>
#include <cstdint>
#include <vector>

/// Linear-with-cliff vesting arithmetic.
///
/// Every function here is pure: the result depends only on the record and
/// the supplied time. A record that is not `present` vests nothing.
namespace tokenlock::vesting {

/// Length of one period in the monthly breakdown.
inline constexpr auto kBreakdownPeriod =
    tokenlock::schema::duration_seconds_t{30ull * 24ull * 60ull * 60ull};
inline constexpr auto kMaxBreakdownPeriods = std::size_t{12};

/// Amount earned by the beneficiary at `now`.
///
/// Zero before the cliff ends, the exact total once the vesting duration
/// has elapsed (unless revoked), otherwise `total * elapsed / duration`
/// computed in 512 bits and floored. After revocation the result never
/// exceeds `vested_at_revoke`.
tokenlock::schema::amount_t vested_amount(
    const tokenlock::schema::lockup_record_t& record,
    tokenlock::schema::timestamp_seconds_t now);

/// Vested but not yet released.
tokenlock::schema::amount_t releasable_amount(
    const tokenlock::schema::lockup_record_t& record,
    tokenlock::schema::timestamp_seconds_t now);

/// Elapsed share of the vesting duration, floored, in `0..100`. Ignores the
/// cliff.
uint8_t vesting_progress(const tokenlock::schema::lockup_record_t& record,
                         tokenlock::schema::timestamp_seconds_t now);

/// Seconds until the vesting duration ends, zero afterwards.
tokenlock::schema::duration_seconds_t remaining_vesting_time(
    const tokenlock::schema::lockup_record_t& record,
    tokenlock::schema::timestamp_seconds_t now);

/// Lifecycle phase at `now`.
tokenlock::schema::lockup_status_t status(
    const tokenlock::schema::lockup_record_t& record,
    tokenlock::schema::timestamp_seconds_t now);

/// Start, cliff end, 25/50/75 percent and end of the schedule.
std::vector<tokenlock::schema::vesting_milestone_t> timeline(
    const tokenlock::schema::lockup_record_t& record);

/// Vested amount at the end of each 30 day period, at most 12 rows. Empty
/// for schedules of 90 days or less.
std::vector<tokenlock::schema::vesting_milestone_t> monthly_breakdown(
    const tokenlock::schema::lockup_record_t& record);

}  // namespace tokenlock::vesting
