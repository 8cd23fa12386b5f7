#include <tokenlock/vesting/calculator.hpp>

#include <algorithm>
#include <string>

using namespace tokenlock::schema;

namespace {

duration_seconds_t elapsed_since_start(const lockup_record_t& record,
                                       const timestamp_seconds_t now) {
  return now > record.start_time ? now - record.start_time : 0;
}

amount_t linear_share(const amount_t& total,
                      const duration_seconds_t elapsed,
                      const duration_seconds_t duration) {
  const wide_amount_t product =
      wide_amount_t{total} * wide_amount_t{elapsed};
  const wide_amount_t quotient = product / wide_amount_t{duration};
  return amount_t{quotient};
}

uint8_t percent_of(const amount_t& part, const amount_t& total) {
  if (total == 0) {
    return 0;
  }
  const wide_amount_t scaled =
      wide_amount_t{part} * 100u / wide_amount_t{total};
  return static_cast<uint8_t>(std::min<unsigned>(scaled.convert_to<unsigned>(),
                                                 100u));
}

vesting_milestone_t make_milestone(const lockup_record_t& record,
                                   std::string label,
                                   const timestamp_seconds_t at) {
  auto vested = tokenlock::vesting::vested_amount(record, at);
  return vesting_milestone_t{.label = std::move(label),
                             .timestamp = at,
                             .vested_amount = vested,
                             .vested_percent =
                                 percent_of(vested, record.total_amount)};
}

}  // namespace

namespace tokenlock::vesting {

amount_t vested_amount(const lockup_record_t& record,
                       const timestamp_seconds_t now) {
  if (!record.present || record.vesting_duration == 0) {
    return 0;
  }
  auto elapsed = elapsed_since_start(record, now);
  if (now < record.start_time || elapsed < record.cliff_duration) {
    return 0;
  }
  if (elapsed >= record.vesting_duration && !record.revoked) {
    return record.total_amount;
  }
  auto computed = linear_share(
      record.total_amount, std::min(elapsed, record.vesting_duration),
      record.vesting_duration);
  if (record.revoked) {
    return std::min(computed, record.vested_at_revoke);
  }
  return computed;
}

amount_t releasable_amount(const lockup_record_t& record,
                           const timestamp_seconds_t now) {
  auto vested = vested_amount(record, now);
  if (vested <= record.released_amount) {
    return 0;
  }
  return vested - record.released_amount;
}

uint8_t vesting_progress(const lockup_record_t& record,
                         const timestamp_seconds_t now) {
  if (!record.present || record.vesting_duration == 0) {
    return 0;
  }
  auto elapsed =
      std::min(elapsed_since_start(record, now), record.vesting_duration);
  return static_cast<uint8_t>((elapsed * 100u) / record.vesting_duration);
}

duration_seconds_t remaining_vesting_time(const lockup_record_t& record,
                                          const timestamp_seconds_t now) {
  if (!record.present) {
    return 0;
  }
  if (now < record.start_time) {
    return record.vesting_duration + (record.start_time - now);
  }
  auto elapsed = elapsed_since_start(record, now);
  return elapsed >= record.vesting_duration ? 0
                                            : record.vesting_duration - elapsed;
}

lockup_status_t status(const lockup_record_t& record,
                       const timestamp_seconds_t now) {
  if (!record.present) {
    return lockup_status_t::uninitialized;
  }
  auto vested = vested_amount(record, now);
  auto claimable_total =
      record.revoked ? record.vested_at_revoke : record.total_amount;
  if (claimable_total > 0 && record.released_amount >= claimable_total) {
    return lockup_status_t::fully_released;
  }
  if (record.revoked) {
    return lockup_status_t::revoked;
  }
  if (elapsed_since_start(record, now) < record.cliff_duration) {
    return lockup_status_t::cliff;
  }
  if (vested >= record.total_amount) {
    return lockup_status_t::fully_vested;
  }
  return lockup_status_t::vesting;
}

std::vector<vesting_milestone_t> timeline(const lockup_record_t& record) {
  auto rows = std::vector<vesting_milestone_t>{};
  if (!record.present) {
    return rows;
  }
  const auto start = record.start_time;
  const auto duration = record.vesting_duration;
  rows.reserve(6);
  rows.push_back(make_milestone(record, "start", start));
  rows.push_back(
      make_milestone(record, "cliff_end", start + record.cliff_duration));
  rows.push_back(make_milestone(record, "25%", start + duration / 4));
  rows.push_back(make_milestone(record, "50%", start + duration / 2));
  rows.push_back(make_milestone(record, "75%", start + duration * 3 / 4));
  rows.push_back(make_milestone(record, "vesting_end", start + duration));
  return rows;
}

std::vector<vesting_milestone_t> monthly_breakdown(
    const lockup_record_t& record) {
  auto rows = std::vector<vesting_milestone_t>{};
  if (!record.present || record.vesting_duration <= 3 * kBreakdownPeriod) {
    return rows;
  }
  auto periods = std::min<std::size_t>(
      kMaxBreakdownPeriods, record.vesting_duration / kBreakdownPeriod);
  rows.reserve(periods);
  for (std::size_t month = 1; month <= periods; ++month) {
    rows.push_back(make_milestone(
        record, "M" + std::to_string(month),
        record.start_time + month * kBreakdownPeriod));
  }
  return rows;
}

}  // namespace tokenlock::vesting
