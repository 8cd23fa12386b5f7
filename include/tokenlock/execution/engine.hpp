#pragma once

#include <tokenlock/execution/access_control.hpp>
#include <tokenlock/execution/collaborators.hpp>
#include <tokenlock/execution/reentrancy_lock.hpp>
#include <tokenlock/execution/token_gateway.hpp>
#include <tokenlock/execution/token_ledger.hpp>
#include <tokenlock/schema/create_lockup.hpp>
#include <tokenlock/schema/deployment.hpp>
#include <tokenlock/schema/encoding/encoder.hpp>
#include <tokenlock/schema/lockup_error_code.hpp>
#include <tokenlock/schema/lockup_record.hpp>
#include <tokenlock/schema/lockup_status.hpp>
#include <tokenlock/schema/operation.hpp>
#include <tokenlock/schema/operation_result.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <tokenlock/schema/query_result.hpp>
#include <tokenlock/schema/vesting_milestone.hpp>
#include <tokenlock/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace tokenlock::execution {

/// Single-beneficiary lockup state machine.
///
/// Owns the one lockup record of an instance, moves tokens through the
/// gateway, persists every committed change and answers read-only queries.
/// Each mutating call either commits completely or returns a non-zero code
/// with no observable change.
class engine final {
 public:
  /// Bring up an instance.
  ///
  /// A store that already holds an instance is restored (owner and record
  /// included) provided it names the same instance and token. A fresh store
  /// requires a non-zero token hosting code and makes `deployer` the owner.
  /// Throws `engine_error` with `invalid_token_address` otherwise. A null
  /// `clock` falls back to the system clock.
  engine(tokenlock::schema::encoding::encoder<
             tokenlock::schema::encoding::scale_encoder_tag>& encoder,
         tokenlock::storage::storage<tokenlock::storage::rocksdb_storage_tag>&
             storage,
         const tokenlock::schema::deployment_t& deployment,
         token_ledger& ledger,
         const code_inspector_t& has_code,
         clock_source_t clock);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Dispatch a tagged operation to its handler.
  tokenlock::schema::operation_result_t execute(
      const tokenlock::schema::address_t& caller,
      const tokenlock::schema::operation_t& operation);

  /// Owner only. Pulls `total_amount` from the owner and starts the
  /// schedule at the current time.
  tokenlock::schema::operation_result_t create_lockup(
      const tokenlock::schema::address_t& caller,
      const tokenlock::schema::create_lockup_t& request);

  /// Beneficiary only. Pushes everything releasable to the beneficiary.
  tokenlock::schema::operation_result_t release(
      const tokenlock::schema::address_t& caller);

  /// Owner only. Freezes vesting and returns the unvested remainder to the
  /// owner.
  tokenlock::schema::operation_result_t revoke(
      const tokenlock::schema::address_t& caller);

  tokenlock::schema::operation_result_t transfer_ownership(
      const tokenlock::schema::address_t& caller,
      const tokenlock::schema::address_t& new_owner);

  tokenlock::schema::operation_result_t renounce_ownership(
      const tokenlock::schema::address_t& caller);

  /// Snapshot of the record; all-zero before creation.
  tokenlock::schema::lockup_record_t lockup_info() const;
  tokenlock::schema::amount_t vested_amount() const;
  tokenlock::schema::amount_t vested_amount_at(
      tokenlock::schema::timestamp_seconds_t at) const;
  tokenlock::schema::amount_t releasable_amount() const;
  uint8_t vesting_progress() const;
  tokenlock::schema::duration_seconds_t remaining_vesting_time() const;
  tokenlock::schema::lockup_status_t status() const;
  std::vector<tokenlock::schema::vesting_milestone_t> timeline() const;
  tokenlock::schema::address_t beneficiary() const;
  tokenlock::schema::address_t token() const;
  tokenlock::schema::address_t owner() const;

  /// Routed read path. Values are SCALE encoded.
  tokenlock::schema::query_result_t query(
      std::string_view path,
      const tokenlock::schema::bytes_view_t& data) const;

 private:
  tokenlock::schema::timestamp_seconds_t now() const;

  /// Write contract fields and record in one batch.
  void persist();

  // Ledger callbacks re-enter on the calling thread, hence recursive.
  mutable std::recursive_mutex mutex_;
  tokenlock::schema::encoding::encoder<
      tokenlock::schema::encoding::scale_encoder_tag>& encoder_;
  tokenlock::storage::storage<tokenlock::storage::rocksdb_storage_tag>&
      storage_;
  tokenlock::schema::address_t instance_;
  tokenlock::schema::address_t token_;
  access_control access_;
  tokenlock::schema::lockup_record_t record_;
  token_gateway gateway_;
  clock_source_t clock_;
  reentrancy_lock reentrancy_;
};

}  // namespace tokenlock::execution
