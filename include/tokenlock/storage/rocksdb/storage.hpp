#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tokenlock/common/critical.hpp>
#include <tokenlock/schema/encoding/scale/encoder.hpp>
#include <tokenlock/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace tokenlock::storage {

namespace detail {

using encoder_t = tokenlock::schema::encoding::encoder<
    tokenlock::schema::encoding::scale_encoder_tag>;

inline constexpr auto kContractStateKey =
    std::string_view{"SYS|LOCKUP|CONTRACT"};
inline constexpr auto kLockupRecordKey = std::string_view{"SYS|LOCKUP|RECORD"};

inline std::string to_string(const tokenlock::schema::bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()),
                     bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<tokenlock::schema::instance_state_t> load_instance_state()
      const;
  void save_instance_state(
      const tokenlock::schema::instance_state_t& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> open_storage_read_only<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<tokenlock::schema::instance_state_t>
storage<rocksdb_storage_tag>::load_instance_state() const {
  if (!database) {
    tokenlock::common::critical("RocksDB database is not initialized");
  }

  auto contract_raw = std::string{};
  auto contract_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kContractStateKey}, &contract_raw);
  if (contract_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!contract_status.ok()) {
    spdlog::error("Failed to read contract state: {}",
                  contract_status.ToString());
    tokenlock::common::critical("failed to load contract state");
  }

  auto encoder = detail::encoder_t{};
  auto contract = encoder.try_decode<
      tokenlock::schema::encoding::scale::contract_state_tuple_t>(
      tokenlock::schema::make_bytes_view(contract_raw));
  if (!contract.has_value()) {
    tokenlock::common::critical("failed to decode contract state");
  }

  auto state = tokenlock::schema::instance_state_t{};
  tokenlock::schema::encoding::scale::from_contract_tuple(contract.value(),
                                                          state);

  auto record_raw = std::string{};
  auto record_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kLockupRecordKey}, &record_raw);
  if (record_status.IsNotFound()) {
    return state;
  }
  if (!record_status.ok()) {
    spdlog::error("Failed to read lockup record: {}",
                  record_status.ToString());
    tokenlock::common::critical("failed to load lockup record");
  }

  auto record = encoder.try_decode<
      tokenlock::schema::encoding::scale::lockup_record_tuple_t>(
      tokenlock::schema::make_bytes_view(record_raw));
  if (!record.has_value()) {
    tokenlock::common::critical("failed to decode lockup record");
  }
  state.record = tokenlock::schema::encoding::scale::from_tuple(record.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_instance_state(
    const tokenlock::schema::instance_state_t& state) const {
  if (!database) {
    tokenlock::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  auto contract = encoder.encode(
      tokenlock::schema::encoding::scale::to_contract_tuple(state));
  auto contract_status = batch.Put(std::string{detail::kContractStateKey},
                                   detail::to_string(contract));
  if (!contract_status.ok()) {
    tokenlock::common::critical("failed staging contract state");
  }

  if (state.record.has_value()) {
    auto record = encoder.encode(
        tokenlock::schema::encoding::scale::to_tuple(state.record.value()));
    auto record_status = batch.Put(std::string{detail::kLockupRecordKey},
                                   detail::to_string(record));
    if (!record_status.ok()) {
      tokenlock::common::critical("failed staging lockup record");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to persist instance state: {}",
                  write_status.ToString());
    tokenlock::common::critical("failed to persist instance state");
  }
}

}  // namespace tokenlock::storage
