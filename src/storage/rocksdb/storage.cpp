#include <tokenlock/common/critical.hpp>
#include <tokenlock/storage/rocksdb/storage.hpp>

namespace tokenlock::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    tokenlock::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> open_storage_read_only<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = false;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
      options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB read-only at {}: {}", path,
                  status.ToString());
    tokenlock::common::critical("Failed to open RocksDB read-only");
  }
  spdlog::debug("Opened RocksDB read-only at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace tokenlock::storage
