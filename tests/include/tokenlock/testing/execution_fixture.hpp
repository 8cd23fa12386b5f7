#pragma once

#include <tokenlock/execution/engine.hpp>
#include <tokenlock/schema/deployment.hpp>
#include <tokenlock/schema/encoding/scale/encoder.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <tokenlock/storage/rocksdb/storage.hpp>
#include <tokenlock/testing/common.hpp>
#include <tokenlock/testing/mock_token_ledger.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tokenlock::testing {

using scale_encoder_t = tokenlock::schema::encoding::encoder<
    tokenlock::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    tokenlock::storage::storage<tokenlock::storage::rocksdb_storage_tag>;

inline constexpr auto kGenesisTime =
    tokenlock::schema::timestamp_seconds_t{1'700'000'000};

/// Temporary RocksDB directory, mock ledger, manual clock and one engine
/// deployed by `owner()` over `token()`.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{tokenlock::storage::make_storage<
            tokenlock::storage::rocksdb_storage_tag>(db_path_)},
        deployment_{.instance = make_address(0xB0),
                    .token = make_address(0xA0),
                    .deployer = make_address(0x10)} {
    ledger_.deploy_code(deployment_.token);
    open_engine();
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return storage_; }
  mock_token_ledger& ledger() { return ledger_; }
  const tokenlock::schema::deployment_t& deployment() const {
    return deployment_;
  }
  tokenlock::execution::engine& engine() { return *engine_; }

  tokenlock::schema::address_t owner() const { return deployment_.deployer; }
  tokenlock::schema::address_t instance() const {
    return deployment_.instance;
  }
  tokenlock::schema::address_t token() const { return deployment_.token; }
  static tokenlock::schema::address_t beneficiary() {
    return make_address(0x20);
  }
  static tokenlock::schema::address_t stranger() { return make_address(0x30); }

  tokenlock::schema::timestamp_seconds_t now() const { return now_; }
  void advance(const tokenlock::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }

  /// Mint `amount` to the owner and approve the instance for it.
  void fund_owner(const tokenlock::schema::amount_t& amount) {
    ledger_.mint(owner(), amount);
    ledger_.approve(owner(), instance(), amount);
  }

  tokenlock::schema::create_lockup_t make_request(
      const tokenlock::schema::amount_t& amount,
      const tokenlock::schema::duration_seconds_t cliff,
      const tokenlock::schema::duration_seconds_t vesting,
      const bool revocable) const {
    return tokenlock::schema::create_lockup_t{.beneficiary = beneficiary(),
                                              .total_amount = amount,
                                              .cliff_duration = cliff,
                                              .vesting_duration = vesting,
                                              .revocable = revocable};
  }

  /// Fund, then create a lockup for `beneficiary()` as the owner.
  tokenlock::schema::operation_result_t create_funded(
      const tokenlock::schema::amount_t& amount,
      const tokenlock::schema::duration_seconds_t cliff,
      const tokenlock::schema::duration_seconds_t vesting,
      const bool revocable) {
    fund_owner(amount);
    return engine_->create_lockup(owner(),
                                  make_request(amount, cliff, vesting, revocable));
  }

  /// Drop the engine and the database handle, then bring both back from
  /// disk.
  void reopen() {
    engine_.reset();
    storage_.database.reset();
    storage_ = tokenlock::storage::make_storage<
        tokenlock::storage::rocksdb_storage_tag>(db_path_);
    open_engine();
  }

 private:
  void open_engine() {
    engine_.emplace(encoder_, storage_, deployment_, ledger_,
                    ledger_.code_inspector(), [this] { return now_; });
  }

  std::string db_path_;
  scale_encoder_t encoder_;
  rocksdb_storage_t storage_;
  tokenlock::schema::deployment_t deployment_;
  mock_token_ledger ledger_;
  tokenlock::schema::timestamp_seconds_t now_{kGenesisTime};
  std::optional<tokenlock::execution::engine> engine_;
};

}  // namespace tokenlock::testing
