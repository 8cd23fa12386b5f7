#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <string>
#include <tokenlock/execution/engine.hpp>
#include <tokenlock/execution/engine_error.hpp>
#include <tokenlock/execution/validation_guard.hpp>
#include <tokenlock/schema/encoding/scale/encoder.hpp>
#include <tokenlock/schema/query_error_code.hpp>
#include <tokenlock/vesting/calculator.hpp>
#include <utility>

using namespace tokenlock::schema;

namespace {

constexpr auto kCreateLockupCodespace =
    std::string_view{"tokenlock.create_lockup"};
constexpr auto kReleaseCodespace = std::string_view{"tokenlock.release"};
constexpr auto kRevokeCodespace = std::string_view{"tokenlock.revoke"};
constexpr auto kOwnershipCodespace = std::string_view{"tokenlock.ownership"};
constexpr auto kQueryCodespace = std::string_view{"tokenlock.query"};

operation_result_t make_error(const std::string_view codespace,
                              const lockup_error_code code,
                              std::string info = {}) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  spdlog::warn("{} rejected: {}{}{}", codespace, result.log,
               result.info.empty() ? "" : " - ", result.info);
  return result;
}

operation_result_t make_success(const std::string_view codespace) {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

operation_event_attribute_t make_attribute(std::string key,
                                           std::string value,
                                           const bool index = false) {
  return operation_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

void set_query_error(query_result_t& result,
                     const query_error_code code,
                     std::string info = {}) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  spdlog::debug("Query rejected: {} {}", result.log, result.info);
}

timestamp_seconds_t system_clock_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

namespace tokenlock::execution {

engine::engine(
    tokenlock::schema::encoding::encoder<
        tokenlock::schema::encoding::scale_encoder_tag>& encoder,
    tokenlock::storage::storage<tokenlock::storage::rocksdb_storage_tag>&
        storage,
    const deployment_t& deployment,
    token_ledger& ledger,
    const code_inspector_t& has_code,
    clock_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      instance_{deployment.instance},
      token_{deployment.token},
      access_{deployment.deployer},
      gateway_{ledger, deployment.token, deployment.instance},
      clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  if (!clock_) {
    spdlog::debug("No clock source supplied; using system clock");
    clock_ = system_clock_seconds;
  }

  if (auto persisted = storage_.load_instance_state()) {
    if (persisted->token != token_ || persisted->instance != instance_) {
      spdlog::error("Persisted instance {} locks token {}, not {}",
                    to_string(persisted->instance),
                    to_string(persisted->token), to_string(token_));
      throw engine_error{lockup_error_code::invalid_token_address,
                         fmt::format("persisted instance targets token {}",
                                     to_string(persisted->token))};
    }
    access_ = access_control{persisted->owner};
    record_ = persisted->record.value_or(lockup_record_t{});
    spdlog::info("Restored lockup instance {} (owner {}, lockup {})",
                 to_string(instance_), to_string(access_.owner()),
                 record_.present ? "present" : "absent");
    return;
  }

  if (auto error = validation::check_token_address(token_, has_code)) {
    spdlog::error("Rejecting token address {}", to_string(token_));
    throw engine_error{
        *error, fmt::format("token address is zero or hosts no code: {}",
                            to_string(token_))};
  }
  persist();
  spdlog::info("Lockup instance {} ready for token {} owned by {}",
               to_string(instance_), to_string(token_),
               to_string(access_.owner()));
}

operation_result_t engine::execute(const address_t& caller,
                                   const operation_t& operation) {
  return std::visit(
      overloaded{[&](const create_lockup_t& value) {
                   return create_lockup(caller, value);
                 },
                 [&](const release_t&) { return release(caller); },
                 [&](const revoke_t&) { return revoke(caller); },
                 [&](const transfer_ownership_t& value) {
                   return transfer_ownership(caller, value.new_owner);
                 },
                 [&](const renounce_ownership_t&) {
                   return renounce_ownership(caller);
                 }},
      operation);
}

operation_result_t engine::create_lockup(const address_t& caller,
                                         const create_lockup_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_lock::scope{reentrancy_};
  if (!entry.acquired()) {
    return make_error(kCreateLockupCodespace,
                      lockup_error_code::reentrant_call);
  }
  if (!access_.is_owner(caller)) {
    return make_error(kCreateLockupCodespace, lockup_error_code::unauthorized);
  }
  if (auto error =
          validation::check_create_request(record_, request, instance_)) {
    return make_error(kCreateLockupCodespace, *error);
  }
  if (auto error =
          validation::check_funding(gateway_, caller, request.total_amount)) {
    return make_error(kCreateLockupCodespace, *error);
  }

  auto outcome = pull_outcome{};
  try {
    outcome = gateway_.pull_from(caller, request.total_amount);
  } catch (const std::exception& ex) {
    return make_error(kCreateLockupCodespace,
                      lockup_error_code::transfer_failed, ex.what());
  }
  if (auto error = validation::check_received(outcome, request.total_amount)) {
    if (outcome.received > 0) {
      // Hand back whatever arrived; fees already taken are not recoverable.
      try {
        if (!gateway_.push_to(caller, outcome.received)) {
          spdlog::error("Could not return {} to {} after short pull",
                        to_string(outcome.received), to_string(caller));
        }
      } catch (const std::exception& ex) {
        spdlog::error("Returning {} to {} failed: {}",
                      to_string(outcome.received), to_string(caller),
                      ex.what());
      }
    }
    return make_error(kCreateLockupCodespace, *error,
                      fmt::format("requested {}, received {}",
                                  to_string(request.total_amount),
                                  to_string(outcome.received)));
  }

  const auto start = now();
  record_ = lockup_record_t{.present = true,
                            .beneficiary = request.beneficiary,
                            .total_amount = request.total_amount,
                            .released_amount = 0,
                            .start_time = start,
                            .cliff_duration = request.cliff_duration,
                            .vesting_duration = request.vesting_duration,
                            .revocable = request.revocable,
                            .revoked = false,
                            .vested_at_revoke = 0};
  persist();

  spdlog::info("Lockup created: {} for {} starting {} (cliff {}s, vesting {}s)",
               to_string(request.total_amount),
               to_string(request.beneficiary), start, request.cliff_duration,
               request.vesting_duration);

  auto result = make_success(kCreateLockupCodespace);
  result.events.push_back(operation_event_t{
      .type = "lockup_created",
      .attributes = {
          make_attribute("beneficiary", to_string(request.beneficiary), true),
          make_attribute("total_amount", to_string(request.total_amount)),
          make_attribute("start_time", std::to_string(start)),
          make_attribute("cliff_duration",
                         std::to_string(request.cliff_duration)),
          make_attribute("vesting_duration",
                         std::to_string(request.vesting_duration)),
          make_attribute("revocable", request.revocable ? "true" : "false")}});
  return result;
}

operation_result_t engine::release(const address_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_lock::scope{reentrancy_};
  if (!entry.acquired()) {
    return make_error(kReleaseCodespace, lockup_error_code::reentrant_call);
  }
  if (!record_.present || caller != record_.beneficiary) {
    return make_error(kReleaseCodespace, lockup_error_code::unauthorized);
  }

  const auto releasable = vesting::releasable_amount(record_, now());
  if (releasable == 0) {
    return make_error(kReleaseCodespace,
                      lockup_error_code::no_tokens_available);
  }

  const auto previous = record_;
  record_.released_amount += releasable;
  auto pushed = false;
  try {
    pushed = gateway_.push_to(record_.beneficiary, releasable);
  } catch (const std::exception& ex) {
    record_ = previous;
    return make_error(kReleaseCodespace, lockup_error_code::transfer_failed,
                      ex.what());
  } catch (...) {
    record_ = previous;
    throw;
  }
  if (!pushed) {
    record_ = previous;
    return make_error(kReleaseCodespace, lockup_error_code::transfer_failed);
  }
  persist();

  spdlog::info("Released {} to {} ({} of {} released)", to_string(releasable),
               to_string(record_.beneficiary),
               to_string(record_.released_amount),
               to_string(record_.total_amount));

  auto result = make_success(kReleaseCodespace);
  result.data = encoder_.encode(to_amount_bytes(releasable));
  result.events.push_back(operation_event_t{
      .type = "tokens_released",
      .attributes = {
          make_attribute("beneficiary", to_string(record_.beneficiary), true),
          make_attribute("amount", to_string(releasable))}});
  return result;
}

operation_result_t engine::revoke(const address_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_lock::scope{reentrancy_};
  if (!entry.acquired()) {
    return make_error(kRevokeCodespace, lockup_error_code::reentrant_call);
  }
  if (!access_.is_owner(caller)) {
    return make_error(kRevokeCodespace, lockup_error_code::unauthorized);
  }
  if (auto error = validation::check_revocable(record_)) {
    return make_error(kRevokeCodespace, *error);
  }

  const auto vested = vesting::vested_amount(record_, now());
  if (vested >= record_.total_amount) {
    return make_error(kRevokeCodespace, lockup_error_code::nothing_to_revoke);
  }

  const auto previous = record_;
  const auto refund = amount_t{record_.total_amount - vested};
  const auto refund_to = access_.owner();
  record_.revoked = true;
  record_.vested_at_revoke = vested;
  auto pushed = false;
  try {
    pushed = gateway_.push_to(refund_to, refund);
  } catch (const std::exception& ex) {
    record_ = previous;
    return make_error(kRevokeCodespace, lockup_error_code::transfer_failed,
                      ex.what());
  } catch (...) {
    record_ = previous;
    throw;
  }
  if (!pushed) {
    record_ = previous;
    return make_error(kRevokeCodespace, lockup_error_code::transfer_failed);
  }
  persist();

  spdlog::info("Lockup revoked: {} returned to {}, {} stays claimable",
               to_string(refund), to_string(refund_to), to_string(vested));

  auto result = make_success(kRevokeCodespace);
  result.data = encoder_.encode(to_amount_bytes(refund));
  result.events.push_back(operation_event_t{
      .type = "lockup_revoked",
      .attributes = {
          make_attribute("beneficiary", to_string(record_.beneficiary), true),
          make_attribute("refund_amount", to_string(refund)),
          make_attribute("vested_at_revoke", to_string(vested))}});
  return result;
}

operation_result_t engine::transfer_ownership(const address_t& caller,
                                              const address_t& new_owner) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_lock::scope{reentrancy_};
  if (!entry.acquired()) {
    return make_error(kOwnershipCodespace, lockup_error_code::reentrant_call);
  }
  const auto previous_owner = access_.owner();
  if (auto error = access_.transfer_ownership(caller, new_owner)) {
    return make_error(kOwnershipCodespace, *error);
  }
  persist();

  auto result = make_success(kOwnershipCodespace);
  result.events.push_back(operation_event_t{
      .type = "ownership_transferred",
      .attributes = {
          make_attribute("previous_owner", to_string(previous_owner), true),
          make_attribute("new_owner", to_string(new_owner), true)}});
  return result;
}

operation_result_t engine::renounce_ownership(const address_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_lock::scope{reentrancy_};
  if (!entry.acquired()) {
    return make_error(kOwnershipCodespace, lockup_error_code::reentrant_call);
  }
  const auto previous_owner = access_.owner();
  if (auto error = access_.renounce_ownership(caller)) {
    return make_error(kOwnershipCodespace, *error);
  }
  persist();

  auto result = make_success(kOwnershipCodespace);
  result.events.push_back(operation_event_t{
      .type = "ownership_transferred",
      .attributes = {
          make_attribute("previous_owner", to_string(previous_owner), true),
          make_attribute("new_owner", to_string(make_zero_address()), true)}});
  return result;
}

lockup_record_t engine::lockup_info() const {
  auto lock = std::scoped_lock{mutex_};
  return record_;
}

amount_t engine::vested_amount() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::vested_amount(record_, now());
}

amount_t engine::vested_amount_at(const timestamp_seconds_t at) const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::vested_amount(record_, at);
}

amount_t engine::releasable_amount() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::releasable_amount(record_, now());
}

uint8_t engine::vesting_progress() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::vesting_progress(record_, now());
}

duration_seconds_t engine::remaining_vesting_time() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::remaining_vesting_time(record_, now());
}

lockup_status_t engine::status() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::status(record_, now());
}

std::vector<vesting_milestone_t> engine::timeline() const {
  auto lock = std::scoped_lock{mutex_};
  return vesting::timeline(record_);
}

address_t engine::beneficiary() const {
  auto lock = std::scoped_lock{mutex_};
  return record_.beneficiary;
}

address_t engine::token() const {
  return token_;
}

address_t engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return access_.owner();
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  result.key = make_bytes(data);
  spdlog::debug("Query {}", path);

  const auto at = now();
  if (path == "/lockup/info") {
    result.value =
        encoder_.encode(tokenlock::schema::encoding::scale::to_tuple(record_));
  } else if (path == "/lockup/vested") {
    result.value =
        encoder_.encode(to_amount_bytes(vesting::vested_amount(record_, at)));
  } else if (path == "/lockup/vested_at") {
    auto requested = encoder_.try_decode<timestamp_seconds_t>(data);
    if (!requested.has_value()) {
      set_query_error(result, query_error_code::invalid_key,
                      "expected SCALE u64 timestamp");
      return result;
    }
    result.value = encoder_.encode(
        to_amount_bytes(vesting::vested_amount(record_, requested.value())));
  } else if (path == "/lockup/releasable") {
    result.value = encoder_.encode(
        to_amount_bytes(vesting::releasable_amount(record_, at)));
  } else if (path == "/lockup/progress") {
    result.value = encoder_.encode(vesting::vesting_progress(record_, at));
  } else if (path == "/lockup/remaining") {
    result.value =
        encoder_.encode(vesting::remaining_vesting_time(record_, at));
  } else if (path == "/lockup/status") {
    result.value = encoder_.encode(
        std::string{to_string(vesting::status(record_, at))});
  } else if (path == "/lockup/beneficiary") {
    result.value = encoder_.encode(record_.beneficiary);
  } else if (path == "/lockup/token") {
    result.value = encoder_.encode(token_);
  } else if (path == "/lockup/owner") {
    result.value = encoder_.encode(access_.owner());
  } else if (path == "/lockup/timeline") {
    if (!record_.present) {
      set_query_error(result, query_error_code::not_found,
                      "lockup not created");
      return result;
    }
    auto rows = std::vector<
        tokenlock::schema::encoding::scale::vesting_milestone_tuple_t>{};
    for (const auto& milestone : vesting::timeline(record_)) {
      rows.push_back(tokenlock::schema::encoding::scale::to_tuple(milestone));
    }
    result.value = encoder_.encode(rows);
  } else {
    set_query_error(result, query_error_code::unsupported_path,
                    std::string{path});
  }
  return result;
}

timestamp_seconds_t engine::now() const {
  return clock_();
}

void engine::persist() {
  auto state = instance_state_t{};
  state.instance = instance_;
  state.token = token_;
  state.owner = access_.owner();
  if (record_.present) {
    state.record = record_;
  }
  storage_.save_instance_state(state);
}

}  // namespace tokenlock::execution
