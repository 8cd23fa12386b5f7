#pragma once

#include <tokenlock/execution/token_ledger.hpp>
#include <tokenlock/schema/primitives.hpp>

namespace tokenlock::execution {

/// What a pull actually did to the instance's balance.
struct pull_outcome final {
  bool accepted{};
  tokenlock::schema::amount_t received{};
};

/// The only code that moves tokens. Every transfer is made on behalf of the
/// lockup instance: pulls draw on the holder's allowance to the instance,
/// pushes spend the instance's own balance.
class token_gateway final {
 public:
  token_gateway(token_ledger& ledger,
                tokenlock::schema::address_t token,
                tokenlock::schema::address_t instance);

  tokenlock::schema::amount_t balance_of(
      const tokenlock::schema::address_t& account) const;

  /// Allowance `holder` has granted the instance.
  tokenlock::schema::amount_t allowance_of(
      const tokenlock::schema::address_t& holder) const;

  /// Pull `amount` from `holder` into the instance and report the balance
  /// delta the instance observed, which may differ from `amount` for
  /// fee-bearing tokens.
  pull_outcome pull_from(const tokenlock::schema::address_t& holder,
                         const tokenlock::schema::amount_t& amount);

  /// Push `amount` from the instance to `recipient`.
  bool push_to(const tokenlock::schema::address_t& recipient,
               const tokenlock::schema::amount_t& amount);

  const tokenlock::schema::address_t& token() const { return token_; }
  const tokenlock::schema::address_t& instance() const { return instance_; }

 private:
  token_ledger& ledger_;
  tokenlock::schema::address_t token_;
  tokenlock::schema::address_t instance_;
};

}  // namespace tokenlock::execution
