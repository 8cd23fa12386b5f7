#pragma once

#include <tokenlock/schema/primitives.hpp>

namespace tokenlock::execution {

/// External fungible-token ledger the lockup moves funds on.
///
/// Calls are synchronous and their effects are observable as soon as they
/// return. Implementations may call back into the engine from inside
/// `transfer` or `transfer_from`.
class token_ledger {
 public:
  virtual ~token_ledger() = default;

  virtual tokenlock::schema::amount_t balance_of(
      const tokenlock::schema::address_t& account) const = 0;

  virtual tokenlock::schema::amount_t allowance(
      const tokenlock::schema::address_t& holder,
      const tokenlock::schema::address_t& spender) const = 0;

  /// Move `amount` out of `sender`'s own balance. False when refused.
  virtual bool transfer(const tokenlock::schema::address_t& sender,
                        const tokenlock::schema::address_t& recipient,
                        const tokenlock::schema::amount_t& amount) = 0;

  /// Move `amount` out of `holder`'s balance on the strength of the
  /// allowance `holder` granted `spender`. False when refused.
  virtual bool transfer_from(const tokenlock::schema::address_t& spender,
                             const tokenlock::schema::address_t& holder,
                             const tokenlock::schema::address_t& recipient,
                             const tokenlock::schema::amount_t& amount) = 0;
};

}  // namespace tokenlock::execution
