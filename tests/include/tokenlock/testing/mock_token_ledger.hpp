#pragma once

#include <tokenlock/execution/collaborators.hpp>
#include <tokenlock/execution/token_ledger.hpp>
#include <tokenlock/schema/primitives.hpp>

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace tokenlock::testing {

struct ledger_fault {};

/// In-memory fungible-token ledger with hooks for misbehaving tokens.
class mock_token_ledger final : public tokenlock::execution::token_ledger {
 public:
  using address_t = tokenlock::schema::address_t;
  using amount_t = tokenlock::schema::amount_t;

  void mint(const address_t& account, const amount_t& amount) {
    balances_[account] += amount;
  }

  void approve(const address_t& holder,
               const address_t& spender,
               const amount_t& amount) {
    allowances_[{holder, spender}] = amount;
  }

  void deploy_code(const address_t& address) { code_.insert(address); }

  tokenlock::execution::code_inspector_t code_inspector() const {
    return [this](const address_t& address) {
      return code_.contains(address);
    };
  }

  /// Burn this share of every transfer_from, in basis points.
  void set_fee_basis_points(const uint32_t fee) { fee_basis_points_ = fee; }
  void refuse_transfers(const bool refuse) { refuse_transfer_ = refuse; }
  void refuse_pulls(const bool refuse) { refuse_transfer_from_ = refuse; }
  void throw_on_transfer(const bool value) { throw_on_transfer_ = value; }
  /// Throw a type outside the std::exception hierarchy.
  void fault_on_transfer(const bool value) { fault_on_transfer_ = value; }

  /// Invoked after balances move, before the call returns.
  void on_transfer(std::function<void()> callback) {
    on_transfer_ = std::move(callback);
  }

  uint32_t transfer_calls() const { return transfer_calls_; }
  uint32_t transfer_from_calls() const { return transfer_from_calls_; }

  amount_t balance_of(const address_t& account) const override {
    auto it = balances_.find(account);
    return it == balances_.end() ? amount_t{0} : it->second;
  }

  amount_t allowance(const address_t& holder,
                     const address_t& spender) const override {
    auto it = allowances_.find({holder, spender});
    return it == allowances_.end() ? amount_t{0} : it->second;
  }

  bool transfer(const address_t& sender,
                const address_t& recipient,
                const amount_t& amount) override {
    ++transfer_calls_;
    if (throw_on_transfer_) {
      throw std::runtime_error{"token reverted"};
    }
    if (fault_on_transfer_) {
      throw ledger_fault{};
    }
    if (refuse_transfer_ || balance_of(sender) < amount) {
      return false;
    }
    balances_[sender] -= amount;
    balances_[recipient] += amount;
    notify();
    return true;
  }

  bool transfer_from(const address_t& spender,
                     const address_t& holder,
                     const address_t& recipient,
                     const amount_t& amount) override {
    ++transfer_from_calls_;
    if (refuse_transfer_from_ || balance_of(holder) < amount ||
        allowance(holder, spender) < amount) {
      return false;
    }
    const amount_t fee = amount * fee_basis_points_ / 10'000u;
    allowances_[{holder, spender}] -= amount;
    balances_[holder] -= amount;
    balances_[recipient] += amount - fee;
    notify();
    return true;
  }

 private:
  void notify() {
    if (on_transfer_) {
      on_transfer_();
    }
  }

  std::map<address_t, amount_t> balances_;
  std::map<std::pair<address_t, address_t>, amount_t> allowances_;
  std::set<address_t> code_;
  uint32_t fee_basis_points_{0};
  bool refuse_transfer_{false};
  bool refuse_transfer_from_{false};
  bool throw_on_transfer_{false};
  bool fault_on_transfer_{false};
  std::function<void()> on_transfer_;
  uint32_t transfer_calls_{0};
  uint32_t transfer_from_calls_{0};
};

}  // namespace tokenlock::testing
