#pragma once

namespace tokenlock::execution {

/// Per-instance busy flag. A lifecycle operation holds a `scope` for its
/// whole duration; a second scope opened while the first is alive (a
/// ledger callback re-entering the engine) does not acquire.
class reentrancy_lock final {
 public:
  class scope final {
   public:
    explicit scope(reentrancy_lock& lock)
        : lock_{lock}, acquired_{!lock.entered_} {
      if (acquired_) {
        lock_.entered_ = true;
      }
    }

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) = delete;
    scope& operator=(scope&&) = delete;

    ~scope() {
      if (acquired_) {
        lock_.entered_ = false;
      }
    }

    bool acquired() const { return acquired_; }

   private:
    reentrancy_lock& lock_;
    bool acquired_{};
  };

  bool entered() const { return entered_; }

 private:
  bool entered_{false};
};

}  // namespace tokenlock::execution
