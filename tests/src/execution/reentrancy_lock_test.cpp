#include <gtest/gtest.h>
#include <tokenlock/execution/reentrancy_lock.hpp>

#include <stdexcept>

TEST(reentrancy_lock, nested_scope_does_not_acquire) {
  auto lock = tokenlock::execution::reentrancy_lock{};
  EXPECT_FALSE(lock.entered());
  {
    auto outer = tokenlock::execution::reentrancy_lock::scope{lock};
    EXPECT_TRUE(outer.acquired());
    EXPECT_TRUE(lock.entered());
    {
      auto inner = tokenlock::execution::reentrancy_lock::scope{lock};
      EXPECT_FALSE(inner.acquired());
    }
    // Inner scope leaves the flag alone.
    EXPECT_TRUE(lock.entered());
  }
  EXPECT_FALSE(lock.entered());
}

TEST(reentrancy_lock, released_on_exception) {
  auto lock = tokenlock::execution::reentrancy_lock{};
  try {
    auto scope = tokenlock::execution::reentrancy_lock::scope{lock};
    throw std::runtime_error{"boom"};
  } catch (const std::runtime_error&) {
  }
  EXPECT_FALSE(lock.entered());
  auto again = tokenlock::execution::reentrancy_lock::scope{lock};
  EXPECT_TRUE(again.acquired());
}
