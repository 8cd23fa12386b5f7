#pragma once
#include <tokenlock/schema/primitives.hpp>

// Schema type: deployment.
// Lockup workflow: Addresses fixed when an instance is brought up: its own
// ledger account, the token it locks and the account that deployed it.
namespace tokenlock::schema {

struct deployment_t final {
  address_t instance{};
  address_t token{};
  address_t deployer{};
};

}  // namespace tokenlock::schema
