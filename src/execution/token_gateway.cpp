#include <spdlog/spdlog.h>
#include <tokenlock/execution/token_gateway.hpp>

using namespace tokenlock::schema;

namespace tokenlock::execution {

token_gateway::token_gateway(token_ledger& ledger,
                             address_t token,
                             address_t instance)
    : ledger_{ledger}, token_{token}, instance_{instance} {}

amount_t token_gateway::balance_of(const address_t& account) const {
  return ledger_.balance_of(account);
}

amount_t token_gateway::allowance_of(const address_t& holder) const {
  return ledger_.allowance(holder, instance_);
}

pull_outcome token_gateway::pull_from(const address_t& holder,
                                      const amount_t& amount) {
  auto before = ledger_.balance_of(instance_);
  auto outcome = pull_outcome{};
  outcome.accepted = ledger_.transfer_from(instance_, holder, instance_, amount);
  if (!outcome.accepted) {
    spdlog::warn("Token {} refused pull of {} from {}", to_string(token_),
                 to_string(amount), to_string(holder));
    return outcome;
  }
  auto after = ledger_.balance_of(instance_);
  outcome.received = after > before ? amount_t{after - before} : amount_t{0};
  spdlog::debug("Pulled {} from {} (requested {})", to_string(outcome.received),
                to_string(holder), to_string(amount));
  return outcome;
}

bool token_gateway::push_to(const address_t& recipient,
                            const amount_t& amount) {
  auto accepted = ledger_.transfer(instance_, recipient, amount);
  if (!accepted) {
    spdlog::warn("Token {} refused push of {} to {}", to_string(token_),
                 to_string(amount), to_string(recipient));
    return false;
  }
  spdlog::debug("Pushed {} to {}", to_string(amount), to_string(recipient));
  return true;
}

}  // namespace tokenlock::execution
