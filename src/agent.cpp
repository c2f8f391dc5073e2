#include "agora/agent.hpp"

#include <stdexcept>
#include <string>

namespace agora {

namespace {
std::string who(AgentId id) { return "agent " + std::to_string(id); }
} // namespace

std::string_view to_string(AgentMode m) noexcept {
  switch (m) {
    case AgentMode::Idle:           return "idle";
    case AgentMode::Foraging:       return "foraging";
    case AgentMode::SeekingPartner: return "seeking_partner";
    case AgentMode::Paired:         return "paired";
    case AgentMode::Trading:        return "trading";
  }
  return "unknown";
}

Agent::Agent(AgentId id, Position pos, UtilityFunction utility, Qty capacity,
             Bundle carrying, Bundle home)
  : id_(id), pos_(pos), home_pos_(pos), carrying_(carrying), home_(home),
    utility_(utility), capacity_(capacity) {
  if (capacity_ <= 0) {
    throw std::invalid_argument(who(id_) + ": carrying capacity must be > 0");
  }
  if (!is_valid_bundle(carrying_) || !is_valid_bundle(home_)) {
    throw std::invalid_argument(who(id_) + ": inventory quantities must be non-negative");
  }
  if (carrying_.total() > capacity_) {
    throw std::invalid_argument(who(id_) + ": carrying " + std::to_string(carrying_.total()) +
                                " exceeds capacity " + std::to_string(capacity_));
  }
}

void Agent::collect(Good g) {
  if (carrying_full()) {
    throw std::logic_error(who(id_) + " cannot collect: carrying at capacity");
  }
  carrying_.at(g) += 1;
}

void Agent::deposit_to_home(Good g, Qty amount) {
  if (amount < 0) {
    throw std::logic_error(who(id_) + " cannot deposit a negative amount");
  }
  if (!at_home()) {
    throw std::logic_error(who(id_) + " cannot deposit away from home");
  }
  if (carrying_.get(g) < amount) {
    throw std::logic_error(who(id_) + " cannot deposit " + std::to_string(amount) + " " +
                           std::string(to_string(g)) + ", only carrying " +
                           std::to_string(carrying_.get(g)));
  }
  carrying_.at(g) -= amount;
  home_.at(g) += amount;
}

void Agent::withdraw_from_home(Good g, Qty amount) {
  if (amount < 0) {
    throw std::logic_error(who(id_) + " cannot withdraw a negative amount");
  }
  if (!at_home()) {
    throw std::logic_error(who(id_) + " cannot withdraw away from home");
  }
  if (home_.get(g) < amount) {
    throw std::logic_error(who(id_) + " cannot withdraw " + std::to_string(amount) + " " +
                           std::string(to_string(g)) + ", only " +
                           std::to_string(home_.get(g)) + " at home");
  }
  if (amount > free_capacity()) {
    throw std::logic_error(who(id_) + " cannot withdraw " + std::to_string(amount) +
                           ": only " + std::to_string(free_capacity()) + " free capacity");
  }
  home_.at(g) -= amount;
  carrying_.at(g) += amount;
}

void Agent::deposit_all() {
  deposit_to_home(Good::Good1, carrying_.q1);
  deposit_to_home(Good::Good2, carrying_.q2);
}

void Agent::exchange(Good give, Good receive) {
  if (give == receive) {
    throw std::logic_error(who(id_) + " cannot exchange a good for itself");
  }
  if (carrying_.get(give) < 1) {
    throw std::logic_error(who(id_) + " cannot give " + std::string(to_string(give)) +
                           ": none carried");
  }
  carrying_.at(give) -= 1;
  carrying_.at(receive) += 1;
}

void Agent::check_invariants() const {
  if (!is_valid_bundle(carrying_) || !is_valid_bundle(home_)) {
    throw std::logic_error(who(id_) + " has negative inventory");
  }
  if (carrying_.total() > capacity_) {
    throw std::logic_error(who(id_) + " carries more than its capacity");
  }
}

} // namespace agora
