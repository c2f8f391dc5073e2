#include "agora/decision_engine.hpp"

#include <cmath>

namespace agora {

std::optional<SwapQuote> quote_swap(const Agent& self, const Agent& partner, Good give,
                                    SwapSource source) noexcept {
  const Good receive = other(give);
  const Bundle self_total = self.total_bundle();
  const Bundle partner_total = partner.total_bundle();

  if (source == SwapSource::Carrying) {
    if (self.carrying().get(give) < 1 || partner.carrying().get(receive) < 1) return std::nullopt;
  } else {
    if (self_total.get(give) < 1 || partner_total.get(receive) < 1) return std::nullopt;
  }

  SwapQuote q{};
  q.give = give;
  q.own_gain = swap_gain(self.utility_function(), self_total, give);
  q.partner_gain = swap_gain(partner.utility_function(), partner_total, receive);
  return q;
}

bool is_pareto(const SwapQuote& q, double min_gain) noexcept {
  return q.own_gain > min_gain && q.partner_gain > min_gain;
}

std::optional<SwapQuote> best_swap(const Agent& self, const Agent& partner, double min_gain,
                                   SwapSource source) noexcept {
  std::optional<SwapQuote> best;
  for (Good give : {Good::Good1, Good::Good2}) {
    auto q = quote_swap(self, partner, give, source);
    if (!q || !is_pareto(*q, min_gain)) continue;
    if (!best || q->joint_gain() > best->joint_gain()) best = q;
  }
  return best;
}

double forage_score(const Agent& agent, const ResourceCell& cell, double distance_discount) noexcept {
  const double mu = marginal_utility(agent.utility_function(), agent.total_bundle(), cell.good);
  const double d = static_cast<double>(manhattan_distance(agent.position(), cell.position));
  return mu * std::exp(-distance_discount * d);
}

AgentAction DecisionEngine::decide(const Agent& agent, const WorldView& view) const {
  const auto& f = cfg_->features;
  if (!f.forage_enabled && !f.trade_enabled) return idle(agent);

  if (auto a = decide_inventory(agent)) return *a;
  if (auto a = decide_partnership(agent, view)) return *a;
  if (f.forage_enabled) {
    if (auto a = decide_forage(agent, view)) return *a;
  }
  if (f.trade_enabled) {
    if (auto a = decide_partner_search(agent, view)) return *a;
  }
  return idle(agent);
}

// Full carrying: deposit at home, otherwise walk home.
std::optional<AgentAction> DecisionEngine::decide_inventory(const Agent& agent) const {
  if (!agent.carrying_full()) return std::nullopt;

  if (agent.at_home()) {
    AgentAction a{};
    a.agent = agent.id();
    a.mode = AgentMode::Foraging;
    a.target = agent.home_position();
    a.command = Deposit{};
    return a;
  }
  return move_toward(agent, agent.home_position(), AgentMode::Foraging, agent.home_position());
}

std::optional<AgentAction> DecisionEngine::decide_partnership(const Agent& agent,
                                                              const WorldView& view) const {
  const auto pid = agent.partner();
  if (!pid) return std::nullopt;

  AgentAction a{};
  a.agent = agent.id();

  const Agent* partner = view.find_agent(*pid);
  if (partner == nullptr ||
      manhattan_distance(agent.position(), partner->position()) > cfg_->perception_radius) {
    a.mode = AgentMode::Idle;
    a.command = Unpair{};
    return a;
  }

  if (agent.position() != partner->position()) {
    a.mode = AgentMode::Paired;
    a.target = *pid;
    if (auto d = meeting_step(agent, *partner)) {
      a.command = Move{*d};
    } else {
      a.command = Idle{};
    }
    return a;
  }

  if (auto q = best_swap(agent, *partner, cfg_->min_trade_gain, SwapSource::Carrying)) {
    a.mode = AgentMode::Trading;
    a.target = *pid;
    a.command = Trade{*pid, q->give, other(q->give), q->own_gain, q->partner_gain};
    return a;
  }

  // A swap that works on paper but needs a unit this agent keeps at home.
  if (auto q = pending_withdraw(agent, *partner)) {
    a.mode = AgentMode::Paired;
    a.target = *pid;
    a.command = Withdraw{q->give, 1};
    return a;
  }

  // The partner is fetching that unit this step; stay paired for the swap.
  if (pending_withdraw(*partner, agent)) {
    a.mode = AgentMode::Paired;
    a.target = *pid;
    a.command = Idle{};
    return a;
  }

  a.mode = AgentMode::Idle;
  a.command = Unpair{};
  return a;
}

std::optional<SwapQuote> DecisionEngine::pending_withdraw(const Agent& self,
                                                         const Agent& partner) const {
  if (!self.at_home() || self.free_capacity() <= 0) return std::nullopt;

  auto q = best_swap(self, partner, cfg_->min_trade_gain, SwapSource::Total);
  if (!q) return std::nullopt;
  if (partner.carrying().get(other(q->give)) < 1) return std::nullopt;
  if (self.carrying().get(q->give) >= 1 || self.home().get(q->give) < 1) return std::nullopt;
  return q;
}

std::optional<ResourceCell> DecisionEngine::select_resource(const Agent& agent,
                                                            const WorldView& view) const {
  std::optional<ResourceCell> best;
  double best_score = 0.0;

  // Candidates arrive in row-major order, so keeping the first maximum
  // resolves score ties toward the lower position.
  for (const auto& cell : view.grid->resources_within(agent.position(), cfg_->perception_radius)) {
    const double s = forage_score(agent, cell, cfg_->distance_discount);
    if (s > best_score) {
      best_score = s;
      best = cell;
    }
  }
  return best;
}

std::optional<AgentAction> DecisionEngine::decide_forage(const Agent& agent,
                                                         const WorldView& view) const {
  const auto cell = select_resource(agent, view);
  if (!cell) return std::nullopt;

  if (cell->position == agent.position()) {
    AgentAction a{};
    a.agent = agent.id();
    a.mode = AgentMode::Foraging;
    a.target = cell->position;
    a.command = Collect{cell->position, cell->good};
    return a;
  }
  return move_toward(agent, cell->position, AgentMode::Foraging, cell->position);
}

std::optional<AgentAction> DecisionEngine::decide_partner_search(const Agent& agent,
                                                                 const WorldView& view) const {
  struct Pick {
    AgentId partner{};
    SwapQuote quote{};
  };
  std::optional<Pick> best;

  const bool can_withdraw = agent.at_home() && agent.free_capacity() > 0;

  // Ascending id + strict comparison => lowest id wins equal gains.
  for (AgentId id : view.agent_index->query_radius(agent.position(), cfg_->perception_radius)) {
    if (id == agent.id()) continue;
    const Agent* cand = view.find_agent(id);
    if (cand == nullptr || cand->partner()) continue;

    for (Good give : {Good::Good1, Good::Good2}) {
      auto q = quote_swap(agent, *cand, give, SwapSource::Total);
      if (!q || !is_pareto(*q, cfg_->min_trade_gain)) continue;
      if (cand->carrying().get(other(give)) < 1) continue;

      const bool carried = agent.carrying().get(give) >= 1;
      if (!carried && !can_withdraw) continue;

      if (!best || q->own_gain > best->quote.own_gain) best = Pick{id, *q};
    }
  }
  if (!best) return std::nullopt;

  AgentAction a{};
  a.agent = agent.id();
  a.mode = AgentMode::SeekingPartner;
  a.target = best->partner;
  if (agent.carrying().get(best->quote.give) >= 1) {
    a.command = ProposePair{best->partner};
  } else {
    a.command = Withdraw{best->quote.give, 1};
  }
  return a;
}

AgentAction DecisionEngine::move_toward(const Agent& agent, Position to, AgentMode mode,
                                        Target target) {
  AgentAction a{};
  a.agent = agent.id();
  a.mode = mode;
  a.target = target;

  Direction d{};
  if (direction_toward(agent.position(), to, d)) {
    a.command = Move{d};
  } else {
    a.command = Idle{};
  }
  return a;
}

std::optional<Direction> meeting_step(const Agent& agent, const Agent& partner) noexcept {
  const Position from = agent.position();
  const Position to = partner.position();
  const int32_t dx = to.x - from.x;
  const int32_t dy = to.y - from.y;
  const int32_t adx = dx < 0 ? -dx : dx;
  const int32_t ady = dy < 0 ? -dy : dy;
  const bool lower = agent.id() < partner.id();

  auto along_x = [&]() { return dx > 0 ? Direction::East : Direction::West; };
  auto along_y = [&]() { return dy > 0 ? Direction::South : Direction::North; };

  if (adx + ady == 0) return std::nullopt;

  // Adjacent: stepping together would swap cells, so the lower id waits.
  if (adx + ady == 1) {
    if (lower) return std::nullopt;
    return adx == 1 ? along_x() : along_y();
  }

  // Diagonal neighbours meet on the lower id's x step.
  if (adx == 1 && ady == 1) return lower ? along_x() : along_y();

  // Larger gap first; equal gaps take x.
  return adx >= ady ? along_x() : along_y();
}

AgentAction DecisionEngine::idle(const Agent& agent) {
  AgentAction a{};
  a.agent = agent.id();
  a.mode = AgentMode::Idle;
  a.command = Idle{};
  return a;
}

} // namespace agora
