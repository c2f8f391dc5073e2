#include "agora/step_executor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "agora/decision_engine.hpp"
#include "agora/log.hpp"
#include "agora/world_view.hpp"

namespace agora {

std::string_view to_string(SkipReason r) noexcept {
  switch (r) {
    case SkipReason::None:              return "none";
    case SkipReason::ResourceGone:      return "resource_gone";
    case SkipReason::CapacityFull:      return "capacity_full";
    case SkipReason::NotAtHome:         return "not_at_home";
    case SkipReason::InsufficientGoods: return "insufficient_goods";
    case SkipReason::TargetBusy:        return "target_busy";
    case SkipReason::Incompatible:      return "incompatible";
    case SkipReason::NotPaired:         return "not_paired";
    case SkipReason::NotCoLocated:      return "not_co_located";
    case SkipReason::NoLongerPareto:    return "no_longer_pareto";
    case SkipReason::OffGrid:           return "off_grid";
  }
  return "unknown";
}

StepStats& StepStats::operator+=(const StepStats& o) noexcept {
  moves += o.moves;
  collects += o.collects;
  deposits += o.deposits;
  withdrawals += o.withdrawals;
  pairings += o.pairings;
  proposals_dropped += o.proposals_dropped;
  trades += o.trades;
  trades_skipped += o.trades_skipped;
  unpairs += o.unpairs;
  idles += o.idles;
  degraded += o.degraded;
  respawned += o.respawned;
  return *this;
}

namespace {
SimConfig validated(SimConfig cfg) {
  cfg.validate();
  return cfg;
}
} // namespace

// Per-step scratch for Phase 2.
struct StepExecutor::Phase2 {
  std::vector<AgentAction> decided;   // Phase-1 output, same order as agents_
  std::vector<uint8_t> traded;        // 1 once the slot has swapped this step
  StepStats stats{};
};

StepExecutor::StepExecutor(SimConfig cfg, SpatialGrid grid, std::vector<Agent> agents)
  : cfg_(validated(std::move(cfg))),
    grid_(std::move(grid)),
    agents_(std::move(agents)),
    index_(cfg_.grid_width, cfg_.grid_height),
    respawn_(cfg_.respawn) {
  if (grid_.width() != cfg_.grid_width || grid_.height() != cfg_.grid_height) {
    throw std::invalid_argument("StepExecutor: grid is " + std::to_string(grid_.width()) + "x" +
                                std::to_string(grid_.height()) + " but config says " +
                                std::to_string(cfg_.grid_width) + "x" +
                                std::to_string(cfg_.grid_height));
  }

  std::sort(agents_.begin(), agents_.end(),
            [](const Agent& a, const Agent& b) { return a.id() < b.id(); });

  for (std::size_t i = 0; i < agents_.size(); ++i) {
    const Agent& a = agents_[i];
    if (i > 0 && agents_[i - 1].id() == a.id()) {
      throw std::invalid_argument("StepExecutor: duplicate agent id " + std::to_string(a.id()));
    }
    if (!cfg_.in_bounds(a.position()) || !cfg_.in_bounds(a.home_position())) {
      throw std::invalid_argument("StepExecutor: agent " + std::to_string(a.id()) +
                                  " is off the grid");
    }
  }

  // Pre-existing partnerships must be mutual.
  const WorldView view = make_view(step_, agents_, grid_, index_, cfg_);
  for (const auto& a : agents_) {
    if (!a.partner()) continue;
    const Agent* p = view.find_agent(*a.partner());
    if (p == nullptr || p->partner() != a.id()) {
      throw std::invalid_argument("StepExecutor: agent " + std::to_string(a.id()) +
                                  " has a one-sided partnership");
    }
  }
  for (const auto& a : agents_) a.check_invariants();
}

const Agent& StepExecutor::agent(AgentId id) const {
  return agents_[slot_of(id)];
}

std::size_t StepExecutor::slot_of(AgentId id) const {
  auto it = std::lower_bound(agents_.begin(), agents_.end(), id,
                             [](const Agent& a, AgentId key) { return a.id() < key; });
  if (it == agents_.end() || it->id() != id) {
    throw std::out_of_range("StepExecutor: unknown agent id " + std::to_string(id));
  }
  return static_cast<std::size_t>(it - agents_.begin());
}

Bundle StepExecutor::totals() const noexcept {
  Bundle sum{};
  for (const auto& a : agents_) sum = sum + a.total_bundle();
  return sum;
}

void StepExecutor::step(std::mt19937_64& rng) {
  const DecisionEngine engine(cfg_);

  // ---- Phase 1: decide against the frozen pre-step state ----
  index_.rebuild(agents_);
  const WorldView view = make_view(step_, agents_, grid_, index_, cfg_);

  Phase2 p2{};
  p2.decided.reserve(agents_.size());
  for (const auto& a : agents_) p2.decided.push_back(engine.decide(a, view));
  p2.traded.assign(agents_.size(), 0);

  // ---- Phase 2: apply in ascending id ----
  last_actions_.clear();
  last_trades_.clear();
  last_actions_.reserve(agents_.size());

  for (std::size_t i = 0; i < agents_.size(); ++i) {
    const AgentAction& a = p2.decided[i];
    const SkipReason r = apply(i, a, p2);
    if (r != SkipReason::None) {
      log()->debug("step {}: agent {} {} skipped ({})", step_, a.agent, to_string(a.type()),
                   to_string(r));
    }
    last_actions_.push_back(ActionResult{a, r});
  }

  if (respawn_.due(step_)) {
    p2.stats.respawned = respawn_.replenish(grid_, rng);
  }

  for (const auto& a : agents_) a.check_invariants();

  last_stats_ = p2.stats;
  total_stats_ += p2.stats;

  log()->trace("step {}: moves={} collects={} trades={} pairings={} unpairs={} respawned={}",
               step_, last_stats_.moves, last_stats_.collects, last_stats_.trades,
               last_stats_.pairings, last_stats_.unpairs, last_stats_.respawned);
  ++step_;
}

SkipReason StepExecutor::apply(std::size_t slot, const AgentAction& a, Phase2& p2) {
  Agent& ag = agents_[slot];
  StepStats& s = p2.stats;

  const SkipReason r = std::visit([&](const auto& cmd) -> SkipReason {
    using T = std::decay_t<decltype(cmd)>;

    if constexpr (std::is_same_v<T, Move>) {
      return apply_move(ag, cmd);
    } else if constexpr (std::is_same_v<T, Collect>) {
      return apply_collect(ag, cmd);
    } else if constexpr (std::is_same_v<T, Deposit>) {
      return apply_deposit(ag);
    } else if constexpr (std::is_same_v<T, Withdraw>) {
      return apply_withdraw(ag, cmd);
    } else if constexpr (std::is_same_v<T, ProposePair>) {
      return apply_propose(slot, cmd, p2);
    } else if constexpr (std::is_same_v<T, Trade>) {
      return apply_trade(slot, cmd, p2);
    } else if constexpr (std::is_same_v<T, Unpair>) {
      if (apply_unpair(ag)) s.unpairs++;
      return SkipReason::None;
    } else {
      return SkipReason::None;
    }
  }, a.command);

  switch (a.type()) {
    case ActionType::Move:
    case ActionType::Collect:
    case ActionType::Deposit:
    case ActionType::Withdraw:
      if (r != SkipReason::None) {
        s.degraded++;
        settle_idle(ag);
        break;
      }
      if (a.type() == ActionType::Move) s.moves++;
      else if (a.type() == ActionType::Collect) s.collects++;
      else if (a.type() == ActionType::Deposit) s.deposits++;
      else s.withdrawals++;

      ag.set_mode(a.mode);
      ag.set_target(a.target);
      // A partner that unpaired earlier this step leaves nothing to head for.
      if ((a.mode == AgentMode::Paired || a.mode == AgentMode::Trading) && !ag.partner()) {
        settle_idle(ag);
      }
      break;

    case ActionType::ProposePair:
      if (r != SkipReason::None) {
        s.proposals_dropped++;
        settle_idle(ag);
      }
      break;

    case ActionType::Trade:
      if (r == SkipReason::None) {
        ag.set_mode(AgentMode::Trading);
        ag.set_target(a.target);
      } else {
        s.trades_skipped++;
        settle_idle(ag);
      }
      break;

    case ActionType::Unpair:
      settle_idle(ag);
      break;

    case ActionType::Idle:
      s.idles++;
      // Paired by a lower id's proposal this step: keep that.
      if (!ag.partner()) {
        ag.set_mode(a.mode);
        ag.set_target(a.target);
      }
      break;
  }
  return r;
}

SkipReason StepExecutor::apply_move(Agent& ag, const Move& m) {
  const Position dest = step_toward(ag.position(), m.dir);
  if (!grid_.in_bounds(dest)) return SkipReason::OffGrid;
  ag.move_to(dest);
  return SkipReason::None;
}

SkipReason StepExecutor::apply_collect(Agent& ag, const Collect& c) {
  if (ag.position() != c.cell) return SkipReason::NotCoLocated;

  const auto cell = grid_.resource_at(c.cell);
  if (!cell || cell->good != c.good) return SkipReason::ResourceGone;
  if (ag.carrying_full()) return SkipReason::CapacityFull;

  (void)grid_.remove_resource(c.cell);
  ag.collect(c.good);
  return SkipReason::None;
}

SkipReason StepExecutor::apply_deposit(Agent& ag) {
  if (!ag.at_home()) return SkipReason::NotAtHome;
  if (ag.carrying().empty()) return SkipReason::InsufficientGoods;
  ag.deposit_all();
  return SkipReason::None;
}

SkipReason StepExecutor::apply_withdraw(Agent& ag, const Withdraw& w) {
  if (!ag.at_home()) return SkipReason::NotAtHome;
  if (w.amount <= 0 || ag.home().get(w.good) < w.amount) return SkipReason::InsufficientGoods;
  if (ag.free_capacity() < w.amount) return SkipReason::CapacityFull;
  ag.withdraw_from_home(w.good, w.amount);
  return SkipReason::None;
}

SkipReason StepExecutor::apply_propose(std::size_t slot, const ProposePair& p, Phase2& p2) {
  Agent& self = agents_[slot];

  // Mutual proposal: the lower id already linked both sides.
  if (self.partner() == p.partner) return SkipReason::None;
  if (p.partner == self.id()) return SkipReason::Incompatible;

  auto it = std::lower_bound(agents_.begin(), agents_.end(), p.partner,
                             [](const Agent& a, AgentId key) { return a.id() < key; });
  if (it == agents_.end() || it->id() != p.partner) return SkipReason::Incompatible;

  const auto other_slot = static_cast<std::size_t>(it - agents_.begin());
  Agent& other = agents_[other_slot];

  if (self.partner() || other.partner()) return SkipReason::TargetBusy;

  // The target must have been free this step: idle, or itself looking for a
  // partner (any partner, so proposal cycles cannot starve each other).
  const Command& theirs = p2.decided[other_slot].command;
  if (!std::holds_alternative<Idle>(theirs) && !std::holds_alternative<ProposePair>(theirs)) {
    return SkipReason::Incompatible;
  }

  self.set_partner(other.id());
  other.set_partner(self.id());
  self.set_mode(AgentMode::Paired);
  self.set_target(other.id());
  other.set_mode(AgentMode::Paired);
  other.set_target(self.id());

  p2.stats.pairings++;
  return SkipReason::None;
}

SkipReason StepExecutor::apply_trade(std::size_t slot, const Trade& t, Phase2& p2) {
  Agent& self = agents_[slot];
  if (self.partner() != t.partner) return SkipReason::NotPaired;

  // The partner's own Trade already moved the goods for both of us.
  if (p2.traded[slot]) return SkipReason::None;

  const std::size_t other_slot = slot_of(t.partner);
  Agent& other = agents_[other_slot];
  if (other.partner() != self.id()) return SkipReason::NotPaired;
  if (self.position() != other.position()) return SkipReason::NotCoLocated;

  const auto q = quote_swap(self, other, t.give, SwapSource::Carrying);
  if (!q) return SkipReason::InsufficientGoods;
  if (!is_pareto(*q, cfg_.min_trade_gain)) return SkipReason::NoLongerPareto;

  self.exchange(t.give, t.receive);
  other.exchange(t.receive, t.give);
  p2.traded[slot] = 1;
  p2.traded[other_slot] = 1;
  p2.stats.trades++;

  TradeRecord rec{};
  if (self.id() < other.id()) {
    rec = TradeRecord{self.id(), other.id(), t.give, q->own_gain, q->partner_gain};
  } else {
    rec = TradeRecord{other.id(), self.id(), t.receive, q->partner_gain, q->own_gain};
  }
  last_trades_.push_back(rec);
  return SkipReason::None;
}

bool StepExecutor::apply_unpair(Agent& ag) {
  const auto pid = ag.partner();
  if (!pid) return false;

  Agent& other = agents_[slot_of(*pid)];
  if (other.partner() == ag.id()) {
    other.clear_partner();
    settle_idle(other);
  }
  ag.clear_partner();
  return true;
}

// Idle for this step, but still pointed at the partner if one remains.
void StepExecutor::settle_idle(Agent& ag) noexcept {
  if (const auto pid = ag.partner()) {
    ag.set_mode(AgentMode::Paired);
    ag.set_target(*pid);
  } else {
    ag.set_mode(AgentMode::Idle);
    ag.set_target(std::monostate{});
  }
}

} // namespace agora
