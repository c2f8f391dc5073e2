#pragma once
#include <cstdint>
#include <random>
#include <span>
#include <string_view>
#include <vector>

#include "agora/action.hpp"
#include "agora/agent.hpp"
#include "agora/agent_index.hpp"
#include "agora/bundle.hpp"
#include "agora/config.hpp"
#include "agora/grid.hpp"
#include "agora/respawn.hpp"

namespace agora {

// Why a Phase-1 action was not applied in Phase 2. Skips are recoverable:
// the action has no side effect and the step carries on.
enum class SkipReason : uint8_t {
  None = 0,
  ResourceGone,
  CapacityFull,
  NotAtHome,
  InsufficientGoods,
  TargetBusy,
  Incompatible,
  NotPaired,
  NotCoLocated,
  NoLongerPareto,
  OffGrid
};

std::string_view to_string(SkipReason r) noexcept;

struct StepStats {
  uint64_t moves{0};
  uint64_t collects{0};
  uint64_t deposits{0};
  uint64_t withdrawals{0};
  uint64_t pairings{0};
  uint64_t proposals_dropped{0};
  uint64_t trades{0};
  uint64_t trades_skipped{0};
  uint64_t unpairs{0};
  uint64_t idles{0};
  uint64_t degraded{0};      // Move/Collect/Deposit/Withdraw turned into Idle
  uint64_t respawned{0};

  StepStats& operator+=(const StepStats& o) noexcept;
};

struct ActionResult {
  AgentAction action{};
  SkipReason  skip{SkipReason::None};

  bool applied() const noexcept { return skip == SkipReason::None; }
};

// One executed 1-for-1 swap. `first` is the lower id and gives `first_gives`.
struct TradeRecord {
  AgentId first{};
  AgentId second{};
  Good    first_gives{Good::Good1};
  double  first_gain{};
  double  second_gain{};
};

class StepExecutor {
public:
  // Validates the config, sorts agents by id and rejects duplicate ids,
  // off-grid agents and a grid whose size differs from the config
  // (std::invalid_argument).
  StepExecutor(SimConfig cfg, SpatialGrid grid, std::vector<Agent> agents);

  // Phase 1: every agent decides against the pre-step state.
  // Phase 2: actions are applied by ascending id; the lower id wins conflicts.
  // `rng` is consumed only by resource respawn.
  void step(std::mt19937_64& rng);

  std::span<const Agent> agents() const noexcept { return agents_; }
  const Agent& agent(AgentId id) const;    // throws std::out_of_range
  const SpatialGrid& grid() const noexcept { return grid_; }
  const SimConfig& config() const noexcept { return cfg_; }

  StepNo step_count() const noexcept { return step_; }
  const StepStats& last_stats() const noexcept { return last_stats_; }
  const StepStats& total_stats() const noexcept { return total_stats_; }
  const std::vector<ActionResult>& last_actions() const noexcept { return last_actions_; }
  const std::vector<TradeRecord>& last_trades() const noexcept { return last_trades_; }

  // Economy-wide carrying + home.
  Bundle totals() const noexcept;

private:
  SimConfig cfg_;
  SpatialGrid grid_;
  std::vector<Agent> agents_;          // ascending id
  AgentSpatialGrid index_;
  RespawnScheduler respawn_;

  StepNo step_{0};
  StepStats last_stats_{};
  StepStats total_stats_{};
  std::vector<ActionResult> last_actions_;
  std::vector<TradeRecord> last_trades_;

  std::size_t slot_of(AgentId id) const;   // index into agents_, throws std::out_of_range

  struct Phase2;
  SkipReason apply(std::size_t slot, const AgentAction& a, Phase2& p2);
  SkipReason apply_move(Agent& ag, const Move& m);
  SkipReason apply_collect(Agent& ag, const Collect& c);
  SkipReason apply_deposit(Agent& ag);
  SkipReason apply_withdraw(Agent& ag, const Withdraw& w);
  SkipReason apply_propose(std::size_t slot, const ProposePair& p, Phase2& p2);
  SkipReason apply_trade(std::size_t slot, const Trade& t, Phase2& p2);
  bool apply_unpair(Agent& ag);         // false if there was no link to clear
  void settle_idle(Agent& ag) noexcept;
};

} // namespace agora
