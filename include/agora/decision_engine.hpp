#pragma once
#include <optional>

#include "agora/action.hpp"
#include "agora/agent.hpp"
#include "agora/config.hpp"
#include "agora/grid.hpp"
#include "agora/world_view.hpp"

namespace agora {

// A 1-for-1 swap seen from `self`: give one `give`, receive one of the other good.
// Gains are measured on total bundles (carrying + home).
struct SwapQuote {
  Good   give{Good::Good1};
  double own_gain{};
  double partner_gain{};

  double joint_gain() const noexcept { return own_gain + partner_gain; }
};

enum class SwapSource : uint8_t {
  Carrying,   // both sides must carry the good they hand over
  Total       // goods stored at home count as well
};

// Quote for one direction, or nullopt if either side lacks the good it would
// hand over under `source`.
std::optional<SwapQuote> quote_swap(const Agent& self, const Agent& partner, Good give,
                                    SwapSource source) noexcept;

bool is_pareto(const SwapQuote& q, double min_gain) noexcept;

// Both directions are tried (Good1 first); the Pareto-improving one with the
// larger joint gain wins, Good1 on equal gains.
std::optional<SwapQuote> best_swap(const Agent& self, const Agent& partner, double min_gain,
                                   SwapSource source) noexcept;

// MU(total, good) * exp(-k * distance)
double forage_score(const Agent& agent, const ResourceCell& cell, double distance_discount) noexcept;

// One step of a paired agent toward its partner. Both partners step in the
// same phase, so adjacent and diagonal pairs get asymmetric moves that meet
// instead of swapping cells. nullopt => wait this step.
std::optional<Direction> meeting_step(const Agent& agent, const Agent& partner) noexcept;

class DecisionEngine {
public:
  explicit DecisionEngine(const SimConfig& cfg) : cfg_(&cfg) {}

  // Pure with respect to the view: nothing in the world is mutated.
  AgentAction decide(const Agent& agent, const WorldView& view) const;

  // Best forage target within perception radius, if any has a positive score.
  std::optional<ResourceCell> select_resource(const Agent& agent, const WorldView& view) const;

private:
  const SimConfig* cfg_;

  std::optional<AgentAction> decide_inventory(const Agent& agent) const;
  std::optional<AgentAction> decide_partnership(const Agent& agent, const WorldView& view) const;
  std::optional<AgentAction> decide_forage(const Agent& agent, const WorldView& view) const;
  std::optional<AgentAction> decide_partner_search(const Agent& agent, const WorldView& view) const;

  // Co-located pair: the swap `self` can complete by withdrawing one stored unit.
  std::optional<SwapQuote> pending_withdraw(const Agent& self, const Agent& partner) const;

  static AgentAction move_toward(const Agent& agent, Position to, AgentMode mode, Target target);
  static AgentAction idle(const Agent& agent);
};

} // namespace agora
