#pragma once
#include <string_view>
#include <variant>

#include "agora/agent.hpp"
#include "agora/types.hpp"

namespace agora {

struct Move {
  Direction dir{Direction::East};
};

struct Collect {
  Position cell{};
  Good     good{Good::Good1};
};

struct Deposit {};

struct Withdraw {
  Good good{Good::Good1};
  Qty  amount{};
};

struct ProposePair {
  AgentId partner{};
};

struct Trade {
  AgentId partner{};
  Good    give{Good::Good1};
  Good    receive{Good::Good2};
  double  own_gain{};       // utility deltas seen in the snapshot
  double  partner_gain{};
};

struct Unpair {};

struct Idle {};

using Command = std::variant<Move, Collect, Deposit, Withdraw, ProposePair, Trade, Unpair, Idle>;

enum class ActionType : uint8_t { Move, Collect, Deposit, Withdraw, ProposePair, Trade, Unpair, Idle };

inline ActionType type_of(const Command& c) noexcept {
  return static_cast<ActionType>(c.index()); // relies on variant order above
}

inline std::string_view to_string(ActionType t) noexcept {
  switch (t) {
    case ActionType::Move:        return "move";
    case ActionType::Collect:     return "collect";
    case ActionType::Deposit:     return "deposit";
    case ActionType::Withdraw:    return "withdraw";
    case ActionType::ProposePair: return "propose_pair";
    case ActionType::Trade:       return "trade";
    case ActionType::Unpair:      return "unpair";
    case ActionType::Idle:        return "idle";
  }
  return "unknown";
}

// Phase 1 output for one agent: the command plus the mode/target the agent adopts.
struct AgentAction {
  AgentId   agent{};
  AgentMode mode{AgentMode::Idle};
  Target    target{};
  Command   command{Idle{}};

  ActionType type() const noexcept { return type_of(command); }
};

} // namespace agora
