#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "agora/bundle.hpp"
#include "agora/types.hpp"
#include "agora/utility.hpp"

namespace agora {

enum class AgentMode : uint8_t {
  Idle           = 0,
  Foraging       = 1,
  SeekingPartner = 2,
  Paired         = 3,
  Trading        = 4
};

std::string_view to_string(AgentMode m) noexcept;

// What the agent was last heading for: nothing, a cell, or another agent.
using Target = std::variant<std::monostate, Position, AgentId>;

class Agent {
public:
  // Home defaults to the spawn cell. Throws std::invalid_argument on a
  // non-positive capacity, negative quantities, or carrying above capacity.
  Agent(AgentId id, Position pos, UtilityFunction utility, Qty capacity,
        Bundle carrying = {}, Bundle home = {});

  AgentId id() const noexcept { return id_; }
  Position position() const noexcept { return pos_; }
  Position home_position() const noexcept { return home_pos_; }
  const Bundle& carrying() const noexcept { return carrying_; }
  const Bundle& home() const noexcept { return home_; }
  Bundle total_bundle() const noexcept { return carrying_ + home_; }
  const UtilityFunction& utility_function() const noexcept { return utility_; }
  Qty capacity() const noexcept { return capacity_; }

  AgentMode mode() const noexcept { return mode_; }
  const Target& target() const noexcept { return target_; }
  std::optional<AgentId> partner() const noexcept { return partner_; }

  bool at_home() const noexcept { return pos_ == home_pos_; }
  bool carrying_full() const noexcept { return carrying_.total() >= capacity_; }
  Qty free_capacity() const noexcept { return capacity_ - carrying_.total(); }
  double utility() const noexcept { return value(utility_, total_bundle()); }

  // ---- single-entity mutations (driven by the step executor) ----
  void set_home_position(Position p) noexcept { home_pos_ = p; }
  void move_to(Position p) noexcept { pos_ = p; }
  void collect(Good g);                          // +1 carrying; throws std::logic_error when full
  void deposit_to_home(Good g, Qty amount);      // carrying -> home
  void withdraw_from_home(Good g, Qty amount);   // home -> carrying
  void deposit_all();
  void exchange(Good give, Good receive);        // one unit out of carrying, one in

  void set_mode(AgentMode m) noexcept { mode_ = m; }
  void set_target(Target t) noexcept { target_ = t; }
  void set_partner(AgentId other) noexcept { partner_ = other; }
  void clear_partner() noexcept { partner_.reset(); }

  // Throws std::logic_error when the inventory invariants do not hold.
  void check_invariants() const;

private:
  AgentId id_{};
  Position pos_{};
  Position home_pos_{};
  Bundle carrying_{};
  Bundle home_{};
  UtilityFunction utility_{};
  Qty capacity_{};

  AgentMode mode_{AgentMode::Idle};
  Target target_{};
  std::optional<AgentId> partner_{};
};

} // namespace agora
