#include <gtest/gtest.h>

#include <limits>
#include <variant>
#include <vector>

#include "agora/agent_index.hpp"
#include "agora/decision_engine.hpp"
#include "agora/grid.hpp"
#include "agora/world_view.hpp"

namespace {

// Hand-built snapshot; push agents in ascending id order.
struct Snapshot {
  agora::SimConfig cfg{};
  agora::SpatialGrid grid;
  agora::AgentSpatialGrid index;
  std::vector<agora::Agent> agents;

  Snapshot(agora::Coord w, agora::Coord h) : grid(w, h), index(w, h) {
    cfg.grid_width = w;
    cfg.grid_height = h;
  }

  agora::Agent& add(agora::AgentId id, agora::Position p, agora::UtilityFunction u,
                    agora::Bundle carrying = {}, agora::Bundle home = {}) {
    agents.emplace_back(id, p, u, cfg.carrying_capacity, carrying, home);
    return agents.back();
  }

  void pair(std::size_t i, std::size_t j) {
    agents[i].set_partner(agents[j].id());
    agents[j].set_partner(agents[i].id());
    agents[i].set_mode(agora::AgentMode::Paired);
    agents[j].set_mode(agora::AgentMode::Paired);
  }

  agora::AgentAction decide(std::size_t i) {
    index.rebuild(agents);
    const auto view = agora::make_view(0, agents, grid, index, cfg);
    return agora::DecisionEngine(cfg).decide(agents[i], view);
  }
};

const agora::UtilityFunction kHalf = agora::cobb_douglas(0.5);

} // namespace

TEST(DecisionEngine, ForageStepsTowardNearestEqualValueResource) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf);
  s.grid.add_resource({3, 0}, agora::Good::Good1);
  s.grid.add_resource({0, 1}, agora::Good::Good1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Move>(a.command).dir, agora::Direction::South);
  EXPECT_EQ(a.mode, agora::AgentMode::Foraging);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{0, 1}));
}

TEST(DecisionEngine, ForageTiesBreakRowMajor) {
  Snapshot s(5, 5);
  s.add(0, {2, 2}, kHalf);
  s.grid.add_resource({2, 3}, agora::Good::Good1);
  s.grid.add_resource({3, 2}, agora::Good::Good1);
  s.grid.add_resource({1, 2}, agora::Good::Good1);
  s.grid.add_resource({2, 1}, agora::Good::Good1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{2, 1}));
  EXPECT_EQ(std::get<agora::Move>(a.command).dir, agora::Direction::North);

  // the same snapshot always yields the same answer
  auto b = s.decide(0);
  EXPECT_EQ(std::get<agora::Position>(b.target), (agora::Position{2, 1}));
}

TEST(DecisionEngine, CoLocatedResourceIsCollected) {
  Snapshot s(5, 5);
  s.add(0, {1, 1}, kHalf);
  s.grid.add_resource({1, 1}, agora::Good::Good2);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Collect);
  EXPECT_EQ(std::get<agora::Collect>(a.command).good, agora::Good::Good2);
  EXPECT_EQ(std::get<agora::Collect>(a.command).cell, (agora::Position{1, 1}));
}

TEST(DecisionEngine, CobbDouglasTargetsTheScarceGood) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{0, 0}, agora::Bundle{5, 0});
  s.grid.add_resource({1, 0}, agora::Good::Good1);   // closer, but plentiful at home
  s.grid.add_resource({0, 3}, agora::Good::Good2);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{0, 3}));
}

TEST(DecisionEngine, CobbDouglasWeightDecidesBetweenEquidistantGoods) {
  Snapshot s(11, 11);
  s.add(0, {5, 5}, agora::cobb_douglas(0.7), agora::Bundle{5, 5});
  s.grid.add_resource({5, 0}, agora::Good::Good2);    // first in row-major order
  s.grid.add_resource({5, 10}, agora::Good::Good1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{5, 10}));
  EXPECT_EQ(std::get<agora::Move>(a.command).dir, agora::Direction::South);
}

TEST(DecisionEngine, PerfectComplementsTargetsTheBindingGood) {
  Snapshot s(10, 10);
  const auto pc = agora::make_utility(agora::UtilityKind::PerfectComplements, 1.0, 2.0);
  s.add(0, {0, 0}, pc, agora::Bundle{1, 0});   // 1*1 > 2*0 => good2 binds
  s.grid.add_resource({1, 0}, agora::Good::Good1);
  s.grid.add_resource({0, 1}, agora::Good::Good2);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{0, 1}));
}

TEST(DecisionEngine, NothingBeyondPerceptionRadius) {
  Snapshot s(20, 20);
  s.cfg.perception_radius = 8;
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {9, 0}, kHalf, agora::Bundle{0, 10});   // a good trade, but 9 cells away
  s.grid.add_resource({5, 4}, agora::Good::Good1);  // distance 9

  auto a = s.decide(0);
  EXPECT_EQ(a.type(), agora::ActionType::Idle);

  s.grid.add_resource({4, 4}, agora::Good::Good1);  // distance 8: visible
  auto b = s.decide(0);
  ASSERT_EQ(b.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(b.target), (agora::Position{4, 4}));
}

TEST(DecisionEngine, FullCarryingGoesHomeThenDeposits) {
  Snapshot s(10, 10);
  s.cfg.carrying_capacity = 2;
  auto& ag = s.add(0, {2, 2}, kHalf, agora::Bundle{1, 1});
  s.grid.add_resource({2, 3}, agora::Good::Good1);

  auto at_home = s.decide(0);
  EXPECT_EQ(at_home.type(), agora::ActionType::Deposit);

  ag.move_to({4, 2});
  auto away = s.decide(0);
  ASSERT_EQ(away.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Move>(away.command).dir, agora::Direction::West);
  EXPECT_EQ(std::get<agora::Position>(away.target), (agora::Position{2, 2}));
}

TEST(DecisionEngine, CoLocatedPartnersTradeOnJointGain) {
  Snapshot s(5, 5);
  s.add(0, {1, 1}, agora::cobb_douglas(0.7), agora::Bundle{13, 12});
  s.add(1, {1, 1}, agora::cobb_douglas(0.3), agora::Bundle{12, 13});
  s.pair(0, 1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Trade);
  const auto& t = std::get<agora::Trade>(a.command);
  EXPECT_EQ(t.partner, 1u);
  EXPECT_EQ(t.give, agora::Good::Good2);
  EXPECT_EQ(t.receive, agora::Good::Good1);
  EXPECT_GT(t.own_gain, s.cfg.min_trade_gain);
  EXPECT_GT(t.partner_gain, s.cfg.min_trade_gain);
  EXPECT_EQ(a.mode, agora::AgentMode::Trading);

  auto b = s.decide(1);
  ASSERT_EQ(b.type(), agora::ActionType::Trade);
  EXPECT_EQ(std::get<agora::Trade>(b.command).give, agora::Good::Good1);
}

TEST(DecisionEngine, NoSwapWhenMarginalRatesAlreadyMatch) {
  // (7,3) at alpha .7 and (3,7) at alpha .3: every 1-for-1 swap lowers
  // somebody's utility.
  Snapshot s(5, 5);
  s.add(0, {1, 1}, agora::cobb_douglas(0.7), agora::Bundle{7, 3});
  s.add(1, {1, 1}, agora::cobb_douglas(0.3), agora::Bundle{3, 7});
  s.pair(0, 1);

  EXPECT_FALSE(agora::best_swap(s.agents[0], s.agents[1], s.cfg.min_trade_gain,
                                agora::SwapSource::Total).has_value());
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Unpair);
  EXPECT_EQ(s.decide(1).type(), agora::ActionType::Unpair);
}

TEST(DecisionEngine, HugePerceptionRadiusStillFindsResources) {
  Snapshot s(5, 5);
  s.cfg.perception_radius = std::numeric_limits<int32_t>::max();
  s.add(0, {1, 1}, kHalf);
  s.grid.add_resource({4, 4}, agora::Good::Good1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Position>(a.target), (agora::Position{4, 4}));
}

TEST(DecisionEngine, GoodsAtHomeCannotBeSwapped) {
  // Same bundles as the trading case, but stored at home: nothing is carried,
  // and neither partner carries what the other would receive.
  Snapshot s(5, 5);
  s.add(0, {1, 1}, agora::cobb_douglas(0.7), agora::Bundle{}, agora::Bundle{13, 12});
  s.add(1, {1, 1}, agora::cobb_douglas(0.3), agora::Bundle{}, agora::Bundle{12, 13});
  s.pair(0, 1);

  EXPECT_TRUE(agora::best_swap(s.agents[0], s.agents[1], s.cfg.min_trade_gain,
                               agora::SwapSource::Total).has_value());
  EXPECT_FALSE(agora::best_swap(s.agents[0], s.agents[1], s.cfg.min_trade_gain,
                                agora::SwapSource::Carrying).has_value());
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Unpair);
}

TEST(DecisionEngine, PairedAgentWithdrawsTheUnitItsPartnerWants) {
  Snapshot s(5, 5);
  s.add(0, {1, 1}, kHalf, agora::Bundle{}, agora::Bundle{10, 0});
  s.add(1, {1, 1}, kHalf, agora::Bundle{0, 10});
  s.pair(0, 1);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Withdraw);
  EXPECT_EQ(std::get<agora::Withdraw>(a.command).good, agora::Good::Good1);
  EXPECT_EQ(std::get<agora::Withdraw>(a.command).amount, 1);
  EXPECT_EQ(a.mode, agora::AgentMode::Paired);

  // the partner holds the pair open instead of unpairing
  auto b = s.decide(1);
  ASSERT_EQ(b.type(), agora::ActionType::Idle);
  EXPECT_EQ(b.mode, agora::AgentMode::Paired);
  EXPECT_EQ(std::get<agora::AgentId>(b.target), 0u);
}

TEST(DecisionEngine, PartnerOutOfRangeIsDropped) {
  Snapshot s(20, 20);
  s.cfg.perception_radius = 3;
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {4, 0}, kHalf, agora::Bundle{0, 10});
  s.pair(0, 1);

  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Unpair);
}

TEST(DecisionEngine, PartnersConvergeWithoutSwappingCells) {
  Snapshot s(10, 10);
  s.add(0, {2, 2}, kHalf, agora::Bundle{10, 0});
  s.add(1, {3, 2}, kHalf, agora::Bundle{0, 10});
  s.pair(0, 1);

  // adjacent: the lower id waits
  auto a0 = s.decide(0);
  EXPECT_EQ(a0.type(), agora::ActionType::Idle);
  EXPECT_EQ(a0.mode, agora::AgentMode::Paired);
  auto a1 = s.decide(1);
  ASSERT_EQ(a1.type(), agora::ActionType::Move);
  EXPECT_EQ(std::get<agora::Move>(a1.command).dir, agora::Direction::West);

  // diagonal: lower id moves in x, higher id in y, landing on the same cell
  s.agents[1].move_to({3, 3});
  auto d0 = s.decide(0);
  auto d1 = s.decide(1);
  ASSERT_EQ(d0.type(), agora::ActionType::Move);
  ASSERT_EQ(d1.type(), agora::ActionType::Move);
  EXPECT_EQ(agora::step_toward({2, 2}, std::get<agora::Move>(d0.command).dir),
            agora::step_toward({3, 3}, std::get<agora::Move>(d1.command).dir));
}

TEST(DecisionEngine, PartnerSearchPrefersLowestIdOnEqualGain) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {4, 0}, kHalf, agora::Bundle{0, 10});
  s.add(2, {1, 0}, kHalf, agora::Bundle{0, 10});   // closer, same gain

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::ProposePair);
  EXPECT_EQ(std::get<agora::ProposePair>(a.command).partner, 1u);
  EXPECT_EQ(a.mode, agora::AgentMode::SeekingPartner);
}

TEST(DecisionEngine, PartnerSearchSkipsPairedCandidates) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {4, 0}, kHalf, agora::Bundle{0, 10});
  s.add(2, {6, 0}, kHalf, agora::Bundle{0, 10});
  s.add(3, {6, 0}, kHalf, agora::Bundle{0, 10});
  s.pair(1, 2);

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::ProposePair);
  EXPECT_EQ(std::get<agora::ProposePair>(a.command).partner, 3u);
}

TEST(DecisionEngine, PartnerSearchWithdrawsStoredGoodFirst) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{}, agora::Bundle{10, 0});
  s.add(1, {2, 0}, kHalf, agora::Bundle{0, 10});

  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::Withdraw);
  EXPECT_EQ(std::get<agora::Withdraw>(a.command).good, agora::Good::Good1);
  EXPECT_EQ(std::get<agora::AgentId>(a.target), 1u);

  // away from home the stored good is out of reach
  s.agents[0].move_to({1, 0});
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Idle);
}

TEST(DecisionEngine, PartnerSearchSkipsCandidatesWithGoodsOnlyAtHome) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {2, 0}, kHalf, agora::Bundle{}, agora::Bundle{0, 10});   // Good2 stored, none carried

  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Idle);

  s.add(2, {4, 0}, kHalf, agora::Bundle{0, 10});
  auto a = s.decide(0);
  ASSERT_EQ(a.type(), agora::ActionType::ProposePair);
  EXPECT_EQ(std::get<agora::ProposePair>(a.command).partner, 2u);
}

TEST(DecisionEngine, FeatureFlagsGateBehaviour) {
  Snapshot s(10, 10);
  s.add(0, {0, 0}, kHalf, agora::Bundle{10, 0});
  s.add(1, {3, 3}, kHalf, agora::Bundle{0, 10});
  s.grid.add_resource({0, 1}, agora::Good::Good2);

  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Move);          // forage wins

  s.cfg.features.forage_enabled = false;
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::ProposePair);

  s.cfg.features.forage_enabled = true;
  s.cfg.features.trade_enabled = false;
  s.grid.remove_resource({0, 1});
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Idle);

  s.cfg.features.forage_enabled = false;
  s.grid.add_resource({0, 0}, agora::Good::Good2);
  EXPECT_EQ(s.decide(0).type(), agora::ActionType::Idle);
}
