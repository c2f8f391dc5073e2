#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

#include "agora/digest.hpp"
#include "agora/scenario.hpp"
#include "agora/simulation.hpp"

namespace {

agora::SimConfig busy_config() {
  agora::SimConfig cfg{};
  cfg.grid_width = 16;
  cfg.grid_height = 16;
  cfg.carrying_capacity = 6;
  cfg.respawn.enabled = true;
  cfg.respawn.target_density = 0.2;
  cfg.respawn.rate = 0.5;
  cfg.respawn.interval = 2;
  return cfg;
}

agora::RunResult run_once(uint64_t seed, uint64_t steps) {
  std::mt19937_64 rng(seed);
  auto scenario = agora::random_scenario(busy_config(), 12, 0.2, rng);
  auto ex = agora::build_scenario(scenario, rng);
  return agora::run_steps(ex, rng, steps);
}

} // namespace

TEST(Determinism, SameSeedSameDigests) {
  const auto r1 = run_once(42, 150);
  const auto r2 = run_once(42, 150);

  ASSERT_EQ(r1.steps.size(), r2.steps.size());
  for (std::size_t i = 0; i < r1.steps.size(); ++i) {
    ASSERT_EQ(r1.steps[i].digest, r2.steps[i].digest) << "diverged at step " << i;
  }
  EXPECT_EQ(r1.final_digest, r2.final_digest);
  EXPECT_EQ(r1.totals.trades, r2.totals.trades);
  EXPECT_EQ(r1.totals.collects, r2.totals.collects);

  // the run actually did something
  EXPECT_GT(r1.totals.moves, 0u);
  EXPECT_GT(r1.totals.collects, 0u);
}

TEST(Determinism, DifferentSeedsDiverge) {
  EXPECT_NE(run_once(1, 50).final_digest, run_once(2, 50).final_digest);
}

TEST(Determinism, InputOrderOfAgentsDoesNotMatter) {
  std::mt19937_64 setup(7);
  auto scenario = agora::random_scenario(busy_config(), 10, 0.25, setup);
  auto base = agora::build_scenario(scenario, setup);

  std::vector<agora::Agent> forward(base.agents().begin(), base.agents().end());
  std::vector<agora::Agent> reversed(forward.rbegin(), forward.rend());

  agora::StepExecutor a(base.config(), base.grid(), std::move(forward));
  agora::StepExecutor b(base.config(), base.grid(), std::move(reversed));

  std::mt19937_64 ra(123);
  std::mt19937_64 rb(123);
  const auto r1 = agora::run_steps(a, ra, 80);
  const auto r2 = agora::run_steps(b, rb, 80);

  EXPECT_EQ(r1.final_digest, r2.final_digest);
}

TEST(Determinism, TradesNeverCreateOrDestroyGoods) {
  agora::SimConfig cfg = busy_config();
  cfg.features.forage_enabled = false;
  cfg.respawn.enabled = false;

  std::mt19937_64 rng(11);
  agora::ScenarioSpec scenario{};
  scenario.config = cfg;
  for (int i = 0; i < 8; ++i) {
    agora::AgentSpec a{};
    a.utility = agora::cobb_douglas(i % 2 == 0 ? 0.3 : 0.7);
    a.carrying = (i % 2 == 0) ? agora::Bundle{5, 1} : agora::Bundle{1, 5};
    a.position = agora::Position{i, i};
    scenario.agents.push_back(a);
  }
  auto ex = agora::build_scenario(scenario, rng);
  const auto before = ex.totals();

  const auto res = agora::run_steps(ex, rng, 60);
  for (const auto& rec : res.steps) EXPECT_EQ(rec.totals, before);
  EXPECT_GT(res.totals.trades, 0u);
}

TEST(Scenario, BuildsAgentsAndResourcesFromSpec) {
  agora::ScenarioSpec scenario{};
  scenario.config.grid_width = 6;
  scenario.config.grid_height = 6;
  scenario.config.carrying_capacity = 4;
  scenario.resources.push_back(agora::ResourceCell{{1, 1}, agora::Good::Good2});
  scenario.random_resource_density = 0.25;   // 9 cells

  agora::AgentSpec fixed{};
  fixed.position = agora::Position{0, 0};
  fixed.home = agora::Bundle{3, 3};
  scenario.agents.push_back(fixed);
  scenario.agents.push_back(agora::AgentSpec{});
  scenario.agents.push_back(agora::AgentSpec{});

  std::mt19937_64 rng(3);
  auto ex = agora::build_scenario(scenario, rng);

  ASSERT_EQ(ex.agents().size(), 3u);
  EXPECT_EQ(ex.agent(0).position(), (agora::Position{0, 0}));
  EXPECT_EQ(ex.agent(0).home(), (agora::Bundle{3, 3}));
  EXPECT_EQ(ex.agent(1).capacity(), 4);
  EXPECT_NE(ex.agent(1).position(), ex.agent(2).position());
  EXPECT_NE(ex.agent(1).position(), (agora::Position{0, 0}));
  EXPECT_EQ(ex.agent(2).home_position(), ex.agent(2).position());

  EXPECT_EQ(ex.grid().resource_count(), 9u);
  ASSERT_TRUE(ex.grid().resource_at({1, 1}).has_value());
  EXPECT_EQ(ex.grid().resource_at({1, 1})->good, agora::Good::Good2);
}

TEST(Scenario, RejectsImpossibleSpecs) {
  std::mt19937_64 rng(1);

  agora::ScenarioSpec crowded{};
  crowded.config.grid_width = 2;
  crowded.config.grid_height = 1;
  crowded.agents.resize(3);
  EXPECT_THROW(agora::build_scenario(crowded, rng), std::invalid_argument);

  agora::ScenarioSpec off{};
  off.config.grid_width = 3;
  off.config.grid_height = 3;
  agora::AgentSpec a{};
  a.position = agora::Position{3, 0};
  off.agents.push_back(a);
  EXPECT_THROW(agora::build_scenario(off, rng), std::invalid_argument);

  agora::ScenarioSpec dense{};
  dense.random_resource_density = 1.5;
  EXPECT_THROW(agora::build_scenario(dense, rng), std::invalid_argument);
}

TEST(Digest, ChangesWithState) {
  agora::SpatialGrid grid(4, 4);
  std::vector<agora::Agent> agents;
  agents.emplace_back(0, agora::Position{1, 1}, agora::cobb_douglas(0.5), 10);

  const auto d0 = agora::state_digest(agents, grid);
  EXPECT_EQ(d0, agora::state_digest(agents, grid));

  grid.add_resource({2, 2}, agora::Good::Good1);
  const auto d1 = agora::state_digest(agents, grid);
  EXPECT_NE(d0, d1);

  agents[0].move_to({1, 2});
  EXPECT_NE(d1, agora::state_digest(agents, grid));
}
