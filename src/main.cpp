#include <cstdint>
#include <exception>
#include <iostream>
#include <random>
#include <string>

#include "agora/config.hpp"
#include "agora/log.hpp"
#include "agora/scenario.hpp"
#include "agora/simulation.hpp"

static void usage() {
  std::cout
    << "Usage:\n"
    << "  agora_cli [seed] [steps]\n"
    << "  agora_cli --forage-only <seed> <steps>\n"
    << "  agora_cli --trade-only <seed> <steps>\n";
}

int main(int argc, char** argv) {
  agora::SimConfig cfg{};
  cfg.grid_width = 30;
  cfg.grid_height = 30;
  cfg.carrying_capacity = 10;
  cfg.respawn.enabled = true;

  int arg = 1;
  if (argc >= 2 && std::string(argv[1]).rfind("--", 0) == 0) {
    const std::string mode = argv[1];
    if (mode == "--forage-only") {
      cfg.features.trade_enabled = false;
    } else if (mode == "--trade-only") {
      cfg.features.forage_enabled = false;
    } else {
      usage();
      return 1;
    }
    if (argc < 4) { usage(); return 1; }
    arg = 2;
  }

  uint64_t seed = 1;
  uint64_t steps = 200;

  try {
    if (argc > arg) seed = static_cast<uint64_t>(std::stoull(argv[arg]));
    if (argc > arg + 1) steps = static_cast<uint64_t>(std::stoull(argv[arg + 1]));
  } catch (const std::exception&) {
    usage();
    return 1;
  }

  auto log = agora::log();

  try {
    std::mt19937_64 rng(seed);
    auto scenario = agora::random_scenario(cfg, /*n_agents*/ 24, /*resource_density*/ 0.2, rng);
    auto ex = agora::build_scenario(scenario, rng);

    log->info("agents={} resources={} grid={}x{} seed={}", ex.agents().size(),
              ex.grid().resource_count(), cfg.grid_width, cfg.grid_height, seed);

    const auto res = agora::run_steps(ex, rng, steps);
    const auto totals = ex.totals();

    double welfare = 0.0;
    for (const auto& a : ex.agents()) welfare += a.utility();

    std::cout << "RUN COMPLETE"
              << " steps=" << ex.step_count()
              << " moves=" << res.totals.moves
              << " collects=" << res.totals.collects
              << " trades=" << res.totals.trades
              << " pairings=" << res.totals.pairings
              << " respawned=" << res.totals.respawned
              << " good1=" << totals.q1
              << " good2=" << totals.q2
              << " welfare=" << welfare
              << " digest=" << std::hex << res.final_digest << std::dec
              << "\n";
  } catch (const std::exception& e) {
    log->error("simulation failed: {}", e.what());
    return 2;
  }
  return 0;
}
