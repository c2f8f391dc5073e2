#pragma once
#include <cstdint>
#include <random>
#include <vector>

#include "agora/bundle.hpp"
#include "agora/step_executor.hpp"

namespace agora {

// Snapshot taken after each step.
struct StepRecord {
  StepNo    step{};            // step number just completed (0-based)
  StepStats stats{};
  uint64_t  digest{};
  Bundle    totals{};
};

struct RunResult {
  std::vector<StepRecord> steps;
  StepStats totals{};
  uint64_t  final_digest{};
};

// Advances `ex` by `n` steps with the caller's RNG, recording each one.
RunResult run_steps(StepExecutor& ex, std::mt19937_64& rng, uint64_t n);

} // namespace agora
