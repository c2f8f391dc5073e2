#include "agora/simulation.hpp"

#include "agora/digest.hpp"

namespace agora {

namespace {
inline StepRecord make_record(const StepExecutor& ex) {
  StepRecord r{};
  r.step = ex.step_count() - 1;
  r.stats = ex.last_stats();
  r.digest = state_digest(ex.agents(), ex.grid());
  r.totals = ex.totals();
  return r;
}
} // namespace

RunResult run_steps(StepExecutor& ex, std::mt19937_64& rng, uint64_t n) {
  RunResult out{};
  out.steps.reserve(static_cast<std::size_t>(n));

  for (uint64_t i = 0; i < n; ++i) {
    ex.step(rng);
    out.steps.push_back(make_record(ex));
    out.totals += ex.last_stats();
  }

  out.final_digest = state_digest(ex.agents(), ex.grid());
  return out;
}

} // namespace agora
