#include "brinksmanship/Variance.hpp"

#include "brinksmanship/Constants.hpp"
#include "util/Random.hpp"

#include <algorithm>

namespace brinksmanship {

VPSplit expected_vp(const GameState& state) {
  double total = state.position_a() + state.position_b();
  if (total == 0) return VPSplit{50.0, 50.0};

  double ev_a = kTotalVP * state.position_a() / total;
  return VPSplit{ev_a, kTotalVP - ev_a};
}

VPSplit resolve_base_vp(const GameState& state, std::mt19937& prng) {
  VPSplit ev = expected_vp(state);
  double noise = util::Random::normal(prng, 0.0, state.shared_sigma());

  double a = std::clamp(ev.vp_a + noise, kFinalVPMin, kFinalVPMax);
  double b = std::clamp(ev.vp_b - noise, kFinalVPMin, kFinalVPMax);

  double total = a + b;
  return VPSplit{a * kTotalVP / total, b * kTotalVP / total};
}

VPSplit final_resolution(const GameState& state, std::mt19937& prng) {
  VPSplit base = resolve_base_vp(state, prng);
  return VPSplit{base.vp_a + state.surplus_captured_a(), base.vp_b + state.surplus_captured_b()};
}

double crisis_termination_probability(const GameState& state) {
  if (state.turn() < kCrisisMinTurn || state.risk_level() <= kCrisisRiskThreshold) return 0;
  return (state.risk_level() - kCrisisRiskThreshold) * kCrisisProbabilityPerRisk;
}

bool check_crisis_termination(const GameState& state, std::mt19937& prng) {
  double p = crisis_termination_probability(state);
  if (p <= 0) return false;
  return util::Random::bernoulli(prng, p);
}

VarianceSummary variance_summary(const GameState& state) {
  VPSplit ev = expected_vp(state);
  double sigma = state.shared_sigma();
  return VarianceSummary{ev.vp_a, ev.vp_b, sigma,
                         std::clamp(ev.vp_a - sigma, kFinalVPMin, kFinalVPMax),
                         std::clamp(ev.vp_a + sigma, kFinalVPMin, kFinalVPMax)};
}

}  // namespace brinksmanship
