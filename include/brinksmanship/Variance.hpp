#pragma once

#include "brinksmanship/GameState.hpp"

#include <random>

/*
 * Final-VP resolution.
 *
 * A game that ends without a deterministic winner or a settlement is scored by drawing around
 * the expected split implied by relative position. The noise is wider when risk is high,
 * cooperation is low, stability is low, or the game is late.
 *
 * All functions are pure apart from the draws they take from prng.
 */
namespace brinksmanship {

struct VPSplit {
  double vp_a;
  double vp_b;
};

// 100 * pos_a / (pos_a + pos_b), or 50/50 when both positions are 0.
VPSplit expected_vp(const GameState& state);

/*
 * One N(0, shared_sigma) draw, applied symmetrically to the expected split, each side clamped to
 * [5, 95], then renormalized to sum to 100. Captured surplus is not included.
 */
VPSplit resolve_base_vp(const GameState& state, std::mt19937& prng);

// resolve_base_vp() plus each player's captured surplus.
VPSplit final_resolution(const GameState& state, std::mt19937& prng);

// (risk - 7) * 0.08 once turn >= 10 and risk > 7, otherwise 0.
double crisis_termination_probability(const GameState& state);

// Draws exactly one uniform value when the probability is positive, none otherwise.
bool check_crisis_termination(const GameState& state, std::mt19937& prng);

struct VarianceSummary {
  double ev_a;
  double ev_b;
  double sigma;
  double band_low_a;   // ev_a - sigma, clamped to [5, 95]
  double band_high_a;  // ev_a + sigma, clamped to [5, 95]
};

VarianceSummary variance_summary(const GameState& state);

}  // namespace brinksmanship
