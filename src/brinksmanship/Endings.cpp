#include "brinksmanship/Endings.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"
#include "brinksmanship/Variance.hpp"

#include <cmath>
#include <format>
#include <utility>

namespace brinksmanship {

namespace {

constexpr double kVPSumTolerance = 1e-6;

// Loser gets loser_vp, winner keeps their own captured surplus.
GameEnding make_defeat(EndingType type, Player loser, double loser_vp, const GameState& state,
                       std::string description) {
  Player winner = opponent(loser);
  double vp_a = loser == Player::kA ? loser_vp : kTotalVP - loser_vp;
  double vp_b = kTotalVP - vp_a;
  double surplus_a = winner == Player::kA ? state.surplus_captured_a() : 0.0;
  double surplus_b = winner == Player::kB ? state.surplus_captured_b() : 0.0;
  return GameEnding(type, vp_a, vp_b, state.turn(), std::move(description), surplus_a,
                    surplus_b);
}

}  // namespace

GameEnding::GameEnding(EndingType ending_type, double vp_a, double vp_b, int turn,
                       std::string description, double surplus_a, double surplus_b)
    : ending_type_(ending_type),
      vp_a_(vp_a),
      vp_b_(vp_b),
      turn_(turn),
      description_(std::move(description)),
      surplus_a_(surplus_a),
      surplus_b_(surplus_b) {
  if (vp_a < 0 || vp_a > kTotalVP || vp_b < 0 || vp_b > kTotalVP) {
    throw RangeError("GameEnding: VP must be in [0, 100] (got {}, {})", vp_a, vp_b);
  }
  if (ending_type == EndingType::kMutualDestruction) {
    if (vp_a != kMutualDestructionVP || vp_b != kMutualDestructionVP) {
      throw RangeError("GameEnding: mutual destruction must score {} each (got {}, {})",
                       kMutualDestructionVP, vp_a, vp_b);
    }
  } else if (std::abs(vp_a + vp_b - kTotalVP) > kVPSumTolerance) {
    throw RangeError("GameEnding: VP must sum to 100 (got {} + {})", vp_a, vp_b);
  }
  if (surplus_a < 0 || surplus_b < 0) {
    throw RangeError("GameEnding: surplus must be non-negative (got {}, {})", surplus_a,
                     surplus_b);
  }
  if (turn < 1) {
    throw RangeError("GameEnding: turn must be >= 1 (got {})", turn);
  }
}

std::optional<GameEnding> check_deterministic_endings(const GameState& state) {
  if (state.risk_level() >= kMaxRisk) {
    return GameEnding(EndingType::kMutualDestruction, kMutualDestructionVP, kMutualDestructionVP,
                      state.turn(), "Risk reached critical level. Mutual destruction.");
  }
  if (state.position_a() <= kMinPosition) {
    return make_defeat(EndingType::kPositionCollapseA, Player::kA, kPositionCollapseLoserVP,
                       state, "Player A's position collapsed. Total defeat.");
  }
  if (state.position_b() <= kMinPosition) {
    return make_defeat(EndingType::kPositionCollapseB, Player::kB, kPositionCollapseLoserVP,
                       state, "Player B's position collapsed. Total defeat.");
  }
  if (state.resources_a() <= kMinResources) {
    return make_defeat(EndingType::kResourceExhaustionA, Player::kA, kResourceExhaustionLoserVP,
                       state, "Player A exhausted all resources. Defeat.");
  }
  if (state.resources_b() <= kMinResources) {
    return make_defeat(EndingType::kResourceExhaustionB, Player::kB, kResourceExhaustionLoserVP,
                       state, "Player B exhausted all resources. Defeat.");
  }
  return std::nullopt;
}

std::optional<GameEnding> check_crisis_ending(const GameState& state, std::mt19937& prng) {
  if (!check_crisis_termination(state, prng)) return std::nullopt;

  VPSplit vp = resolve_base_vp(state, prng);
  return GameEnding(EndingType::kCrisisTermination, vp.vp_a, vp.vp_b, state.turn(),
                    std::format("Crisis spiraled out of control at Risk {:.1f}.",
                                state.risk_level()),
                    state.surplus_captured_a(), state.surplus_captured_b());
}

std::optional<GameEnding> check_natural_ending(const GameState& state, std::mt19937& prng) {
  if (state.turn() <= state.max_turns()) return std::nullopt;

  VPSplit vp = resolve_base_vp(state, prng);
  return GameEnding(EndingType::kNaturalEnding, vp.vp_a, vp.vp_b, state.turn() - 1,
                    "The crisis reached its natural conclusion.", state.surplus_captured_a(),
                    state.surplus_captured_b());
}

}  // namespace brinksmanship
