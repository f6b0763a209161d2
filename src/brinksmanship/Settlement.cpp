#include "brinksmanship/Settlement.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"

#include <algorithm>
#include <format>

namespace brinksmanship {

VPSplit settlement_vp(const GameState& state) {
  double vp_a = expected_vp(state).vp_a;
  vp_a += (state.cooperation_score() - kDefaultCooperation) * kSettlementCooperationBonus;
  vp_a = std::clamp(vp_a, kSettlementVPMin, kSettlementVPMax);
  return VPSplit{vp_a, kTotalVP - vp_a};
}

SettlementConstraints settlement_constraints(const GameState& state, Player player) {
  double own = state.player(player).position();
  double other = state.player(opponent(player)).position();

  double raw = 50.0 + (own - other) * kOfferPositionFactor +
               (state.cooperation_score() - kDefaultCooperation) * kSettlementCooperationBonus;
  int suggested = std::clamp(static_cast<int>(raw), kOfferMinVP, kOfferMaxVP);

  SettlementConstraints constraints;
  constraints.min_vp = std::max(kOfferMinVP, suggested - kOfferBand);
  constraints.max_vp = std::min(kOfferMaxVP, suggested + kOfferBand);
  constraints.suggested_vp = suggested;
  return constraints;
}

void validate_settlement_offer(int offered_vp, const GameState& state, Player player) {
  SettlementConstraints c = settlement_constraints(state, player);
  if (offered_vp < c.min_vp || offered_vp > c.max_vp) {
    throw ConstraintError("Player {} offer of {} VP is outside the allowed range [{}, {}]",
                          player_name(player), offered_vp, c.min_vp, c.max_vp);
  }
}

std::pair<Player, Player> settlement_roles(const GameState& state) {
  if (state.position_b() > state.position_a()) return {Player::kB, Player::kA};
  return {Player::kA, Player::kB};
}

GameEnding settlement_ending(const GameState& before, const GameState& after) {
  VPSplit vp = settlement_vp(before);
  return GameEnding(EndingType::kSettlement, vp.vp_a, vp.vp_b, before.turn(),
                    std::format("Settlement reached. Player A: {:.1f} VP, Player B: {:.1f} VP",
                                vp.vp_a, vp.vp_b),
                    after.surplus_captured_a(), after.surplus_captured_b());
}

double negotiated_surplus_share(const Action& action_a, const Action& action_b) {
  double asked_by_a = std::clamp(action_a.surplus_share, 0.0, 1.0);
  double left_by_b = 1.0 - std::clamp(action_b.surplus_share, 0.0, 1.0);
  return (asked_by_a + left_by_b) / 2;
}

}  // namespace brinksmanship
