#include "brinksmanship/GameState.hpp"

#include "brinksmanship/Exceptions.hpp"

#include <algorithm>

namespace brinksmanship {

namespace {

void check_range(const char* name, double value, double lo, double hi) {
  if (value < lo || value > hi) {
    throw RangeError("{} must be in [{}, {}] (got {})", name, lo, hi, value);
  }
}

}  // namespace

PlayerState::PlayerState(double position, double resources)
    : position_(position), resources_(resources) {
  check_range("position", position, kMinPosition, kMaxPosition);
  check_range("resources", resources, kMinResources, kMaxResources);
}

void PlayerState::set_position(double x) {
  position_ = std::clamp(x, kMinPosition, kMaxPosition);
}

void PlayerState::set_resources(double x) {
  resources_ = std::clamp(x, kMinResources, kMaxResources);
}

GameState::GameState(int max_turns) : max_turns_(max_turns) {
  check_range("max_turns", max_turns, kMinMaxTurns, kMaxMaxTurns);
}

GameState::GameState(const PlayerState& a, const PlayerState& b, double cooperation_score,
                     double stability, double risk_level, int turn, int max_turns)
    : player_a_(a),
      player_b_(b),
      cooperation_score_(cooperation_score),
      stability_(stability),
      risk_level_(risk_level),
      turn_(turn),
      max_turns_(max_turns) {
  check_range("cooperation_score", cooperation_score, kMinCooperation, kMaxCooperation);
  check_range("stability", stability, kMinStability, kMaxStability);
  check_range("risk_level", risk_level, kMinRisk, kMaxRisk);
  if (turn < 1) throw RangeError("turn must be >= 1 (got {})", turn);
  check_range("max_turns", max_turns, kMinMaxTurns, kMaxMaxTurns);
}

double GameState::surplus_captured(Player p) const {
  return p == Player::kA ? surplus_captured_a_ : surplus_captured_b_;
}

void GameState::set_cooperation_score(double x) {
  cooperation_score_ = std::clamp(x, kMinCooperation, kMaxCooperation);
}

void GameState::set_stability(double x) {
  stability_ = std::clamp(x, kMinStability, kMaxStability);
}

void GameState::set_risk_level(double x) { risk_level_ = std::clamp(x, kMinRisk, kMaxRisk); }

void GameState::set_turn(int turn) {
  if (turn < 1) throw RangeError("turn must be >= 1 (got {})", turn);
  turn_ = turn;
}

void GameState::set_cooperation_surplus(double x) { cooperation_surplus_ = std::max(0.0, x); }

void GameState::set_surplus_captured(Player p, double x) {
  (p == Player::kA ? surplus_captured_a_ : surplus_captured_b_) = std::max(0.0, x);
}

void GameState::set_cooperation_streak(int n) { cooperation_streak_ = std::max(0, n); }

int GameState::act() const {
  if (turn_ <= kLastTurnOfActI) return 1;
  if (turn_ <= kLastTurnOfActII) return 2;
  return 3;
}

double GameState::act_multiplier() const { return kActMultipliers[act() - 1]; }

double GameState::base_sigma() const { return kBaseSigma + kRiskSigmaFactor * risk_level_; }

double GameState::chaos_factor() const {
  return kChaosBase - cooperation_score_ / kChaosCooperationDivisor;
}

double GameState::instability_factor() const {
  return 1.0 + (kMaxStability - stability_) / kInstabilityDivisor;
}

double GameState::shared_sigma() const {
  return base_sigma() * chaos_factor() * instability_factor() * act_multiplier();
}

bool ActionResult::is_mutual_cooperation() const {
  return action_a == ActionType::kCooperative && action_b == ActionType::kCooperative;
}

bool ActionResult::is_mutual_defection() const {
  return action_a == ActionType::kCompetitive && action_b == ActionType::kCompetitive;
}

double update_cooperation_score(double current, ActionType a, ActionType b) {
  double next = current;
  if (a == ActionType::kCooperative && b == ActionType::kCooperative) {
    next += 1.0;
  } else if (a == ActionType::kCompetitive && b == ActionType::kCompetitive) {
    next -= 1.0;
  }
  return std::clamp(next, kMinCooperation, kMaxCooperation);
}

double update_stability(double current, const std::optional<ActionType>& previous_a,
                        ActionType a, const std::optional<ActionType>& previous_b, ActionType b) {
  int switches = 0;
  if (previous_a && *previous_a != a) switches++;
  if (previous_b && *previous_b != b) switches++;

  double next = current * kStabilityDecay + kStabilityPull;
  switch (switches) {
    case 0:
      next += kConsistencyBonus;
      break;
    case 1:
      next -= kOneSwitchPenalty;
      break;
    default:
      next -= kTwoSwitchPenalty;
      break;
  }
  return std::clamp(next, kMinStability, kMaxStability);
}

void apply_surplus(GameState& state, std::string_view outcome_code) {
  double pool = state.cooperation_surplus();

  if (outcome_code == kOutcomeCC) {
    double created = kSurplusBase * (1.0 + kSurplusStreakBonus * state.cooperation_streak());
    state.set_cooperation_surplus(pool + created);
    state.set_cooperation_streak(state.cooperation_streak() + 1);
  } else if (outcome_code == kOutcomeCD || outcome_code == kOutcomeDC) {
    // The defector captures part of the pool
    Player defector = outcome_code == kOutcomeCD ? Player::kB : Player::kA;
    double captured = pool * kCaptureRate;
    state.set_surplus_captured(defector, state.surplus_captured(defector) + captured);
    state.set_cooperation_surplus(pool - captured);
    state.set_cooperation_streak(0);
  } else if (outcome_code == kOutcomeDD) {
    state.set_cooperation_surplus(pool * (1.0 - kDDBurnRate));
    state.set_cooperation_streak(0);
  }
}

GameState apply_action_result(const GameState& state, const ActionResult& result) {
  GameState next = state;
  const PlayerState& a = state.player_a();
  const PlayerState& b = state.player_b();
  const double mult = state.act_multiplier();
  const int turn = state.turn();

  next.player_a().set_position(a.position() + result.position_delta_a * mult);
  next.player_b().set_position(b.position() + result.position_delta_b * mult);
  next.player_a().set_resources(a.resources() - result.resource_cost_a);
  next.player_b().set_resources(b.resources() - result.resource_cost_b);
  next.set_risk_level(state.risk_level() + result.risk_delta * mult);

  next.set_cooperation_score(
    update_cooperation_score(state.cooperation_score(), result.action_a, result.action_b));
  next.set_stability(update_stability(state.stability(), a.previous_type(), result.action_a,
                                      b.previous_type(), result.action_b));

  if (result.a_learns_position) {
    next.player_a().information().observe_position(b.position(), turn);
  }
  if (result.b_learns_position) {
    next.player_b().information().observe_position(a.position(), turn);
  }
  if (result.a_learns_resources) {
    next.player_a().information().observe_resources(b.resources(), turn);
  }
  if (result.b_learns_resources) {
    next.player_b().information().observe_resources(a.resources(), turn);
  }

  apply_surplus(next, result.outcome_code);
  if (result.surplus_share_a) {
    double pool = next.cooperation_surplus();
    double share_a = std::clamp(*result.surplus_share_a, 0.0, 1.0);
    next.set_surplus_captured(Player::kA, next.surplus_captured_a() + pool * share_a);
    next.set_surplus_captured(Player::kB, next.surplus_captured_b() + pool * (1.0 - share_a));
    next.set_cooperation_surplus(0);
  }

  next.player_a().set_previous_type(result.action_a);
  next.player_b().set_previous_type(result.action_b);
  next.set_turn(turn + 1);
  return next;
}

}  // namespace brinksmanship
