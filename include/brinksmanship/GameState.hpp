#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/Constants.hpp"
#include "brinksmanship/InformationState.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace brinksmanship {

/*
 * One side of the crisis. position and resources saturate to [0, 10] on write; the constructor
 * throws RangeError instead.
 */
class PlayerState {
 public:
  PlayerState(double position = kDefaultPosition, double resources = kDefaultResources);

  double position() const { return position_; }
  double resources() const { return resources_; }
  const std::optional<ActionType>& previous_type() const { return previous_type_; }
  const InformationState& information() const { return information_; }
  InformationState& information() { return information_; }

  void set_position(double x);
  void set_resources(double x);
  void set_previous_type(ActionType t) { previous_type_ = t; }

  bool operator==(const PlayerState&) const = default;

 private:
  double position_;
  double resources_;
  std::optional<ActionType> previous_type_;
  InformationState information_;
};

/*
 * The complete state of one game.
 *
 * Constructors validate every field and throw RangeError. Setters saturate to the field's range,
 * which is how apply_action_result() keeps the state legal.
 *
 * max_turns is fixed at creation and is never shown to players.
 */
class GameState {
 public:
  GameState() = default;
  explicit GameState(int max_turns);
  GameState(const PlayerState& a, const PlayerState& b, double cooperation_score,
            double stability, double risk_level, int turn, int max_turns);

  const PlayerState& player(Player p) const { return p == Player::kA ? player_a_ : player_b_; }
  PlayerState& player(Player p) { return p == Player::kA ? player_a_ : player_b_; }
  const PlayerState& player_a() const { return player_a_; }
  const PlayerState& player_b() const { return player_b_; }
  PlayerState& player_a() { return player_a_; }
  PlayerState& player_b() { return player_b_; }

  double position_a() const { return player_a_.position(); }
  double position_b() const { return player_b_.position(); }
  double resources_a() const { return player_a_.resources(); }
  double resources_b() const { return player_b_.resources(); }

  double cooperation_score() const { return cooperation_score_; }
  double stability() const { return stability_; }
  double risk_level() const { return risk_level_; }
  int turn() const { return turn_; }
  int max_turns() const { return max_turns_; }

  double cooperation_surplus() const { return cooperation_surplus_; }
  double surplus_captured_a() const { return surplus_captured_a_; }
  double surplus_captured_b() const { return surplus_captured_b_; }
  double surplus_captured(Player p) const;
  int cooperation_streak() const { return cooperation_streak_; }

  void set_cooperation_score(double x);
  void set_stability(double x);
  void set_risk_level(double x);
  void set_turn(int turn);  // throws RangeError if turn < 1
  void set_cooperation_surplus(double x);
  void set_surplus_captured(Player p, double x);
  void set_cooperation_streak(int n);

  // 1 for turns 1-4, 2 for turns 5-8, 3 afterwards
  int act() const;
  double act_multiplier() const;

  double base_sigma() const;
  double chaos_factor() const;
  double instability_factor() const;

  // Standard deviation of the final-resolution noise.
  double shared_sigma() const;

  double total_surplus_captured() const { return surplus_captured_a_ + surplus_captured_b_; }

  bool operator==(const GameState&) const = default;

 private:
  PlayerState player_a_;
  PlayerState player_b_;
  double cooperation_score_ = kDefaultCooperation;
  double stability_ = kDefaultStability;
  double risk_level_ = kDefaultRisk;
  int turn_ = 1;
  int max_turns_ = kDefaultMaxTurns;
  double cooperation_surplus_ = 0;
  double surplus_captured_a_ = 0;
  double surplus_captured_b_ = 0;
  int cooperation_streak_ = 0;
};

// The outcome of resolving one turn, before it is applied to the state.
struct ActionResult {
  ActionType action_a = ActionType::kCooperative;
  ActionType action_b = ActionType::kCooperative;
  double position_delta_a = 0;
  double position_delta_b = 0;
  double resource_cost_a = 0;
  double resource_cost_b = 0;
  double risk_delta = 0;
  std::string outcome_code;
  std::string narrative;

  bool a_learns_position = false;
  bool b_learns_position = false;
  bool a_learns_resources = false;
  bool b_learns_resources = false;

  // Set by a mutual settlement: A's share of the cooperation surplus pool.
  std::optional<double> surplus_share_a;

  bool is_mutual_cooperation() const;
  bool is_mutual_defection() const;
};

/*
 * Returns the state that results from applying result to state. Neither argument is modified.
 *
 * Position and risk deltas are scaled by the act multiplier of the pre-update turn. Reveals
 * record the pre-update values at the pre-update turn. The turn counter advances by one.
 */
GameState apply_action_result(const GameState& state, const ActionResult& result);

// cooperation +1 on mutual cooperation, -1 on mutual defection, clamped to [0, 10]
double update_cooperation_score(double current, ActionType a, ActionType b);

/*
 * stability * 0.8 + 1, then +1.5 if neither player switched type, -3.5 if one did, -5.5 if both
 * did. A player with no previous type has not switched. Clamped to [1, 10].
 */
double update_stability(double current, const std::optional<ActionType>& previous_a,
                        ActionType a, const std::optional<ActionType>& previous_b, ActionType b);

/*
 * Applies the cooperation-surplus rules for a standard matrix outcome (CC, CD, DC or DD). Other
 * outcome codes leave state untouched.
 */
void apply_surplus(GameState& state, std::string_view outcome_code);

}  // namespace brinksmanship
