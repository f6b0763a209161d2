#pragma once

#include <boost/json.hpp>

namespace brinksmanship {

/*
 * The raw payoff parameters from which a PayoffMatrix is built. Each matrix type reads only the
 * fields it needs; the rest are ignored.
 *
 * The shared contract (scale > 0, non-negative weights summing to 1) is checked by validate().
 * The ordinal constraints of each matrix type are checked by brinksmanship::validate().
 */
struct MatrixParameters {
  double scale = 1.0;
  double position_weight = 0.6;
  double resource_weight = 0.2;
  double risk_weight = 0.2;

  // Prisoner's dilemma family
  double temptation = 1.5;
  double reward = 1.0;
  double punishment = 0.3;
  double sucker = 0.0;

  // Chicken
  double swerve_payoff = 0.5;
  double crash_payoff = -1.0;

  // Coordination
  double coordination_bonus = 1.0;
  double miscoordination_penalty = 0.0;
  double preference_a = 1.2;
  double preference_b = 1.2;

  // Stag hunt
  double stag_payoff = 2.0;
  double hare_temptation = 1.5;
  double hare_safe = 1.0;
  double stag_fail = 0.0;

  // Volunteer's dilemma
  double volunteer_cost = 0.3;
  double free_ride_bonus = 0.5;
  double disaster_penalty = 1.0;

  // Inspection game
  double inspection_cost = 0.3;
  double cheat_gain = 0.5;
  double caught_penalty = 1.0;
  double loss_if_exploited = 0.7;

  // Throws ConstraintError
  void validate() const;

  boost::json::object to_json() const;

  /*
   * Reads the fields present in obj on top of base. Throws ScenarioError on an unknown key or a
   * non-numeric value.
   */
  static MatrixParameters from_json(const boost::json::object& obj,
                                    const MatrixParameters& base = MatrixParameters());

  bool operator==(const MatrixParameters&) const = default;
};

}  // namespace brinksmanship
