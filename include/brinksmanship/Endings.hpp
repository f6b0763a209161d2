#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/GameState.hpp"

#include <optional>
#include <random>
#include <string>

namespace brinksmanship {

/*
 * How a game ended, and its score.
 *
 * vp_a and vp_b are the base split: each in [0, 100], summing to 100, except for mutual
 * destruction where both are exactly 20. The constructor throws RangeError otherwise.
 *
 * surplus_a and surplus_b are the captured cooperation surplus paid on top of the base split.
 */
class GameEnding {
 public:
  GameEnding(EndingType ending_type, double vp_a, double vp_b, int turn, std::string description,
             double surplus_a = 0, double surplus_b = 0);

  EndingType ending_type() const { return ending_type_; }
  double vp_a() const { return vp_a_; }
  double vp_b() const { return vp_b_; }
  int turn() const { return turn_; }
  const std::string& description() const { return description_; }
  double surplus_a() const { return surplus_a_; }
  double surplus_b() const { return surplus_b_; }

  double total_a() const { return vp_a_ + surplus_a_; }
  double total_b() const { return vp_b_ + surplus_b_; }

  bool operator==(const GameEnding&) const = default;

 private:
  EndingType ending_type_;
  double vp_a_;
  double vp_b_;
  int turn_;
  std::string description_;
  double surplus_a_;
  double surplus_b_;
};

/*
 * Checks, in order: risk at maximum (mutual destruction), A's position at 0, B's position at 0,
 * A's resources at 0, B's resources at 0. The first match wins.
 *
 * The winner of a collapse or exhaustion keeps their captured surplus; the loser forfeits theirs.
 * Mutual destruction forfeits everything.
 */
std::optional<GameEnding> check_deterministic_endings(const GameState& state);

// Draws from prng only when the crisis-termination probability is positive.
std::optional<GameEnding> check_crisis_ending(const GameState& state, std::mt19937& prng);

// Ends the game by final resolution once state.turn() > state.max_turns().
std::optional<GameEnding> check_natural_ending(const GameState& state, std::mt19937& prng);

}  // namespace brinksmanship
