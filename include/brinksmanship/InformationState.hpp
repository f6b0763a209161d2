#pragma once

#include <optional>

namespace brinksmanship {

// A value one player learned about the other, and the turn it was learned on.
struct Observation {
  double value;
  int observed_turn;

  bool operator==(const Observation&) const = default;
};

// A point estimate and the half-width of the interval around it.
struct Estimate {
  double center;
  double radius;

  bool operator==(const Estimate&) const = default;
};

/*
 * What one player knows about the opponent's position and resources.
 *
 * An empty optional means the value has never been observed. Observed values go stale: the
 * uncertainty radius grows by 0.8 per turn since the observation, capped at 5.
 */
class InformationState {
 public:
  const std::optional<Observation>& known_position() const { return known_position_; }
  const std::optional<Observation>& known_resources() const { return known_resources_; }

  void observe_position(double value, int turn) { known_position_ = Observation{value, turn}; }
  void observe_resources(double value, int turn) { known_resources_ = Observation{value, turn}; }

  Estimate estimate_position(int current_turn) const;
  Estimate estimate_resources(int current_turn) const;

  bool operator==(const InformationState&) const = default;

 private:
  static Estimate estimate(const std::optional<Observation>& obs, int current_turn);

  std::optional<Observation> known_position_;
  std::optional<Observation> known_resources_;
};

}  // namespace brinksmanship

#include "inline/brinksmanship/InformationState.inl"
