#include "brinksmanship/InformationState.hpp"

#include "brinksmanship/Constants.hpp"

#include <algorithm>

namespace brinksmanship {

inline Estimate InformationState::estimate_position(int current_turn) const {
  return estimate(known_position_, current_turn);
}

inline Estimate InformationState::estimate_resources(int current_turn) const {
  return estimate(known_resources_, current_turn);
}

inline Estimate InformationState::estimate(const std::optional<Observation>& obs,
                                           int current_turn) {
  if (!obs) return Estimate{kUnknownCenter, kMaxUncertainty};

  int elapsed = std::max(0, current_turn - obs->observed_turn);
  double radius = std::min(elapsed * kUncertaintyPerTurn, kMaxUncertainty);
  return Estimate{obs->value, radius};
}

}  // namespace brinksmanship
