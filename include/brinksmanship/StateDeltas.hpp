#pragma once

namespace brinksmanship {

/*
 * The state changes produced by one outcome cell of a payoff matrix.
 *
 * Immutable. The constructor throws RangeError if any component lies outside its bounds:
 *
 * pos_a, pos_b in [-1.5, 1.5]
 * res_cost_a, res_cost_b in [0, 1]
 * risk_delta in [-1, 2]
 * |pos_a + pos_b| <= 0.5
 */
class StateDeltas {
 public:
  StateDeltas() = default;
  StateDeltas(double pos_a, double pos_b, double res_cost_a, double res_cost_b,
              double risk_delta);

  double pos_a() const { return pos_a_; }
  double pos_b() const { return pos_b_; }
  double res_cost_a() const { return res_cost_a_; }
  double res_cost_b() const { return res_cost_b_; }
  double risk_delta() const { return risk_delta_; }

  bool operator==(const StateDeltas&) const = default;

 private:
  double pos_a_ = 0;
  double pos_b_ = 0;
  double res_cost_a_ = 0;
  double res_cost_b_ = 0;
  double risk_delta_ = 0;
};

// Ordinal payoffs for one matrix cell, together with its state deltas.
struct OutcomePayoffs {
  double payoff_a = 0;
  double payoff_b = 0;
  StateDeltas deltas;

  bool operator==(const OutcomePayoffs&) const = default;
};

}  // namespace brinksmanship
