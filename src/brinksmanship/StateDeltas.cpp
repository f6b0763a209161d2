#include "brinksmanship/StateDeltas.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"

#include <cmath>

namespace brinksmanship {

namespace {

void check_range(const char* name, double value, double lo, double hi) {
  if (value < lo || value > hi) {
    throw RangeError("StateDeltas: {} must be in [{}, {}] (got {})", name, lo, hi, value);
  }
}

}  // namespace

StateDeltas::StateDeltas(double pos_a, double pos_b, double res_cost_a, double res_cost_b,
                         double risk_delta)
    : pos_a_(pos_a),
      pos_b_(pos_b),
      res_cost_a_(res_cost_a),
      res_cost_b_(res_cost_b),
      risk_delta_(risk_delta) {
  check_range("pos_a", pos_a, -kMaxPositionDelta, kMaxPositionDelta);
  check_range("pos_b", pos_b, -kMaxPositionDelta, kMaxPositionDelta);
  check_range("res_cost_a", res_cost_a, 0.0, kMaxResourceCost);
  check_range("res_cost_b", res_cost_b, 0.0, kMaxResourceCost);
  check_range("risk_delta", risk_delta, kMinRiskDelta, kMaxRiskDelta);
  if (std::abs(pos_a + pos_b) > kMaxNetPositionDelta + 1e-9) {
    throw RangeError("StateDeltas: |pos_a + pos_b| must be <= {} (got {} + {})",
                     kMaxNetPositionDelta, pos_a, pos_b);
  }
}

}  // namespace brinksmanship
