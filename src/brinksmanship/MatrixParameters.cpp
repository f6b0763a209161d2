#include "brinksmanship/MatrixParameters.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"

#include <cmath>
#include <string_view>

namespace brinksmanship {

namespace {

struct Field {
  const char* name;
  double MatrixParameters::*member;
};

constexpr Field kFields[] = {
  {"scale", &MatrixParameters::scale},
  {"position_weight", &MatrixParameters::position_weight},
  {"resource_weight", &MatrixParameters::resource_weight},
  {"risk_weight", &MatrixParameters::risk_weight},
  {"temptation", &MatrixParameters::temptation},
  {"reward", &MatrixParameters::reward},
  {"punishment", &MatrixParameters::punishment},
  {"sucker", &MatrixParameters::sucker},
  {"swerve_payoff", &MatrixParameters::swerve_payoff},
  {"crash_payoff", &MatrixParameters::crash_payoff},
  {"coordination_bonus", &MatrixParameters::coordination_bonus},
  {"miscoordination_penalty", &MatrixParameters::miscoordination_penalty},
  {"preference_a", &MatrixParameters::preference_a},
  {"preference_b", &MatrixParameters::preference_b},
  {"stag_payoff", &MatrixParameters::stag_payoff},
  {"hare_temptation", &MatrixParameters::hare_temptation},
  {"hare_safe", &MatrixParameters::hare_safe},
  {"stag_fail", &MatrixParameters::stag_fail},
  {"volunteer_cost", &MatrixParameters::volunteer_cost},
  {"free_ride_bonus", &MatrixParameters::free_ride_bonus},
  {"disaster_penalty", &MatrixParameters::disaster_penalty},
  {"inspection_cost", &MatrixParameters::inspection_cost},
  {"cheat_gain", &MatrixParameters::cheat_gain},
  {"caught_penalty", &MatrixParameters::caught_penalty},
  {"loss_if_exploited", &MatrixParameters::loss_if_exploited},
};

const Field* find_field(std::string_view name) {
  for (const Field& field : kFields) {
    if (name == field.name) return &field;
  }
  return nullptr;
}

}  // namespace

void MatrixParameters::validate() const {
  if (scale <= 0) {
    throw ConstraintError("scale must be positive (got {})", scale);
  }
  if (position_weight < 0 || resource_weight < 0 || risk_weight < 0) {
    throw ConstraintError("weights must be non-negative (got position={} resource={} risk={})",
                          position_weight, resource_weight, risk_weight);
  }
  double sum = position_weight + resource_weight + risk_weight;
  if (std::abs(sum - 1.0) > kWeightSumTolerance) {
    throw ConstraintError("weights must sum to 1.0 (got {})", sum);
  }
}

boost::json::object MatrixParameters::to_json() const {
  boost::json::object obj;
  for (const Field& field : kFields) {
    obj[field.name] = this->*field.member;
  }
  return obj;
}

MatrixParameters MatrixParameters::from_json(const boost::json::object& obj,
                                             const MatrixParameters& base) {
  MatrixParameters params = base;
  for (const auto& kv : obj) {
    std::string_view key = kv.key();
    const Field* field = find_field(key);
    if (!field) {
      throw ScenarioError("Unknown matrix parameter: {}", key);
    }
    if (!kv.value().is_number()) {
      throw ScenarioError("Matrix parameter {} must be a number", key);
    }
    params.*(field->member) = kv.value().to_number<double>();
  }
  return params;
}

}  // namespace brinksmanship
