#include "brinksmanship/MatrixConstructors.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"
#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace brinksmanship {

namespace {

using labels_t = PayoffMatrix::labels_t;

// One raw cell: ordinal payoffs plus the base risk that make_deltas() scales.
struct Cell {
  double a;
  double b;
  double base_risk;
};

OutcomePayoffs make_outcome(const Cell& cell, const MatrixParameters& params) {
  return OutcomePayoffs{cell.a, cell.b, make_deltas(cell.a, cell.b, cell.base_risk, params)};
}

PayoffMatrix make_matrix(MatrixType type, const MatrixParameters& params, const Cell& cc,
                         const Cell& cd, const Cell& dc, const Cell& dd,
                         const labels_t& row_labels, const labels_t& col_labels) {
  return PayoffMatrix(type, make_outcome(cc, params), make_outcome(cd, params),
                      make_outcome(dc, params), make_outcome(dd, params), row_labels,
                      col_labels);
}

PayoffMatrix make_matrix(MatrixType type, const MatrixParameters& params, const Cell& cc,
                         const Cell& cd, const Cell& dc, const Cell& dd, const labels_t& labels) {
  return make_matrix(type, params, cc, cd, dc, dd, labels, labels);
}

void validate_pd_family(const char* name, const MatrixParameters& p) {
  const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
  if (!(T > R && R > P && P > S)) {
    throw ConstraintError("{} requires T > R > P > S, got T={}, R={}, P={}, S={}", name, T, R, P,
                          S);
  }
}

}  // namespace

const std::vector<MatrixType>& all_matrix_types() {
  static const std::vector<MatrixType> types = [] {
    std::vector<MatrixType> v;
    for (MatrixType t : magic_enum::enum_values<MatrixType>()) v.push_back(t);
    return v;
  }();
  return types;
}

const std::vector<std::pair<std::string, MatrixType>>& matrix_type_aliases() {
  static const std::vector<std::pair<std::string, MatrixType>> aliases = {
    {"inspection", MatrixType::kInspectionGame},
    {"inspect", MatrixType::kInspectionGame},
    {"recon", MatrixType::kReconnaissance},
    {"pd", MatrixType::kPrisonersDilemma},
    {"prisoner_dilemma", MatrixType::kPrisonersDilemma},
    {"bos", MatrixType::kBattleOfSexes},
    {"battle", MatrixType::kBattleOfSexes},
    {"stag", MatrixType::kStagHunt},
    {"trust", MatrixType::kStagHunt},
    {"trust_game", MatrixType::kStagHunt},
    {"coord", MatrixType::kPureCoordination},
    {"coordination", MatrixType::kPureCoordination},
    {"security", MatrixType::kSecurityDilemma},
  };
  return aliases;
}

MatrixType parse_matrix_type(const std::string& tag) {
  std::string normalized = util::to_lower(tag);
  normalized = util::replace_chars(normalized, "- ", '_');

  for (const auto& [alias, type] : matrix_type_aliases()) {
    if (normalized == alias) return type;
  }

  // Enum-style names such as "PRISONERS_DILEMMA" lowercase to the canonical tag above.
  auto type = enum_from_tag<MatrixType>(normalized);
  if (type) return *type;

  std::vector<std::string> valid;
  for (MatrixType t : all_matrix_types()) valid.push_back(matrix_type_tag(t));
  std::vector<std::string> aliases;
  for (const auto& [alias, t] : matrix_type_aliases()) {
    aliases.push_back(alias + " (" + matrix_type_tag(t) + ")");
  }
  throw UnknownTagError("Unknown matrix type: '{}'. Valid types: {}. Aliases: {}", tag,
                        util::grammatically_join(valid, "and"),
                        util::grammatically_join(aliases, "and"));
}

MatrixParameters default_params(MatrixType type) {
  MatrixParameters p;
  switch (type) {
    case MatrixType::kPrisonersDilemma:
    case MatrixType::kWarOfAttrition:
    case MatrixType::kSecurityDilemma:
      p.temptation = 1.5;
      p.reward = 1.0;
      p.punishment = 0.3;
      p.sucker = 0.0;
      break;
    case MatrixType::kDeadlock:
      p.temptation = 1.5;
      p.punishment = 1.0;
      p.reward = 0.5;
      p.sucker = 0.0;
      break;
    case MatrixType::kHarmony:
      p.reward = 1.5;
      p.temptation = 1.0;
      p.sucker = 0.5;
      p.punishment = 0.0;
      break;
    case MatrixType::kChicken:
      p.temptation = 1.5;
      p.reward = 1.0;
      p.swerve_payoff = 0.5;
      p.crash_payoff = -1.0;
      break;
    case MatrixType::kVolunteersDilemma:
      p.reward = 1.0;
      p.volunteer_cost = 0.3;
      p.free_ride_bonus = 0.5;
      p.disaster_penalty = 1.0;
      break;
    case MatrixType::kPureCoordination:
      p.coordination_bonus = 1.0;
      p.miscoordination_penalty = 0.0;
      break;
    case MatrixType::kStagHunt:
      p.stag_payoff = 2.0;
      p.hare_temptation = 1.5;
      p.hare_safe = 1.0;
      p.stag_fail = 0.0;
      break;
    case MatrixType::kBattleOfSexes:
      p.coordination_bonus = 1.0;
      p.miscoordination_penalty = 0.0;
      p.preference_a = 1.5;
      p.preference_b = 1.3;
      break;
    case MatrixType::kLeader:
      p.temptation = 2.0;
      p.reward = 1.5;
      p.sucker = 0.5;
      p.punishment = 0.0;
      break;
    case MatrixType::kMatchingPennies:
    case MatrixType::kReconnaissance:
      p.scale = 1.0;
      break;
    case MatrixType::kInspectionGame:
      p.inspection_cost = 0.3;
      p.cheat_gain = 0.5;
      p.caught_penalty = 1.0;
      p.loss_if_exploited = 0.7;
      break;
  }
  return p;
}

void validate(MatrixType type, const MatrixParameters& p) {
  p.validate();

  switch (type) {
    case MatrixType::kPrisonersDilemma:
      validate_pd_family("Prisoner's Dilemma", p);
      break;
    case MatrixType::kSecurityDilemma:
      validate_pd_family("Security Dilemma", p);
      break;
    case MatrixType::kDeadlock: {
      const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
      if (!(T > P && P > R && R > S)) {
        throw ConstraintError("Deadlock requires T > P > R > S, got T={}, P={}, R={}, S={}", T,
                              P, R, S);
      }
      break;
    }
    case MatrixType::kHarmony: {
      const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
      if (!(R > T && T > S && S > P)) {
        throw ConstraintError("Harmony requires R > T > S > P, got R={}, T={}, S={}, P={}", R, T,
                              S, P);
      }
      break;
    }
    case MatrixType::kChicken: {
      const double T = p.temptation, R = p.reward;
      const double sw = p.swerve_payoff, crash = p.crash_payoff;
      if (!(T > R && R > sw && sw > crash)) {
        throw ConstraintError(
          "Chicken requires T > R > swerve > crash, got T={}, R={}, swerve={}, crash={}", T, R,
          sw, crash);
      }
      break;
    }
    case MatrixType::kVolunteersDilemma: {
      const double free_ride = p.reward + p.free_ride_bonus;
      const double volunteer = p.reward - p.volunteer_cost;
      const double disaster = -p.disaster_penalty;
      if (!(free_ride > volunteer && volunteer > disaster)) {
        throw ConstraintError(
          "Volunteer's Dilemma requires free_ride > volunteer > disaster, got {} > {} > {}",
          free_ride, volunteer, disaster);
      }
      break;
    }
    case MatrixType::kWarOfAttrition: {
      const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
      if (!(T > R && R > P && T > S)) {
        throw ConstraintError(
          "War of Attrition requires T > R, R > P and T > S, got T={}, R={}, P={}, S={}", T, R,
          P, S);
      }
      break;
    }
    case MatrixType::kPureCoordination:
      if (!(p.coordination_bonus > p.miscoordination_penalty)) {
        throw ConstraintError(
          "Pure Coordination requires coordination_bonus > miscoordination_penalty, got {} <= {}",
          p.coordination_bonus, p.miscoordination_penalty);
      }
      break;
    case MatrixType::kStagHunt: {
      const double stag = p.stag_payoff, ht = p.hare_temptation;
      const double safe = p.hare_safe, fail = p.stag_fail;
      if (!(stag > ht && ht > safe && safe > fail)) {
        throw ConstraintError(
          "Stag Hunt requires stag > hare_temptation > hare_safe > stag_fail, got {}, {}, {}, {}",
          stag, ht, safe, fail);
      }
      break;
    }
    case MatrixType::kBattleOfSexes:
      if (!(p.coordination_bonus > p.miscoordination_penalty)) {
        throw ConstraintError(
          "Battle of the Sexes requires coordination_bonus > miscoordination_penalty, got {} <= "
          "{}",
          p.coordination_bonus, p.miscoordination_penalty);
      }
      if (!(p.preference_a > 1.0 && p.preference_b > 1.0)) {
        throw ConstraintError(
          "Battle of the Sexes requires preference_a > 1 and preference_b > 1, got {} and {}",
          p.preference_a, p.preference_b);
      }
      break;
    case MatrixType::kLeader: {
      const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
      if (!(T > R && R > S && S > P)) {
        throw ConstraintError("Leader requires T > R > S > P, got T={}, R={}, S={}, P={}", T, R,
                              S, P);
      }
      break;
    }
    case MatrixType::kInspectionGame:
      if (!(p.loss_if_exploited > p.inspection_cost)) {
        throw ConstraintError(
          "Inspection Game requires loss_if_exploited > inspection_cost, got {} <= {}",
          p.loss_if_exploited, p.inspection_cost);
      }
      if (!(p.caught_penalty > p.cheat_gain && p.cheat_gain > 0)) {
        throw ConstraintError(
          "Inspection Game requires caught_penalty > cheat_gain > 0, got {} and {}",
          p.caught_penalty, p.cheat_gain);
      }
      break;
    case MatrixType::kMatchingPennies:
    case MatrixType::kReconnaissance:
      break;
  }
}

StateDeltas make_deltas(double payoff_a, double payoff_b, double base_risk,
                        const MatrixParameters& params) {
  double norm_a = payoff_a * params.scale;
  double norm_b = payoff_b * params.scale;

  double d = (norm_a - norm_b) * params.position_weight * 0.5;
  double pos_a = std::clamp(d, -kMaxPositionDelta, kMaxPositionDelta);
  double pos_b = std::clamp(-d, -kMaxPositionDelta, kMaxPositionDelta);

  double res_cost_a = std::clamp(-std::min(0.0, norm_a) * params.resource_weight, 0.0,
                                 kMaxResourceCost);
  double res_cost_b = std::clamp(-std::min(0.0, norm_b) * params.resource_weight, 0.0,
                                 kMaxResourceCost);

  double risk =
    std::clamp(base_risk * params.risk_weight * kRiskWeightScale, kMinRiskDelta, kMaxRiskDelta);

  return StateDeltas(pos_a, pos_b, res_cost_a, res_cost_b, risk);
}

PayoffMatrix build(MatrixType type, const MatrixParameters& p) {
  validate(type, p);

  const double T = p.temptation, R = p.reward, P = p.punishment, S = p.sucker;
  const double m = p.coordination_bonus, x = p.miscoordination_penalty;
  const double k = p.scale;

  switch (type) {
    case MatrixType::kPrisonersDilemma:
      return make_matrix(type, p, {R, R, -0.5}, {S, T, 0.5}, {T, S, 0.5}, {P, P, 1.0},
                         {"Cooperate", "Defect"});
    case MatrixType::kSecurityDilemma:
      return make_matrix(type, p, {R, R, -0.5}, {S, T, 0.5}, {T, S, 0.5}, {P, P, 1.0},
                         {"Disarm", "Arm"});
    case MatrixType::kDeadlock:
      return make_matrix(type, p, {R, R, 0.0}, {S, T, 0.5}, {T, S, 0.5}, {P, P, 0.5},
                         {"Cooperate", "Defect"});
    case MatrixType::kHarmony:
      return make_matrix(type, p, {R, R, -0.5}, {S, T, 0.0}, {T, S, 0.0}, {P, P, 0.5},
                         {"Cooperate", "Defect"});
    case MatrixType::kChicken: {
      const double sw = p.swerve_payoff, crash = p.crash_payoff;
      return make_matrix(type, p, {R, R, -0.5}, {sw, T, 0.5}, {T, sw, 0.5},
                         {crash, crash, 2.0}, {"Dove", "Hawk"});
    }
    case MatrixType::kVolunteersDilemma: {
      const double w = R - p.volunteer_cost;
      const double f = R + p.free_ride_bonus;
      const double d = -p.disaster_penalty;
      return make_matrix(type, p, {w, w, -0.5}, {w, f, 0.0}, {f, w, 0.0}, {d, d, 1.5},
                         {"Volunteer", "Abstain"});
    }
    case MatrixType::kWarOfAttrition:
      return make_matrix(type, p, {P, P, 1.0}, {T, S, 0.0}, {S, T, 0.0}, {R, R, -0.5},
                         {"Continue", "Quit"});
    case MatrixType::kPureCoordination:
      return make_matrix(type, p, {m, m, -0.3}, {x, x, 0.3}, {x, x, 0.3}, {m, m, -0.3},
                         {"A", "B"});
    case MatrixType::kStagHunt: {
      const double stag = p.stag_payoff, ht = p.hare_temptation;
      const double safe = p.hare_safe, fail = p.stag_fail;
      return make_matrix(type, p, {stag, stag, -0.5}, {fail, ht, 0.3}, {ht, fail, 0.3},
                         {safe, safe, 0.0}, {"Stag", "Hare"});
    }
    case MatrixType::kBattleOfSexes:
      return make_matrix(type, p, {m * p.preference_a, m, -0.3}, {x, x, 0.5}, {x, x, 0.5},
                         {m, m * p.preference_b, -0.3}, {"Opera", "Football"});
    case MatrixType::kLeader:
      return make_matrix(type, p, {S, S, 0.3}, {R, T, -0.3}, {T, R, -0.3}, {P, P, 1.0},
                         {"Follow", "Lead"});
    case MatrixType::kMatchingPennies:
      return make_matrix(type, p, {k, -k, 0.0}, {-k, k, 0.0}, {-k, k, 0.0}, {k, -k, 0.0},
                         {"Heads", "Tails"});
    case MatrixType::kInspectionGame: {
      const double c = p.inspection_cost, pen = p.caught_penalty;
      return make_matrix(type, p, {-c, 0.0, 0.0}, {pen / 2 - c, -pen, 1.0}, {0.0, 0.0, 0.0},
                         {-p.loss_if_exploited, p.cheat_gain, 0.5}, {"Inspect", "Trust"},
                         {"Comply", "Cheat"});
    }
    case MatrixType::kReconnaissance: {
      // Information game: payoffs are ordinal only, the state effect is the reveal itself.
      StateDeltas none;
      return PayoffMatrix(type, OutcomePayoffs{-k, k, StateDeltas(0, 0, 0, 0, 0.5)},
                          OutcomePayoffs{k, -k, none}, OutcomePayoffs{0, 0, none},
                          OutcomePayoffs{-k, k, none}, {"Probe", "Mask"},
                          {"Vigilant", "Project"});
    }
  }
  throw util::Exception("build(): unhandled matrix type {}", static_cast<int>(type));
}

}  // namespace brinksmanship
