#include "brinksmanship/Resolution.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Settlement.hpp"

#include <format>
#include <string>

namespace brinksmanship {

namespace {

std::string default_matrix_narrative(const std::string& code, const PayoffMatrix& matrix) {
  const auto& rows = matrix.row_labels();
  const auto& cols = matrix.col_labels();
  if (code == kOutcomeCC) {
    return std::format("Both sides chose cooperation. {} met {}.", rows[0], cols[0]);
  } else if (code == kOutcomeCD) {
    return std::format("You cooperated while your opponent competed. {} against {}.", rows[0],
                       cols[1]);
  } else if (code == kOutcomeDC) {
    return std::format("You competed while your opponent cooperated. {} against {}.", rows[1],
                       cols[0]);
  }
  return std::format("Both sides chose competition. {} met {}.", rows[1], cols[1]);
}

ActionResult make_result(const Action& action_a, const Action& action_b, const char* code) {
  ActionResult result;
  result.action_a = action_a.type;
  result.action_b = action_b.type;
  result.outcome_code = code;
  return result;
}

}  // namespace

ResolutionMode resolution_mode(const Action& action_a, const Action& action_b) {
  auto either = [&](ActionCategory c) {
    return action_a.category == c || action_b.category == c;
  };
  if (either(ActionCategory::kSettlement)) return ResolutionMode::kSettlement;
  if (either(ActionCategory::kReconnaissance)) return ResolutionMode::kReconnaissance;
  if (either(ActionCategory::kInspection)) return ResolutionMode::kInspection;
  return ResolutionMode::kMatrix;
}

ReconOutcome reconnaissance_outcome(ReconChoice choice, ReconResponse response) {
  ReconOutcome outcome{false, false, false};
  if (choice == ReconChoice::kProbe) {
    if (response == ReconResponse::kVigilant) {
      outcome.detected = true;
    } else {
      outcome.initiator_learns_position = true;
    }
  } else if (response == ReconResponse::kProject) {
    outcome.responder_learns_position = true;
  }
  return outcome;
}

ActionResult resolve_matrix(const GameState& state, const Action& action_a,
                            const Action& action_b, const TurnConfiguration& config) {
  PayoffMatrix matrix = config.build_matrix();
  int row = action_a.is_cooperative() ? 0 : 1;
  int col = action_b.is_cooperative() ? 0 : 1;
  const OutcomePayoffs& outcome = matrix.outcome(row, col);
  const StateDeltas& deltas = outcome.deltas;

  std::string code{outcome_char(action_a.type), outcome_char(action_b.type)};
  ActionResult result = make_result(action_a, action_b, code.c_str());
  result.position_delta_a = deltas.pos_a();
  result.position_delta_b = deltas.pos_b();
  result.resource_cost_a = deltas.res_cost_a() + action_a.resource_cost;
  result.resource_cost_b = deltas.res_cost_b() + action_b.resource_cost;
  result.risk_delta = deltas.risk_delta();

  auto it = config.outcome_narratives.find(code);
  result.narrative = it != config.outcome_narratives.end()
                       ? it->second
                       : default_matrix_narrative(code, matrix);

  // A costly signal reveals the signaler's exact position
  if (action_a.category == ActionCategory::kCostlySignaling) {
    result.b_learns_position = true;
    result.narrative += std::format(" Player A signaled strength: Position {:.1f}.",
                                    state.position_a());
  }
  if (action_b.category == ActionCategory::kCostlySignaling) {
    result.a_learns_position = true;
    result.narrative += std::format(" Player B signaled strength: Position {:.1f}.",
                                    state.position_b());
  }
  return result;
}

ActionResult resolve_reconnaissance(const GameState& state, const Action& action_a,
                                    const Action& action_b) {
  ActionResult result = make_result(action_a, action_b, kOutcomeRecon);

  // A initiates if both players chose reconnaissance
  bool a_initiates = action_a.category == ActionCategory::kReconnaissance;
  const Action& responder_action = a_initiates ? action_b : action_a;
  ReconResponse response =
    responder_action.is_cooperative() ? ReconResponse::kVigilant : ReconResponse::kProject;
  ReconOutcome outcome = reconnaissance_outcome(ReconChoice::kProbe, response);

  if (a_initiates) {
    result.resource_cost_a = kReconnaissanceCost;
    result.a_learns_position = outcome.initiator_learns_position;
    result.b_learns_position = outcome.responder_learns_position;
  } else {
    result.resource_cost_b = kReconnaissanceCost;
    result.b_learns_position = outcome.initiator_learns_position;
    result.a_learns_position = outcome.responder_learns_position;
  }

  if (outcome.detected) {
    result.risk_delta = kReconnaissanceDetectedRisk;
    result.narrative = a_initiates ? "Your reconnaissance attempt was detected. Risk increases."
                                   : "Opponent's reconnaissance was detected. Risk increases.";
  } else if (outcome.initiator_learns_position) {
    result.narrative =
      a_initiates
        ? std::format("Reconnaissance successful. You learned your opponent's position: {:.1f}",
                      state.position_b())
        : std::string("Opponent gained intelligence on your position.");
  } else if (outcome.responder_learns_position) {
    result.narrative = a_initiates ? "Your position was exposed to your opponent."
                                   : "Your counterintelligence revealed opponent's position.";
  } else {
    result.narrative = "Your cautious approach yielded no information.";
  }
  return result;
}

ActionResult resolve_inspection(const GameState& state, const Action& action_a,
                                const Action& action_b) {
  ActionResult result = make_result(action_a, action_b, kOutcomeInspect);

  bool a_inspects = action_a.category == ActionCategory::kInspection;
  const Action& target_action = a_inspects ? action_b : action_a;
  bool cheated = target_action.is_competitive();

  if (a_inspects) {
    result.resource_cost_a = kInspectionCost;
    result.a_learns_resources = true;
  } else {
    result.resource_cost_b = kInspectionCost;
    result.b_learns_resources = true;
  }

  if (!cheated) {
    result.narrative =
      a_inspects
        ? std::format("Inspection verified. Opponent resources: {:.1f}", state.resources_b())
        : std::format(
            "Opponent's inspection verified your compliance. Your resources revealed: {:.1f}",
            state.resources_a());
    return result;
  }

  result.risk_delta = kCaughtCheatingRisk;
  if (a_inspects) {
    result.position_delta_b = -kCaughtCheatingPositionPenalty;
    result.narrative = std::format(
      "Inspection caught opponent cheating! Their resources: {:.1f}. They lose position and "
      "risk increases.",
      state.resources_b());
  } else {
    result.position_delta_a = -kCaughtCheatingPositionPenalty;
    result.narrative = "You were caught cheating during inspection! Position and risk affected.";
  }
  return result;
}

ActionResult resolve_settlement(const GameState&, const Action& action_a,
                                const Action& action_b, const TurnConfiguration& config) {
  bool both = action_a.category == ActionCategory::kSettlement &&
              action_b.category == ActionCategory::kSettlement;

  if (both) {
    ActionResult result = make_result(action_a, action_b, kOutcomeSettle);
    result.surplus_share_a = negotiated_surplus_share(action_a, action_b);
    result.narrative = "Settlement reached!";
    return result;
  }

  ActionResult result = make_result(action_a, action_b, kOutcomeSettleFail);
  result.risk_delta = kFailedSettlementRisk;
  result.narrative = config.settlement_failed_narrative;
  return result;
}

ActionResult resolve_actions(const GameState& state, const Action& action_a,
                             const Action& action_b, const TurnConfiguration& config) {
  switch (resolution_mode(action_a, action_b)) {
    case ResolutionMode::kSettlement:
      return resolve_settlement(state, action_a, action_b, config);
    case ResolutionMode::kReconnaissance:
      return resolve_reconnaissance(state, action_a, action_b);
    case ResolutionMode::kInspection:
      return resolve_inspection(state, action_a, action_b);
    case ResolutionMode::kMatrix:
      return resolve_matrix(state, action_a, action_b, config);
  }
  return resolve_matrix(state, action_a, action_b, config);
}

}  // namespace brinksmanship
