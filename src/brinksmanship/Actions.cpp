#include "brinksmanship/Actions.hpp"

#include "util/StringUtil.hpp"

#include <format>

namespace brinksmanship {

namespace actions {

namespace {

Action make(const char* name, ActionType type, const char* description) {
  Action action;
  action.name = name;
  action.type = type;
  action.description = description;
  return action;
}

constexpr ActionType kCoop = ActionType::kCooperative;
constexpr ActionType kComp = ActionType::kCompetitive;

}  // namespace

Action deescalate() {
  return make("De-escalate", kCoop, "Lower tensions with a conciliatory gesture.");
}

Action hold() {
  return make("Hold / Maintain", kCoop, "Keep the current position without pushing or yielding.");
}

Action back_channel() {
  return make("Back Channel", kCoop, "Open an informal, deniable line of communication.");
}

Action concede() {
  return make("Concede", kCoop, "Give ground to bring the overall risk down.");
}

Action withdraw() {
  return make("Withdraw", kCoop, "Pull back from a contested claim.");
}

Action escalate() {
  return make("Escalate", kComp, "Raise pressure and deepen commitment.");
}

Action aggressive_pressure() {
  return make("Aggressive Pressure", kComp, "Press directly with threats or demonstrations.");
}

Action issue_ultimatum() {
  return make("Issue Ultimatum", kComp, "Demand concessions against a deadline.");
}

Action show_of_force() {
  return make("Show of Force", kComp, "Put capability and resolve on visible display.");
}

Action demand() {
  return make("Demand", kComp, "State explicit demands for concessions.");
}

Action advance() {
  return make("Advance", kComp, "Push into contested space.");
}

Action propose_settlement(double surplus_share) {
  Action action = make("Propose Settlement", kCoop,
                       "Offer a negotiated end to the crisis. Available after Turn 4 while "
                       "Stability is above 2.");
  action.category = ActionCategory::kSettlement;
  action.surplus_share = surplus_share;
  return action;
}

Action initiate_reconnaissance() {
  Action action = make("Initiate Reconnaissance", kCoop,
                       "Try to learn the opponent's exact Position. Replaces the matrix game "
                       "this turn.");
  action.category = ActionCategory::kReconnaissance;
  action.resource_cost = kReconnaissanceCost;
  return action;
}

Action initiate_inspection() {
  Action action = make("Initiate Inspection", kCoop,
                       "Try to learn the opponent's exact Resources. Replaces the matrix game "
                       "this turn.");
  action.category = ActionCategory::kInspection;
  action.resource_cost = kInspectionCost;
  return action;
}

double signal_cost(double position) {
  if (position >= kSignalStrongPosition) return kSignalCostStrong;
  if (position >= kSignalModeratePosition) return kSignalCostModerate;
  return kSignalCostWeak;
}

Action signal_strength(double position) {
  double cost = signal_cost(position);
  Action action;
  action.name = "Signal Strength";
  action.type = kCoop;
  action.category = ActionCategory::kCostlySignaling;
  action.resource_cost = cost;
  action.description = std::format(
    "Credibly reveal your Position to the opponent for {} Resources. The matrix game is still "
    "played.",
    cost);
  return action;
}

const std::vector<Action>& standard_actions() {
  static const std::vector<Action> all = {
    deescalate(), hold(), back_channel(), concede(), withdraw(),
    escalate(), aggressive_pressure(), issue_ultimatum(), show_of_force(), demand(),
    advance(),
  };
  return all;
}

std::optional<Action> find(const std::string& name, double position) {
  std::string key = util::to_lower(name);
  for (const Action& action : standard_actions()) {
    if (util::to_lower(action.name) == key) return action;
  }
  for (const Action& action : {propose_settlement(), initiate_reconnaissance(),
                               initiate_inspection(), signal_strength(position)}) {
    if (util::to_lower(action.name) == key) return action;
  }
  return std::nullopt;
}

}  // namespace actions

RiskTier risk_tier(double risk_level) {
  int level = static_cast<int>(risk_level);
  if (level <= kLowRiskTierMax) return RiskTier::kLow;
  if (level <= kMediumRiskTierMax) return RiskTier::kMedium;
  return RiskTier::kHigh;
}

std::vector<Action> standard_actions_for_tier(RiskTier tier) {
  using namespace actions;
  switch (tier) {
    case RiskTier::kLow:
      return {deescalate(), hold(), back_channel(), withdraw(), escalate(), aggressive_pressure()};
    case RiskTier::kMedium:
      return {deescalate(), hold(), back_channel(), escalate(), aggressive_pressure(),
              show_of_force()};
    case RiskTier::kHigh:
      return {hold(), concede(), escalate(), aggressive_pressure(), issue_ultimatum(),
              show_of_force()};
  }
  return {};
}

bool can_propose_settlement(int turn, double stability) {
  return turn > kSettlementMinTurn && stability > kSettlementMinStability;
}

std::vector<Action> ActionMenu::all_actions() const {
  std::vector<Action> all = standard_actions;
  all.insert(all.end(), special_actions.begin(), special_actions.end());
  return all;
}

ActionMenu build_action_menu(const GameState& state, Player player, bool settlement_allowed) {
  const PlayerState& self = state.player(player);

  ActionMenu menu;
  menu.standard_actions = standard_actions_for_tier(risk_tier(state.risk_level()));
  menu.settlement_available =
    settlement_allowed && can_propose_settlement(state.turn(), state.stability());

  if (menu.settlement_available) {
    menu.special_actions.push_back(actions::propose_settlement());
  }
  for (const Action& action : {actions::initiate_reconnaissance(), actions::initiate_inspection(),
                               actions::signal_strength(self.position())}) {
    if (self.resources() >= action.resource_cost) {
      menu.special_actions.push_back(action);
    }
  }
  return menu;
}

std::optional<std::string> validate_action(const Action& action, const GameState& state,
                                           Player player, bool settlement_allowed) {
  double resources = state.player(player).resources();
  if (action.resource_cost > resources) {
    return std::format("Insufficient resources. Need {}, have {}", action.resource_cost,
                       resources);
  }

  if (action.category == ActionCategory::kSettlement) {
    if (state.turn() <= kSettlementMinTurn) {
      return std::string("Settlement not available until after Turn 4");
    }
    if (state.stability() <= kSettlementMinStability) {
      return std::format("Settlement not available when Stability <= 2 (current: {})",
                         state.stability());
    }
    if (!settlement_allowed) {
      return std::string("Settlement not available this turn");
    }
  }
  return std::nullopt;
}

}  // namespace brinksmanship
