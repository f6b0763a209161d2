#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/Constants.hpp"
#include "brinksmanship/GameState.hpp"

#include <optional>
#include <string>
#include <vector>

namespace brinksmanship {

/*
 * A move a player submits for one turn. Every action classifies as cooperative or competitive;
 * that classification is all the payoff matrix sees. Special actions (category other than
 * kStandard) also trigger their own resolution mode.
 */
struct Action {
  std::string name;
  ActionType type = ActionType::kCooperative;
  ActionCategory category = ActionCategory::kStandard;
  double resource_cost = 0;
  std::string description;

  // Settlement proposals only: the share of the cooperation surplus the proposer asks for.
  double surplus_share = kDefaultSurplusShare;

  bool is_cooperative() const { return type == ActionType::kCooperative; }
  bool is_competitive() const { return type == ActionType::kCompetitive; }
  bool is_special() const { return category != ActionCategory::kStandard; }

  bool operator==(const Action&) const = default;
};

namespace actions {

Action deescalate();
Action hold();
Action back_channel();
Action concede();
Action withdraw();
Action escalate();
Action aggressive_pressure();
Action issue_ultimatum();
Action show_of_force();
Action demand();
Action advance();

Action propose_settlement(double surplus_share = kDefaultSurplusShare);
Action initiate_reconnaissance();
Action initiate_inspection();

// The cost of signaling strength falls as the signaler's position rises.
Action signal_strength(double position);
double signal_cost(double position);

// Every standard action, cooperative ones first.
const std::vector<Action>& standard_actions();

// Looks up a standard or special action by name, case-insensitively.
std::optional<Action> find(const std::string& name, double position = kDefaultPosition);

}  // namespace actions

enum class RiskTier : int8_t { kLow, kMedium, kHigh };

// Tier of the integer part of risk_level: 0-3 low, 4-6 medium, 7+ high.
RiskTier risk_tier(double risk_level);

// The standard actions offered at tier.
std::vector<Action> standard_actions_for_tier(RiskTier tier);

// True once turn > 4 and stability > 2.
bool can_propose_settlement(int turn, double stability);

struct ActionMenu {
  std::vector<Action> standard_actions;
  std::vector<Action> special_actions;
  bool settlement_available = false;

  std::vector<Action> all_actions() const;
};

/*
 * The actions player may choose this turn. Special actions are listed in the order settlement,
 * reconnaissance, inspection, signaling, and only when available and affordable.
 *
 * settlement_allowed is the turn configuration's own switch; timing and stability are checked
 * here as well.
 */
ActionMenu build_action_menu(const GameState& state, Player player,
                             bool settlement_allowed = true);

/*
 * Returns an error message if player may not take action in state, std::nullopt otherwise.
 */
std::optional<std::string> validate_action(const Action& action, const GameState& state,
                                           Player player, bool settlement_allowed = true);

}  // namespace brinksmanship
