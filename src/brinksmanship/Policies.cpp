#include "brinksmanship/Policies.hpp"

#include "util/Exception.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

namespace brinksmanship {

namespace {

constexpr double kOpportunistShare = 0.6;
constexpr double kOpportunistLead = 1.0;
constexpr double kReconRadiusThreshold = 2.0;

Action first_of_type(const ActionMenu& menu, ActionType type) {
  for (const Action& action : menu.standard_actions) {
    if (action.type == type) return action;
  }
  throw util::Exception("No {} action on the menu", enum_to_tag(type));
}

const Action* find_special(const ActionMenu& menu, ActionCategory category) {
  for (const Action& action : menu.special_actions) {
    if (action.category == category) return &action;
  }
  return nullptr;
}

}  // namespace

Action RandomPolicy::choose_action(const GameState&, Player, const ActionMenu& menu,
                                   std::mt19937& prng) {
  std::vector<Action> all = menu.all_actions();
  return all[util::Random::uniform_sample(prng, size_t(0), all.size())];
}

Action DovePolicy::choose_action(const GameState&, Player, const ActionMenu& menu,
                                 std::mt19937&) {
  if (const Action* settle = find_special(menu, ActionCategory::kSettlement)) return *settle;
  return first_of_type(menu, ActionType::kCooperative);
}

Action HawkPolicy::choose_action(const GameState&, Player, const ActionMenu& menu,
                                 std::mt19937&) {
  return first_of_type(menu, ActionType::kCompetitive);
}

Action TitForTatPolicy::choose_action(const GameState& state, Player self, const ActionMenu& menu,
                                      std::mt19937&) {
  const auto& last = state.player(opponent(self)).previous_type();
  return first_of_type(menu, last.value_or(ActionType::kCooperative));
}

Action GrimTriggerPolicy::choose_action(const GameState& state, Player self,
                                        const ActionMenu& menu, std::mt19937&) {
  const auto& last = state.player(opponent(self)).previous_type();
  if (last == ActionType::kCompetitive) triggered_ = true;
  return first_of_type(menu, triggered_ ? ActionType::kCompetitive : ActionType::kCooperative);
}

Action OpportunistPolicy::choose_action(const GameState& state, Player self,
                                        const ActionMenu& menu, std::mt19937&) {
  const PlayerState& me = state.player(self);
  Estimate estimate = me.information().estimate_position(state.turn());

  if (estimate.radius > kReconRadiusThreshold) {
    if (const Action* recon = find_special(menu, ActionCategory::kReconnaissance)) return *recon;
  }

  bool ahead = me.position() > estimate.center + kOpportunistLead;
  if (ahead && menu.settlement_available) return actions::propose_settlement(kOpportunistShare);
  return first_of_type(menu, ahead ? ActionType::kCompetitive : ActionType::kCooperative);
}

namespace policies {

const std::vector<std::string>& names() {
  static const std::vector<std::string> kNames = {"random",       "dove",         "hawk",
                                                  "tit_for_tat",  "grim_trigger", "opportunist"};
  return kNames;
}

Policy_uptr make(const std::string& name) {
  std::string key = util::to_lower(name);
  if (key == "random") return std::make_unique<RandomPolicy>();
  if (key == "dove") return std::make_unique<DovePolicy>();
  if (key == "hawk") return std::make_unique<HawkPolicy>();
  if (key == "tit_for_tat") return std::make_unique<TitForTatPolicy>();
  if (key == "grim_trigger") return std::make_unique<GrimTriggerPolicy>();
  if (key == "opportunist") return std::make_unique<OpportunistPolicy>();
  throw util::CleanException("Unknown policy \"{}\" (valid: {})", name,
                             util::grammatically_join(names(), "or"));
}

}  // namespace policies

}  // namespace brinksmanship
