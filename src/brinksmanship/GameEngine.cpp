#include "brinksmanship/GameEngine.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Resolution.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <format>

namespace brinksmanship {

namespace {

int resolve_max_turns(int requested, std::mt19937& prng) {
  if (requested == 0) return util::Random::uniform_sample(prng, kMinMaxTurns, kMaxMaxTurns + 1);
  return std::clamp(requested, kMinMaxTurns, kMaxMaxTurns);
}

}  // namespace

GameEngine::GameEngine(const Scenario& scenario, const Params& params)
    : scenario_(scenario),
      seed_(util::Random::resolve_seed(params.seed)),
      prng_(util::Random::make_prng(seed_)),
      state_(resolve_max_turns(params.max_turns, prng_)) {
  scenario_.validate();
  current_turn_key_ = scenario_.first_turn_key();
  ensure_config(current_turn_key_);
  open_turn_record();
  LOG_DEBUG("Starting scenario '{}' (seed={})", scenario_.name(), seed_);
}

const TurnConfiguration& GameEngine::current_config() const {
  const TurnConfiguration* config = scenario_.find(current_turn_key_);
  if (!config) {
    throw util::Exception("GameEngine: no configuration for turn key {}", current_turn_key_);
  }
  return *config;
}

ActionMenu GameEngine::action_menu(Player player) const {
  return build_action_menu(state_, player, current_config().settlement_available);
}

std::vector<Action> GameEngine::available_actions(Player player) const {
  return action_menu(player).all_actions();
}

std::string GameEngine::briefing() const { return current_config().narrative_briefing; }

SettlementConstraints GameEngine::settlement_constraints(Player player) const {
  return brinksmanship::settlement_constraints(state_, player);
}

InformationState GameEngine::information_state(Player player) const {
  return state_.player(player).information();
}

TurnResult GameEngine::submit_actions(const Action& action_a, const Action& action_b) {
  if (ending_) return failure("Game is already over");

  const TurnConfiguration& config = current_config();
  for (Player p : {Player::kA, Player::kB}) {
    const Action& action = p == Player::kA ? action_a : action_b;
    auto error = validate_action(action, state_, p, config.settlement_available);
    if (error) {
      LOG_WARN("Turn {}: rejected action '{}' from player {}: {}", state_.turn(), action.name,
               player_name(p), *error);
      return failure(std::format("Player {}: {}", player_name(p), *error));
    }
  }

  phase_ = TurnPhase::kResolution;
  ActionResult result = resolve_actions(state_, action_a, action_b, config);
  LOG_DEBUG("Turn {} [{}]: '{}' vs '{}' -> {}", state_.turn(), current_turn_key_, action_a.name,
            action_b.name, result.outcome_code);

  phase_ = TurnPhase::kStateUpdate;
  GameState before = state_;
  state_ = apply_action_result(before, result);

  TurnRecord& record = history_.back();
  record.action_a = action_a;
  record.action_b = action_b;
  record.outcome = result.outcome_code;
  record.state_after = state_;
  record.narrative = result.narrative;

  std::optional<GameEnding> ending;
  if (result.outcome_code == kOutcomeSettle) {
    ending = settlement_ending(before, state_);
  }
  if (!ending) {
    phase_ = TurnPhase::kCheckDeterministic;
    ending = check_deterministic_endings(state_);
  }
  if (!ending) {
    phase_ = TurnPhase::kCheckCrisis;
    ending = check_crisis_ending(state_, prng_);
  }
  if (!ending) {
    phase_ = TurnPhase::kCheckNatural;
    ending = check_natural_ending(state_, prng_);
  }

  TurnResult turn_result;
  turn_result.success = true;
  turn_result.action_result = result;
  turn_result.ending = ending;
  turn_result.narrative = result.narrative;

  if (ending) {
    finish(*ending);
    record.phase = phase_;
    return turn_result;
  }

  phase_ = TurnPhase::kAdvance;
  record.phase = phase_;
  std::string next_key = next_turn_key(config, result.outcome_code);
  ensure_config(next_key);
  current_turn_key_ = next_key;

  phase_ = TurnPhase::kBriefing;
  open_turn_record();
  return turn_result;
}

TurnResult GameEngine::failure(const std::string& error) {
  TurnResult result;
  result.success = false;
  result.error = error;
  return result;
}

void GameEngine::ensure_config(const std::string& key) {
  if (scenario_.find(key)) return;
  LOG_DEBUG("No configuration for {}, using the default for turn {}", key, state_.turn());
  scenario_.add_turn(key, TurnConfiguration::make_default(state_.turn()));
}

std::string GameEngine::next_turn_key(const TurnConfiguration& config,
                                      const std::string& outcome) const {
  auto it = config.branches.find(outcome);
  if (it != config.branches.end()) return it->second;
  if (config.default_next) return *config.default_next;
  return std::format("turn_{}", state_.turn());
}

void GameEngine::open_turn_record() {
  const TurnConfiguration& config = current_config();
  TurnRecord record{.turn = state_.turn(),
                    .phase = phase_,
                    .state_before = state_,
                    .narrative = config.narrative_briefing,
                    .matrix_type = config.matrix_type};
  history_.push_back(record);
  phase_ = TurnPhase::kDecision;
}

void GameEngine::finish(const GameEnding& ending) {
  ending_ = ending;
  phase_ = TurnPhase::kGameOver;
  LOG_INFO("Game over on turn {}: {} (A {:.1f}, B {:.1f})", ending.turn(),
           magic_enum::enum_name(ending.ending_type()), ending.total_a(), ending.total_b());
}

}  // namespace brinksmanship
