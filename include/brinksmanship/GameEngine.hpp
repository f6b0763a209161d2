#pragma once

#include "brinksmanship/Actions.hpp"
#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/Endings.hpp"
#include "brinksmanship/GameState.hpp"
#include "brinksmanship/Scenario.hpp"
#include "brinksmanship/Settlement.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace brinksmanship {

// The history entry for one turn. Opened at Briefing, completed when the turn resolves.
struct TurnRecord {
  int turn;
  TurnPhase phase;
  std::optional<Action> action_a;
  std::optional<Action> action_b;
  std::optional<std::string> outcome;
  GameState state_before;
  std::optional<GameState> state_after;
  std::string narrative;
  MatrixType matrix_type;
};

struct TurnResult {
  bool success = false;
  std::optional<ActionResult> action_result;
  std::optional<GameEnding> ending;
  std::string narrative;
  std::optional<std::string> error;
};

/*
 * Runs one game of a scenario.
 *
 * Each call to submit_actions() plays one full turn through the phases
 *
 * Briefing -> Decision -> Resolution -> StateUpdate -> CheckDeterministic -> CheckCrisis
 *   -> CheckNatural -> Advance -> Briefing
 *
 * or stops in GameOver once an ending is reached. Between calls the engine waits in Decision.
 * A call either commits a whole turn or leaves the engine untouched.
 *
 * An engine owns its own prng, so distinct engines may run on distinct threads. It is not itself
 * thread-safe.
 */
class GameEngine {
 public:
  struct Params {
    uint64_t seed = 0;  // 0 means seed from std::random_device
    int max_turns = 0;  // 0 means draw from [12, 16]; otherwise clamped to [12, 16]
  };

  // Throws ConstraintError if any turn of scenario cannot build its matrix.
  explicit GameEngine(const Scenario& scenario, const Params& params = Params());

  GameState current_state() const { return state_; }
  const std::string& current_turn_key() const { return current_turn_key_; }
  const TurnConfiguration& current_config() const;
  uint64_t seed() const { return seed_; }
  TurnPhase phase() const { return phase_; }

  ActionMenu action_menu(Player player) const;
  std::vector<Action> available_actions(Player player) const;
  std::string briefing() const;
  SettlementConstraints settlement_constraints(Player player) const;
  InformationState information_state(Player player) const;

  TurnResult submit_actions(const Action& action_a, const Action& action_b);

  std::vector<TurnRecord> history() const { return history_; }
  bool is_over() const { return ending_.has_value(); }
  std::optional<GameEnding> ending() const { return ending_; }

 private:
  static TurnResult failure(const std::string& error);

  void ensure_config(const std::string& key);
  std::string next_turn_key(const TurnConfiguration& config, const std::string& outcome) const;
  void open_turn_record();
  void finish(const GameEnding& ending);

  Scenario scenario_;
  uint64_t seed_;
  std::mt19937 prng_;
  GameState state_;
  TurnPhase phase_ = TurnPhase::kBriefing;
  std::string current_turn_key_;
  std::vector<TurnRecord> history_;
  std::optional<GameEnding> ending_;
};

}  // namespace brinksmanship
