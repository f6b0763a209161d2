#pragma once

#include "brinksmanship/Actions.hpp"
#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/GameState.hpp"

#include <memory>
#include <random>
#include <string>
#include <vector>

namespace brinksmanship {

/*
 * Base class for the automated players used by batch simulation.
 *
 * start_game() is called once per game, before the first choose_action() call. A single policy
 * instance plays many games in succession, so any per-game memory must be cleared there.
 *
 * choose_action() must return a member of menu.all_actions(). The prng belongs to the policy's
 * seat in the current game, so a policy's choices are reproducible from the game seed.
 *
 * Policies see the full GameState. They are expected to read only what their own side would see:
 * their own player state, the shared indicators, and the opponent's previous action type.
 */
class Policy {
 public:
  virtual ~Policy() = default;

  virtual std::string name() const = 0;
  virtual void start_game(Player) {}
  virtual Action choose_action(const GameState& state, Player self, const ActionMenu& menu,
                               std::mt19937& prng) = 0;
};

using Policy_uptr = std::unique_ptr<Policy>;

// Uniform over every available action, special actions included.
class RandomPolicy : public Policy {
 public:
  std::string name() const override { return "random"; }
  Action choose_action(const GameState&, Player, const ActionMenu& menu,
                       std::mt19937& prng) override;
};

// Always cooperates, and proposes an even settlement whenever one is available.
class DovePolicy : public Policy {
 public:
  std::string name() const override { return "dove"; }
  Action choose_action(const GameState&, Player, const ActionMenu& menu,
                       std::mt19937&) override;
};

// Always competes.
class HawkPolicy : public Policy {
 public:
  std::string name() const override { return "hawk"; }
  Action choose_action(const GameState&, Player, const ActionMenu& menu,
                       std::mt19937&) override;
};

// Cooperates first, then repeats the opponent's previous action type.
class TitForTatPolicy : public Policy {
 public:
  std::string name() const override { return "tit_for_tat"; }
  Action choose_action(const GameState& state, Player self, const ActionMenu& menu,
                       std::mt19937&) override;
};

// Cooperates until the opponent competes once, then competes for the rest of the game.
class GrimTriggerPolicy : public Policy {
 public:
  std::string name() const override { return "grim_trigger"; }
  void start_game(Player) override { triggered_ = false; }
  Action choose_action(const GameState& state, Player self, const ActionMenu& menu,
                       std::mt19937&) override;

 private:
  bool triggered_ = false;
};

/*
 * Competes while ahead on position and cooperates while behind. When the opponent's position is
 * unknown or stale, spends resources on reconnaissance first. Asks for a favorable settlement
 * while comfortably ahead.
 */
class OpportunistPolicy : public Policy {
 public:
  std::string name() const override { return "opportunist"; }
  Action choose_action(const GameState& state, Player self, const ActionMenu& menu,
                       std::mt19937&) override;
};

namespace policies {

// The names accepted by make(), in a fixed order.
const std::vector<std::string>& names();

// Throws util::CleanException if name is not one of names().
Policy_uptr make(const std::string& name);

}  // namespace policies

}  // namespace brinksmanship
