#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/Policies.hpp"
#include "brinksmanship/Scenario.hpp"

#include <boost/json.hpp>
#include <magic_enum/magic_enum.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace brinksmanship {

// The result of one simulated game.
struct GameSummary {
  int game_index = 0;
  uint64_t seed = 0;
  EndingType ending_type = EndingType::kNaturalEnding;
  int turn = 0;
  double vp_a = 0;
  double vp_b = 0;
  double total_a = 0;
  double total_b = 0;
  double final_position_a = 0;
  double final_position_b = 0;
  double final_risk = 0;

  // Unset for a tie, and for mutual destruction, which has no winner.
  std::optional<Player> winner;
  bool tie = false;

  boost::json::object to_json() const;
};

/*
 * Aggregate statistics over the games of one policy pairing.
 *
 * Mutual destruction counts as neither a win nor a tie.
 */
class PairingStats {
 public:
  PairingStats(const std::string& policy_a, const std::string& policy_b);

  void add(const GameSummary& summary);

  const std::string& policy_a() const { return policy_a_; }
  const std::string& policy_b() const { return policy_b_; }
  int total_games() const { return total_games_; }
  int total_turns() const { return total_turns_; }
  int wins_a() const { return wins_a_; }
  int wins_b() const { return wins_b_; }
  int ties() const { return ties_; }
  int count(EndingType type) const { return ending_counts_[magic_enum::enum_integer(type)]; }

  double avg_turns() const { return mean(total_turns_); }
  double avg_total_a() const { return mean(sum_total_a_); }
  double avg_total_b() const { return mean(sum_total_b_); }
  double avg_final_risk() const { return mean(sum_final_risk_); }
  double avg_position_spread() const { return mean(sum_position_spread_); }

  double mutual_destruction_rate() const;
  double crisis_termination_rate() const;
  double settlement_rate() const;

  // Position collapses and resource exhaustions, either side.
  double elimination_rate() const;

  boost::json::object to_json() const;

 private:
  double mean(double sum) const { return total_games_ ? sum / total_games_ : 0.0; }

  std::string policy_a_;
  std::string policy_b_;
  int total_games_ = 0;
  int total_turns_ = 0;
  int wins_a_ = 0;
  int wins_b_ = 0;
  int ties_ = 0;
  std::array<int, magic_enum::enum_count<EndingType>()> ending_counts_ = {};
  double sum_total_a_ = 0;
  double sum_total_b_ = 0;
  double sum_final_risk_ = 0;
  double sum_position_spread_ = 0;
};

/*
 * Plays many independent games of one scenario between automated policies.
 *
 * Games are distributed over a pool of num_threads worker threads, each pulling the next game
 * index from a shared counter. Game i is seeded with base_seed + i, so the statistics of a run
 * depend only on (scenario, params, base_seed), regardless of the thread count.
 *
 * Each worker owns its own Policy instances. Per-game results are collected under a mutex and
 * folded into the PairingStats in game-index order once every worker has joined.
 */
class BatchRunner {
 public:
  struct Params {
    auto make_options_description();

    int num_games = 100;
    int num_threads = 4;
    std::string policy_a = "random";
    std::string policy_b = "random";
    bool all_pairings = false;
    int max_turns = 0;
    std::string output_json;
  };

  using pairing_t = std::pair<std::string, std::string>;

  // Throws util::CleanException on invalid params. A base_seed of 0 is replaced by a random one.
  BatchRunner(const Scenario& scenario, const Params& params, uint64_t base_seed);

  uint64_t base_seed() const { return base_seed_; }

  // Every unordered pair of policies (self-pairings included) in all-pairings mode, otherwise
  // the single (policy_a, policy_b) pairing.
  std::vector<pairing_t> pairings() const;

  PairingStats run_pairing(const pairing_t& pairing) const;
  std::vector<PairingStats> run() const;

  // The full report: base seed, game count, and the stats of each pairing.
  boost::json::object report(const std::vector<PairingStats>& stats) const;

  // Throws util::Exception if a policy picks an action the engine rejects.
  static GameSummary play_game(const Scenario& scenario, Policy& policy_a, Policy& policy_b,
                               uint64_t seed, int max_turns = 0);

 private:
  const Scenario scenario_;
  const Params params_;
  const uint64_t base_seed_;
};

}  // namespace brinksmanship

#include "inline/brinksmanship/BatchRunner.inl"
