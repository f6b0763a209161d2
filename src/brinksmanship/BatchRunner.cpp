#include "brinksmanship/BatchRunner.hpp"

#include "brinksmanship/GameEngine.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <mutex>
#include <thread>

namespace brinksmanship {

namespace {

constexpr double kTieTolerance = 1e-9;

bool is_elimination(EndingType type) {
  switch (type) {
    case EndingType::kPositionCollapseA:
    case EndingType::kPositionCollapseB:
    case EndingType::kResourceExhaustionA:
    case EndingType::kResourceExhaustionB:
      return true;
    default:
      return false;
  }
}

}  // namespace

boost::json::object GameSummary::to_json() const {
  boost::json::object obj;
  obj["game_index"] = game_index;
  obj["seed"] = seed;
  obj["ending_type"] = enum_to_tag(ending_type);
  obj["turn"] = turn;
  obj["vp_a"] = vp_a;
  obj["vp_b"] = vp_b;
  obj["total_a"] = total_a;
  obj["total_b"] = total_b;
  obj["final_position_a"] = final_position_a;
  obj["final_position_b"] = final_position_b;
  obj["final_risk"] = final_risk;
  if (winner) {
    obj["winner"] = player_name(*winner);
  } else {
    obj["winner"] = nullptr;
  }
  obj["tie"] = tie;
  return obj;
}

PairingStats::PairingStats(const std::string& policy_a, const std::string& policy_b)
    : policy_a_(policy_a), policy_b_(policy_b) {}

void PairingStats::add(const GameSummary& summary) {
  total_games_++;
  total_turns_ += summary.turn;
  ending_counts_[magic_enum::enum_integer(summary.ending_type)]++;

  if (summary.tie) {
    ties_++;
  } else if (summary.winner == Player::kA) {
    wins_a_++;
  } else if (summary.winner == Player::kB) {
    wins_b_++;
  }

  sum_total_a_ += summary.total_a;
  sum_total_b_ += summary.total_b;
  sum_final_risk_ += summary.final_risk;
  sum_position_spread_ += std::abs(summary.final_position_a - summary.final_position_b);
}

double PairingStats::mutual_destruction_rate() const {
  return mean(count(EndingType::kMutualDestruction));
}

double PairingStats::crisis_termination_rate() const {
  return mean(count(EndingType::kCrisisTermination));
}

double PairingStats::settlement_rate() const { return mean(count(EndingType::kSettlement)); }

double PairingStats::elimination_rate() const {
  int n = 0;
  for (EndingType type : magic_enum::enum_values<EndingType>()) {
    if (is_elimination(type)) n += count(type);
  }
  return mean(n);
}

boost::json::object PairingStats::to_json() const {
  boost::json::object endings;
  for (EndingType type : magic_enum::enum_values<EndingType>()) {
    endings[enum_to_tag(type)] = count(type);
  }

  boost::json::object obj;
  obj["policy_a"] = policy_a_;
  obj["policy_b"] = policy_b_;
  obj["total_games"] = total_games_;
  obj["wins_a"] = wins_a_;
  obj["wins_b"] = wins_b_;
  obj["ties"] = ties_;
  obj["endings"] = endings;
  obj["avg_turns"] = avg_turns();
  obj["avg_total_a"] = avg_total_a();
  obj["avg_total_b"] = avg_total_b();
  obj["avg_final_risk"] = avg_final_risk();
  obj["avg_position_spread"] = avg_position_spread();
  obj["mutual_destruction_rate"] = mutual_destruction_rate();
  obj["crisis_termination_rate"] = crisis_termination_rate();
  obj["settlement_rate"] = settlement_rate();
  obj["elimination_rate"] = elimination_rate();
  return obj;
}

BatchRunner::BatchRunner(const Scenario& scenario, const Params& params, uint64_t base_seed)
    : scenario_(scenario), params_(params), base_seed_(util::Random::resolve_seed(base_seed)) {
  if (params_.num_games < 1) {
    throw util::CleanException("--num-games must be positive (got {})", params_.num_games);
  }
  if (params_.num_threads < 1) {
    throw util::CleanException("--num-threads must be positive (got {})", params_.num_threads);
  }
  for (const pairing_t& pairing : pairings()) {
    policies::make(pairing.first);
    policies::make(pairing.second);
  }
}

std::vector<BatchRunner::pairing_t> BatchRunner::pairings() const {
  if (!params_.all_pairings) return {{params_.policy_a, params_.policy_b}};

  std::vector<pairing_t> out;
  const std::vector<std::string>& names = policies::names();
  for (size_t i = 0; i < names.size(); ++i) {
    for (size_t j = i; j < names.size(); ++j) {
      out.emplace_back(names[i], names[j]);
    }
  }
  return out;
}

PairingStats BatchRunner::run_pairing(const pairing_t& pairing) const {
  const int num_games = params_.num_games;
  const int num_threads = std::min(params_.num_threads, num_games);
  const int report_interval = std::max(1, num_games / 10);

  LOG_INFO("BatchRunner: {} vs {}, {} games on {} threads (base seed {})", pairing.first,
           pairing.second, num_games, num_threads, base_seed_);

  std::vector<std::optional<GameSummary>> summaries(num_games);
  std::atomic<int> next_index(0);
  std::mutex mutex;
  int num_completed = 0;
  std::exception_ptr error;

  auto loop = [&]() {
    try {
      Policy_uptr policy_a = policies::make(pairing.first);
      Policy_uptr policy_b = policies::make(pairing.second);
      while (true) {
        int i = next_index++;
        if (i >= num_games) break;

        GameSummary summary =
          play_game(scenario_, *policy_a, *policy_b, base_seed_ + i, params_.max_turns);
        summary.game_index = i;

        std::lock_guard<std::mutex> guard(mutex);
        summaries[i] = summary;
        num_completed++;
        if (num_completed % report_interval == 0 || num_completed == num_games) {
          LOG_INFO("BatchRunner: {}/{} games complete", num_completed, num_games);
        }
      }
    } catch (...) {
      // Recorded and rethrown on the calling thread after join.
      std::lock_guard<std::mutex> guard(mutex);
      if (!error) error = std::current_exception();
      next_index = num_games;
    }
  };

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back(loop);
  }
  for (std::thread& thread : threads) {
    thread.join();
  }
  if (error) std::rethrow_exception(error);

  PairingStats stats(pairing.first, pairing.second);
  for (const std::optional<GameSummary>& summary : summaries) {
    stats.add(summary.value());
  }
  return stats;
}

std::vector<PairingStats> BatchRunner::run() const {
  std::vector<PairingStats> out;
  for (const pairing_t& pairing : pairings()) {
    out.push_back(run_pairing(pairing));
  }
  return out;
}

boost::json::object BatchRunner::report(const std::vector<PairingStats>& stats) const {
  boost::json::array arr;
  for (const PairingStats& s : stats) {
    arr.push_back(s.to_json());
  }

  boost::json::object obj;
  obj["scenario"] = scenario_.name();
  obj["base_seed"] = base_seed_;
  obj["num_games"] = params_.num_games;
  obj["max_turns"] = params_.max_turns;
  obj["pairings"] = arr;
  return obj;
}

GameSummary BatchRunner::play_game(const Scenario& scenario, Policy& policy_a, Policy& policy_b,
                                   uint64_t seed, int max_turns) {
  GameEngine engine(scenario, GameEngine::Params{.seed = seed, .max_turns = max_turns});
  std::mt19937 prng_a = util::Random::make_prng(util::Random::derive_seed(engine.seed(), 1));
  std::mt19937 prng_b = util::Random::make_prng(util::Random::derive_seed(engine.seed(), 2));

  policy_a.start_game(Player::kA);
  policy_b.start_game(Player::kB);

  while (!engine.is_over()) {
    GameState state = engine.current_state();
    Action a = policy_a.choose_action(state, Player::kA, engine.action_menu(Player::kA), prng_a);
    Action b = policy_b.choose_action(state, Player::kB, engine.action_menu(Player::kB), prng_b);

    TurnResult result = engine.submit_actions(a, b);
    if (!result.success) {
      throw util::Exception("Game seed {}: {} vs {} rejected on turn {}: {}", engine.seed(),
                            policy_a.name(), policy_b.name(), state.turn(),
                            result.error.value_or(""));
    }
  }

  GameEnding ending = engine.ending().value();
  GameState final_state = engine.current_state();

  GameSummary summary;
  summary.seed = engine.seed();
  summary.ending_type = ending.ending_type();
  summary.turn = ending.turn();
  summary.vp_a = ending.vp_a();
  summary.vp_b = ending.vp_b();
  summary.total_a = ending.total_a();
  summary.total_b = ending.total_b();
  summary.final_position_a = final_state.position_a();
  summary.final_position_b = final_state.position_b();
  summary.final_risk = final_state.risk_level();

  if (ending.ending_type() != EndingType::kMutualDestruction) {
    double diff = summary.total_a - summary.total_b;
    if (std::abs(diff) < kTieTolerance) {
      summary.tie = true;
    } else {
      summary.winner = diff > 0 ? Player::kA : Player::kB;
    }
  }
  return summary;
}

}  // namespace brinksmanship
