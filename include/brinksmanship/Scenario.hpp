#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/MatrixParameters.hpp"
#include "brinksmanship/PayoffMatrix.hpp"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace brinksmanship {

// Everything the engine needs to play one turn of a scenario.
struct TurnConfiguration {
  static constexpr const char* kDefaultSettlementFailedNarrative =
    "Negotiations failed. The crisis continues.";

  int turn = 1;
  int act = 1;
  std::string narrative_briefing;
  MatrixType matrix_type = MatrixType::kPrisonersDilemma;
  MatrixParameters matrix_params;

  // Keyed by outcome code: "CC", "CD", "DC", "DD"
  std::map<std::string, std::string> outcome_narratives;

  // Keyed by outcome code; values are turn keys
  std::map<std::string, std::string> branches;

  std::optional<std::string> default_next;
  bool settlement_available = true;
  std::string settlement_failed_narrative = kDefaultSettlementFailedNarrative;

  // Throws ConstraintError if matrix_params does not satisfy matrix_type.
  PayoffMatrix build_matrix() const;

  /*
   * The configuration used for a turn the scenario does not define: stag hunt in act 1,
   * prisoner's dilemma in act 2, chicken in act 3, each with default parameters.
   */
  static TurnConfiguration make_default(int turn);

  /*
   * Parses one turn object. fallback_turn is used when the object has no "turn" field. Throws
   * ScenarioError on malformed input, UnknownTagError on an unknown matrix type.
   */
  static TurnConfiguration from_json(const boost::json::value& jv, int fallback_turn);

  boost::json::object to_json() const;
};

// 1 for turns 1-4, 2 for turns 5-8, 3 afterwards
int act_for_turn(int turn);

/*
 * A set of turn configurations keyed by turn key. Linear turns are keyed "turn_{n}"; branch
 * targets use whatever key the scenario gives them.
 *
 * Scenario JSON:
 *
 * {
 *   "name": "...",
 *   "setting": "...",
 *   "turns": [ {turn object}, ... ],
 *   "branches": { "key": {turn object}, ... }
 * }
 */
class Scenario {
 public:
  Scenario() = default;
  Scenario(std::string name, std::string setting);

  /*
   * Parses a scenario and builds the matrix of every turn, so that unknown tags and constraint
   * violations surface here rather than mid-game.
   */
  static Scenario from_json(const boost::json::value& jv);

  // Reads and parses path. Throws ScenarioError naming path if it cannot be read.
  static Scenario load(const boost::filesystem::path& path);

  // turn_1 .. turn_{num_turns}, every turn playing type with its default parameters.
  static Scenario make_linear(const std::string& name, MatrixType type, int num_turns);

  const std::string& name() const { return name_; }
  const std::string& setting() const { return setting_; }

  // The key of the first turn. "turn_1" if the scenario defines no turns.
  std::string first_turn_key() const;

  const TurnConfiguration* find(const std::string& key) const;
  void add_turn(const std::string& key, const TurnConfiguration& config);
  size_t num_turns() const { return turns_.size(); }

  // Builds every turn's matrix. Throws ConstraintError naming the offending turn key.
  void validate() const;

  boost::json::object to_json() const;

 private:
  std::string name_;
  std::string setting_;
  std::optional<std::string> first_turn_key_;
  std::map<std::string, TurnConfiguration> turns_;
};

}  // namespace brinksmanship
