#include "brinksmanship/Scenario.hpp"

#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Exceptions.hpp"
#include "brinksmanship/MatrixConstructors.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

namespace brinksmanship {

namespace {

const boost::json::object& as_object(const boost::json::value& jv, const char* what) {
  if (!jv.is_object()) {
    throw ScenarioError("{} must be a JSON object", what);
  }
  return jv.as_object();
}

std::string get_string(const boost::json::object& obj, const char* key,
                       const std::string& default_value) {
  const boost::json::value* jv = obj.if_contains(key);
  if (!jv || jv->is_null()) return default_value;
  if (!jv->is_string()) {
    throw ScenarioError("\"{}\" must be a string", key);
  }
  return std::string(jv->as_string());
}

std::map<std::string, std::string> get_string_map(const boost::json::object& obj,
                                                  const char* key) {
  std::map<std::string, std::string> out;
  const boost::json::value* jv = obj.if_contains(key);
  if (!jv || jv->is_null()) return out;
  if (!jv->is_object()) {
    throw ScenarioError("\"{}\" must be a JSON object", key);
  }
  for (const auto& kv : jv->as_object()) {
    if (!kv.value().is_string()) {
      throw ScenarioError("\"{}.{}\" must be a string", key, std::string_view(kv.key()));
    }
    out[std::string(kv.key())] = std::string(kv.value().as_string());
  }
  return out;
}

boost::json::object string_map_to_json(const std::map<std::string, std::string>& m) {
  boost::json::object obj;
  for (const auto& [k, v] : m) obj[k] = v;
  return obj;
}

std::string linear_turn_key(int turn) { return std::format("turn_{}", turn); }

constexpr std::string_view kTurnKeys[] = {"turn",
                                          "narrative_briefing",
                                          "matrix_type",
                                          "matrix_parameters",
                                          "outcome_narratives",
                                          "branches",
                                          "default_next",
                                          "settlement_available",
                                          "settlement_failed_narrative"};

// Accepted in scenario files but not read: the act is derived from the turn, and the per-turn
// action list is replaced by the risk-tiered menu.
constexpr std::string_view kIgnoredTurnKeys[] = {"act", "actions", "action_menu"};

void check_turn_keys(const boost::json::object& obj, int turn) {
  for (const auto& kv : obj) {
    std::string_view key = kv.key();
    if (std::ranges::find(kTurnKeys, key) != std::end(kTurnKeys)) continue;
    if (std::ranges::find(kIgnoredTurnKeys, key) != std::end(kIgnoredTurnKeys)) {
      LOG_DEBUG("Turn {}: ignoring \"{}\"", turn, key);
      continue;
    }
    throw ScenarioError("Turn {}: unknown key \"{}\"", turn, key);
  }
}

}  // namespace

int act_for_turn(int turn) {
  if (turn <= kLastTurnOfActI) return 1;
  if (turn <= kLastTurnOfActII) return 2;
  return 3;
}

PayoffMatrix TurnConfiguration::build_matrix() const { return build(matrix_type, matrix_params); }

TurnConfiguration TurnConfiguration::make_default(int turn) {
  TurnConfiguration config;
  config.turn = turn;
  config.act = act_for_turn(turn);
  switch (config.act) {
    case 1:
      config.matrix_type = MatrixType::kStagHunt;
      break;
    case 2:
      config.matrix_type = MatrixType::kPrisonersDilemma;
      break;
    default:
      config.matrix_type = MatrixType::kChicken;
      break;
  }
  config.matrix_params = default_params(config.matrix_type);
  config.narrative_briefing = std::format("Turn {} - The situation develops...", turn);
  return config;
}

TurnConfiguration TurnConfiguration::from_json(const boost::json::value& jv, int fallback_turn) {
  const boost::json::object& obj = as_object(jv, "turn");

  TurnConfiguration config;
  config.turn = fallback_turn;
  if (const boost::json::value* t = obj.if_contains("turn")) {
    if (!t->is_int64() && !t->is_uint64()) {
      throw ScenarioError("\"turn\" must be an integer");
    }
    config.turn = t->to_number<int>();
  }
  if (config.turn < 1) {
    throw ScenarioError("\"turn\" must be >= 1 (got {})", config.turn);
  }
  check_turn_keys(obj, config.turn);
  config.act = act_for_turn(config.turn);
  config.narrative_briefing = get_string(obj, "narrative_briefing", "");

  std::string tag = get_string(obj, "matrix_type", "prisoners_dilemma");
  try {
    config.matrix_type = parse_matrix_type(tag);
  } catch (const UnknownTagError& e) {
    throw UnknownTagError("Turn {}: {}", config.turn, e.what());
  }

  config.matrix_params = default_params(config.matrix_type);
  if (const boost::json::value* p = obj.if_contains("matrix_parameters")) {
    if (!p->is_null()) {
      config.matrix_params = MatrixParameters::from_json(as_object(*p, "matrix_parameters"),
                                                         config.matrix_params);
    }
  }

  config.outcome_narratives = get_string_map(obj, "outcome_narratives");
  config.branches = get_string_map(obj, "branches");

  if (const boost::json::value* d = obj.if_contains("default_next")) {
    if (!d->is_null()) {
      if (!d->is_string()) throw ScenarioError("\"default_next\" must be a string");
      config.default_next = std::string(d->as_string());
    }
  }

  if (const boost::json::value* s = obj.if_contains("settlement_available")) {
    if (!s->is_bool()) throw ScenarioError("\"settlement_available\" must be a boolean");
    config.settlement_available = s->as_bool();
  }
  config.settlement_failed_narrative =
    get_string(obj, "settlement_failed_narrative", kDefaultSettlementFailedNarrative);
  return config;
}

boost::json::object TurnConfiguration::to_json() const {
  boost::json::object obj;
  obj["turn"] = turn;
  obj["narrative_briefing"] = narrative_briefing;
  obj["matrix_type"] = matrix_type_tag(matrix_type);
  obj["matrix_parameters"] = matrix_params.to_json();
  obj["outcome_narratives"] = string_map_to_json(outcome_narratives);
  obj["branches"] = string_map_to_json(branches);
  if (default_next) {
    obj["default_next"] = *default_next;
  } else {
    obj["default_next"] = nullptr;
  }
  obj["settlement_available"] = settlement_available;
  obj["settlement_failed_narrative"] = settlement_failed_narrative;
  return obj;
}

Scenario::Scenario(std::string name, std::string setting)
    : name_(std::move(name)), setting_(std::move(setting)) {}

Scenario Scenario::from_json(const boost::json::value& jv) {
  const boost::json::object& obj = as_object(jv, "scenario");
  Scenario scenario(get_string(obj, "name", "Untitled"), get_string(obj, "setting", ""));

  if (const boost::json::value* turns = obj.if_contains("turns")) {
    if (!turns->is_array()) throw ScenarioError("\"turns\" must be a JSON array");
    int i = 0;
    for (const boost::json::value& t : turns->as_array()) {
      TurnConfiguration config = TurnConfiguration::from_json(t, i + 1);
      std::string key = linear_turn_key(config.turn);
      if (i == 0) scenario.first_turn_key_ = key;
      scenario.add_turn(key, config);
      i++;
    }
  }

  if (const boost::json::value* branches = obj.if_contains("branches")) {
    for (const auto& kv : as_object(*branches, "branches")) {
      scenario.add_turn(std::string(kv.key()), TurnConfiguration::from_json(kv.value(), 1));
    }
  }

  scenario.validate();
  LOG_DEBUG("Loaded scenario '{}' with {} turn configurations", scenario.name(),
            scenario.num_turns());
  return scenario;
}

Scenario Scenario::load(const boost::filesystem::path& path) {
  boost::json::value jv;
  try {
    jv = boost_util::read_json_file(path);
  } catch (const util::CleanException& e) {
    throw ScenarioError("Failed to load scenario {}: {}", path.string(), e.what());
  }
  try {
    return from_json(jv);
  } catch (const ScenarioError& e) {
    throw ScenarioError("Malformed scenario {}: {}", path.string(), e.what());
  }
}

Scenario Scenario::make_linear(const std::string& name, MatrixType type, int num_turns) {
  Scenario scenario(name, "");
  for (int turn = 1; turn <= num_turns; ++turn) {
    TurnConfiguration config = TurnConfiguration::make_default(turn);
    config.matrix_type = type;
    config.matrix_params = default_params(type);
    scenario.add_turn(linear_turn_key(turn), config);
  }
  scenario.first_turn_key_ = linear_turn_key(1);
  return scenario;
}

std::string Scenario::first_turn_key() const {
  return first_turn_key_ ? *first_turn_key_ : linear_turn_key(1);
}

const TurnConfiguration* Scenario::find(const std::string& key) const {
  auto it = turns_.find(key);
  return it == turns_.end() ? nullptr : &it->second;
}

void Scenario::add_turn(const std::string& key, const TurnConfiguration& config) {
  turns_[key] = config;
}

void Scenario::validate() const {
  for (const auto& [key, config] : turns_) {
    try {
      config.build_matrix();
    } catch (const ConstraintError& e) {
      throw ConstraintError("Turn {}: {}", key, e.what());
    }
  }
}

boost::json::object Scenario::to_json() const {
  boost::json::object obj;
  obj["name"] = name_;
  obj["setting"] = setting_;

  // Linear turns in turn order, everything else under "branches"
  std::vector<const TurnConfiguration*> linear;
  boost::json::object branches;
  for (const auto& [key, config] : turns_) {
    if (key == linear_turn_key(config.turn)) {
      linear.push_back(&config);
    } else {
      branches[key] = config.to_json();
    }
  }
  auto by_turn = [](const TurnConfiguration* x, const TurnConfiguration* y) {
    return x->turn < y->turn;
  };
  std::sort(linear.begin(), linear.end(), by_turn);

  boost::json::array turns;
  for (const TurnConfiguration* config : linear) turns.push_back(config->to_json());
  obj["turns"] = std::move(turns);
  obj["branches"] = std::move(branches);
  return obj;
}

}  // namespace brinksmanship
