#include "brinksmanship/Serialization.hpp"

#include "brinksmanship/Exceptions.hpp"
#include "util/Exception.hpp"

#include <string>

namespace brinksmanship {

namespace {

const boost::json::object& require_object(const boost::json::value& jv, const char* what) {
  if (!jv.is_object()) throw util::CleanException("{}: expected a JSON object", what);
  return jv.as_object();
}

const boost::json::value& require(const boost::json::object& obj, const char* key) {
  const boost::json::value* jv = obj.if_contains(key);
  if (!jv) throw util::CleanException("missing field \"{}\"", key);
  return *jv;
}

double get_double(const boost::json::object& obj, const char* key) {
  const boost::json::value& jv = require(obj, key);
  if (!jv.is_number()) throw util::CleanException("field \"{}\" must be a number", key);
  return jv.to_number<double>();
}

int get_int(const boost::json::object& obj, const char* key) {
  const boost::json::value& jv = require(obj, key);
  if (!jv.is_int64() && !jv.is_uint64()) {
    throw util::CleanException("field \"{}\" must be an integer", key);
  }
  return jv.to_number<int>();
}

std::string get_string(const boost::json::object& obj, const char* key) {
  const boost::json::value& jv = require(obj, key);
  if (!jv.is_string()) throw util::CleanException("field \"{}\" must be a string", key);
  return std::string(jv.as_string());
}

template <typename E>
E get_enum(const boost::json::object& obj, const char* key) {
  std::string tag = get_string(obj, key);
  auto e = enum_from_tag<E>(tag);
  if (!e) throw util::CleanException("field \"{}\": unknown value \"{}\"", key, tag);
  return *e;
}

double non_negative(double x, const char* key) {
  if (x < 0) throw RangeError("{} must be non-negative (got {})", key, x);
  return x;
}

boost::json::value observation_to_json(const std::optional<Observation>& obs) {
  if (!obs) return nullptr;
  boost::json::object obj;
  obj["value"] = obs->value;
  obj["observed_turn"] = obs->observed_turn;
  return obj;
}

std::optional<Observation> observation_from_json(const boost::json::object& obj,
                                                 const char* key) {
  const boost::json::value& jv = require(obj, key);
  if (jv.is_null()) return std::nullopt;
  const boost::json::object& o = require_object(jv, key);
  return Observation{get_double(o, "value"), get_int(o, "observed_turn")};
}

}  // namespace

boost::json::object to_json(const InformationState& info) {
  boost::json::object obj;
  obj["known_position"] = observation_to_json(info.known_position());
  obj["known_resources"] = observation_to_json(info.known_resources());
  return obj;
}

boost::json::object to_json(const PlayerState& player) {
  boost::json::object obj;
  obj["position"] = player.position();
  obj["resources"] = player.resources();
  if (player.previous_type()) {
    obj["previous_type"] = enum_to_tag(*player.previous_type());
  } else {
    obj["previous_type"] = nullptr;
  }
  obj["information"] = to_json(player.information());
  return obj;
}

boost::json::object to_json(const GameState& state) {
  boost::json::object obj;
  obj["player_a"] = to_json(state.player_a());
  obj["player_b"] = to_json(state.player_b());
  obj["cooperation_score"] = state.cooperation_score();
  obj["stability"] = state.stability();
  obj["risk_level"] = state.risk_level();
  obj["turn"] = state.turn();
  obj["max_turns"] = state.max_turns();
  obj["cooperation_surplus"] = state.cooperation_surplus();
  obj["surplus_captured_a"] = state.surplus_captured_a();
  obj["surplus_captured_b"] = state.surplus_captured_b();
  obj["cooperation_streak"] = state.cooperation_streak();
  return obj;
}

boost::json::object to_json(const GameEnding& ending) {
  boost::json::object obj;
  obj["ending_type"] = enum_to_tag(ending.ending_type());
  obj["vp_a"] = ending.vp_a();
  obj["vp_b"] = ending.vp_b();
  obj["turn"] = ending.turn();
  obj["description"] = ending.description();
  obj["surplus_a"] = ending.surplus_a();
  obj["surplus_b"] = ending.surplus_b();
  return obj;
}

boost::json::object to_json(const ActionResult& result) {
  boost::json::object obj;
  obj["action_a"] = enum_to_tag(result.action_a);
  obj["action_b"] = enum_to_tag(result.action_b);
  obj["position_delta_a"] = result.position_delta_a;
  obj["position_delta_b"] = result.position_delta_b;
  obj["resource_cost_a"] = result.resource_cost_a;
  obj["resource_cost_b"] = result.resource_cost_b;
  obj["risk_delta"] = result.risk_delta;
  obj["outcome_code"] = result.outcome_code;
  obj["narrative"] = result.narrative;
  obj["a_learns_position"] = result.a_learns_position;
  obj["b_learns_position"] = result.b_learns_position;
  obj["a_learns_resources"] = result.a_learns_resources;
  obj["b_learns_resources"] = result.b_learns_resources;
  if (result.surplus_share_a) {
    obj["surplus_share_a"] = *result.surplus_share_a;
  } else {
    obj["surplus_share_a"] = nullptr;
  }
  return obj;
}

boost::json::object to_json(const TurnRecord& record) {
  auto action_json = [](const std::optional<Action>& action) -> boost::json::value {
    if (!action) return nullptr;
    boost::json::object obj;
    obj["name"] = action->name;
    obj["type"] = enum_to_tag(action->type);
    obj["category"] = enum_to_tag(action->category);
    obj["resource_cost"] = action->resource_cost;
    return obj;
  };

  boost::json::object obj;
  obj["turn"] = record.turn;
  obj["phase"] = enum_to_tag(record.phase);
  obj["action_a"] = action_json(record.action_a);
  obj["action_b"] = action_json(record.action_b);
  if (record.outcome) {
    obj["outcome"] = *record.outcome;
  } else {
    obj["outcome"] = nullptr;
  }
  obj["state_before"] = to_json(record.state_before);
  if (record.state_after) {
    obj["state_after"] = to_json(*record.state_after);
  } else {
    obj["state_after"] = nullptr;
  }
  obj["narrative"] = record.narrative;
  obj["matrix_type"] = enum_to_tag(record.matrix_type);
  return obj;
}

InformationState information_state_from_json(const boost::json::value& jv) {
  const boost::json::object& obj = require_object(jv, "information");
  InformationState info;
  if (auto obs = observation_from_json(obj, "known_position")) {
    info.observe_position(obs->value, obs->observed_turn);
  }
  if (auto obs = observation_from_json(obj, "known_resources")) {
    info.observe_resources(obs->value, obs->observed_turn);
  }
  return info;
}

PlayerState player_state_from_json(const boost::json::value& jv) {
  const boost::json::object& obj = require_object(jv, "player");
  PlayerState player(get_double(obj, "position"), get_double(obj, "resources"));
  if (!require(obj, "previous_type").is_null()) {
    player.set_previous_type(get_enum<ActionType>(obj, "previous_type"));
  }
  player.information() = information_state_from_json(require(obj, "information"));
  return player;
}

GameState game_state_from_json(const boost::json::value& jv) {
  const boost::json::object& obj = require_object(jv, "game state");
  GameState state(player_state_from_json(require(obj, "player_a")),
                  player_state_from_json(require(obj, "player_b")),
                  get_double(obj, "cooperation_score"), get_double(obj, "stability"),
                  get_double(obj, "risk_level"), get_int(obj, "turn"),
                  get_int(obj, "max_turns"));

  state.set_cooperation_surplus(
    non_negative(get_double(obj, "cooperation_surplus"), "cooperation_surplus"));
  state.set_surplus_captured(
    Player::kA, non_negative(get_double(obj, "surplus_captured_a"), "surplus_captured_a"));
  state.set_surplus_captured(
    Player::kB, non_negative(get_double(obj, "surplus_captured_b"), "surplus_captured_b"));

  int streak = get_int(obj, "cooperation_streak");
  if (streak < 0) throw RangeError("cooperation_streak must be non-negative (got {})", streak);
  state.set_cooperation_streak(streak);
  return state;
}

GameEnding game_ending_from_json(const boost::json::value& jv) {
  const boost::json::object& obj = require_object(jv, "game ending");
  return GameEnding(get_enum<EndingType>(obj, "ending_type"), get_double(obj, "vp_a"),
                    get_double(obj, "vp_b"), get_int(obj, "turn"),
                    get_string(obj, "description"), get_double(obj, "surplus_a"),
                    get_double(obj, "surplus_b"));
}

}  // namespace brinksmanship
