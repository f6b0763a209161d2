#pragma once

#include "brinksmanship/Endings.hpp"
#include "brinksmanship/GameEngine.hpp"
#include "brinksmanship/GameState.hpp"
#include "brinksmanship/InformationState.hpp"

#include <boost/json.hpp>

/*
 * JSON form of the state model, field for field. Enums are written as their snake_case tags,
 * unknown observations as null, known ones as {"value": ..., "observed_turn": ...}.
 *
 * The *_from_json() functions throw util::CleanException on missing or mistyped fields, and
 * RangeError on values outside their documented bounds.
 */
namespace brinksmanship {

boost::json::object to_json(const InformationState& info);
boost::json::object to_json(const PlayerState& player);
boost::json::object to_json(const GameState& state);
boost::json::object to_json(const GameEnding& ending);
boost::json::object to_json(const ActionResult& result);
boost::json::object to_json(const TurnRecord& record);

InformationState information_state_from_json(const boost::json::value& jv);
PlayerState player_state_from_json(const boost::json::value& jv);
GameState game_state_from_json(const boost::json::value& jv);
GameEnding game_ending_from_json(const boost::json::value& jv);

}  // namespace brinksmanship
