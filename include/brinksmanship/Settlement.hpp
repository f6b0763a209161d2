#pragma once

#include "brinksmanship/Actions.hpp"
#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/Endings.hpp"
#include "brinksmanship/GameState.hpp"
#include "brinksmanship/Variance.hpp"

#include <utility>

namespace brinksmanship {

/*
 * Base VP of a mutual settlement: A's share of total position, shifted by 2 VP per point of
 * cooperation above 5, clamped to [5, 95]. B gets the rest.
 */
VPSplit settlement_vp(const GameState& state);

// The range of VP a player may ask for in a settlement offer.
struct SettlementConstraints {
  int min_vp;
  int max_vp;
  int suggested_vp;
};

/*
 * suggested = 50 + 5 per point of position lead + 2 per point of cooperation above 5, clamped to
 * [20, 80]. The allowed range is 10 VP either side of it, within [20, 80].
 */
SettlementConstraints settlement_constraints(const GameState& state, Player player);

// Throws ConstraintError if offered_vp lies outside settlement_constraints(state, player).
void validate_settlement_offer(int offered_vp, const GameState& state, Player player);

// {proposer, recipient}: the player with the higher position proposes. A wins ties.
std::pair<Player, Player> settlement_roles(const GameState& state);

/*
 * The ending of a mutual settlement. The VP split is taken from before, the state in which both
 * players proposed. The surplus paid out is what each player holds in after, once the pool has
 * been divided.
 */
GameEnding settlement_ending(const GameState& before, const GameState& after);

// A's share of the surplus pool: the average of what A asked for and what B left to A.
double negotiated_surplus_share(const Action& action_a, const Action& action_b);

}  // namespace brinksmanship
