#pragma once

#include "brinksmanship/Actions.hpp"
#include "brinksmanship/GameState.hpp"
#include "brinksmanship/Scenario.hpp"

#include <cstdint>

/*
 * Turn resolution: maps the two submitted actions onto an ActionResult.
 *
 * Exactly one mode resolves each turn, chosen by priority: a settlement proposal from either
 * side, then reconnaissance, then inspection, then the turn's payoff matrix. Costly signaling is
 * resolved through the matrix.
 *
 * Nothing here modifies the state; apply_action_result() does that.
 */
namespace brinksmanship {

enum class ResolutionMode : int8_t { kSettlement, kReconnaissance, kInspection, kMatrix };

ResolutionMode resolution_mode(const Action& action_a, const Action& action_b);

enum class ReconChoice : int8_t { kProbe, kMask };
enum class ReconResponse : int8_t { kVigilant, kProject };

struct ReconOutcome {
  bool detected;                   // risk rises by 0.5
  bool initiator_learns_position;  // the responder's position is revealed
  bool responder_learns_position;  // the initiator's position is revealed
};

/*
 *              Vigilant    Project
 *   Probe      detected    initiator learns
 *   Mask       nothing     responder learns
 */
ReconOutcome reconnaissance_outcome(ReconChoice choice, ReconResponse response);

ActionResult resolve_matrix(const GameState& state, const Action& action_a,
                            const Action& action_b, const TurnConfiguration& config);

ActionResult resolve_reconnaissance(const GameState& state, const Action& action_a,
                                    const Action& action_b);

ActionResult resolve_inspection(const GameState& state, const Action& action_a,
                                const Action& action_b);

/*
 * Outcome SETTLE when both players propose, with the negotiated surplus share set. Outcome
 * SETTLE_FAIL with risk +1 when only one does.
 */
ActionResult resolve_settlement(const GameState& state, const Action& action_a,
                                const Action& action_b, const TurnConfiguration& config);

// Dispatches on resolution_mode().
ActionResult resolve_actions(const GameState& state, const Action& action_a,
                             const Action& action_b, const TurnConfiguration& config);

}  // namespace brinksmanship
