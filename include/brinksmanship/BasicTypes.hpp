#pragma once

#include <magic_enum/magic_enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace brinksmanship {

enum class Player : int8_t { kA, kB };

enum class ActionType : int8_t { kCooperative, kCompetitive };

enum class ActionCategory : int8_t {
  kStandard,
  kSettlement,
  kReconnaissance,
  kInspection,
  kCostlySignaling
};

enum class MatrixType : int8_t {
  // dominant-strategy games
  kPrisonersDilemma,
  kDeadlock,
  kHarmony,

  // anti-coordination games
  kChicken,
  kVolunteersDilemma,
  kWarOfAttrition,

  // coordination games
  kPureCoordination,
  kStagHunt,
  kBattleOfSexes,
  kLeader,

  // zero-sum and information games
  kMatchingPennies,
  kInspectionGame,
  kReconnaissance,

  // same structure as kPrisonersDilemma, different framing
  kSecurityDilemma
};

enum class EndingType : int8_t {
  kMutualDestruction,
  kPositionCollapseA,
  kPositionCollapseB,
  kResourceExhaustionA,
  kResourceExhaustionB,
  kCrisisTermination,
  kNaturalEnding,
  kSettlement
};

enum class TurnPhase : int8_t {
  kBriefing,
  kDecision,
  kResolution,
  kStateUpdate,
  kCheckDeterministic,
  kCheckCrisis,
  kCheckNatural,
  kAdvance,
  kGameOver
};

// Outcome codes recorded on each ActionResult, and used as branch-map keys
constexpr const char* kOutcomeCC = "CC";
constexpr const char* kOutcomeCD = "CD";
constexpr const char* kOutcomeDC = "DC";
constexpr const char* kOutcomeDD = "DD";
constexpr const char* kOutcomeRecon = "RECON";
constexpr const char* kOutcomeInspect = "INSPECT";
constexpr const char* kOutcomeSettle = "SETTLE";
constexpr const char* kOutcomeSettleFail = "SETTLE_FAIL";

inline Player opponent(Player p) { return p == Player::kA ? Player::kB : Player::kA; }

// "A" or "B"
inline const char* player_name(Player p) { return p == Player::kA ? "A" : "B"; }

// 'C' for cooperative, 'D' for competitive
inline char outcome_char(ActionType t) { return t == ActionType::kCooperative ? 'C' : 'D'; }

/*
 * Converts an enum value to its snake_case tag: MatrixType::kPrisonersDilemma becomes
 * "prisoners_dilemma", EndingType::kPositionCollapseA becomes "position_collapse_a". These tags
 * are the names used in scenario files and serialized state.
 */
template <typename E>
std::string enum_to_tag(E e);

// Inverse of enum_to_tag(). Returns std::nullopt if tag matches no value of E.
template <typename E>
std::optional<E> enum_from_tag(std::string_view tag);

}  // namespace brinksmanship

#include "inline/brinksmanship/BasicTypes.inl"
