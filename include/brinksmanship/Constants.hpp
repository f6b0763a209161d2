#pragma once

namespace brinksmanship {

// State ranges and defaults
constexpr double kMinPosition = 0.0;
constexpr double kMaxPosition = 10.0;
constexpr double kMinResources = 0.0;
constexpr double kMaxResources = 10.0;
constexpr double kDefaultPosition = 5.0;
constexpr double kDefaultResources = 5.0;

constexpr double kMinCooperation = 0.0;
constexpr double kMaxCooperation = 10.0;
constexpr double kDefaultCooperation = 5.0;

constexpr double kMinStability = 1.0;
constexpr double kMaxStability = 10.0;
constexpr double kDefaultStability = 5.0;

constexpr double kMinRisk = 0.0;
constexpr double kMaxRisk = 10.0;
constexpr double kDefaultRisk = 2.0;

constexpr int kMinMaxTurns = 12;
constexpr int kMaxMaxTurns = 16;
constexpr int kDefaultMaxTurns = 14;

// Acts: I is turns 1-4, II is turns 5-8, III is turns 9+
constexpr int kLastTurnOfActI = 4;
constexpr int kLastTurnOfActII = 8;
constexpr double kActMultipliers[3] = {0.7, 1.0, 1.3};

// Variance
constexpr double kBaseSigma = 8.0;
constexpr double kRiskSigmaFactor = 1.2;
constexpr double kChaosBase = 1.2;
constexpr double kChaosCooperationDivisor = 50.0;
constexpr double kInstabilityDivisor = 20.0;

// Information decay
constexpr double kUnknownCenter = 5.0;
constexpr double kUncertaintyPerTurn = 0.8;
constexpr double kMaxUncertainty = 5.0;

// Stability update
constexpr double kStabilityDecay = 0.8;
constexpr double kStabilityPull = 1.0;
constexpr double kConsistencyBonus = 1.5;
constexpr double kOneSwitchPenalty = 3.5;
constexpr double kTwoSwitchPenalty = 5.5;

// StateDeltas bounds
constexpr double kMaxPositionDelta = 1.5;
constexpr double kMaxResourceCost = 1.0;
constexpr double kMinRiskDelta = -1.0;
constexpr double kMaxRiskDelta = 2.0;
constexpr double kMaxNetPositionDelta = 0.5;
constexpr double kRiskWeightScale = 5.0;
constexpr double kWeightSumTolerance = 1e-6;

// Endings
constexpr int kCrisisMinTurn = 10;
constexpr double kCrisisRiskThreshold = 7.0;
constexpr double kCrisisProbabilityPerRisk = 0.08;
constexpr double kMutualDestructionVP = 20.0;
constexpr double kPositionCollapseLoserVP = 10.0;
constexpr double kResourceExhaustionLoserVP = 15.0;
constexpr double kFinalVPMin = 5.0;
constexpr double kFinalVPMax = 95.0;
constexpr double kTotalVP = 100.0;

// Settlement
constexpr int kSettlementMinTurn = 4;  // settlement opens strictly after this turn
constexpr double kSettlementMinStability = 2.0;
constexpr double kSettlementVPMin = 5.0;
constexpr double kSettlementVPMax = 95.0;
constexpr double kSettlementCooperationBonus = 2.0;
constexpr int kOfferMinVP = 20;
constexpr int kOfferMaxVP = 80;
constexpr int kOfferBand = 10;
constexpr double kOfferPositionFactor = 5.0;
constexpr double kFailedSettlementRisk = 1.0;

// Cooperation surplus
constexpr double kSurplusBase = 2.0;
constexpr double kSurplusStreakBonus = 0.1;
constexpr double kCaptureRate = 0.4;
constexpr double kDDBurnRate = 0.2;
constexpr double kDefaultSurplusShare = 0.5;

// Special actions
constexpr double kReconnaissanceCost = 0.5;
constexpr double kReconnaissanceDetectedRisk = 0.5;
constexpr double kInspectionCost = 0.3;
constexpr double kCaughtCheatingPositionPenalty = 0.5;
constexpr double kCaughtCheatingRisk = 1.0;
constexpr double kSignalCostStrong = 0.3;
constexpr double kSignalCostModerate = 0.7;
constexpr double kSignalCostWeak = 1.2;
constexpr double kSignalStrongPosition = 7.0;
constexpr double kSignalModeratePosition = 4.0;

// Menu risk tiers, applied to the integer part of the risk level
constexpr int kLowRiskTierMax = 3;
constexpr int kMediumRiskTierMax = 6;

}  // namespace brinksmanship
