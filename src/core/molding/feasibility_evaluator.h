#pragma once

// MoldCheck - Feasibility & Warning Evaluator
// Runs an ordered rule table over the derived numbers, then folds the
// resulting warnings into a 0-100 score and a status band.

#include <array>
#include <string>
#include <vector>

#include "../types.h"
#include "molding_types.h"

namespace mc {
namespace molding {

// Numbers the rules look at
struct FeasibilityInput {
    f64 minThicknessMm = 0.0;
    f64 maxThicknessMm = 0.0;
    f64 flowRatio = 0.0;
    f64 maxFlowLengthRatio = 0.0; // Material limit
    f64 projectedAreaCm2 = 0.0;
    f64 recommendedTonnage = 0.0;
};

struct FeasibilityAssessment {
    FeasibilityStatus status = FeasibilityStatus::Feasible;
    int score = 100;
};

// One row of the rule table
struct FeasibilityRule {
    WarningKind kind;
    Severity severity;
    bool (*applies)(const FeasibilityInput& input);
    std::string (*designerMessage)(const FeasibilityInput& input);
    const char* customerMessage;
    const char* remediation; // nullptr when there is no generic fix
};

class FeasibilityEvaluator {
  public:
    // Rule table in evaluation order
    static const std::array<FeasibilityRule, 7>& rules();

    // Warnings for every rule whose condition holds, in table order
    static std::vector<Warning> evaluate(const FeasibilityInput& input);

    // Raised by the orchestrator when no catalog machine can run the part
    static Warning makeNoSuitableMachineWarning(f64 requiredTonnage, f64 requiredShotVolumeCm3);

    // 100 - sum of penalties, floored at 0
    static int scoreWarnings(const std::vector<Warning>& warnings);
    static int severityPenalty(Severity severity);

    static FeasibilityStatus statusForScore(int score);
    static FeasibilityAssessment assess(const std::vector<Warning>& warnings);

    // One-line summary per status band
    static const char* statusMessage(FeasibilityStatus status);

    static constexpr f64 kThickSectionMm = 4.0;
    static constexpr f64 kVeryThickSectionMm = 8.0;
    static constexpr f64 kThinSectionMm = 1.0;
    static constexpr f64 kBorderlineFlowFraction = 0.7;
    static constexpr f64 kLargeProjectedAreaCm2 = 500.0;
    static constexpr f64 kHighTonnage = 500.0;

    static constexpr int kFeasibleScore = 70;
    static constexpr int kBorderlineScore = 40;
};

} // namespace molding
} // namespace mc
