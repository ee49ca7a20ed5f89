#include "feasibility_evaluator.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace mc {
namespace molding {

namespace {

std::string fixed(f64 value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

bool thickSection(const FeasibilityInput& in) {
    return in.maxThicknessMm > FeasibilityEvaluator::kThickSectionMm;
}

bool veryThickSection(const FeasibilityInput& in) {
    return in.maxThicknessMm >= FeasibilityEvaluator::kVeryThickSectionMm;
}

bool thinSection(const FeasibilityInput& in) {
    return in.minThicknessMm < FeasibilityEvaluator::kThinSectionMm;
}

bool highFlowRatio(const FeasibilityInput& in) {
    return in.flowRatio > in.maxFlowLengthRatio;
}

bool borderlineFlowRatio(const FeasibilityInput& in) {
    const f64 lower = FeasibilityEvaluator::kBorderlineFlowFraction * in.maxFlowLengthRatio;
    return in.flowRatio >= lower && in.flowRatio <= in.maxFlowLengthRatio;
}

bool largeProjectedArea(const FeasibilityInput& in) {
    return in.projectedAreaCm2 > FeasibilityEvaluator::kLargeProjectedAreaCm2;
}

bool highTonnage(const FeasibilityInput& in) {
    return in.recommendedTonnage > FeasibilityEvaluator::kHighTonnage;
}

std::string thickSectionMessage(const FeasibilityInput& in) {
    return "Max thickness " + fixed(in.maxThicknessMm, 1) +
           "mm may cause sink marks and extended cooling time";
}

std::string veryThickSectionMessage(const FeasibilityInput& in) {
    return "Max thickness " + fixed(in.maxThicknessMm, 1) +
           "mm will significantly increase cycle time and risk of voids";
}

std::string thinSectionMessage(const FeasibilityInput& in) {
    return "Min thickness " + fixed(in.minThicknessMm, 1) +
           "mm risks short shots, especially far from the gate";
}

std::string highFlowRatioMessage(const FeasibilityInput& in) {
    return "Flow L/t ratio " + fixed(in.flowRatio, 0) + " exceeds the " +
           fixed(in.maxFlowLengthRatio, 0) + " material limit";
}

std::string borderlineFlowRatioMessage(const FeasibilityInput& in) {
    const f64 pct = in.maxFlowLengthRatio > 0.0 ? in.flowRatio / in.maxFlowLengthRatio * 100.0
                                                : 0.0;
    return "Flow L/t ratio " + fixed(in.flowRatio, 0) + " is " + fixed(pct, 0) + "% of the " +
           fixed(in.maxFlowLengthRatio, 0) + " material limit";
}

std::string largeProjectedAreaMessage(const FeasibilityInput& in) {
    return "Large projected area (" + fixed(in.projectedAreaCm2, 0) +
           " cm2) requires careful venting";
}

std::string highTonnageMessage(const FeasibilityInput& in) {
    return "High tonnage requirement (" + fixed(in.recommendedTonnage, 0) +
           "T) - verify machine availability";
}

const std::array<FeasibilityRule, 7> kRules = {{
    {WarningKind::ThickSection, Severity::Medium, thickSection, thickSectionMessage,
     "Thick section detected - may affect surface quality and increase cycle time",
     "Consider coring out thick sections or reducing wall thickness"},
    {WarningKind::VeryThickSection, Severity::High, veryThickSection, veryThickSectionMessage,
     "Very thick section - will increase production time and may affect part quality",
     "Strongly recommend design review to reduce thickness"},
    {WarningKind::ThinSection, Severity::Medium, thinSection, thinSectionMessage,
     "Very thin areas may be difficult to fill completely",
     "Position the gate near thin sections or increase thickness"},
    {WarningKind::HighFlowRatio, Severity::High, highFlowRatio, highFlowRatioMessage,
     "Part geometry is challenging for this material - may need additional gates",
     "Consider multiple gates, a higher-flow material, or thicker walls"},
    {WarningKind::BorderlineFlowRatio, Severity::Low, borderlineFlowRatio,
     borderlineFlowRatioMessage, "Part is close to the fill limit of this material",
     "Keep the gate central or consider a higher-flow grade"},
    {WarningKind::LargeProjectedArea, Severity::Low, largeProjectedArea,
     largeProjectedAreaMessage, "Large part size - ensure adequate machine capacity",
     "Plan for adequate venting and balanced fill"},
    {WarningKind::HighTonnage, Severity::Medium, highTonnage, highTonnageMessage,
     "Requires larger machine - may affect production costs",
     "Confirm machine availability with supplier"},
}};

} // namespace

const std::array<FeasibilityRule, 7>& FeasibilityEvaluator::rules() {
    return kRules;
}

std::vector<Warning> FeasibilityEvaluator::evaluate(const FeasibilityInput& input) {
    std::vector<Warning> warnings;
    for (const auto& rule : kRules) {
        if (!rule.applies(input)) continue;

        Warning w;
        w.kind = rule.kind;
        w.severity = rule.severity;
        w.designerMessage = rule.designerMessage(input);
        w.customerMessage = rule.customerMessage;
        if (rule.remediation) {
            w.remediation = std::string(rule.remediation);
        }
        warnings.push_back(std::move(w));
    }
    return warnings;
}

Warning FeasibilityEvaluator::makeNoSuitableMachineWarning(f64 requiredTonnage,
                                                           f64 requiredShotVolumeCm3) {
    Warning w;
    w.kind = WarningKind::NoSuitableMachine;
    w.severity = Severity::Medium;
    w.designerMessage = "No catalog machine provides " + fixed(requiredShotVolumeCm3, 1) +
                        " cm3 shot volume at around " + fixed(requiredTonnage, 0) + "T";
    w.customerMessage = "No machine in the current list can produce this part";
    w.remediation = std::string("Reduce cavity count or source a larger machine");
    return w;
}

int FeasibilityEvaluator::severityPenalty(Severity severity) {
    switch (severity) {
    case Severity::Low: return 5;
    case Severity::Medium: return 15;
    case Severity::High: return 30;
    }
    return 5;
}

int FeasibilityEvaluator::scoreWarnings(const std::vector<Warning>& warnings) {
    int score = 100;
    for (const auto& w : warnings) {
        score -= severityPenalty(w.severity);
    }
    return std::max(0, score);
}

FeasibilityStatus FeasibilityEvaluator::statusForScore(int score) {
    if (score >= kFeasibleScore) return FeasibilityStatus::Feasible;
    if (score >= kBorderlineScore) return FeasibilityStatus::Borderline;
    return FeasibilityStatus::NotRecommended;
}

FeasibilityAssessment FeasibilityEvaluator::assess(const std::vector<Warning>& warnings) {
    FeasibilityAssessment a;
    a.score = scoreWarnings(warnings);
    a.status = statusForScore(a.score);
    return a;
}

const char* FeasibilityEvaluator::statusMessage(FeasibilityStatus status) {
    switch (status) {
    case FeasibilityStatus::Feasible: return "Part appears feasible for injection molding";
    case FeasibilityStatus::Borderline:
        return "Part is moldable but has some concerns to address";
    case FeasibilityStatus::NotRecommended:
        return "Significant concerns - design review recommended before proceeding";
    }
    return "";
}

} // namespace molding
} // namespace mc
