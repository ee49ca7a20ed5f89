// MoldCheck - FeasibilityEvaluator Tests

#include <gtest/gtest.h>

#include "core/molding/feasibility_evaluator.h"

using namespace mc;
using namespace mc::molding;

namespace {

// Clean part: no rule fires
FeasibilityInput cleanInput() {
    FeasibilityInput in;
    in.minThicknessMm = 2.0;
    in.maxThicknessMm = 3.0;
    in.flowRatio = 30.0;
    in.maxFlowLengthRatio = 150.0;
    in.projectedAreaCm2 = 100.0;
    in.recommendedTonnage = 120.0;
    return in;
}

std::vector<WarningKind> kinds(const std::vector<Warning>& warnings) {
    std::vector<WarningKind> out;
    for (const auto& w : warnings) out.push_back(w.kind);
    return out;
}

Warning warningOf(Severity s) {
    Warning w;
    w.severity = s;
    return w;
}

} // namespace

// ============================================================================
// Rule table
// ============================================================================

TEST(FeasibilityEvaluator, RuleTable_DeclaredOrder) {
    const auto& rules = FeasibilityEvaluator::rules();
    ASSERT_EQ(rules.size(), 7u);
    EXPECT_EQ(rules[0].kind, WarningKind::ThickSection);
    EXPECT_EQ(rules[1].kind, WarningKind::VeryThickSection);
    EXPECT_EQ(rules[2].kind, WarningKind::ThinSection);
    EXPECT_EQ(rules[3].kind, WarningKind::HighFlowRatio);
    EXPECT_EQ(rules[4].kind, WarningKind::BorderlineFlowRatio);
    EXPECT_EQ(rules[5].kind, WarningKind::LargeProjectedArea);
    EXPECT_EQ(rules[6].kind, WarningKind::HighTonnage);
}

TEST(FeasibilityEvaluator, CleanPart_NoWarnings) {
    EXPECT_TRUE(FeasibilityEvaluator::evaluate(cleanInput()).empty());
}

TEST(FeasibilityEvaluator, ThickSection_StrictlyAbove4mm) {
    auto in = cleanInput();
    in.maxThicknessMm = 4.0;
    EXPECT_TRUE(FeasibilityEvaluator::evaluate(in).empty());

    in.maxThicknessMm = 4.01;
    auto w = FeasibilityEvaluator::evaluate(in);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, WarningKind::ThickSection);
    EXPECT_EQ(w[0].severity, Severity::Medium);
    EXPECT_TRUE(w[0].remediation.has_value());
    EXPECT_NE(w[0].designerMessage.find("4.0mm"), std::string::npos);
}

TEST(FeasibilityEvaluator, VeryThick_8mmFiresBothRules) {
    auto in = cleanInput();
    in.maxThicknessMm = 8.0;
    auto w = FeasibilityEvaluator::evaluate(in);
    EXPECT_EQ(kinds(w),
              (std::vector<WarningKind>{WarningKind::ThickSection, WarningKind::VeryThickSection}));
    EXPECT_EQ(w[1].severity, Severity::High);
    EXPECT_EQ(FeasibilityEvaluator::scoreWarnings(w), 55);
    EXPECT_EQ(FeasibilityEvaluator::assess(w).status, FeasibilityStatus::Borderline);
}

TEST(FeasibilityEvaluator, ThinSection_Below1mm) {
    auto in = cleanInput();
    in.minThicknessMm = 1.0;
    EXPECT_TRUE(FeasibilityEvaluator::evaluate(in).empty());

    in.minThicknessMm = 0.9;
    auto w = FeasibilityEvaluator::evaluate(in);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, WarningKind::ThinSection);
}

TEST(FeasibilityEvaluator, FlowRatio_AtLimitIsBorderline) {
    auto in = cleanInput();
    in.flowRatio = in.maxFlowLengthRatio;
    auto w = FeasibilityEvaluator::evaluate(in);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, WarningKind::BorderlineFlowRatio);
    EXPECT_EQ(w[0].severity, Severity::Low);
}

TEST(FeasibilityEvaluator, FlowRatio_AboveLimitIsHighOnly) {
    auto in = cleanInput();
    in.flowRatio = 151.0;
    auto w = FeasibilityEvaluator::evaluate(in);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, WarningKind::HighFlowRatio);
    EXPECT_EQ(w[0].severity, Severity::High);
}

TEST(FeasibilityEvaluator, FlowRatio_BorderlineLowerBound) {
    auto in = cleanInput();
    in.maxFlowLengthRatio = 100.0;
    in.flowRatio = 70.0;
    ASSERT_EQ(FeasibilityEvaluator::evaluate(in).size(), 1u);

    in.flowRatio = 69.9;
    EXPECT_TRUE(FeasibilityEvaluator::evaluate(in).empty());
}

TEST(FeasibilityEvaluator, LargeAreaAndHighTonnage) {
    auto in = cleanInput();
    in.projectedAreaCm2 = 500.0;
    in.recommendedTonnage = 500.0;
    EXPECT_TRUE(FeasibilityEvaluator::evaluate(in).empty());

    in.projectedAreaCm2 = 600.0;
    in.recommendedTonnage = 650.0;
    EXPECT_EQ(kinds(FeasibilityEvaluator::evaluate(in)),
              (std::vector<WarningKind>{WarningKind::LargeProjectedArea, WarningKind::HighTonnage}));
}

TEST(FeasibilityEvaluator, AllRules_EvaluationOrder) {
    FeasibilityInput in;
    in.minThicknessMm = 0.5;
    in.maxThicknessMm = 9.0;
    in.flowRatio = 400.0;
    in.maxFlowLengthRatio = 150.0;
    in.projectedAreaCm2 = 900.0;
    in.recommendedTonnage = 900.0;
    EXPECT_EQ(kinds(FeasibilityEvaluator::evaluate(in)),
              (std::vector<WarningKind>{WarningKind::ThickSection, WarningKind::VeryThickSection,
                                        WarningKind::ThinSection, WarningKind::HighFlowRatio,
                                        WarningKind::LargeProjectedArea,
                                        WarningKind::HighTonnage}));
}

TEST(FeasibilityEvaluator, Deterministic) {
    auto in = cleanInput();
    in.maxThicknessMm = 6.5;
    in.minThicknessMm = 0.8;
    auto a = FeasibilityEvaluator::evaluate(in);
    auto b = FeasibilityEvaluator::evaluate(in);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].kind, b[i].kind);
        EXPECT_EQ(a[i].designerMessage, b[i].designerMessage);
    }
}

// ============================================================================
// Scoring
// ============================================================================

TEST(FeasibilityEvaluator, Penalties) {
    EXPECT_EQ(FeasibilityEvaluator::severityPenalty(Severity::Low), 5);
    EXPECT_EQ(FeasibilityEvaluator::severityPenalty(Severity::Medium), 15);
    EXPECT_EQ(FeasibilityEvaluator::severityPenalty(Severity::High), 30);
}

TEST(FeasibilityEvaluator, Score_NoWarningsIs100) {
    EXPECT_EQ(FeasibilityEvaluator::scoreWarnings({}), 100);
}

TEST(FeasibilityEvaluator, Score_FlooredAtZero) {
    std::vector<Warning> w(4, warningOf(Severity::High));
    EXPECT_EQ(FeasibilityEvaluator::scoreWarnings(w), 0);
    EXPECT_EQ(FeasibilityEvaluator::assess(w).status, FeasibilityStatus::NotRecommended);
}

TEST(FeasibilityEvaluator, StatusBands) {
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(100), FeasibilityStatus::Feasible);
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(70), FeasibilityStatus::Feasible);
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(69), FeasibilityStatus::Borderline);
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(40), FeasibilityStatus::Borderline);
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(39), FeasibilityStatus::NotRecommended);
    EXPECT_EQ(FeasibilityEvaluator::statusForScore(0), FeasibilityStatus::NotRecommended);
}

TEST(FeasibilityEvaluator, NoSuitableMachineWarning) {
    auto w = FeasibilityEvaluator::makeNoSuitableMachineWarning(2000.0, 9000.0);
    EXPECT_EQ(w.kind, WarningKind::NoSuitableMachine);
    EXPECT_EQ(w.severity, Severity::Medium);
    EXPECT_FALSE(w.customerMessage.empty());
    EXPECT_NE(w.designerMessage.find("2000T"), std::string::npos);
}
