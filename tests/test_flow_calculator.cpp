// MoldCheck - FlowCalculator Tests

#include <gtest/gtest.h>

#include <cmath>

#include "core/molding/flow_calculator.h"

using namespace mc;
using namespace mc::molding;

namespace {

// 50 cm3 box-ish part, 2.5 mm walls, ABS-like material
FlowInput makeInput() {
    FlowInput in;
    in.volumeCm3 = 50.0;
    in.avgThicknessMm = 2.5;
    in.maxThicknessMm = 3.0;
    in.bbox = {100.0, 50.0, 20.0};
    in.viscosity = ViscosityClass::Medium;
    in.basePressureMpa = 100.0;
    in.maxFlowLengthRatio = 150.0;
    return in;
}

} // namespace

TEST(FlowCalculator, SuppliedGate_FillTimeInRange) {
    auto in = makeInput();
    in.gateDiameterMm = 3.0;
    auto r = FlowCalculator::calculate(in);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.get().gateDiameterSupplied);
    EXPECT_DOUBLE_EQ(r.get().gateDiameterMm, 3.0);
    EXPECT_GE(r.get().fillTimeSeconds, 0.5);
    EXPECT_LE(r.get().fillTimeSeconds, 5.0);
    EXPECT_NEAR(r.get().fillTimeSeconds * r.get().flowRateCm3PerS, 50.0, 1e-9);
}

TEST(FlowCalculator, DerivedGateAndRunner) {
    auto r = FlowCalculator::calculate(makeInput());
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.get().gateDiameterSupplied);
    EXPECT_FALSE(r.get().runnerDiameterSupplied);
    EXPECT_NEAR(r.get().gateDiameterMm, 1.83, 1e-9);
    EXPECT_NEAR(r.get().runnerDiameterMm, 1.83 * 1.75, 1e-9);
}

TEST(FlowCalculator, RunnerOverrideKept) {
    auto in = makeInput();
    in.runnerDiameterMm = 6.0;
    auto r = FlowCalculator::calculate(in);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.get().runnerDiameterSupplied);
    EXPECT_DOUBLE_EQ(r.get().runnerDiameterMm, 6.0);
}

TEST(FlowCalculator, FlowRatioAndUtilisation) {
    auto r = FlowCalculator::calculate(makeInput());
    ASSERT_TRUE(r);
    EXPECT_NEAR(r.get().flowLengthMm, std::hypot(50.0, 25.0), 1e-9);
    EXPECT_NEAR(r.get().flowRatio, std::hypot(50.0, 25.0) / 2.5, 1e-9);
    EXPECT_NEAR(r.get().flowRatioUtilizationPct, r.get().flowRatio / 150.0 * 100.0, 1e-9);
}

TEST(FlowCalculator, GateLocationChangesFlowLength) {
    auto in = makeInput();
    in.gateLocationMm = Point3{0.0, 0.0, 0.0};
    auto r = FlowCalculator::calculate(in);
    ASSERT_TRUE(r);
    EXPECT_NEAR(r.get().flowLengthMm, std::sqrt(12900.0), 1e-9);
}

TEST(FlowCalculator, InjectionPressure_BelowReferenceRatioIsBase) {
    // Ratio ~22 < 50: no length penalty
    auto r = FlowCalculator::calculate(makeInput());
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.get().injectionPressureMpa, 100.0);
}

TEST(FlowCalculator, Rejects_ZeroGateOverride) {
    auto in = makeInput();
    in.gateDiameterMm = 0.0;
    auto r = FlowCalculator::calculate(in);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error.code, AnalysisErrorCode::InvalidConfig);
}

TEST(FlowCalculator, Rejects_NegativeRunnerOverride) {
    auto in = makeInput();
    in.runnerDiameterMm = -1.0;
    auto r = FlowCalculator::calculate(in);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error.code, AnalysisErrorCode::InvalidConfig);
}

TEST(FlowCalculator, Rejects_ZeroVolume) {
    auto in = makeInput();
    in.volumeCm3 = 0.0;
    auto r = FlowCalculator::calculate(in);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error.code, AnalysisErrorCode::InvalidGeometry);
}
