// MoldCheck - CycleTimeCalculator Tests

#include <gtest/gtest.h>

#include <limits>

#include "core/molding/cycle_time_calculator.h"

using namespace mc;
using namespace mc::molding;

TEST(CycleTimeCalculator, Amorphous_2mm) {
    auto r = CycleTimeCalculator::calculate(1.0, 2.0, PolymerFamily::ABS);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.get().coolingSeconds, 8.0);
    EXPECT_NEAR(r.get().packSeconds, 2.4, 1e-12);
    EXPECT_DOUBLE_EQ(r.get().overheadSeconds, 3.0);
    EXPECT_DOUBLE_EQ(r.get().fillSeconds, 1.0);
}

TEST(CycleTimeCalculator, Crystalline_CoolsLonger) {
    auto pp = CycleTimeCalculator::calculate(1.0, 3.0, PolymerFamily::PP);
    auto abs = CycleTimeCalculator::calculate(1.0, 3.0, PolymerFamily::ABS);
    ASSERT_TRUE(pp);
    ASSERT_TRUE(abs);
    EXPECT_DOUBLE_EQ(pp.get().coolingSeconds, 22.5);
    EXPECT_GT(pp.get().totalSeconds, abs.get().totalSeconds);
}

TEST(CycleTimeCalculator, Total_IsExactSumOfComponents) {
    const PolymerFamily families[] = {PolymerFamily::PA, PolymerFamily::PC, PolymerFamily::POM,
                                      PolymerFamily::PCABS};
    const f64 thicknesses[] = {0.7, 1.9, 3.3, 7.1};
    for (auto fam : families) {
        for (f64 t : thicknesses) {
            auto r = CycleTimeCalculator::calculate(0.37, t, fam);
            ASSERT_TRUE(r);
            const auto& c = r.get();
            EXPECT_EQ(c.totalSeconds,
                      c.fillSeconds + c.packSeconds + c.coolingSeconds + c.overheadSeconds);
        }
    }
}

TEST(CycleTimeCalculator, Rejects_ZeroThickness) {
    auto r = CycleTimeCalculator::calculate(1.0, 0.0, PolymerFamily::ABS);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error.code, AnalysisErrorCode::InvalidGeometry);
}

TEST(CycleTimeCalculator, Rejects_NonFiniteFill) {
    auto r = CycleTimeCalculator::calculate(std::numeric_limits<f64>::infinity(), 2.0,
                                            PolymerFamily::ABS);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error.code, AnalysisErrorCode::ComputationOverflow);
}

TEST(Morphology, FamilyClassification) {
    EXPECT_EQ(morphologyOf(PolymerFamily::PP), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::PE), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::PA), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::POM), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::PBT), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::PET), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::ABS), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::PC), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::PS), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::PMMA), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::SAN), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::PCABS), Morphology::Amorphous);
}
