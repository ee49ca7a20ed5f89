// MoldCheck - Molding Types Tests

#include <gtest/gtest.h>

#include "core/molding/molding_types.h"

using namespace mc::molding;

TEST(MoldingTypes, Morphology) {
    EXPECT_EQ(morphologyOf(PolymerFamily::PP), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::POM), Morphology::Crystalline);
    EXPECT_EQ(morphologyOf(PolymerFamily::ABS), Morphology::Amorphous);
    EXPECT_EQ(morphologyOf(PolymerFamily::PCABS), Morphology::Amorphous);
}

TEST(MoldingTypes, ProvenanceLabel) {
    EXPECT_STREQ(provenanceLabel(GeometrySource::FromCad), "CAD Geometry");
    EXPECT_STREQ(provenanceLabel(GeometrySource::ManualEstimate), "Estimated - No CAD");
}

TEST(MoldingTypes, ParseFamily_CaseAndBlendSpelling) {
    EXPECT_EQ(parsePolymerFamily("abs"), PolymerFamily::ABS);
    EXPECT_EQ(parsePolymerFamily("PC+ABS"), PolymerFamily::PCABS);
    EXPECT_EQ(parsePolymerFamily(polymerFamilyToString(PolymerFamily::PCABS)),
              PolymerFamily::PCABS);
    EXPECT_FALSE(parsePolymerFamily("TPU").has_value());
}

TEST(MoldingTypes, ParseGateType) {
    for (auto g : {GateType::Edge, GateType::Pin, GateType::Fan, GateType::Submarine}) {
        EXPECT_EQ(parseGateType(gateTypeToString(g)), g);
    }
    EXPECT_FALSE(parseGateType("hot_runner").has_value());
}

TEST(MoldingTypes, ParseViscosityAndSource) {
    EXPECT_EQ(parseViscosityClass("HIGH"), ViscosityClass::High);
    EXPECT_FALSE(parseViscosityClass("thick").has_value());
    EXPECT_EQ(parseGeometrySource("stl"), GeometrySource::FromCad);
    EXPECT_EQ(parseGeometrySource("manual"), GeometrySource::ManualEstimate);
}

TEST(MoldingTypes, WarningCodes) {
    EXPECT_STREQ(warningKindToString(WarningKind::NoSuitableMachine), "no_suitable_machine");
    EXPECT_STREQ(feasibilityStatusToString(FeasibilityStatus::NotRecommended),
                 "not_recommended");
}
