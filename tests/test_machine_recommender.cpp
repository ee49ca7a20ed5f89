// MoldCheck - MachineRecommender Tests

#include <gtest/gtest.h>

#include "core/molding/machine_recommender.h"

using namespace mc;
using namespace mc::molding;

namespace {

MachineSpec makeMachine(i64 id, f64 tonnage, f64 shot, f64 platen = 1000.0) {
    MachineSpec m;
    m.id = id;
    m.name = std::to_string(static_cast<int>(tonnage)) + "T";
    m.tonnage = tonnage;
    m.maxShotVolumeCm3 = shot;
    m.platenWidthMm = platen;
    m.platenHeightMm = platen;
    return m;
}

MachineRequirement makeReq(f64 tonnage, f64 shot) {
    MachineRequirement r;
    r.tonnage = tonnage;
    r.shotVolumeCm3 = shot;
    r.partWidthMm = 100.0;
    r.partHeightMm = 100.0;
    return r;
}

std::vector<f64> tonnages(const std::vector<MachineRecommendation>& recs) {
    std::vector<f64> out;
    for (const auto& r : recs) out.push_back(r.machine.tonnage);
    return out;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

TEST(MachineRecommender, Classify_ShotTooSmallExcluded) {
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 200.0, 99.0), makeReq(150.0, 100.0)),
              Suitability::Excluded);
}

TEST(MachineRecommender, Classify_Bands) {
    const auto req = makeReq(100.0, 10.0);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 100.0, 500.0), req), Suitability::Ideal);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 125.0, 500.0), req), Suitability::Ideal);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 150.0, 500.0), req),
              Suitability::Acceptable);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 95.0, 500.0), req),
              Suitability::Acceptable);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 85.0, 500.0), req),
              Suitability::Borderline);
    EXPECT_EQ(MachineRecommender::classify(makeMachine(1, 200.0, 500.0), req),
              Suitability::Borderline);
}

// ============================================================================
// Ranking
// ============================================================================

TEST(MachineRecommender, Scenario_150tRequired) {
    std::vector<MachineSpec> machines = {
        makeMachine(1, 120.0, 100.0),
        makeMachine(2, 180.0, 300.0),
        makeMachine(3, 250.0, 500.0),
    };
    auto recs = MachineRecommender::recommend(machines, makeReq(150.0, 200.0));
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].machine.id, 2);
    EXPECT_EQ(recs[0].suitability, Suitability::Ideal);
    EXPECT_EQ(recs[1].machine.id, 3);
    for (const auto& r : recs) {
        EXPECT_NE(r.machine.id, 1);
    }
}

TEST(MachineRecommender, BandThenAscendingTonnage_CappedAtFive) {
    std::vector<MachineSpec> machines = {
        makeMachine(1, 181.0, 1000.0), // borderline
        makeMachine(2, 131.0, 1000.0), // acceptable
        makeMachine(3, 130.0, 1000.0), // ideal
        makeMachine(4, 50.0, 1000.0),  // borderline
        makeMachine(5, 95.0, 1000.0),  // acceptable
        makeMachine(6, 100.0, 1000.0), // ideal
        makeMachine(7, 170.0, 1000.0), // acceptable
    };
    auto recs = MachineRecommender::recommend(machines, makeReq(100.0, 10.0));
    ASSERT_EQ(static_cast<int>(recs.size()), MachineRecommender::kMaxRecommendations);
    EXPECT_EQ(tonnages(recs), (std::vector<f64>{100.0, 130.0, 95.0, 131.0, 170.0}));
}

TEST(MachineRecommender, Ties_KeepCatalogOrder) {
    std::vector<MachineSpec> machines = {
        makeMachine(7, 120.0, 500.0),
        makeMachine(3, 120.0, 500.0),
        makeMachine(5, 120.0, 500.0),
    };
    auto recs = MachineRecommender::recommend(machines, makeReq(100.0, 10.0));
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].machine.id, 7);
    EXPECT_EQ(recs[1].machine.id, 3);
    EXPECT_EQ(recs[2].machine.id, 5);
}

TEST(MachineRecommender, NeverRecommendsUndersizedShot) {
    std::vector<MachineSpec> machines;
    for (int i = 0; i < 10; ++i) {
        machines.push_back(makeMachine(i + 1, 100.0 + 20.0 * i, 50.0 * (i + 1)));
    }
    const auto req = makeReq(150.0, 260.0);
    for (const auto& r : MachineRecommender::recommend(machines, req)) {
        EXPECT_GE(r.machine.maxShotVolumeCm3, req.shotVolumeCm3);
    }
}

TEST(MachineRecommender, AllExcluded_Empty) {
    std::vector<MachineSpec> machines = {makeMachine(1, 500.0, 100.0)};
    EXPECT_TRUE(MachineRecommender::recommend(machines, makeReq(100.0, 1000.0)).empty());
}

// ============================================================================
// Notes
// ============================================================================

TEST(MachineRecommender, Notes_GoodMatch) {
    std::vector<MachineSpec> machines = {makeMachine(1, 110.0, 1000.0)};
    auto recs = MachineRecommender::recommend(machines, makeReq(100.0, 10.0));
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_NEAR(recs[0].tonnageUtilizationPct, 100.0 / 110.0 * 100.0, 1e-9);
    ASSERT_EQ(recs[0].notes.size(), 2u);
    EXPECT_NE(recs[0].notes[1].find("Good match"), std::string::npos);
}

TEST(MachineRecommender, Notes_ShotHeadroomAndPlaten) {
    // 120 cm3 < 1.3 x 100; 140 mm platen < 1.5 x 100 mm part
    std::vector<MachineSpec> machines = {makeMachine(1, 110.0, 120.0, 140.0)};
    auto recs = MachineRecommender::recommend(machines, makeReq(100.0, 100.0));
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].suitability, Suitability::Ideal);

    bool shotNote = false;
    bool platenNote = false;
    for (const auto& n : recs[0].notes) {
        if (n.find("Shot volume") != std::string::npos) shotNote = true;
        if (n.find("Platen") != std::string::npos) platenNote = true;
    }
    EXPECT_TRUE(shotNote);
    EXPECT_TRUE(platenNote);
}

TEST(MachineRecommender, Notes_UnknownPlatenNotFlagged) {
    // Platen dimensions absent from the catalog are stored as 0
    std::vector<MachineSpec> machines = {makeMachine(1, 110.0, 1000.0, 0.0)};
    auto recs = MachineRecommender::recommend(machines, makeReq(100.0, 100.0));
    ASSERT_EQ(recs.size(), 1u);
    for (const auto& n : recs[0].notes) {
        EXPECT_EQ(n.find("Platen"), std::string::npos) << n;
    }
    ASSERT_EQ(recs[0].notes.size(), 2u);
    EXPECT_NE(recs[0].notes[1].find("Good match"), std::string::npos);
}
