// MoldCheck - Analysis Report Tests

#include <gtest/gtest.h>

#include "core/catalog/default_machines.h"
#include "core/catalog/default_materials.h"
#include "core/report/analysis_report.h"

using namespace mc;
using namespace mc::molding;

namespace {

// Thick, very thin-walled cover: raises thick and thin section warnings
AnalysisResult thickPartResult() {
    GeometrySummary g;
    g.partId = 21;
    g.volumeCm3 = 80.0;
    g.projectedAreaCm2 = 120.0;
    g.minThicknessMm = 0.8;
    g.avgThicknessMm = 2.0;
    g.maxThicknessMm = 5.0;
    g.bbox = {120.0, 100.0, 25.0};

    auto outcome = AnalysisEngine::run(g, getDefaultMaterials().front(), getDefaultMachines(),
                                       ProcessConfig{});
    EXPECT_TRUE(outcome) << outcome.error.describe();
    return outcome.value.value_or(AnalysisResult{});
}

} // namespace

// ============================================================================
// View names
// ============================================================================

TEST(AnalysisReport, ParseView) {
    EXPECT_EQ(report::parseReportView("designer"), report::ReportView::Designer);
    EXPECT_EQ(report::parseReportView(" Customer "), report::ReportView::Customer);
    EXPECT_FALSE(report::parseReportView("manager").has_value());
    EXPECT_STREQ(report::reportViewToString(report::ReportView::Customer), "customer");
}

// ============================================================================
// Designer view
// ============================================================================

TEST(AnalysisReport, Designer_CarriesEveryNumber) {
    const auto r = thickPartResult();
    const auto j = report::toJson(r, report::ReportView::Designer);

    EXPECT_EQ(j["view"], "designer");
    EXPECT_EQ(j["part_id"], 21);
    EXPECT_EQ(j["provenance"], "CAD Geometry");
    EXPECT_DOUBLE_EQ(j["tonnage"]["recommended"].get<double>(), r.tonnage.recommended);
    EXPECT_DOUBLE_EQ(j["cycle"]["total_s"].get<double>(), r.cycle.totalSeconds);
    EXPECT_DOUBLE_EQ(j["gate"]["diameter_mm"].get<double>(), r.flow.gateDiameterMm);
    EXPECT_FALSE(j["gate"]["diameter_supplied"].get<bool>());
    EXPECT_EQ(j["feasibility"]["score"], r.feasibility.score);

    ASSERT_EQ(j["warnings"].size(), r.warnings.size());
    ASSERT_GE(r.warnings.size(), 2u);
    EXPECT_EQ(j["warnings"][0]["code"], "thick_section");
    EXPECT_EQ(j["warnings"][0]["message"], r.warnings[0].designerMessage);
    EXPECT_TRUE(j["warnings"][0].contains("remediation"));

    ASSERT_FALSE(j["machines"].empty());
    EXPECT_TRUE(j["machines"][0].contains("notes"));
    EXPECT_TRUE(j["machines"][0].contains("suitability"));
}

TEST(AnalysisReport, Designer_GateLocationEchoed) {
    auto r = thickPartResult();
    r.config.gateLocationMm = Point3{10.0, 20.0, 5.0};
    const auto j = report::toJson(r, report::ReportView::Designer);
    ASSERT_TRUE(j["config"].contains("gate_location_mm"));
    EXPECT_DOUBLE_EQ(j["config"]["gate_location_mm"][1].get<double>(), 20.0);
}

// ============================================================================
// Customer view
// ============================================================================

TEST(AnalysisReport, Customer_PlainLanguageOnly) {
    const auto r = thickPartResult();
    const auto j = report::toJson(r, report::ReportView::Customer);

    EXPECT_EQ(j["view"], "customer");
    EXPECT_EQ(j["feasibility"]["status"], feasibilityStatusToString(r.feasibility.status));
    EXPECT_DOUBLE_EQ(j["cycle_time_s"].get<double>(), r.cycle.totalSeconds);
    EXPECT_FALSE(j.contains("warnings"));
    EXPECT_FALSE(j.contains("flow"));

    ASSERT_EQ(j["messages"].size(), r.warnings.size());
    EXPECT_EQ(j["messages"][0], r.warnings[0].customerMessage);
    EXPECT_EQ(j["machines"].size(), r.recommendations.size());
}

TEST(AnalysisReport, Customer_ManualProvenanceShown) {
    auto r = thickPartResult();
    r.provenance = GeometrySource::ManualEstimate;
    const auto text = report::toJsonString(r, report::ReportView::Customer);
    EXPECT_NE(text.find("Estimated - No CAD"), std::string::npos);
}
