#include "analysis_report.h"

#include "../utils/string_utils.h"

namespace mc {
namespace report {

using molding::AnalysisResult;
using molding::FeasibilityEvaluator;

namespace {

nlohmann::json feasibilityJson(const AnalysisResult& r) {
    return {
        {"status", molding::feasibilityStatusToString(r.feasibility.status)},
        {"score", r.feasibility.score},
        {"message", FeasibilityEvaluator::statusMessage(r.feasibility.status)},
    };
}

nlohmann::json designerView(const AnalysisResult& r) {
    nlohmann::json config{
        {"cavity_count", r.config.cavityCount},
        {"gate_type", molding::gateTypeToString(r.config.gateType)},
        {"safety_factor", r.config.safetyFactor},
    };
    if (r.config.gateLocationMm) {
        const auto& p = *r.config.gateLocationMm;
        config["gate_location_mm"] = {p.x, p.y, p.z};
    }

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : r.warnings) {
        nlohmann::json jw{
            {"code", molding::warningKindToString(w.kind)},
            {"severity", molding::severityToString(w.severity)},
            {"message", w.designerMessage},
        };
        if (w.remediation) jw["remediation"] = *w.remediation;
        warnings.push_back(jw);
    }

    nlohmann::json machines = nlohmann::json::array();
    for (const auto& rec : r.recommendations) {
        machines.push_back({
            {"machine_id", rec.machine.id},
            {"name", rec.machine.name},
            {"manufacturer", rec.machine.manufacturer},
            {"tonnage", rec.machine.tonnage},
            {"max_shot_volume_cm3", rec.machine.maxShotVolumeCm3},
            {"suitability", molding::suitabilityToString(rec.suitability)},
            {"tonnage_utilization_pct", rec.tonnageUtilizationPct},
            {"shot_utilization_pct", rec.shotUtilizationPct},
            {"notes", rec.notes},
        });
    }

    return {
        {"view", "designer"},
        {"part_id", r.partId},
        {"material_id", r.materialId},
        {"geometry_source", molding::geometrySourceToString(r.provenance)},
        {"provenance", r.provenanceLabel()},
        {"config", config},
        {"tonnage",
         {
             {"minimum", r.tonnage.minimum},
             {"recommended", r.tonnage.recommended},
             {"conservative", r.tonnage.conservative},
             {"clamp_force_kn", r.tonnage.clampForceKn},
             {"cavity_pressure_mpa", r.cavityPressureMpa},
         }},
        {"flow",
         {
             {"fill_time_s", r.flow.fillTimeSeconds},
             {"flow_rate_cm3_s", r.flow.flowRateCm3PerS},
             {"injection_pressure_mpa", r.flow.injectionPressureMpa},
             {"flow_length_mm", r.flow.flowLengthMm},
             {"flow_ratio", r.flow.flowRatio},
             {"flow_ratio_limit", r.flowRatioLimit},
             {"flow_ratio_utilization_pct", r.flow.flowRatioUtilizationPct},
         }},
        {"gate",
         {
             {"diameter_mm", r.flow.gateDiameterMm},
             {"diameter_supplied", r.flow.gateDiameterSupplied},
             {"area_mm2", r.flow.gateAreaMm2},
             {"runner_diameter_mm", r.flow.runnerDiameterMm},
             {"runner_diameter_supplied", r.flow.runnerDiameterSupplied},
         }},
        {"cycle",
         {
             {"fill_s", r.cycle.fillSeconds},
             {"pack_s", r.cycle.packSeconds},
             {"cooling_s", r.cycle.coolingSeconds},
             {"overhead_s", r.cycle.overheadSeconds},
             {"total_s", r.cycle.totalSeconds},
         }},
        {"weight",
         {
             {"part_g", r.partWeightGrams},
             {"shot_g", r.shotWeightGrams},
             {"required_shot_volume_cm3", r.requiredShotVolumeCm3},
         }},
        {"feasibility", feasibilityJson(r)},
        {"warnings", warnings},
        {"machines", machines},
    };
}

nlohmann::json customerView(const AnalysisResult& r) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& w : r.warnings) {
        messages.push_back(w.customerMessage);
    }

    nlohmann::json machines = nlohmann::json::array();
    for (const auto& rec : r.recommendations) {
        machines.push_back(rec.machine.name);
    }

    return {
        {"view", "customer"},
        {"part_id", r.partId},
        {"provenance", r.provenanceLabel()},
        {"feasibility", feasibilityJson(r)},
        {"recommended_tonnage", r.tonnage.recommended},
        {"cycle_time_s", r.cycle.totalSeconds},
        {"part_weight_g", r.partWeightGrams},
        {"cavity_count", r.config.cavityCount},
        {"messages", messages},
        {"machines", machines},
    };
}

} // namespace

const char* reportViewToString(ReportView view) {
    return view == ReportView::Customer ? "customer" : "designer";
}

Result<ReportView> parseReportView(std::string_view str) {
    const std::string s = str::toLower(str::trim(str));
    if (s == "designer") return ReportView::Designer;
    if (s == "customer") return ReportView::Customer;
    return std::nullopt;
}

nlohmann::json toJson(const AnalysisResult& result, ReportView view) {
    return view == ReportView::Customer ? customerView(result) : designerView(result);
}

std::string toJsonString(const AnalysisResult& result, ReportView view) {
    return toJson(result, view).dump(2);
}

} // namespace report
} // namespace mc
