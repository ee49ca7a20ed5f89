#include "analysis_engine.h"

#include <cmath>
#include <utility>

#include "formulas.h"
#include "input_validation.h"

namespace mc {
namespace molding {

AnalysisOutcome AnalysisEngine::run(const GeometrySummary& geometry,
                                    const MaterialProperties& material,
                                    const std::vector<MachineSpec>& machines,
                                    const ProcessConfig& config) {
    // Validation short-circuits in a fixed order
    if (auto err = checkGeometry(geometry)) return AnalysisOutcome::fail(*err);
    if (auto err = checkMaterial(material)) return AnalysisOutcome::fail(*err);
    if (auto err = checkConfig(config, geometry)) return AnalysisOutcome::fail(*err);
    if (auto err = checkMachines(machines)) return AnalysisOutcome::fail(*err);

    AnalysisResult result;
    result.partId = geometry.partId;
    result.materialId = material.id;
    result.config = config;
    result.provenance = geometry.source;
    result.cavityPressureMpa = material.cavityPressureMpa.midpoint();
    result.flowRatioLimit = material.maxFlowLengthRatio;

    // Tonnage
    TonnageInput tin;
    tin.projectedAreaCm2 = geometry.projectedAreaCm2;
    tin.cavityCount = config.cavityCount;
    tin.cavityPressureMpa = result.cavityPressureMpa;
    tin.safetyFactor = config.safetyFactor;
    auto tonnage = TonnageCalculator::calculate(tin);
    if (!tonnage) return AnalysisOutcome::fail(tonnage.error);
    result.tonnage = tonnage.get();

    // Flow and fill
    FlowInput fin;
    fin.volumeCm3 = geometry.volumeCm3;
    fin.avgThicknessMm = geometry.avgThicknessMm;
    fin.maxThicknessMm = geometry.maxThicknessMm;
    fin.bbox = geometry.bbox;
    fin.viscosity = material.viscosity;
    fin.basePressureMpa = result.cavityPressureMpa;
    fin.maxFlowLengthRatio = material.maxFlowLengthRatio;
    fin.gateType = config.gateType;
    fin.gateDiameterMm = config.gateDiameterMm;
    fin.runnerDiameterMm = config.runnerDiameterMm;
    fin.gateLocationMm = config.gateLocationMm;
    auto flow = FlowCalculator::calculate(fin);
    if (!flow) return AnalysisOutcome::fail(flow.error);
    result.flow = flow.get();

    // Cycle
    auto cycle = CycleTimeCalculator::calculate(result.flow.fillTimeSeconds,
                                                geometry.maxThicknessMm, material.family);
    if (!cycle) return AnalysisOutcome::fail(cycle.error);
    result.cycle = cycle.get();

    // Weights
    result.partWeightGrams = MoldFormulas::partWeightGrams(geometry.volumeCm3,
                                                           material.densityGPerCm3);
    result.shotWeightGrams = result.partWeightGrams * config.cavityCount;
    result.requiredShotVolumeCm3 = geometry.volumeCm3 * config.cavityCount;
    if (!std::isfinite(result.shotWeightGrams) || !std::isfinite(result.requiredShotVolumeCm3)) {
        return AnalysisOutcome::fail(AnalysisErrorCode::ComputationOverflow,
                                     "shot weight or shot volume is not finite");
    }

    // Rules
    FeasibilityInput feas;
    feas.minThicknessMm = geometry.minThicknessMm;
    feas.maxThicknessMm = geometry.maxThicknessMm;
    feas.flowRatio = result.flow.flowRatio;
    feas.maxFlowLengthRatio = material.maxFlowLengthRatio;
    feas.projectedAreaCm2 = geometry.projectedAreaCm2;
    feas.recommendedTonnage = result.tonnage.recommended;
    result.warnings = FeasibilityEvaluator::evaluate(feas);

    // Machines
    MachineRequirement req;
    req.tonnage = result.tonnage.recommended;
    req.shotVolumeCm3 = result.requiredShotVolumeCm3;
    req.partWidthMm = geometry.bbox.x;
    req.partHeightMm = geometry.bbox.y;
    result.recommendations = MachineRecommender::recommend(machines, req);

    // Also raised for an empty catalog: no machine can run the part
    if (result.recommendations.empty()) {
        result.warnings.push_back(FeasibilityEvaluator::makeNoSuitableMachineWarning(
            req.tonnage, req.shotVolumeCm3));
    }

    result.feasibility = FeasibilityEvaluator::assess(result.warnings);

    return AnalysisOutcome::ok(std::move(result));
}

} // namespace molding
} // namespace mc
