#include "flow_calculator.h"

#include <cmath>

#include "formulas.h"

namespace mc {
namespace molding {

Outcome<f64> FlowCalculator::resolveGateDiameter(const FlowInput& input) {
    if (input.gateDiameterMm) {
        const f64 d = *input.gateDiameterMm;
        if (!std::isfinite(d) || d <= 0.0) {
            return Outcome<f64>::fail(AnalysisErrorCode::InvalidConfig,
                                      "gate diameter must be > 0 mm");
        }
        return Outcome<f64>::ok(d);
    }
    return Outcome<f64>::ok(MoldFormulas::gateDiameterMm(
        input.volumeCm3, input.maxThicknessMm, input.viscosity, input.gateType));
}

f64 FlowCalculator::flowLength(const BoundingBox& bbox, const std::optional<Point3>& gateLocation) {
    if (gateLocation) {
        return MoldFormulas::flowLengthFromGate(bbox, *gateLocation);
    }
    return MoldFormulas::flowLengthFromBoundingBox(bbox);
}

Outcome<FlowEstimate> FlowCalculator::calculate(const FlowInput& input) {
    using Out = Outcome<FlowEstimate>;

    if (!(input.volumeCm3 > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry, "volume must be > 0 cm3");
    }
    if (!(input.avgThicknessMm > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry, "average thickness must be > 0 mm");
    }
    if (!(input.basePressureMpa > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidMaterial, "cavity pressure must be > 0 MPa");
    }

    auto gate = resolveGateDiameter(input);
    if (!gate) {
        return Out::fail(gate.error);
    }

    FlowEstimate est;
    est.gateDiameterMm = gate.get();
    est.gateDiameterSupplied = input.gateDiameterMm.has_value();

    if (input.runnerDiameterMm) {
        const f64 r = *input.runnerDiameterMm;
        if (!std::isfinite(r) || r <= 0.0) {
            return Out::fail(AnalysisErrorCode::InvalidConfig, "runner diameter must be > 0 mm");
        }
        est.runnerDiameterMm = r;
        est.runnerDiameterSupplied = true;
    } else {
        est.runnerDiameterMm = MoldFormulas::runnerDiameterMm(est.gateDiameterMm);
    }

    est.gateAreaMm2 = MoldFormulas::gateAreaMm2(est.gateDiameterMm);
    est.flowRateCm3PerS = MoldFormulas::flowRateCm3PerS(est.gateDiameterMm, input.viscosity,
                                                        input.avgThicknessMm);
    if (!std::isfinite(est.flowRateCm3PerS) || est.flowRateCm3PerS <= 0.0) {
        return Out::fail(AnalysisErrorCode::ComputationOverflow,
                         "flow rate through the gate is zero or not finite");
    }
    est.fillTimeSeconds = input.volumeCm3 / est.flowRateCm3PerS;

    est.flowLengthMm = flowLength(input.bbox, input.gateLocationMm);
    est.flowRatio = MoldFormulas::flowRatio(est.flowLengthMm, input.avgThicknessMm);
    if (input.maxFlowLengthRatio > 0.0) {
        est.flowRatioUtilizationPct = est.flowRatio / input.maxFlowLengthRatio * 100.0;
    }

    est.injectionPressureMpa =
        MoldFormulas::injectionPressureMpa(input.basePressureMpa, input.viscosity, est.flowRatio);

    if (!std::isfinite(est.fillTimeSeconds) || !std::isfinite(est.flowRatio) ||
        !std::isfinite(est.injectionPressureMpa) || !std::isfinite(est.runnerDiameterMm)) {
        return Out::fail(AnalysisErrorCode::ComputationOverflow,
                         "fill time, flow ratio or injection pressure is not finite");
    }
    return Out::ok(est);
}

} // namespace molding
} // namespace mc
