#pragma once

// MoldCheck - Flow & Fill Calculator
// Gate and runner sizing, flow length risk, fill time and injection pressure.

#include <optional>

#include "../types.h"
#include "analysis_error.h"
#include "molding_types.h"

namespace mc {
namespace molding {

struct FlowInput {
    f64 volumeCm3 = 0.0;
    f64 avgThicknessMm = 0.0;
    f64 maxThicknessMm = 0.0;
    BoundingBox bbox;
    ViscosityClass viscosity = ViscosityClass::Medium;
    f64 basePressureMpa = 0.0;     // Midpoint of the material's recommended range
    f64 maxFlowLengthRatio = 0.0;  // Material limit, reported as utilisation
    GateType gateType = GateType::Edge;
    std::optional<f64> gateDiameterMm;
    std::optional<f64> runnerDiameterMm;
    std::optional<Point3> gateLocationMm;
};

struct FlowEstimate {
    f64 gateDiameterMm = 0.0;
    bool gateDiameterSupplied = false;
    f64 runnerDiameterMm = 0.0;
    bool runnerDiameterSupplied = false;
    f64 gateAreaMm2 = 0.0;
    f64 flowRateCm3PerS = 0.0;
    f64 fillTimeSeconds = 0.0;
    f64 flowLengthMm = 0.0;
    f64 flowRatio = 0.0;
    f64 flowRatioUtilizationPct = 0.0;  // flowRatio / material limit * 100
    f64 injectionPressureMpa = 0.0;
};

class FlowCalculator {
  public:
    // Gate diameter used for the fill: the supplied override, or the
    // thickness-based recommendation. A supplied value <= 0 is rejected.
    static Outcome<f64> resolveGateDiameter(const FlowInput& input);

    // Flow length from the gate location, or from the largest face centre
    static f64 flowLength(const BoundingBox& bbox, const std::optional<Point3>& gateLocation);

    static Outcome<FlowEstimate> calculate(const FlowInput& input);
};

} // namespace molding
} // namespace mc
