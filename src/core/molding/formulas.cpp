#include "formulas.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "units.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace mc {
namespace molding {

f64 MoldFormulas::clampForceKn(f64 projectedAreaCm2, int cavityCount, f64 cavityPressureMpa) {
    const f64 areaMm2 = projectedAreaCm2 * units::cm2_to_mm2;
    // MPa * mm2 = N
    return areaMm2 * static_cast<f64>(cavityCount) * cavityPressureMpa * units::N_to_kN;
}

f64 MoldFormulas::knToMetricTons(f64 forceKn) {
    return forceKn / units::kN_per_metric_ton;
}

f64 MoldFormulas::gateAreaMm2(f64 gateDiameterMm) {
    return M_PI * units::sqr(gateDiameterMm / 2.0);
}

f64 MoldFormulas::viscosityFillFactor(ViscosityClass viscosity) {
    switch (viscosity) {
    case ViscosityClass::Low: return 0.8;    // PP, PE, PS
    case ViscosityClass::Medium: return 1.0; // ABS, PA
    case ViscosityClass::High: return 1.3;   // PC, POM, PMMA
    }
    return 1.0;
}

f64 MoldFormulas::thicknessFlowFactor(f64 avgThicknessMm) {
    return std::min(avgThicknessMm / kReferenceThicknessMm, kMaxThicknessFactor);
}

f64 MoldFormulas::flowRateCm3PerS(f64 gateDiameterMm, ViscosityClass viscosity,
                                  f64 avgThicknessMm) {
    const f64 rate = kBaseFlowRate * gateAreaMm2(gateDiameterMm) / viscosityFillFactor(viscosity);
    return rate * thicknessFlowFactor(avgThicknessMm);
}

f64 MoldFormulas::fillTimeSeconds(f64 volumeCm3, f64 gateDiameterMm, ViscosityClass viscosity,
                                  f64 avgThicknessMm) {
    return volumeCm3 / flowRateCm3PerS(gateDiameterMm, viscosity, avgThicknessMm);
}

f64 MoldFormulas::viscosityPressureFactor(ViscosityClass viscosity) {
    switch (viscosity) {
    case ViscosityClass::Low: return 0.85;
    case ViscosityClass::Medium: return 1.0;
    case ViscosityClass::High: return 1.25;
    }
    return 1.0;
}

f64 MoldFormulas::injectionPressureMpa(f64 basePressureMpa, ViscosityClass viscosity,
                                       f64 flowRatio) {
    const f64 ratioFactor = 1.0 + 0.3 * std::log10(std::max(flowRatio / kReferenceFlowRatio, 1.0));
    return basePressureMpa * viscosityPressureFactor(viscosity) * ratioFactor;
}

f64 MoldFormulas::coolingCoefficient(Morphology morphology) {
    return morphology == Morphology::Crystalline ? 2.5 : 2.0;
}

f64 MoldFormulas::coolingTimeSeconds(f64 maxThicknessMm, Morphology morphology) {
    return coolingCoefficient(morphology) * units::sqr(maxThicknessMm);
}

f64 MoldFormulas::packTimeSeconds(f64 coolingTimeSeconds) {
    return coolingTimeSeconds * kPackFraction;
}

f64 MoldFormulas::flowLengthFromBoundingBox(const BoundingBox& bbox) {
    std::array<f64, 3> dims{bbox.x, bbox.y, bbox.z};
    std::sort(dims.begin(), dims.end(), [](f64 a, f64 b) { return a > b; });
    return std::hypot(dims[0] / 2.0, dims[1] / 2.0);
}

f64 MoldFormulas::flowLengthFromGate(const BoundingBox& bbox, const Point3& gate) {
    // Per axis, the furthest corner lies on the opposite side of the gate
    const f64 dx = std::max(gate.x, bbox.x - gate.x);
    const f64 dy = std::max(gate.y, bbox.y - gate.y);
    const f64 dz = std::max(gate.z, bbox.z - gate.z);
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

f64 MoldFormulas::flowRatio(f64 flowLengthMm, f64 wallThicknessMm) {
    if (wallThicknessMm <= 0.0) return 0.0;
    return flowLengthMm / wallThicknessMm;
}

f64 MoldFormulas::gateTypeFactor(GateType gateType) {
    switch (gateType) {
    case GateType::Edge: return 1.0;
    case GateType::Fan: return 1.1;       // wide land, thicker section
    case GateType::Submarine: return 0.85; // tunnel must shear off on ejection
    case GateType::Pin: return 0.7;       // point gate, small vestige
    }
    return 1.0;
}

f64 MoldFormulas::gateDiameterMm(f64 volumeCm3, f64 maxThicknessMm, ViscosityClass viscosity,
                                 GateType gateType) {
    f64 fraction = 0.6;

    switch (viscosity) {
    case ViscosityClass::Low: fraction -= 0.05; break;
    case ViscosityClass::Medium: break;
    case ViscosityClass::High: fraction += 0.10; break;
    }

    // Larger parts need bigger gates
    fraction += std::min(0.1, volumeCm3 / 500.0 * 0.1);

    fraction *= gateTypeFactor(gateType);
    fraction = std::clamp(fraction, 0.4, 0.8);

    return std::max(maxThicknessMm * fraction, kMinGateDiameterMm);
}

f64 MoldFormulas::runnerDiameterMm(f64 gateDiameterMm) {
    return gateDiameterMm * kRunnerToGateRatio;
}

f64 MoldFormulas::partWeightGrams(f64 volumeCm3, f64 densityGPerCm3) {
    return volumeCm3 * densityGPerCm3;
}

} // namespace molding
} // namespace mc
