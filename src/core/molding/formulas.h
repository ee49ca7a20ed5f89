#pragma once

// MoldCheck - Formula Library
// Closed-form injection molding estimates. Every function is pure; callers
// validate inputs and guard against non-finite results.

#include "../types.h"
#include "molding_types.h"

namespace mc {
namespace molding {

class MoldFormulas {
  public:
    // Clamp force in kN: A[cm2] * 100 * n * P[MPa] / 1000
    // Reference: Rosato, Injection Molding Handbook
    static f64 clampForceKn(f64 projectedAreaCm2, int cavityCount, f64 cavityPressureMpa);

    // kN to metric tons-force
    static f64 knToMetricTons(f64 forceKn);

    // Circular gate cross-section in mm2
    static f64 gateAreaMm2(f64 gateDiameterMm);

    // Fill-rate divisor by viscosity class (low 0.8, medium 1.0, high 1.3)
    static f64 viscosityFillFactor(ViscosityClass viscosity);

    // min(avgThickness / 2.5, 1.2); thick walls stop accelerating the fill
    static f64 thicknessFlowFactor(f64 avgThicknessMm);

    // Volumetric flow rate through the gate in cm3/s
    static f64 flowRateCm3PerS(f64 gateDiameterMm, ViscosityClass viscosity,
                               f64 avgThicknessMm);

    // t = V / Q
    // Reference: Beaumont, Runner and Gating Design Handbook
    static f64 fillTimeSeconds(f64 volumeCm3, f64 gateDiameterMm, ViscosityClass viscosity,
                               f64 avgThicknessMm);

    // Injection pressure multiplier by viscosity class (low 0.85, medium 1.0, high 1.25)
    static f64 viscosityPressureFactor(ViscosityClass viscosity);

    // P = P_base * k_visc * (1 + 0.3 * log10(max(L/t / 50, 1)))
    static f64 injectionPressureMpa(f64 basePressureMpa, ViscosityClass viscosity,
                                    f64 flowRatio);

    // Cooling coefficient in s/mm2 (crystalline 2.5, amorphous 2.0)
    static f64 coolingCoefficient(Morphology morphology);

    // Cooling ~ k * t^2
    // Reference: Menges, How to Make Injection Molds
    static f64 coolingTimeSeconds(f64 maxThicknessMm, Morphology morphology);

    // Hold/pack phase as a fraction of cooling
    static f64 packTimeSeconds(f64 coolingTimeSeconds);

    // Half diagonal of the face spanned by the two largest box dimensions
    // (gate assumed at the centre of the largest face)
    static f64 flowLengthFromBoundingBox(const BoundingBox& bbox);

    // Distance from the gate to the furthest bounding-box corner
    static f64 flowLengthFromGate(const BoundingBox& bbox, const Point3& gate);

    // L / t; zero when thickness is not positive
    static f64 flowRatio(f64 flowLengthMm, f64 wallThicknessMm);

    // Gate size as a fraction of max wall thickness, adjusted by viscosity,
    // part volume and gate style; never below kMinGateDiameterMm
    static f64 gateDiameterMm(f64 volumeCm3, f64 maxThicknessMm, ViscosityClass viscosity,
                              GateType gateType);

    // Gate-type multiplier on the thickness fraction
    static f64 gateTypeFactor(GateType gateType);

    // Runner ~ 1.75 x gate
    static f64 runnerDiameterMm(f64 gateDiameterMm);

    // W = V * rho
    static f64 partWeightGrams(f64 volumeCm3, f64 densityGPerCm3);

    static constexpr f64 kBaseFlowRate = 12.0;        // cm3/s per mm2 of gate area
    static constexpr f64 kReferenceThicknessMm = 2.5;
    static constexpr f64 kMaxThicknessFactor = 1.2;
    static constexpr f64 kPackFraction = 0.3;
    static constexpr f64 kMoldOverheadSeconds = 3.0;  // open, eject, close
    static constexpr f64 kConservativeMargin = 1.1;
    static constexpr f64 kRunnerToGateRatio = 1.75;
    static constexpr f64 kMinGateDiameterMm = 0.8;
    static constexpr f64 kReferenceFlowRatio = 50.0;
};

} // namespace molding
} // namespace mc
