#pragma once

// Unit conversions used across the molding calculators.
// Areas arrive in cm2, thicknesses in mm, pressures in MPa, forces leave in t.

namespace mc {
namespace units {

// Area
inline constexpr double cm2_to_mm2 = 100.0;
inline constexpr double mm2_to_cm2 = 1.0 / cm2_to_mm2;

// Volume
inline constexpr double cm3_to_mm3 = 1000.0;
inline constexpr double mm3_to_cm3 = 1.0 / cm3_to_mm3;

// Force: MPa * mm2 = N
inline constexpr double N_to_kN = 1.0 / 1000.0;
inline constexpr double g0 = 9.80665;            // m/s^2
inline constexpr double kN_per_metric_ton = g0;  // 1 t-force = 9.80665 kN

inline double sqr(double x) { return x * x; }

} // namespace units
} // namespace mc
