#pragma once

// MoldCheck - Manual geometry estimate
// Hollow-box approximation for parts without a CAD file. Results are
// tagged ManualEstimate so every downstream view shows "Estimated - No CAD".

#include "../molding/analysis_error.h"
#include "../molding/molding_types.h"
#include "../types.h"

namespace mc {
namespace geometry {

struct ManualDimensions {
    f64 lengthMm = 0.0;
    f64 widthMm = 0.0;
    f64 heightMm = 0.0;
    f64 wallThicknessMm = 0.0; // Nominal wall
    i64 partId = 0;
};

// Nominal wall spread assumed for hand-entered parts
inline constexpr f64 kManualMinWallFactor = 0.8;
inline constexpr f64 kManualMaxWallFactor = 1.5;

// Outer box minus inner box (inner clamped at zero). Projected area is L x W.
// Fails with InvalidGeometry on non-positive dimensions.
molding::Outcome<molding::GeometrySummary> estimateManualGeometry(const ManualDimensions& dims);

} // namespace geometry
} // namespace mc
