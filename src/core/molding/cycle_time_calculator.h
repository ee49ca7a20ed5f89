#pragma once

// MoldCheck - Cycle Time Calculator
// Fill + pack + cooling + mold overhead, reported per component.

#include "../types.h"
#include "analysis_error.h"
#include "molding_types.h"

namespace mc {
namespace molding {

struct CycleTimeBreakdown {
    f64 fillSeconds = 0.0;
    f64 packSeconds = 0.0;
    f64 coolingSeconds = 0.0;
    f64 overheadSeconds = 0.0;
    f64 totalSeconds = 0.0; // Sum of the four stored components
};

class CycleTimeCalculator {
  public:
    // Cooling dominates and scales with the square of the thickest wall
    static Outcome<CycleTimeBreakdown> calculate(f64 fillSeconds, f64 maxThicknessMm,
                                                 PolymerFamily family);
};

} // namespace molding
} // namespace mc
