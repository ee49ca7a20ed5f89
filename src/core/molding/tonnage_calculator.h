#pragma once

#include "../types.h"
#include "analysis_error.h"

namespace mc {
namespace molding {

struct TonnageInput {
    f64 projectedAreaCm2 = 0.0;
    int cavityCount = 1;
    f64 cavityPressureMpa = 0.0;
    f64 safetyFactor = 1.15;
};

// Clamp tonnage range in metric tons
struct TonnageEstimate {
    f64 clampForceKn = 0.0;
    f64 minimum = 0.0;       // Bare clamp force
    f64 recommended = 0.0;   // minimum * safety factor
    f64 conservative = 0.0;  // recommended * 1.1
};

class TonnageCalculator {
  public:
    // Fails on area <= 0, cavities < 1, pressure <= 0 or safety factor <= 0
    static Outcome<TonnageEstimate> calculate(const TonnageInput& input);
};

} // namespace molding
} // namespace mc
