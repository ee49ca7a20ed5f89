#include "tonnage_calculator.h"

#include <cmath>

#include "formulas.h"

namespace mc {
namespace molding {

Outcome<TonnageEstimate> TonnageCalculator::calculate(const TonnageInput& input) {
    using Out = Outcome<TonnageEstimate>;

    if (!(input.projectedAreaCm2 > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry,
                         "projected area must be > 0 cm2");
    }
    if (input.cavityCount < 1) {
        return Out::fail(AnalysisErrorCode::InvalidConfig, "cavity count must be >= 1");
    }
    if (!(input.cavityPressureMpa > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidMaterial, "cavity pressure must be > 0 MPa");
    }
    if (!(input.safetyFactor > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidConfig, "safety factor must be > 0");
    }

    TonnageEstimate est;
    est.clampForceKn = MoldFormulas::clampForceKn(input.projectedAreaCm2, input.cavityCount,
                                                  input.cavityPressureMpa);
    est.minimum = MoldFormulas::knToMetricTons(est.clampForceKn);
    est.recommended = est.minimum * input.safetyFactor;
    est.conservative = est.recommended * MoldFormulas::kConservativeMargin;

    if (!std::isfinite(est.conservative)) {
        return Out::fail(AnalysisErrorCode::ComputationOverflow,
                         "clamp tonnage is not finite");
    }
    return Out::ok(est);
}

} // namespace molding
} // namespace mc
