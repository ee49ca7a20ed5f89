#include "cycle_time_calculator.h"

#include <cmath>

#include "formulas.h"

namespace mc {
namespace molding {

Outcome<CycleTimeBreakdown> CycleTimeCalculator::calculate(f64 fillSeconds,
                                                           f64 maxThicknessMm,
                                                           PolymerFamily family) {
    using Out = Outcome<CycleTimeBreakdown>;

    if (!(maxThicknessMm > 0.0)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry, "max thickness must be > 0 mm");
    }
    if (!std::isfinite(fillSeconds) || fillSeconds < 0.0) {
        return Out::fail(AnalysisErrorCode::ComputationOverflow, "fill time is not finite");
    }

    CycleTimeBreakdown cycle;
    cycle.fillSeconds = fillSeconds;
    cycle.coolingSeconds = MoldFormulas::coolingTimeSeconds(maxThicknessMm, morphologyOf(family));
    cycle.packSeconds = MoldFormulas::packTimeSeconds(cycle.coolingSeconds);
    cycle.overheadSeconds = MoldFormulas::kMoldOverheadSeconds;
    cycle.totalSeconds =
        cycle.fillSeconds + cycle.packSeconds + cycle.coolingSeconds + cycle.overheadSeconds;

    if (!std::isfinite(cycle.totalSeconds)) {
        return Out::fail(AnalysisErrorCode::ComputationOverflow, "cycle time is not finite");
    }
    return Out::ok(cycle);
}

} // namespace molding
} // namespace mc
