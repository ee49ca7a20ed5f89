#include "manual_geometry.h"

#include <algorithm>
#include <cmath>

#include "../molding/units.h"

namespace mc {
namespace geometry {

using molding::AnalysisErrorCode;
using molding::GeometrySummary;
using Out = molding::Outcome<GeometrySummary>;

Out estimateManualGeometry(const ManualDimensions& d) {
    auto positive = [](f64 v) { return std::isfinite(v) && v > 0.0; };
    if (!positive(d.lengthMm) || !positive(d.widthMm) || !positive(d.heightMm)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry,
                         "length, width and height must be > 0 mm");
    }
    if (!positive(d.wallThicknessMm)) {
        return Out::fail(AnalysisErrorCode::InvalidGeometry, "wall thickness must be > 0 mm");
    }

    const f64 wall2 = 2.0 * d.wallThicknessMm;
    const f64 outer = d.lengthMm * d.widthMm * d.heightMm;
    const f64 inner = std::max(0.0, d.lengthMm - wall2) * std::max(0.0, d.widthMm - wall2) *
                      std::max(0.0, d.heightMm - wall2);

    GeometrySummary g;
    g.partId = d.partId;
    g.volumeCm3 = (outer - inner) * units::mm3_to_cm3;
    g.projectedAreaCm2 = d.lengthMm * d.widthMm * units::mm2_to_cm2;
    g.minThicknessMm = d.wallThicknessMm * kManualMinWallFactor;
    g.avgThicknessMm = d.wallThicknessMm;
    g.maxThicknessMm = d.wallThicknessMm * kManualMaxWallFactor;
    g.bbox = {d.lengthMm, d.widthMm, d.heightMm};
    g.source = molding::GeometrySource::ManualEstimate;
    return Out::ok(g);
}

} // namespace geometry
} // namespace mc
